#include "evo/sandbox.h"

#include "evo/log.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <utility>

namespace evo {
namespace fs = std::filesystem;

namespace {
bool is_excluded(const fs::path& rel, const std::vector<fs::path>& excludes) {
  for (const auto& ex : excludes) {
    auto rel_it = rel.begin();
    auto ex_it = ex.begin();
    for (; rel_it != rel.end() && ex_it != ex.end(); ++rel_it, ++ex_it) {
      if (*rel_it != *ex_it) break;
    }
    if (ex_it == ex.end()) {
      return true;
    }
  }
  return false;
}
} // namespace

SandboxHandle::~SandboxHandle() {
  release();
}

SandboxHandle::SandboxHandle(SandboxHandle&& other) noexcept : path_(std::move(other.path_)) {
  other.path_.clear();
}

SandboxHandle& SandboxHandle::operator=(SandboxHandle&& other) noexcept {
  if (this != &other) {
    release();
    path_ = std::move(other.path_);
    other.path_.clear();
  }
  return *this;
}

bool SandboxHandle::release() {
  if (path_.empty()) {
    return true;
  }
  std::error_code ec;
  fs::remove_all(path_, ec);
  if (ec) {
    log::warn("sandbox cleanup failed: " + path_.string() + ": " + ec.message());
  } else {
    log::info("sandbox removed: " + path_.string());
  }
  path_.clear();
  return !ec;
}

SandboxManager::SandboxManager(std::vector<std::string> excludes) : excludes_(std::move(excludes)) {}

bool SandboxManager::acquire(const fs::path& project_root, SandboxHandle& out, std::string& error) const {
  std::error_code ec;
  if (!fs::is_directory(project_root, ec)) {
    error = "project root is not a directory: " + project_root.string();
    return false;
  }
  auto temp_root = fs::temp_directory_path(ec);
  if (ec) {
    temp_root = "/tmp";
  }
  std::string templ = (temp_root / "evo_sandbox_XXXXXX").string();
  if (!::mkdtemp(templ.data())) {
    error = std::string("mkdtemp failed: ") + std::strerror(errno);
    return false;
  }

  SandboxHandle handle{fs::path(templ)};
  std::vector<std::string> excludes = excludes_;
  excludes.push_back(".git");
  if (!copy_tree(project_root, handle.path(), excludes, error)) {
    return false;
  }
  log::info("sandbox created: " + handle.path().string());
  out = std::move(handle);
  return true;
}

bool SandboxManager::release(SandboxHandle& handle) const {
  return handle.release();
}

bool copy_tree(const fs::path& src, const fs::path& dst, const std::vector<std::string>& excludes,
               std::string& error) {
  std::error_code ec;
  if (!fs::exists(src, ec) || !fs::is_directory(src, ec)) {
    error = "copy source is not a directory: " + src.string();
    return false;
  }
  std::vector<fs::path> normalized;
  normalized.reserve(excludes.size());
  for (const auto& ex : excludes) {
    if (ex.empty()) continue;
    auto path = fs::path(ex).lexically_normal();
    // "vendor/" names the same directory as "vendor".
    if (!path.has_filename()) path = path.parent_path();
    if (!path.empty()) {
      normalized.push_back(path);
    }
  }

  fs::create_directories(dst, ec);
  if (ec) {
    error = "failed to create " + dst.string() + ": " + ec.message();
    return false;
  }
  fs::recursive_directory_iterator it(src, ec);
  if (ec) {
    error = "failed to read " + src.string() + ": " + ec.message();
    return false;
  }
  fs::recursive_directory_iterator end;
  for (; it != end; it.increment(ec)) {
    if (ec) {
      error = "failed to walk " + src.string() + ": " + ec.message();
      return false;
    }
    const auto rel = it->path().lexically_relative(src);
    if (is_excluded(rel, normalized)) {
      if (it->is_directory(ec)) {
        it.disable_recursion_pending();
      }
      continue;
    }
    const auto out = dst / rel;
    if (it->is_symlink(ec)) {
      fs::copy_symlink(it->path(), out, ec);
    } else if (it->is_directory(ec)) {
      fs::create_directories(out, ec);
    } else if (it->is_regular_file(ec)) {
      fs::create_directories(out.parent_path(), ec);
      if (!ec) {
        fs::copy_file(it->path(), out, fs::copy_options::overwrite_existing, ec);
      }
    }
    if (ec) {
      error = "failed to copy " + rel.string() + ": " + ec.message();
      return false;
    }
  }
  return true;
}

} // namespace evo
