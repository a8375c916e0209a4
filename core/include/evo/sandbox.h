#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace evo {

// Owns one temporary copy of the project. Removing the directory happens
// in release() or the destructor, whichever comes first.
class SandboxHandle {
 public:
  SandboxHandle() = default;
  explicit SandboxHandle(std::filesystem::path path) : path_(std::move(path)) {}
  ~SandboxHandle();

  SandboxHandle(const SandboxHandle&) = delete;
  SandboxHandle& operator=(const SandboxHandle&) = delete;
  SandboxHandle(SandboxHandle&& other) noexcept;
  SandboxHandle& operator=(SandboxHandle&& other) noexcept;

  const std::filesystem::path& path() const { return path_; }
  bool valid() const { return !path_.empty(); }
  bool release();

 private:
  std::filesystem::path path_;
};

class SandboxManager {
 public:
  // `excludes` are project-relative paths left out of every copy; .git is
  // always excluded.
  explicit SandboxManager(std::vector<std::string> excludes = {});

  bool acquire(const std::filesystem::path& project_root, SandboxHandle& out, std::string& error) const;
  bool release(SandboxHandle& handle) const;

  const std::vector<std::string>& excludes() const { return excludes_; }

 private:
  std::vector<std::string> excludes_;
};

// Recursive copy skipping any entry whose relative path equals, or sits
// under, one of `excludes`.
bool copy_tree(const std::filesystem::path& src, const std::filesystem::path& dst,
               const std::vector<std::string>& excludes, std::string& error);

} // namespace evo
