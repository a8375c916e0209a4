#include "evo/vcs.h"

#include "evo/data_io.h"
#include "evo/log.h"
#include "evo/subprocess.h"

#include <sstream>
#include <utility>

namespace evo {
namespace fs = std::filesystem;

namespace {
std::string trim_whitespace(const std::string& value) {
  const auto begin = value.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) return {};
  const auto end = value.find_last_not_of(" \t\r\n");
  return value.substr(begin, end - begin + 1);
}

std::string lookup_packed_ref(const fs::path& git_dir, const std::string& ref) {
  std::istringstream in(data::read_text_file(git_dir / "packed-refs"));
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty() || line[0] == '#' || line[0] == '^') continue;
    const auto space = line.find(' ');
    if (space != std::string::npos && trim_whitespace(line.substr(space + 1)) == ref) {
      return line.substr(0, space);
    }
  }
  return {};
}
} // namespace

std::string read_git_head_hash(const fs::path& root) {
  const fs::path git_dir = root / ".git";
  const fs::path head_path = git_dir / "HEAD";
  std::error_code ec;
  if (!fs::exists(head_path, ec)) {
    return {};
  }
  const std::string head_contents = trim_whitespace(data::read_text_file(head_path));
  if (head_contents.rfind("ref:", 0) == 0) {
    const std::string ref = trim_whitespace(head_contents.substr(4));
    if (ref.empty()) return {};
    const fs::path ref_path = git_dir / ref;
    if (!fs::exists(ref_path, ec)) {
      return lookup_packed_ref(git_dir, ref);
    }
    return trim_whitespace(data::read_text_file(ref_path));
  }
  return head_contents;
}

GitGateway::GitGateway(fs::path root, double timeout_seconds)
    : root_(std::move(root)), timeout_seconds_(timeout_seconds) {}

VcsResult GitGateway::run_git(const std::vector<std::string>& args) const {
  std::vector<std::string> full{"git"};
  full.insert(full.end(), args.begin(), args.end());
  const auto run = run_command(full, root_, timeout_seconds_);

  VcsResult result;
  result.ok = run.ok();
  result.exit_code = run.exit_code;
  result.output = run.output;
  result.error = run.error;
  if (!result.ok) {
    log::warn("git " + (args.empty() ? std::string() : args.front()) + " failed (exit " +
              std::to_string(run.exit_code) + "): " + trim_whitespace(run.output));
  }
  return result;
}

VcsResult GitGateway::add_all() {
  return run_git({"add", "."});
}

VcsResult GitGateway::commit(const std::string& message) {
  return run_git({"commit", "-m", message});
}

VcsResult GitGateway::rollback(const std::vector<std::string>& touched) {
  log::warn("rolling back working tree in " + root_.string());
  auto checkout = run_git({"checkout", "--", "."});
  auto reset = run_git({"reset", "--hard"});

  VcsResult result;
  result.ok = checkout.ok && reset.ok;
  result.exit_code = checkout.ok ? reset.exit_code : checkout.exit_code;
  result.output = checkout.output + reset.output;
  result.error = checkout.ok ? reset.error : checkout.error;

  if (result.ok && !touched.empty()) {
    std::vector<std::string> clean{"clean", "-f", "--"};
    clean.insert(clean.end(), touched.begin(), touched.end());
    const auto cleaned = run_git(clean);
    result.output += cleaned.output;
    if (!cleaned.ok) {
      log::warn("untracked files left after rollback");
    }
  }
  return result;
}

VcsResult GitGateway::status() {
  return run_git({"status", "--porcelain"});
}

VcsResult GitGateway::history(int count) {
  return run_git({"log", "--oneline", "-n", std::to_string(count)});
}

std::string GitGateway::head_revision() const {
  return read_git_head_hash(root_);
}

bool GitGateway::is_repository() const {
  std::error_code ec;
  return fs::exists(root_ / ".git", ec);
}

bool GitGateway::ensure_ignored(const std::string& pattern) {
  if (!is_repository() || pattern.empty()) {
    return false;
  }
  const fs::path exclude_path = root_ / ".git" / "info" / "exclude";
  std::string contents = data::read_text_file(exclude_path);
  std::istringstream in(contents);
  std::string line;
  while (std::getline(in, line)) {
    if (trim_whitespace(line) == pattern) {
      return true;
    }
  }
  if (!contents.empty() && contents.back() != '\n') {
    contents += "\n";
  }
  contents += pattern + "\n";
  return data::write_text_file(exclude_path, contents);
}

} // namespace evo
