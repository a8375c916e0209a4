#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace evo {

struct VcsResult {
  bool ok = false;
  int exit_code = -1;
  // stdout+stderr of the underlying command, verbatim.
  std::string output;
  std::string error;
};

class VersionControl {
 public:
  virtual ~VersionControl() = default;

  virtual VcsResult add_all() = 0;
  virtual VcsResult commit(const std::string& message) = 0;
  // Discards working-tree changes back to the last commit. `touched` are
  // project-relative paths the cycle wrote; untracked ones are removed too.
  virtual VcsResult rollback(const std::vector<std::string>& touched) = 0;
  virtual VcsResult status() = 0;
  virtual VcsResult history(int count) = 0;
  virtual std::string head_revision() const = 0;
};

class GitGateway : public VersionControl {
 public:
  GitGateway(std::filesystem::path root, double timeout_seconds);

  VcsResult add_all() override;
  VcsResult commit(const std::string& message) override;
  VcsResult rollback(const std::vector<std::string>& touched) override;
  VcsResult status() override;
  VcsResult history(int count) override;
  std::string head_revision() const override;

  bool is_repository() const;
  // Adds `pattern` to .git/info/exclude unless already listed.
  bool ensure_ignored(const std::string& pattern);

 private:
  VcsResult run_git(const std::vector<std::string>& args) const;

  std::filesystem::path root_;
  double timeout_seconds_ = 120.0;
};

// HEAD commit hash read straight from .git, empty when unavailable.
std::string read_git_head_hash(const std::filesystem::path& root);

} // namespace evo
