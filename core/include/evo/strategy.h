#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "evo/validation_step.h"

namespace evo {

inline constexpr const char* kDiscardStrategy = "DISCARD";

struct ValidationStrategy {
  std::string name;
  std::vector<std::string> step_names;
  std::vector<StepKind> steps;
  // Names that matched no registered step; a non-empty list makes the
  // pipeline fail before running anything.
  std::vector<std::string> unknown_steps;
  std::string sanity_check_step = "skip_sanity_check";
  StepKind sanity_check = StepKind::SkipSanityCheck;

  bool modifies_disk() const;
  bool runs_file_checks() const;
  bool is_discard() const { return name == kDiscardStrategy; }
  bool skips_sanity_check() const { return sanity_check == StepKind::SkipSanityCheck; }
  // Sandbox only when there is something to stage and something to check.
  bool needs_sandbox(size_t patch_count) const;
};

struct StrategyDefinition {
  std::vector<std::string> steps;
  std::string sanity_check_step = "skip_sanity_check";
};

class StrategyTable {
 public:
  static StrategyTable builtin();

  // Extension dispatch like the engine config. Entries without a `steps`
  // list are ignored.
  bool load(const std::filesystem::path& path, std::string& error);

  void set(const std::string& key, StrategyDefinition definition);
  bool contains(const std::string& key) const;
  std::vector<std::string> keys() const;
  size_t size() const { return entries_.size(); }

  // False when the key is missing. Unknown step names are recorded on the
  // strategy, not treated as a lookup failure.
  bool resolve(const std::string& key, ValidationStrategy& out, std::string& error) const;

 private:
  std::map<std::string, StrategyDefinition> entries_;
};

} // namespace evo
