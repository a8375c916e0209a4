#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "evo/failure_ledger.h"

namespace evo {

struct CompletedObjective {
  std::string objective;
  std::string strategy;
  std::string details;
  std::string date;
};

struct FailedObjective {
  std::string objective;
  std::string reason;
  std::string details;
  std::string date;
};

struct AcquiredCapability {
  std::string description;
  std::optional<std::string> related_objective;
  std::string date;
};

// Persistent history of the loop: outcomes, capabilities and the bounded
// recent-outcome ledger used for degenerate-loop detection.
class Memory {
 public:
  explicit Memory(std::filesystem::path path, size_t ledger_capacity = 20, size_t history_limit = 100);

  // A missing file leaves memory empty and returns true; a corrupt one is
  // reported, memory is reset, and false is returned.
  bool load();
  bool save() const;

  void record_success(const std::string& objective, const std::string& strategy, const std::string& reason_code,
                      const std::string& details);
  void record_failure(const std::string& objective, const std::string& reason, const std::string& details);
  // Failed-objective history only; the recent ledger is left alone.
  void record_discard(const std::string& objective, const std::string& reason, const std::string& details);
  void add_capability(const std::string& description, const std::optional<std::string>& related_objective);

  const std::vector<CompletedObjective>& completed() const { return completed_; }
  const std::vector<FailedObjective>& failed() const { return failed_; }
  const std::vector<AcquiredCapability>& capabilities() const { return capabilities_; }
  const FailureLedger& ledger() const { return ledger_; }
  const std::filesystem::path& path() const { return path_; }

  // Short newest-first digest handed to collaborators.
  std::string history_summary(size_t max_items_per_category = 3) const;

 private:
  void trim_history();

  std::filesystem::path path_;
  size_t history_limit_ = 100;
  std::vector<CompletedObjective> completed_;
  std::vector<FailedObjective> failed_;
  std::vector<AcquiredCapability> capabilities_;
  FailureLedger ledger_;
};

} // namespace evo
