#pragma once

#include <cstddef>
#include <deque>
#include <string>
#include <vector>

namespace evo {

enum class OutcomeStatus {
  Success,
  Failure
};

const char* outcome_status_name(OutcomeStatus status);
bool parse_outcome_status(const std::string& text, OutcomeStatus& out);

struct FailureLogEntry {
  std::string objective;
  OutcomeStatus status = OutcomeStatus::Failure;
  std::string reason_code;
  std::string timestamp;
};

// Bounded, append-only record of recent cycle outcomes. Oldest entries fall
// off once capacity is reached.
class FailureLedger {
 public:
  explicit FailureLedger(size_t capacity = 20);

  void append(FailureLogEntry entry);
  void clear() { entries_.clear(); }

  size_t capacity() const { return capacity_; }
  size_t size() const { return entries_.size(); }
  const std::deque<FailureLogEntry>& entries() const { return entries_; }
  std::vector<FailureLogEntry> newest_first() const;

 private:
  size_t capacity_ = 20;
  std::deque<FailureLogEntry> entries_;
};

// Failures of `objective` counted newest-first until a success of the same
// objective or until `threshold` is reached. Other objectives are skipped.
int count_consecutive_failures(const std::vector<FailureLogEntry>& newest_first, const std::string& objective,
                               int threshold);
bool is_degenerate(const FailureLedger& ledger, const std::string& objective, int threshold);

} // namespace evo
