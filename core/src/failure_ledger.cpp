#include "evo/failure_ledger.h"

#include <utility>

namespace evo {

const char* outcome_status_name(OutcomeStatus status) {
  return status == OutcomeStatus::Success ? "success" : "failure";
}

bool parse_outcome_status(const std::string& text, OutcomeStatus& out) {
  if (text == "success") {
    out = OutcomeStatus::Success;
    return true;
  }
  if (text == "failure") {
    out = OutcomeStatus::Failure;
    return true;
  }
  return false;
}

FailureLedger::FailureLedger(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

void FailureLedger::append(FailureLogEntry entry) {
  entries_.push_back(std::move(entry));
  while (entries_.size() > capacity_) {
    entries_.pop_front();
  }
}

std::vector<FailureLogEntry> FailureLedger::newest_first() const {
  return std::vector<FailureLogEntry>(entries_.rbegin(), entries_.rend());
}

int count_consecutive_failures(const std::vector<FailureLogEntry>& newest_first, const std::string& objective,
                               int threshold) {
  int failures = 0;
  for (const auto& entry : newest_first) {
    if (entry.objective != objective) {
      continue;
    }
    if (entry.status == OutcomeStatus::Success) {
      break;
    }
    ++failures;
    if (threshold > 0 && failures >= threshold) {
      break;
    }
  }
  return failures;
}

bool is_degenerate(const FailureLedger& ledger, const std::string& objective, int threshold) {
  if (threshold <= 0) {
    return false;
  }
  return count_consecutive_failures(ledger.newest_first(), objective, threshold) >= threshold;
}

} // namespace evo
