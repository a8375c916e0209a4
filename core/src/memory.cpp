#include "evo/memory.h"

#include "evo/data_io.h"
#include "evo/log.h"

#include <cstddef>
#include <sstream>
#include <utility>

#include <nlohmann/json.hpp>

namespace evo {
using json = nlohmann::json;

namespace {
std::string clip(const std::string& text, size_t max_chars) {
  if (text.size() <= max_chars) return text;
  return text.substr(0, data::utf8_floor(text, max_chars)) + "...";
}

template <typename T>
void drop_oldest(std::vector<T>& items, size_t limit) {
  if (items.size() > limit) {
    items.erase(items.begin(), items.begin() + static_cast<std::ptrdiff_t>(items.size() - limit));
  }
}
} // namespace

Memory::Memory(std::filesystem::path path, size_t ledger_capacity, size_t history_limit)
    : path_(std::move(path)), history_limit_(history_limit), ledger_(ledger_capacity) {}

bool Memory::load() {
  completed_.clear();
  failed_.clear();
  capabilities_.clear();
  ledger_.clear();

  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) {
    return true;
  }
  json doc;
  if (!data::load_json_file(path_, doc) || !doc.is_object()) {
    log::warn("memory file unreadable, starting empty: " + path_.string());
    return false;
  }

  try {
    for (const auto& item : doc.value("completed_objectives", json::array())) {
      completed_.push_back({item.value("objective", ""), item.value("strategy_used", ""),
                            item.value("details", ""), item.value("date", "")});
    }
    for (const auto& item : doc.value("failed_objectives", json::array())) {
      failed_.push_back({item.value("objective", ""), item.value("reason", ""), item.value("details", ""),
                         item.value("date", "")});
    }
    for (const auto& item : doc.value("acquired_capabilities", json::array())) {
      AcquiredCapability cap;
      cap.description = item.value("description", "");
      if (item.contains("related_objective") && item["related_objective"].is_string()) {
        cap.related_objective = item["related_objective"].get<std::string>();
      }
      cap.date = item.value("date", "");
      capabilities_.push_back(cap);
    }
    for (const auto& item : doc.value("recent_objectives_log", json::array())) {
      FailureLogEntry entry;
      entry.objective = item.value("objective", "");
      if (!parse_outcome_status(item.value("status", ""), entry.status)) {
        continue;
      }
      entry.reason_code = item.value("reason_code", "");
      entry.timestamp = item.value("date", "");
      ledger_.append(entry);
    }
  } catch (const std::exception& e) {
    log::warn(std::string("memory file malformed, starting empty: ") + e.what());
    completed_.clear();
    failed_.clear();
    capabilities_.clear();
    ledger_.clear();
    return false;
  }
  return true;
}

bool Memory::save() const {
  json doc;
  doc["completed_objectives"] = json::array();
  for (const auto& item : completed_) {
    doc["completed_objectives"].push_back(
        {{"objective", item.objective}, {"strategy_used", item.strategy}, {"details", item.details}, {"date", item.date}});
  }
  doc["failed_objectives"] = json::array();
  for (const auto& item : failed_) {
    doc["failed_objectives"].push_back(
        {{"objective", item.objective}, {"reason", item.reason}, {"details", item.details}, {"date", item.date}});
  }
  doc["acquired_capabilities"] = json::array();
  for (const auto& item : capabilities_) {
    json cap;
    cap["description"] = item.description;
    cap["related_objective"] = item.related_objective ? json(*item.related_objective) : json();
    cap["date"] = item.date;
    doc["acquired_capabilities"].push_back(cap);
  }
  doc["recent_objectives_log"] = json::array();
  for (const auto& entry : ledger_.entries()) {
    doc["recent_objectives_log"].push_back({{"objective", entry.objective},
                                            {"status", outcome_status_name(entry.status)},
                                            {"reason_code", entry.reason_code},
                                            {"date", entry.timestamp}});
  }
  if (!data::save_json_file(path_, doc)) {
    log::error("failed to save memory: " + path_.string());
    return false;
  }
  return true;
}

void Memory::record_success(const std::string& objective, const std::string& strategy, const std::string& reason_code,
                            const std::string& details) {
  const auto now = data::now_iso();
  completed_.push_back({objective, strategy, details, now});
  ledger_.append({objective, OutcomeStatus::Success, reason_code, now});
  trim_history();
}

void Memory::record_failure(const std::string& objective, const std::string& reason, const std::string& details) {
  const auto now = data::now_iso();
  failed_.push_back({objective, reason, details, now});
  ledger_.append({objective, OutcomeStatus::Failure, reason, now});
  trim_history();
}

void Memory::record_discard(const std::string& objective, const std::string& reason, const std::string& details) {
  failed_.push_back({objective, reason, details, data::now_iso()});
  trim_history();
}

void Memory::add_capability(const std::string& description, const std::optional<std::string>& related_objective) {
  capabilities_.push_back({description, related_objective, data::now_iso()});
  drop_oldest(capabilities_, history_limit_);
}

void Memory::trim_history() {
  drop_oldest(completed_, history_limit_);
  drop_oldest(failed_, history_limit_);
}

std::string Memory::history_summary(size_t max_items_per_category) const {
  std::ostringstream out;
  bool any = false;
  if (!completed_.empty()) {
    out << "Recent successes:\n";
    size_t n = 0;
    for (auto it = completed_.rbegin(); it != completed_.rend() && n < max_items_per_category; ++it, ++n) {
      out << "  - " << clip(it->objective, 100) << " (strategy: " << it->strategy << ", " << it->date << ")\n";
    }
    any = true;
  }
  if (!failed_.empty()) {
    out << "Recent failures:\n";
    size_t n = 0;
    for (auto it = failed_.rbegin(); it != failed_.rend() && n < max_items_per_category; ++it, ++n) {
      out << "  - " << clip(it->objective, 100) << " (reason: " << it->reason << ", " << it->date << ")\n";
    }
    any = true;
  }
  if (!capabilities_.empty()) {
    out << "Acquired capabilities:\n";
    size_t n = 0;
    for (auto it = capabilities_.rbegin(); it != capabilities_.rend() && n < max_items_per_category; ++it, ++n) {
      out << "  - " << clip(it->description, 100) << " (" << it->date << ")\n";
    }
    any = true;
  }
  if (!any) {
    return "No significant history recorded yet.";
  }
  return out.str();
}

} // namespace evo
