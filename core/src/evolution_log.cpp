#include "evo/evolution_log.h"

#include "evo/data_io.h"
#include "evo/log.h"

#include <cstdio>
#include <fstream>
#include <utility>

namespace evo {
namespace fs = std::filesystem;

namespace {
constexpr const char* kHeader =
    "cycle,objective,status,elapsed_seconds,quality_placeholder,strategy,start_ts,end_ts,reason_code,context";
constexpr size_t kColumns = 10;

std::string format_seconds(double value) {
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%.2f", value);
  return buffer;
}
} // namespace

std::string csv_escape(const std::string& field) {
  if (field.find_first_of(",\"\r\n") == std::string::npos) {
    return field;
  }
  std::string out = "\"";
  for (char c : field) {
    if (c == '"') out += '"';
    out += c;
  }
  out += '"';
  return out;
}

std::vector<std::vector<std::string>> parse_csv(const std::string& text) {
  std::vector<std::vector<std::string>> rows;
  std::vector<std::string> row;
  std::string field;
  bool quoted = false;
  bool row_has_data = false;
  for (size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (quoted) {
      if (c == '"') {
        if (i + 1 < text.size() && text[i + 1] == '"') {
          field += '"';
          ++i;
        } else {
          quoted = false;
        }
      } else {
        field += c;
      }
      continue;
    }
    if (c == '"') {
      quoted = true;
      row_has_data = true;
    } else if (c == ',') {
      row.push_back(field);
      field.clear();
      row_has_data = true;
    } else if (c == '\n' || c == '\r') {
      if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') ++i;
      if (row_has_data || !field.empty()) {
        row.push_back(field);
        rows.push_back(row);
      }
      row.clear();
      field.clear();
      row_has_data = false;
    } else {
      field += c;
      row_has_data = true;
    }
  }
  if (row_has_data || !field.empty()) {
    row.push_back(field);
    rows.push_back(row);
  }
  return rows;
}

bool EvolutionLog::append(const EvolutionRecord& record) const {
  std::error_code ec;
  const bool fresh = !fs::exists(path_, ec) || fs::file_size(path_, ec) == 0;
  if (path_.has_parent_path()) {
    fs::create_directories(path_.parent_path(), ec);
  }
  std::ofstream out(path_, std::ios::app | std::ios::binary);
  if (!out) {
    log::warn("evolution log append failed: " + path_.string());
    return false;
  }
  if (fresh) {
    out << kHeader << "\n";
  }
  out << record.cycle << ',' << csv_escape(record.objective) << ',' << csv_escape(record.status) << ','
      << format_seconds(record.elapsed_seconds) << ',' << csv_escape(record.quality) << ','
      << csv_escape(record.strategy) << ',' << csv_escape(record.start_ts) << ',' << csv_escape(record.end_ts) << ','
      << csv_escape(record.reason_code) << ',' << csv_escape(record.context) << "\n";
  return static_cast<bool>(out);
}

bool EvolutionLog::read_all(std::vector<EvolutionRecord>& out, std::string& error) const {
  std::error_code ec;
  if (!fs::exists(path_, ec)) {
    out.clear();
    return true;
  }
  const auto rows = parse_csv(data::read_text_file(path_));
  std::vector<EvolutionRecord> records;
  for (size_t i = 0; i < rows.size(); ++i) {
    const auto& row = rows[i];
    if (i == 0 && !row.empty() && row[0] == "cycle") {
      continue;
    }
    if (row.size() != kColumns) {
      error = "evolution log row " + std::to_string(i) + " has " + std::to_string(row.size()) + " columns";
      return false;
    }
    EvolutionRecord record;
    try {
      record.cycle = std::stoi(row[0]);
      record.elapsed_seconds = std::stod(row[3]);
    } catch (const std::exception&) {
      error = "evolution log row " + std::to_string(i) + " has a malformed number";
      return false;
    }
    record.objective = row[1];
    record.status = row[2];
    record.quality = row[4];
    record.strategy = row[5];
    record.start_ts = row[6];
    record.end_ts = row[7];
    record.reason_code = row[8];
    record.context = row[9];
    records.push_back(std::move(record));
  }
  out = std::move(records);
  return true;
}

} // namespace evo
