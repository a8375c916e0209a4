#pragma once

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace evo {

struct EvolutionRecord {
  int cycle = 0;
  std::string objective;
  std::string status;
  double elapsed_seconds = 0.0;
  std::string quality = "N/A";
  std::string strategy;
  std::string start_ts;
  std::string end_ts;
  std::string reason_code;
  std::string context;
};

// One CSV row per cycle; the header is written when the file is created.
class EvolutionLog {
 public:
  explicit EvolutionLog(std::filesystem::path path) : path_(std::move(path)) {}

  bool append(const EvolutionRecord& record) const;
  bool read_all(std::vector<EvolutionRecord>& out, std::string& error) const;

  const std::filesystem::path& path() const { return path_; }

 private:
  std::filesystem::path path_;
};

std::string csv_escape(const std::string& field);
// RFC 4180 rows; quoted fields may span lines.
std::vector<std::vector<std::string>> parse_csv(const std::string& text);

} // namespace evo
