#include "evo/data_io.h"

#include "evo/log.h"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace evo::data {

#if EVO_ENABLE_YAML
bool load_yaml_file(const std::filesystem::path& path, YAML::Node& out) {
  try {
    out = YAML::LoadFile(path.string());
  } catch (const std::exception& e) {
    evo::log::warn(std::string("YAML load failed: ") + path.string() + ": " + e.what());
    return false;
  }
  return true;
}
#endif

bool load_json_file(const std::filesystem::path& path, nlohmann::json& out) {
  std::ifstream in(path);
  if (!in) {
    evo::log::warn(std::string("JSON read failed: ") + path.string());
    return false;
  }
  try {
    in >> out;
  } catch (const std::exception& e) {
    evo::log::warn(std::string("JSON parse failed: ") + e.what());
    return false;
  }
  return true;
}

bool save_json_file(const std::filesystem::path& path, const nlohmann::json& node) {
  return write_text_file(path, dump_json(node, 2));
}

std::string read_text_file(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return {};
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

bool write_text_file(const std::filesystem::path& path, const std::string& contents) {
  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    evo::log::warn(std::string("failed to write file: ") + path.string());
    return false;
  }
  out << contents;
  return static_cast<bool>(out);
}

void append_audit_line(const std::filesystem::path& audit_path, const nlohmann::json& record) {
  std::error_code ec;
  std::filesystem::create_directories(audit_path.parent_path(), ec);
  std::ofstream out(audit_path, std::ios::app);
  if (!out) {
    evo::log::warn(std::string("audit append failed: ") + audit_path.string());
    return;
  }
  out << dump_json(record) << "\n";
}

std::string dump_json(const nlohmann::json& node, int indent) {
  return node.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

namespace {
bool is_continuation(unsigned char c) {
  return (c & 0xC0) == 0x80;
}
} // namespace

size_t utf8_floor(const std::string& text, size_t pos) {
  if (pos >= text.size()) {
    return text.size();
  }
  // A sequence is at most 4 bytes; stray continuation bytes are cut anywhere.
  size_t start = pos;
  for (int i = 0; i < 3 && start > 0 && is_continuation(static_cast<unsigned char>(text[start])); ++i) {
    --start;
  }
  return is_continuation(static_cast<unsigned char>(text[start])) ? pos : start;
}

size_t utf8_ceil(const std::string& text, size_t pos) {
  size_t end = pos;
  for (int i = 0; i < 3 && end < text.size() && is_continuation(static_cast<unsigned char>(text[end])); ++i) {
    ++end;
  }
  return end;
}

std::string now_iso() {
  using clock = std::chrono::system_clock;
  const auto now = clock::now();
  const auto t = clock::to_time_t(now);
  std::tm tm{};
  localtime_r(&t, &tm);
  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  return out.str();
}

uint64_t fnv1a_64(const std::string& data) {
  uint64_t hash = 1469598103934665603ull;
  for (unsigned char c : data) {
    hash ^= static_cast<uint64_t>(c);
    hash *= 1099511628211ull;
  }
  return hash;
}

std::string to_hex(uint64_t value) {
  std::ostringstream out;
  out << std::hex << std::setw(16) << std::setfill('0') << value;
  return out.str();
}

} // namespace evo::data
