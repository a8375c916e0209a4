#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#if EVO_ENABLE_YAML
#include <yaml-cpp/yaml.h>
#endif

namespace evo::data {

#if EVO_ENABLE_YAML
bool load_yaml_file(const std::filesystem::path& path, YAML::Node& out);
#endif

bool load_json_file(const std::filesystem::path& path, nlohmann::json& out);
bool save_json_file(const std::filesystem::path& path, const nlohmann::json& node);

// Binary-safe; an unreadable file yields an empty string.
std::string read_text_file(const std::filesystem::path& path);
// Creates missing parent directories.
bool write_text_file(const std::filesystem::path& path, const std::string& contents);

// JSON-lines audit trail: {time, action_type, params_hash, result, message, files_touched}.
void append_audit_line(const std::filesystem::path& audit_path, const nlohmann::json& record);

// Tool output can be any bytes; invalid UTF-8 is written as U+FFFD.
std::string dump_json(const nlohmann::json& node, int indent = -1);

// Byte offsets that never split a UTF-8 sequence: `floor` moves back to the
// start of the character containing pos, `ceil` forward to the next start.
size_t utf8_floor(const std::string& text, size_t pos);
size_t utf8_ceil(const std::string& text, size_t pos);

std::string now_iso();
uint64_t fnv1a_64(const std::string& data);
std::string to_hex(uint64_t value);

} // namespace evo::data
