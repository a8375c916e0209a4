#include "evo/patch.h"

#include "evo/data_io.h"
#include "evo/log.h"
#include "evo/reason_codes.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <regex>
#include <sstream>
#include <system_error>
#include <unordered_set>

namespace evo {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::string to_upper(std::string value) {
  for (auto& c : value) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  return value;
}

bool read_existing_file(const fs::path& path, std::string& out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  std::ostringstream ss;
  ss << in.rdbuf();
  out = ss.str();
  return true;
}

bool read_optional_text(const json& j, const char* key, std::optional<std::string>& out, std::string& error) {
  if (!j.contains(key) || j[key].is_null()) {
    return true;
  }
  const auto& node = j[key];
  if (node.is_string()) {
    out = node.get<std::string>();
    return true;
  }
  if (node.is_array()) {
    std::string joined;
    for (size_t i = 0; i < node.size(); ++i) {
      if (!node[i].is_string()) {
        error = std::string(key) + " array must contain strings";
        return false;
      }
      if (i > 0) joined += "\n";
      joined += node[i].get<std::string>();
    }
    out = joined;
    return true;
  }
  error = std::string(key) + " must be a string, a list of lines or null";
  return false;
}

bool parse_line_number(const json& node, std::optional<int>& out, std::string& error) {
  if (node.is_null()) return true;
  if (node.is_number_integer()) {
    out = node.get<int>();
    return true;
  }
  if (node.is_string()) {
    const auto text = node.get<std::string>();
    int value = 0;
    const auto* begin = text.data();
    const auto* end = text.data() + text.size();
    const auto res = std::from_chars(begin, end, value);
    if (res.ec == std::errc() && res.ptr == end) {
      out = value;
      return true;
    }
  }
  error = "line_number must be an integer";
  return false;
}

size_t count_lines(const std::string& text) {
  if (text.empty()) return 0;
  size_t n = static_cast<size_t>(std::count(text.begin(), text.end(), '\n'));
  if (text.back() != '\n') ++n;
  return n;
}

size_t line_offset(const std::string& text, size_t line_index) {
  size_t offset = 0;
  for (size_t i = 0; i < line_index; ++i) {
    const auto nl = text.find('\n', offset);
    if (nl == std::string::npos) return text.size();
    offset = nl + 1;
  }
  return offset;
}

std::string with_newline(const std::string& content) {
  if (content.empty() || content.back() == '\n') return content;
  return content + "\n";
}

bool locate_block(const std::string& text, const PatchInstruction& patch, size_t& pos, size_t& len,
                  std::string& reason_code, std::string& message) {
  const std::string& pattern = *patch.match;
  if (pattern.empty()) {
    reason_code = reason::kInvalidPatch;
    message = "empty match block for " + patch.file_path;
    return false;
  }
  if (patch.is_regex) {
    try {
      const std::regex re(pattern, std::regex::ECMAScript);
      std::smatch m;
      if (std::regex_search(text, m, re)) {
        pos = static_cast<size_t>(m.position(0));
        len = static_cast<size_t>(m.length(0));
        return true;
      }
    } catch (const std::regex_error& e) {
      reason_code = reason::kInvalidPatch;
      message = "invalid regex '" + pattern + "': " + e.what();
      return false;
    }
  } else {
    const auto found = text.find(pattern);
    if (found != std::string::npos) {
      pos = found;
      len = pattern.size();
      return true;
    }
  }
  reason_code = reason::kBlockNotFound;
  message = "block not found in " + patch.file_path + ": " + pattern;
  return false;
}

PatchApplyResult fail(const PatchInstruction& patch, const std::string& reason_code, const std::string& message) {
  PatchApplyResult result;
  result.success = false;
  result.reason_code = reason_code;
  result.message = message;
  result.file_status[patch.file_path] = "failed: " + reason_code;
  return result;
}

PatchApplyResult ok(const PatchInstruction& patch, const std::string& status) {
  PatchApplyResult result;
  result.success = true;
  result.reason_code = reason::kPatchesApplied;
  result.applied = 1;
  result.file_status[patch.file_path] = status;
  return result;
}

} // namespace

const char* patch_operation_name(PatchOperation op) {
  switch (op) {
    case PatchOperation::Insert:
      return "INSERT";
    case PatchOperation::Replace:
      return "REPLACE";
    case PatchOperation::Delete:
      return "DELETE";
  }
  return "UNKNOWN";
}

bool parse_patch_instruction(const json& j, PatchInstruction& out, std::string& error) {
  if (!j.is_object()) {
    error = "patch must be an object";
    return false;
  }
  if (!j.contains("operation") || !j["operation"].is_string()) {
    error = "patch missing operation";
    return false;
  }
  if (!j.contains("file_path") || !j["file_path"].is_string() || j["file_path"].get<std::string>().empty()) {
    error = "patch missing file_path";
    return false;
  }

  PatchInstruction patch;
  const auto op = to_upper(j["operation"].get<std::string>());
  const char* block_key = nullptr;
  if (op == "INSERT") {
    patch.operation = PatchOperation::Insert;
  } else if (op == "REPLACE") {
    patch.operation = PatchOperation::Replace;
    block_key = "block_to_replace";
  } else if (op == "DELETE" || op == "DELETE_BLOCK") {
    patch.operation = PatchOperation::Delete;
    block_key = "block_to_delete";
  } else {
    error = "unknown operation: " + op;
    return false;
  }
  patch.file_path = j["file_path"].get<std::string>();

  if (!read_optional_text(j, "match", patch.match, error)) return false;
  if (!patch.match && block_key && !read_optional_text(j, block_key, patch.match, error)) return false;
  if (!read_optional_text(j, "content", patch.content, error)) return false;
  if (j.contains("line_number") && !parse_line_number(j["line_number"], patch.line_number, error)) {
    return false;
  }
  if (j.contains("is_regex")) {
    if (!j["is_regex"].is_boolean()) {
      error = "is_regex must be a boolean";
      return false;
    }
    patch.is_regex = j["is_regex"].get<bool>();
  }

  out = patch;
  return true;
}

bool parse_patch_list(const json& list, std::vector<PatchInstruction>& out, std::string& error) {
  if (!list.is_array()) {
    error = "patches_to_apply must be an array";
    return false;
  }
  std::vector<PatchInstruction> patches;
  patches.reserve(list.size());
  for (size_t i = 0; i < list.size(); ++i) {
    PatchInstruction patch;
    std::string item_error;
    if (!parse_patch_instruction(list[i], patch, item_error)) {
      error = "patch " + std::to_string(i) + ": " + item_error;
      return false;
    }
    patches.push_back(patch);
  }
  out = std::move(patches);
  return true;
}

json patch_to_json(const PatchInstruction& patch) {
  json j;
  j["operation"] = patch_operation_name(patch.operation);
  j["file_path"] = patch.file_path;
  j["match"] = patch.match ? json(*patch.match) : json();
  j["is_regex"] = patch.is_regex;
  j["content"] = patch.content ? json(*patch.content) : json();
  j["line_number"] = patch.line_number ? json(*patch.line_number) : json();
  return j;
}

json patches_to_json(const std::vector<PatchInstruction>& patches) {
  json list = json::array();
  for (const auto& patch : patches) {
    list.push_back(patch_to_json(patch));
  }
  return list;
}

std::optional<fs::path> resolve_patch_path(const fs::path& base_path, const std::string& file_path) {
  if (file_path.empty()) return std::nullopt;
  const fs::path rel = fs::path(file_path).lexically_normal();
  if (rel.empty() || rel.is_absolute() || rel.has_root_name() || rel == ".") {
    return std::nullopt;
  }
  const auto first = *rel.begin();
  if (first == ".." || first == ".git") {
    return std::nullopt;
  }
  const fs::path full = base_path / rel;

  // Symlinks in the tree must not carry a write outside of it.
  std::error_code ec;
  const auto real_base = fs::weakly_canonical(base_path, ec);
  if (ec) return std::nullopt;
  const auto real_full = fs::weakly_canonical(full, ec);
  if (ec) return std::nullopt;
  const auto inside = real_full.lexically_relative(real_base);
  if (inside.empty() || inside == "." || *inside.begin() == ".." || *inside.begin() == ".git") {
    return std::nullopt;
  }
  return full;
}

bool is_protected_patch_path(const std::string& file_path, const std::vector<std::string>& protected_paths) {
  const fs::path rel = fs::path(file_path).lexically_normal();
  for (auto entry : protected_paths) {
    while (!entry.empty() && entry.back() == '/') {
      entry.pop_back();
    }
    if (entry.empty()) continue;
    const fs::path prefix = fs::path(entry).lexically_normal();
    auto rel_it = rel.begin();
    auto prefix_it = prefix.begin();
    for (; rel_it != rel.end() && prefix_it != prefix.end(); ++rel_it, ++prefix_it) {
      if (*rel_it != *prefix_it) break;
    }
    if (prefix_it == prefix.end()) {
      return true;
    }
  }
  return false;
}

std::vector<std::string> distinct_patch_paths(const std::vector<PatchInstruction>& patches) {
  std::vector<std::string> out;
  std::unordered_set<std::string> seen;
  for (const auto& patch : patches) {
    if (patch.file_path.empty()) continue;
    const auto key = fs::path(patch.file_path).lexically_normal().generic_string();
    if (seen.insert(key).second) {
      out.push_back(patch.file_path);
    }
  }
  return out;
}

void insert_into_text(std::string& text, const std::string& content, const std::optional<int>& line_number) {
  if (content.empty()) return;
  const size_t total = count_lines(text);
  const bool append = !line_number.has_value() || (*line_number > 0 && static_cast<size_t>(*line_number) > total);
  if (append) {
    if (!text.empty() && text.back() != '\n') {
      text += '\n';
      text += content;
    } else {
      text += with_newline(content);
    }
    return;
  }
  const size_t index = *line_number <= 1 ? 0 : static_cast<size_t>(*line_number - 1);
  text.insert(line_offset(text, index), with_newline(content));
}

bool replace_in_text(std::string& text, const PatchInstruction& patch, std::string& reason_code,
                     std::string& message) {
  size_t pos = 0;
  size_t len = 0;
  if (!locate_block(text, patch, pos, len, reason_code, message)) {
    return false;
  }
  text.replace(pos, len, patch.content.value_or(""));
  return true;
}

bool delete_from_text(std::string& text, const PatchInstruction& patch, std::string& reason_code,
                      std::string& message) {
  size_t begin = 0;
  size_t len = 0;
  if (!locate_block(text, patch, begin, len, reason_code, message)) {
    return false;
  }
  size_t end = begin + len;
  const bool at_line_start = begin == 0 || text[begin - 1] == '\n';
  // A block that fills whole lines takes its line terminator with it.
  if (len > 0 && at_line_start && text[end - 1] != '\n') {
    if (end < text.size() && text[end] == '\n') {
      ++end;
    } else if (end == text.size() && begin > 0) {
      --begin;
    }
  }
  text.erase(begin, end - begin);
  return true;
}

PatchApplyResult apply_patch(const fs::path& base_path, const PatchInstruction& patch) {
  const auto full_path = resolve_patch_path(base_path, patch.file_path);
  if (!full_path) {
    return fail(patch, reason::kInvalidPatch, "unsafe or empty patch path: " + patch.file_path);
  }

  std::error_code ec;
  const bool exists = fs::exists(*full_path, ec) && !ec;
  if (exists && fs::is_directory(*full_path, ec)) {
    return fail(patch, reason::kInvalidPatch, "patch target is a directory: " + patch.file_path);
  }

  std::string text;
  if (exists && !read_existing_file(*full_path, text)) {
    return fail(patch, reason::kPatchIoError, "failed to read " + full_path->string());
  }

  auto write_back = [&](const std::string& contents, const char* status) {
    if (!data::write_text_file(*full_path, contents)) {
      return fail(patch, reason::kPatchIoError, "failed to write " + full_path->string());
    }
    return ok(patch, status);
  };

  std::string reason_code;
  std::string message;
  switch (patch.operation) {
    case PatchOperation::Insert: {
      if (!exists) {
        return write_back(patch.content.value_or(""), "created");
      }
      insert_into_text(text, patch.content.value_or(""), patch.line_number);
      return write_back(text, "applied");
    }
    case PatchOperation::Replace: {
      if (!patch.match) {
        return write_back(patch.content.value_or(""), exists ? "applied" : "created");
      }
      if (!exists) {
        return fail(patch, reason::kBlockNotFound, "replace target missing: " + patch.file_path);
      }
      if (!replace_in_text(text, patch, reason_code, message)) {
        return fail(patch, reason_code, message);
      }
      return write_back(text, "applied");
    }
    case PatchOperation::Delete: {
      if (!patch.match) {
        if (!exists) {
          evo::log::warn("delete target already absent: " + patch.file_path);
          PatchApplyResult skipped = ok(patch, "skipped");
          skipped.applied = 0;
          return skipped;
        }
        fs::remove(*full_path, ec);
        if (ec) {
          return fail(patch, reason::kPatchIoError, "failed to delete " + full_path->string() + ": " + ec.message());
        }
        return ok(patch, "deleted");
      }
      if (!exists) {
        return fail(patch, reason::kBlockNotFound, "delete target missing: " + patch.file_path);
      }
      if (!delete_from_text(text, patch, reason_code, message)) {
        return fail(patch, reason_code, message);
      }
      return write_back(text, "applied");
    }
  }
  return fail(patch, reason::kInvalidPatch, "unsupported operation");
}

PatchApplyResult apply_patches(const fs::path& base_path, const std::vector<PatchInstruction>& patches,
                               const std::vector<std::string>& protected_paths) {
  for (const auto& patch : patches) {
    if (is_protected_patch_path(patch.file_path, protected_paths)) {
      evo::log::warn("patch targets an excluded path: " + patch.file_path);
      auto rejected = fail(patch, reason::kInvalidPatch, "patch targets an excluded path: " + patch.file_path);
      for (const auto& other : patches) {
        rejected.file_status.emplace(other.file_path, "skipped");
      }
      return rejected;
    }
  }

  PatchApplyResult total;
  total.success = true;
  total.reason_code = reason::kPatchesApplied;

  for (size_t i = 0; i < patches.size(); ++i) {
    const auto& patch = patches[i];
    evo::log::info("patch " + std::to_string(i + 1) + "/" + std::to_string(patches.size()) + ": " +
                   patch_operation_name(patch.operation) + " " + patch.file_path);
    const auto result = apply_patch(base_path, patch);
    for (const auto& kv : result.file_status) {
      total.file_status[kv.first] = kv.second;
    }
    total.applied += result.applied;
    if (!result.success) {
      evo::log::warn("patch " + std::to_string(i + 1) + " failed (" + result.reason_code + "): " + result.message);
      for (size_t j = i + 1; j < patches.size(); ++j) {
        total.file_status.emplace(patches[j].file_path, "skipped");
      }
      total.success = false;
      total.reason_code = result.reason_code;
      total.message = "patch " + std::to_string(i + 1) + ": " + result.message;
      return total;
    }
  }
  total.message = std::to_string(total.applied) + " patch(es) applied under " + base_path.string();
  return total;
}

} // namespace evo
