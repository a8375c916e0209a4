#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace evo {

enum class PatchOperation {
  Insert,
  Replace,
  Delete
};

// One structured edit against one file. Replace/Delete without `match`
// act on the whole file; Insert without `line_number` appends.
struct PatchInstruction {
  PatchOperation operation = PatchOperation::Insert;
  std::string file_path;
  std::optional<std::string> match;
  bool is_regex = false;
  std::optional<std::string> content;
  std::optional<int> line_number;
};

struct PatchApplyResult {
  bool success = false;
  std::string reason_code;
  std::string message;
  size_t applied = 0;
  // file_path -> "applied" | "created" | "deleted" | "failed: <reason>" | "skipped"
  std::map<std::string, std::string> file_status;
};

const char* patch_operation_name(PatchOperation op);

bool parse_patch_instruction(const nlohmann::json& j, PatchInstruction& out, std::string& error);
bool parse_patch_list(const nlohmann::json& list, std::vector<PatchInstruction>& out, std::string& error);
nlohmann::json patch_to_json(const PatchInstruction& patch);
nlohmann::json patches_to_json(const std::vector<PatchInstruction>& patches);

// Normalized path under base_path, or nullopt if the relative path is
// empty, absolute, climbs out of the base, points into .git, or resolves
// through a symlink to somewhere outside the base.
std::optional<std::filesystem::path> resolve_patch_path(const std::filesystem::path& base_path,
                                                        const std::string& file_path);

// True if file_path is one of, or lies under one of, the project-relative
// `protected_paths` (sandbox excludes: never copied, so never patchable).
bool is_protected_patch_path(const std::string& file_path, const std::vector<std::string>& protected_paths);

// Distinct file paths in first-seen order.
std::vector<std::string> distinct_patch_paths(const std::vector<PatchInstruction>& patches);

// Pure text transforms used by apply_patch. Inserted content always
// occupies whole lines; replace/delete return false with reason_code set
// when the block cannot be located in `text`.
void insert_into_text(std::string& text, const std::string& content, const std::optional<int>& line_number);
bool replace_in_text(std::string& text, const PatchInstruction& patch, std::string& reason_code,
                     std::string& message);
bool delete_from_text(std::string& text, const PatchInstruction& patch, std::string& reason_code,
                      std::string& message);

PatchApplyResult apply_patch(const std::filesystem::path& base_path, const PatchInstruction& patch);

// Applies in order; the first failing instruction stops the rest. A patch to
// a protected path fails the whole batch with INVALID_PATCH before any write.
PatchApplyResult apply_patches(const std::filesystem::path& base_path,
                               const std::vector<PatchInstruction>& patches,
                               const std::vector<std::string>& protected_paths = {});

} // namespace evo
