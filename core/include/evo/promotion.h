#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "evo/patch.h"

namespace evo {

struct PromotionResult {
  bool success = false;
  std::string reason_code;
  std::string message;
  std::vector<std::string> promoted;
  std::vector<std::string> deleted;
};

// Copies every patched file from the sandbox over the real tree, or deletes
// the real file when the sandbox no longer has it. Each touched file gets an
// audit line when `audit_path` is non-empty.
PromotionResult promote_changes(const std::filesystem::path& sandbox_root, const std::filesystem::path& real_root,
                                const std::vector<PatchInstruction>& patches,
                                const std::filesystem::path& audit_path = {});

} // namespace evo
