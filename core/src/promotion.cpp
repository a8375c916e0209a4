#include "evo/promotion.h"

#include "evo/data_io.h"
#include "evo/log.h"
#include "evo/reason_codes.h"

#include <nlohmann/json.hpp>

namespace evo {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {
void audit_file(const fs::path& audit_path, const char* action, const fs::path& target, const std::string& hash) {
  if (audit_path.empty()) {
    return;
  }
  json audit;
  audit["time"] = data::now_iso();
  audit["action_type"] = action;
  audit["params_hash"] = hash;
  audit["result"] = "ok";
  audit["message"] = target.string();
  audit["files_touched"] = {target.string()};
  data::append_audit_line(audit_path, audit);
}
} // namespace

PromotionResult promote_changes(const fs::path& sandbox_root, const fs::path& real_root,
                                const std::vector<PatchInstruction>& patches, const fs::path& audit_path) {
  PromotionResult result;
  try {
    for (const auto& rel : distinct_patch_paths(patches)) {
      const auto from = resolve_patch_path(sandbox_root, rel);
      const auto to = resolve_patch_path(real_root, rel);
      if (!from || !to) {
        result.reason_code = reason::kPromotionFailed;
        result.message = "unsafe path during promotion: " + rel;
        return result;
      }

      if (fs::exists(*from)) {
        if (to->has_parent_path()) {
          fs::create_directories(to->parent_path());
        }
        fs::copy_file(*from, *to, fs::copy_options::overwrite_existing);
        result.promoted.push_back(rel);
        audit_file(audit_path, "promote", *to, data::to_hex(data::fnv1a_64(data::read_text_file(*to))));
      } else if (fs::exists(*to)) {
        fs::remove(*to);
        result.deleted.push_back(rel);
        audit_file(audit_path, "promote_delete", *to, "");
      }
    }
  } catch (const fs::filesystem_error& e) {
    log::error(std::string("promotion failed: ") + e.what());
    result.reason_code = reason::kPromotionFailed;
    result.message = e.what();
    return result;
  }

  result.success = true;
  result.reason_code = reason::kAppliedAndValidated;
  result.message = std::to_string(result.promoted.size()) + " promoted, " + std::to_string(result.deleted.size()) +
                   " deleted";
  log::info("promotion: " + result.message);
  return result;
}

} // namespace evo
