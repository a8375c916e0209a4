#include "evo/cycle_state.h"

#include "evo/reason_codes.h"

#include <utility>

namespace evo {
using json = nlohmann::json;

bool parse_action_plan(const json& j, ActionPlan& out, std::string& error) {
  if (!j.is_object()) {
    error = "plan must be a JSON object";
    return false;
  }
  if (!j.contains("analysis") || !j["analysis"].is_string()) {
    error = "plan missing analysis";
    return false;
  }
  if (!j.contains("patches_to_apply")) {
    error = "plan missing patches_to_apply";
    return false;
  }

  ActionPlan plan;
  plan.analysis = j["analysis"].get<std::string>();
  if (!parse_patch_list(j["patches_to_apply"], plan.patches, error)) {
    return false;
  }
  if (j.contains("strategy_key") && j["strategy_key"].is_string()) {
    plan.strategy_key = j["strategy_key"].get<std::string>();
  }
  if (j.contains("capacitation_need") && j["capacitation_need"].is_string()) {
    plan.capacitation_need = j["capacitation_need"].get<std::string>();
  }
  out = std::move(plan);
  return true;
}

json action_plan_to_json(const ActionPlan& plan) {
  json j;
  j["analysis"] = plan.analysis;
  j["patches_to_apply"] = patches_to_json(plan.patches);
  if (!plan.strategy_key.empty()) {
    j["strategy_key"] = plan.strategy_key;
  }
  if (!plan.capacitation_need.empty()) {
    j["capacitation_need"] = plan.capacitation_need;
  }
  return j;
}

void CycleState::reset_for_new_cycle(const std::string& next_objective) {
  objective = next_objective;
  manifest.clear();
  plan = ActionPlan{};
  has_plan = false;
  strategy_key.clear();
  validation_result = ValidationStepResult{};
  validation_result.success = false;
  validation_result.reason_code = reason::kPending;
  validation_result.details = "cycle not started";
  applied_files.clear();
}

} // namespace evo
