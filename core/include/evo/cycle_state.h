#pragma once

#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "evo/patch.h"
#include "evo/validation_step.h"

namespace evo {

struct ActionPlan {
  std::string analysis;
  std::vector<PatchInstruction> patches;
  // Optional hints for the strategy selector.
  std::string strategy_key;
  std::string capacitation_need;
};

// Accepts {"analysis", "patches_to_apply", "strategy_key"?, "capacitation_need"?}.
bool parse_action_plan(const nlohmann::json& j, ActionPlan& out, std::string& error);
nlohmann::json action_plan_to_json(const ActionPlan& plan);

struct CycleState {
  std::string objective;
  std::string manifest;
  ActionPlan plan;
  bool has_plan = false;
  std::string strategy_key;
  ValidationStepResult validation_result;
  std::map<std::string, std::string> applied_files;

  void reset_for_new_cycle(const std::string& next_objective);
};

} // namespace evo
