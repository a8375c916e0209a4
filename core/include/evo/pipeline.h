#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "evo/config.h"
#include "evo/patch.h"
#include "evo/sandbox.h"
#include "evo/strategy.h"
#include "evo/validation_step.h"

namespace evo {

struct PipelineResult {
  ValidationStepResult result;
  std::vector<std::string> executed_steps;
  std::map<std::string, std::string> file_status;
};

// Runs the strategy's steps in order against ctx.base_path, stopping at the
// first failure. A step that throws fails as <STEP>_UNEXPECTED_ERROR.
PipelineResult run_pipeline(const ValidationStrategy& strategy, const StepContext& ctx);

struct StrategyRunOptions {
  std::filesystem::path project_root;
  ToolConfig tools;
  const SandboxManager* sandbox = nullptr;
  std::filesystem::path audit_path;
};

struct StrategyRun {
  ValidationStepResult result;
  std::vector<std::string> executed_steps;
  std::map<std::string, std::string> applied_files;
  bool used_sandbox = false;
  // The real project tree was changed (promotion or direct apply).
  bool changed_project = false;
};

// Pipeline plus sandbox staging and promotion. The sandbox is gone by the
// time this returns, whatever the outcome.
StrategyRun execute_strategy(const ValidationStrategy& strategy, const std::vector<PatchInstruction>& patches,
                             const StrategyRunOptions& options);

} // namespace evo
