#include "evo/pipeline.h"

#include "evo/log.h"
#include "evo/promotion.h"
#include "evo/reason_codes.h"

#include <cctype>

namespace evo {

namespace {
std::string upper(std::string value) {
  for (auto& c : value) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  return value;
}
} // namespace

PipelineResult run_pipeline(const ValidationStrategy& strategy, const StepContext& ctx) {
  PipelineResult out;

  if (!strategy.unknown_steps.empty()) {
    out.result.success = false;
    out.result.reason_code = reason::kUnknownValidationStep;
    out.result.details = "unknown validation step: " + strategy.unknown_steps.front();
    log::error("strategy " + strategy.name + ": " + out.result.details);
    return out;
  }

  bool nothing_to_promote = false;
  for (size_t i = 0; i < strategy.steps.size(); ++i) {
    const std::string step_name =
        i < strategy.step_names.size() ? strategy.step_names[i] : step_kind_name(strategy.steps[i]);
    log::info("step " + step_name + " (" + (ctx.in_sandbox ? "sandbox" : "project") + ")");
    out.executed_steps.push_back(step_name);

    ValidationStepResult step_result;
    try {
      auto step = create_step(strategy.steps[i], ctx);
      step_result = step->execute();
    } catch (const std::exception& e) {
      step_result.success = false;
      step_result.reason_code = upper(step_name) + "_UNEXPECTED_ERROR";
      step_result.details = e.what();
    }

    for (const auto& kv : step_result.file_status) {
      out.file_status[kv.first] = kv.second;
    }
    if (!step_result.success) {
      log::warn("step " + step_name + " failed: " + step_result.reason_code);
      step_result.file_status = out.file_status;
      out.result = step_result;
      return out;
    }
    nothing_to_promote = nothing_to_promote || step_result.nothing_to_promote;
  }

  out.result.success = true;
  out.result.file_status = out.file_status;
  if (strategy.is_discard()) {
    out.result.reason_code = reason::kDiscarded;
  } else if (strategy.modifies_disk() && !ctx.patches.empty() && !nothing_to_promote) {
    out.result.reason_code = reason::kStrategySucceeded;
  } else {
    out.result.reason_code = reason::kNoChanges;
  }
  out.result.details = std::to_string(out.executed_steps.size()) + " step(s) passed";
  return out;
}

StrategyRun execute_strategy(const ValidationStrategy& strategy, const std::vector<PatchInstruction>& patches,
                             const StrategyRunOptions& options) {
  StrategyRun run;
  StepContext ctx;
  ctx.patches = patches;
  ctx.tools = options.tools;
  if (options.sandbox) {
    ctx.protected_paths = options.sandbox->excludes();
  }

  if (!strategy.needs_sandbox(patches.size())) {
    ctx.base_path = options.project_root;
    ctx.in_sandbox = false;
    const auto pipeline = run_pipeline(strategy, ctx);
    run.result = pipeline.result;
    run.executed_steps = pipeline.executed_steps;
    run.applied_files = pipeline.file_status;
    run.changed_project = pipeline.result.success && pipeline.result.reason_code == reason::kStrategySucceeded;
    return run;
  }

  const SandboxManager fallback;
  const SandboxManager& sandboxes = options.sandbox ? *options.sandbox : fallback;
  SandboxHandle sandbox;
  std::string error;
  if (!sandboxes.acquire(options.project_root, sandbox, error)) {
    run.result.success = false;
    run.result.reason_code = "SANDBOX_SETUP_FAILED";
    run.result.details = error;
    log::error("sandbox setup failed: " + error);
    return run;
  }
  run.used_sandbox = true;

  ctx.base_path = sandbox.path();
  ctx.in_sandbox = true;
  const auto pipeline = run_pipeline(strategy, ctx);
  run.result = pipeline.result;
  run.executed_steps = pipeline.executed_steps;
  run.applied_files = pipeline.file_status;

  if (pipeline.result.success && pipeline.result.reason_code == reason::kStrategySucceeded) {
    const auto promotion = promote_changes(sandbox.path(), options.project_root, patches, options.audit_path);
    run.result.reason_code = promotion.reason_code;
    run.result.details = promotion.message;
    run.result.success = promotion.success;
    run.changed_project = promotion.success;
  }

  sandboxes.release(sandbox);
  return run;
}

} // namespace evo
