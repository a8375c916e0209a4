#include "evo/cycle_engine.h"

#include "evo/data_io.h"
#include "evo/log.h"
#include "evo/manifest.h"
#include "evo/pipeline.h"
#include "evo/reason_codes.h"

#include <array>
#include <chrono>

namespace evo {
namespace fs = std::filesystem;

namespace {
constexpr std::array<const char*, 6> kCorrectionPrefixes = {
    "[AUTOMATIC CORRECTION TASK]", "[CORRECTION TASK - SYNTAX]", "[CORRECTION TASK - TEST]",
    "[CORRECTION TASK - LOGIC]",   "[REVISED OBJECTIVE",        "[MODIFIED OBJECTIVE",
};

std::string clip(const std::string& text, size_t max_chars) {
  if (text.size() <= max_chars) return text;
  return text.substr(0, data::utf8_floor(text, max_chars)) + "...";
}

std::vector<std::string> engine_excludes(const EngineContext& ctx) {
  std::vector<std::string> excludes = ctx.config.sandbox_excludes;
  const auto rel = ctx.paths.state.lexically_relative(ctx.paths.root);
  if (!rel.empty() && *rel.begin() != "..") {
    excludes.push_back(rel.generic_string());
  }
  return excludes;
}
} // namespace

const char* cycle_phase_name(CyclePhase phase) {
  switch (phase) {
    case CyclePhase::AwaitObjective:
      return "AwaitObjective";
    case CyclePhase::Planning:
      return "Planning";
    case CyclePhase::StrategySelection:
      return "StrategySelection";
    case CyclePhase::Capacitation:
      return "Capacitation";
    case CyclePhase::ExecuteStrategy:
      return "ExecuteStrategy";
    case CyclePhase::SanityCheck:
      return "SanityCheck";
    case CyclePhase::PromoteCommit:
      return "PromoteCommit";
    case CyclePhase::Rollback:
      return "Rollback";
    case CyclePhase::RecordOutcome:
      return "RecordOutcome";
  }
  return "Unknown";
}

bool is_correction_objective(const std::string& objective) {
  for (const auto* prefix : kCorrectionPrefixes) {
    if (objective.rfind(prefix, 0) == 0) {
      return true;
    }
  }
  return false;
}

CycleEngine::CycleEngine(EngineContext& ctx) : ctx_(ctx), sandbox_(engine_excludes(ctx)) {}

void CycleEngine::enter(CyclePhase phase, CycleOutcome& outcome) {
  outcome.phases.push_back(phase);
  log::info(std::string("phase: ") + cycle_phase_name(phase));
}

void CycleEngine::fail(const std::string& reason_code, const std::string& details) {
  state_.validation_result.success = false;
  state_.validation_result.reason_code = reason_code;
  state_.validation_result.details = details;
}

std::string CycleEngine::last_failure_context(const std::string& objective) const {
  if (!ctx_.memory) return {};
  for (const auto& entry : ctx_.memory->ledger().newest_first()) {
    if (entry.objective != objective) continue;
    if (entry.status == OutcomeStatus::Success) return {};
    return entry.reason_code;
  }
  return {};
}

CycleOutcome CycleEngine::run_cycle(const std::string& objective) {
  ++cycle_count_;
  capacitation_queued_ = false;
  const auto started = std::chrono::steady_clock::now();
  const auto start_ts = data::now_iso();

  CycleOutcome outcome;
  outcome.cycle = cycle_count_;
  outcome.objective = objective;
  state_.reset_for_new_cycle(objective);
  log::info("=== cycle " + std::to_string(cycle_count_) + " ===");
  log::info("objective: " + clip(objective, 200));

  const int threshold = ctx_.config.degenerate_loop_threshold;
  if (ctx_.memory && is_degenerate(ctx_.memory->ledger(), objective, threshold)) {
    const std::string details = "objective failed " + std::to_string(threshold) +
                                " consecutive times; discarded";
    log::error("degenerate loop detected: " + clip(objective, 120));
    fail(reason::kDegenerativeLoop, details);
    outcome.degenerate = true;
  } else {
    try {
      execute_phases(outcome);
    } catch (const std::exception& e) {
      log::error(std::string("cycle aborted by exception: ") + e.what());
      fail(reason::kCycleException, e.what());
    }
  }

  const double elapsed =
      std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
  record_outcome(outcome, start_ts, elapsed);
  return outcome;
}

void CycleEngine::execute_phases(CycleOutcome& outcome) {
  const auto& objective = state_.objective;

  enter(CyclePhase::Planning, outcome);
  ManifestOptions manifest_options;
  manifest_options.excludes = sandbox_.excludes();
  state_.manifest = render_manifest(ctx_.paths.root, ctx_.vcs, manifest_options);
  if (!ctx_.paths.manifest.empty() && !data::write_text_file(ctx_.paths.manifest, state_.manifest)) {
    log::warn("failed to write manifest: " + ctx_.paths.manifest.string());
  }
  if (!ctx_.planner) {
    fail(reason::kPlanningFailed, "no planner configured");
    return;
  }
  const std::string history = ctx_.memory ? ctx_.memory->history_summary() : std::string();
  auto planned = ctx_.planner->plan(objective, state_.manifest, history);
  if (!planned.ok) {
    log::error("planning failed: " + planned.error);
    fail(reason::kPlanningFailed, planned.error);
    return;
  }
  state_.plan = planned.plan;
  state_.has_plan = true;
  log::info("plan: " + std::to_string(state_.plan.patches.size()) + " patch(es); " + clip(state_.plan.analysis, 200));

  enter(CyclePhase::StrategySelection, outcome);
  std::string key;
  if (is_correction_objective(objective)) {
    key = ctx_.config.correction_strategy;
    log::info("correction objective; using " + key);
    if (!ctx_.strategies.contains(key)) {
      state_.strategy_key = key;
      fail(reason::kConfigError, "correction strategy not defined: " + key);
      return;
    }
  } else {
    if (!ctx_.selector) {
      fail(reason::kStrategySelectionFailed, "no strategy selector configured");
      return;
    }
    const auto decision = ctx_.selector->select(state_.plan, last_failure_context(objective));
    if (decision.kind == DecisionKind::Error) {
      fail(reason::kStrategySelectionFailed, decision.error);
      return;
    }
    if (decision.kind == DecisionKind::CapacitationRequired) {
      enter(CyclePhase::Capacitation, outcome);
      state_.strategy_key = kCapacitationSentinel;
      const auto capacitation = ctx_.generator
                                    ? ctx_.generator->capacitation_objective(decision.capacitation_need, objective)
                                    : std::string(kCapacitationPrefix) + " " + decision.capacitation_need;
      if (ctx_.queue) {
        ctx_.queue->push(objective);
        ctx_.queue->push(capacitation);
        capacitation_queued_ = true;
      }
      log::info("capability gap; queued: " + clip(capacitation, 120));
      fail(reason::kCapacitationRequired, decision.capacitation_need);
      return;
    }
    key = decision.strategy_key;
  }
  state_.strategy_key = key;

  ValidationStrategy strategy;
  std::string error;
  if (!ctx_.strategies.resolve(key, strategy, error)) {
    fail(reason::kStrategySelectionFailed, error);
    return;
  }

  enter(CyclePhase::ExecuteStrategy, outcome);
  StrategyRunOptions options;
  options.project_root = ctx_.paths.root;
  options.tools = ctx_.config.tools;
  options.sandbox = &sandbox_;
  options.audit_path = ctx_.paths.audit_log;
  const auto run = execute_strategy(strategy, state_.plan.patches, options);
  state_.applied_files = run.applied_files;
  state_.validation_result = run.result;
  outcome.executed_steps = run.executed_steps;
  log::info("strategy " + key + ": " + run.result.reason_code);
  if (!run.result.success || !run.changed_project) {
    return;
  }

  if (strategy.skips_sanity_check()) {
    log::info("sanity check skipped; changes left uncommitted");
    return;
  }

  enter(CyclePhase::SanityCheck, outcome);
  StepContext sanity_ctx;
  sanity_ctx.base_path = ctx_.paths.root;
  sanity_ctx.patches = state_.plan.patches;
  sanity_ctx.in_sandbox = false;
  sanity_ctx.tools = ctx_.config.tools;
  ValidationStepResult sanity;
  try {
    sanity = create_step(strategy.sanity_check, sanity_ctx)->execute();
  } catch (const std::exception& e) {
    sanity.success = false;
    sanity.reason_code = "SANITY_CHECK_UNEXPECTED_ERROR";
    sanity.details = e.what();
  }

  if (!sanity.success) {
    enter(CyclePhase::Rollback, outcome);
    log::error("sanity check " + strategy.sanity_check_step + " failed: " + sanity.reason_code);
    std::string rollback_note = "rollback skipped (no version control)";
    if (ctx_.vcs) {
      const auto rolled_back = ctx_.vcs->rollback(distinct_patch_paths(state_.plan.patches));
      rollback_note = rolled_back.ok ? "rollback succeeded" : "rollback FAILED: " + rolled_back.output;
    }
    fail(reason::regression_reason(strategy.sanity_check_step),
         "sanity check failed (" + sanity.reason_code + "): " + sanity.details + "\n" + rollback_note);
    return;
  }

  enter(CyclePhase::PromoteCommit, outcome);
  if (!ctx_.vcs) {
    log::warn("no version control; promoted changes not committed");
    return;
  }
  const auto message = ctx_.generator ? ctx_.generator->commit_message(objective, state_.plan.analysis)
                                      : std::string("evo: automated change");
  auto committed = ctx_.vcs->add_all();
  if (committed.ok) {
    committed = ctx_.vcs->commit(message);
  }
  if (!committed.ok) {
    fail(reason::kCommitFailed, "commit failed: " + committed.output + committed.error);
    return;
  }
  log::info("committed: " + message);
  state_.validation_result.details += "\ncommitted: " + message;
}

void CycleEngine::record_outcome(CycleOutcome& outcome, const std::string& start_ts, double elapsed_seconds) {
  enter(CyclePhase::RecordOutcome, outcome);
  const auto& result = state_.validation_result;
  outcome.success = result.success;
  outcome.reason_code = result.reason_code;
  outcome.details = result.details;
  outcome.strategy_key = state_.strategy_key;
  const auto& objective = state_.objective;

  try {
    if (outcome.degenerate) {
      if (ctx_.memory) ctx_.memory->record_discard(objective, result.reason_code, result.details);
    } else if (result.success) {
      log::info("cycle succeeded: " + result.reason_code);
      if (ctx_.memory) {
        ctx_.memory->record_success(objective, state_.strategy_key, result.reason_code, result.details);
        if (objective.rfind(kCapacitationPrefix, 0) == 0) {
          ctx_.memory->add_capability("Capacitation task completed and validated: " + objective, objective);
        }
      }
      if (!limit_mode() && ctx_.generator && ctx_.queue) {
        const std::string history = ctx_.memory ? ctx_.memory->history_summary() : std::string();
        const auto next = ctx_.generator->next_objective(state_.manifest, history, objective);
        if (next && !next->empty()) {
          ctx_.queue->push(*next);
          outcome.followup_queued = true;
          log::info("next objective: " + clip(*next, 120));
        }
      }
    } else {
      log::warn("cycle failed: " + result.reason_code + ": " + clip(result.details, 400));
      if (ctx_.memory) ctx_.memory->record_failure(objective, result.reason_code, result.details);

      const bool correctable = reason::is_correctable(result.reason_code);
      if (correctable && !capacitation_queued_ && !limit_mode() && ctx_.queue) {
        if (is_correction_objective(objective)) {
          // A failed correction falls back to the original, which is still queued.
          log::warn("correction attempt failed; not nesting another correction");
        } else {
          CorrectionRequest request;
          request.objective = objective;
          request.reason_code = result.reason_code;
          request.details = result.details;
          request.patches_json = state_.has_plan ? data::dump_json(patches_to_json(state_.plan.patches), 2) : "N/A";
          const auto correction = ctx_.generator ? ctx_.generator->correction_objective(request)
                                                 : std::string(kCorrectionPrefix) + " " + objective;
          ctx_.queue->push(objective);
          ctx_.queue->push(correction);
          outcome.correction_queued = true;
          log::info("correction queued for " + result.reason_code);
        }
      } else if (!correctable) {
        log::warn("failure " + result.reason_code + " is not correctable; moving on");
      }
    }
  } catch (const std::exception& e) {
    log::error(std::string("recording outcome failed: ") + e.what());
  }

  // Each sink is guarded on its own so a failing one never skips the other.
  if (ctx_.evolution_log) {
    try {
      EvolutionRecord record;
      record.cycle = outcome.cycle;
      record.objective = objective;
      record.status = result.success ? "success" : "failure";
      record.elapsed_seconds = elapsed_seconds;
      record.strategy = state_.strategy_key;
      record.start_ts = start_ts;
      record.end_ts = data::now_iso();
      record.reason_code = result.reason_code;
      record.context = clip(result.details, 1000);
      if (!ctx_.evolution_log->append(record)) {
        log::warn("evolution log row for cycle " + std::to_string(outcome.cycle) + " not written");
      }
    } catch (const std::exception& e) {
      log::error(std::string("evolution log append failed: ") + e.what());
    }
  }
  if (ctx_.memory) {
    try {
      if (!ctx_.memory->save()) {
        log::error("failed to persist memory: " + ctx_.memory->path().string());
      }
    } catch (const std::exception& e) {
      log::error(std::string("failed to persist memory: ") + e.what());
    }
  }
  log::info("=== end of cycle " + std::to_string(outcome.cycle) + " ===");
}

int CycleEngine::run() {
  if (!ctx_.queue) {
    log::error("engine has no objective queue");
    return 0;
  }
  const int start_count = cycle_count_;
  if (ctx_.queue->is_empty() && ctx_.generator) {
    const std::string history = ctx_.memory ? ctx_.memory->history_summary() : std::string();
    if (auto seed = ctx_.generator->next_objective({}, history, std::nullopt)) {
      log::info("initial objective: " + clip(*seed, 120));
      ctx_.queue->push(*seed);
    }
  }
  log::info(std::string("engine started; continuous mode ") + (ctx_.config.continuous_mode ? "on" : "off"));

  while (!ctx_.queue->stop_requested()) {
    if (ctx_.config.max_cycles > 0 && cycle_count_ - start_count >= ctx_.config.max_cycles) {
      log::info("cycle limit reached (" + std::to_string(ctx_.config.max_cycles) + ")");
      break;
    }

    auto objective = ctx_.queue->try_pop();
    if (!objective) {
      if (!ctx_.config.continuous_mode) {
        log::info("objective queue empty; stopping");
        break;
      }
      const auto delay = std::chrono::milliseconds(
          static_cast<long long>(ctx_.config.continuous_mode_delay_seconds * 1000.0));
      if (ctx_.generator) {
        const std::string history = ctx_.memory ? ctx_.memory->history_summary() : std::string();
        if (auto generated = ctx_.generator->next_objective(state_.manifest, history, std::nullopt)) {
          ctx_.queue->push(*generated);
          if (ctx_.queue->wait_for_stop(delay)) break;
          continue;
        }
      }
      objective = ctx_.queue->wait_pop(delay);
      if (!objective) continue;
      if (ctx_.queue->stop_requested()) {
        ctx_.queue->push(*objective);
        break;
      }
    }

    run_cycle(*objective);

    if (ctx_.config.cycle_delay_seconds > 0.0) {
      const auto delay =
          std::chrono::milliseconds(static_cast<long long>(ctx_.config.cycle_delay_seconds * 1000.0));
      if (ctx_.queue->wait_for_stop(delay)) break;
    }
  }
  log::info("engine stopped after " + std::to_string(cycle_count_ - start_count) + " cycle(s)");
  return cycle_count_ - start_count;
}

} // namespace evo
