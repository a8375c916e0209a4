#pragma once

#include <string>
#include <vector>

#include "evo/collaborators.h"
#include "evo/config.h"
#include "evo/cycle_state.h"
#include "evo/evolution_log.h"
#include "evo/memory.h"
#include "evo/objective_queue.h"
#include "evo/sandbox.h"
#include "evo/strategy.h"
#include "evo/vcs.h"

namespace evo {

enum class CyclePhase {
  AwaitObjective,
  Planning,
  StrategySelection,
  Capacitation,
  ExecuteStrategy,
  SanityCheck,
  PromoteCommit,
  Rollback,
  RecordOutcome
};

const char* cycle_phase_name(CyclePhase phase);

// Objectives carrying one of the correction prefixes bypass the selector.
bool is_correction_objective(const std::string& objective);

// Everything one engine instance works with. Pointers are non-owning and
// must outlive the engine; vcs may be null when the project is not under
// version control (no sanity commit or rollback then).
struct EngineContext {
  EngineConfig config;
  ResolvedPaths paths;
  StrategyTable strategies = StrategyTable::builtin();
  ObjectiveQueue* queue = nullptr;
  Planner* planner = nullptr;
  StrategySelector* selector = nullptr;
  ObjectiveGenerator* generator = nullptr;
  VersionControl* vcs = nullptr;
  Memory* memory = nullptr;
  EvolutionLog* evolution_log = nullptr;
};

struct CycleOutcome {
  int cycle = 0;
  std::string objective;
  bool success = false;
  std::string reason_code;
  std::string details;
  std::string strategy_key;
  std::vector<std::string> executed_steps;
  std::vector<CyclePhase> phases;
  bool degenerate = false;
  bool correction_queued = false;
  bool followup_queued = false;
};

class CycleEngine {
 public:
  explicit CycleEngine(EngineContext& ctx);

  // One objective through every phase. Always records the outcome.
  CycleOutcome run_cycle(const std::string& objective);
  // Pops and runs objectives until the queue drains (non-continuous), the
  // cycle limit is hit, or a stop is requested while idle.
  int run();

  const CycleState& state() const { return state_; }

 private:
  void enter(CyclePhase phase, CycleOutcome& outcome);
  void execute_phases(CycleOutcome& outcome);
  void record_outcome(CycleOutcome& outcome, const std::string& start_ts, double elapsed_seconds);
  bool limit_mode() const { return ctx_.config.max_cycles > 0; }
  void fail(const std::string& reason_code, const std::string& details);
  std::string last_failure_context(const std::string& objective) const;

  EngineContext& ctx_;
  CycleState state_;
  SandboxManager sandbox_;
  int cycle_count_ = 0;
  bool capacitation_queued_ = false;
};

} // namespace evo
