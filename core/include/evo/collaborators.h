#pragma once

#include <deque>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "evo/cycle_state.h"

namespace evo {

inline constexpr const char* kCapacitationSentinel = "CAPACITATION_REQUIRED";
inline constexpr const char* kCapacitationPrefix = "[CAPACITATION TASK]";
inline constexpr const char* kCorrectionPrefix = "[AUTOMATIC CORRECTION TASK]";

struct PlanResult {
  bool ok = false;
  ActionPlan plan;
  std::string error;
};

class Planner {
 public:
  virtual ~Planner() = default;
  virtual PlanResult plan(const std::string& objective, const std::string& manifest,
                          const std::string& file_context) = 0;
};

enum class DecisionKind {
  Selected,
  CapacitationRequired,
  Error
};

struct StrategyDecision {
  DecisionKind kind = DecisionKind::Error;
  std::string strategy_key;
  std::string capacitation_need;
  std::string error;

  static StrategyDecision selected(std::string key);
  static StrategyDecision capacitation(std::string need);
  static StrategyDecision failed(std::string message);
};

class StrategySelector {
 public:
  virtual ~StrategySelector() = default;
  virtual StrategyDecision select(const ActionPlan& plan, const std::string& failure_context) = 0;
};

struct CorrectionRequest {
  std::string objective;
  std::string reason_code;
  std::string details;
  std::string patches_json;
};

class ObjectiveGenerator {
 public:
  virtual ~ObjectiveGenerator() = default;
  // Follow-up after a success (or the seed objective when nothing is
  // queued); nullopt when there is nothing more to do.
  virtual std::optional<std::string> next_objective(const std::string& manifest, const std::string& history,
                                                    const std::optional<std::string>& completed_objective) = 0;
  virtual std::string capacitation_objective(const std::string& need, const std::string& original_objective) = 0;
  virtual std::string correction_objective(const CorrectionRequest& request) = 0;
  virtual std::string commit_message(const std::string& objective, const std::string& analysis) = 0;
};

// Reads plans from a JSON file: either one plan object, or
// {"plans": [{"objective": ..., <plan>}, ...]} matched by objective text,
// where an entry without "objective" matches anything.
class FilePlanner : public Planner {
 public:
  explicit FilePlanner(std::filesystem::path plan_file);
  PlanResult plan(const std::string& objective, const std::string& manifest, const std::string& file_context) override;

 private:
  std::filesystem::path plan_file_;
};

// Runs an external command and parses the JSON plan it prints. `{objective}`
// and `{manifest_file}` in the command line are substituted.
class CommandPlanner : public Planner {
 public:
  CommandPlanner(std::string command, std::filesystem::path working_dir, std::filesystem::path manifest_file,
                 double timeout_seconds);
  PlanResult plan(const std::string& objective, const std::string& manifest, const std::string& file_context) override;

 private:
  std::string command_;
  std::filesystem::path working_dir_;
  std::filesystem::path manifest_file_;
  double timeout_seconds_ = 300.0;
};

// Uses the plan's own strategy_key, else the configured default. A plan
// naming CAPACITATION_REQUIRED asks for a capacitation objective.
class PlanStrategySelector : public StrategySelector {
 public:
  explicit PlanStrategySelector(std::string default_key);
  StrategyDecision select(const ActionPlan& plan, const std::string& failure_context) override;

 private:
  std::string default_key_;
};

// Deterministic text templates; follow-ups come from a fixed list.
class TemplateObjectiveGenerator : public ObjectiveGenerator {
 public:
  explicit TemplateObjectiveGenerator(std::vector<std::string> followups = {});

  std::optional<std::string> next_objective(const std::string& manifest, const std::string& history,
                                            const std::optional<std::string>& completed_objective) override;
  std::string capacitation_objective(const std::string& need, const std::string& original_objective) override;
  std::string correction_objective(const CorrectionRequest& request) override;
  std::string commit_message(const std::string& objective, const std::string& analysis) override;

 private:
  std::deque<std::string> followups_;
};

// Pulls the outermost {...} out of free-form output and parses it.
bool extract_json_object(const std::string& text, nlohmann::json& out, std::string& error);

} // namespace evo
