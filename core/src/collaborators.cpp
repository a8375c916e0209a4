#include "evo/collaborators.h"

#include "evo/data_io.h"
#include "evo/log.h"
#include "evo/subprocess.h"

#include <utility>

namespace evo {
using json = nlohmann::json;

namespace {
std::string first_line(const std::string& text) {
  const auto nl = text.find('\n');
  return nl == std::string::npos ? text : text.substr(0, nl);
}

std::string clip(const std::string& text, size_t max_chars) {
  if (text.size() <= max_chars) return text;
  return text.substr(0, data::utf8_floor(text, max_chars - 3)) + "...";
}
} // namespace

StrategyDecision StrategyDecision::selected(std::string key) {
  StrategyDecision d;
  d.kind = DecisionKind::Selected;
  d.strategy_key = std::move(key);
  return d;
}

StrategyDecision StrategyDecision::capacitation(std::string need) {
  StrategyDecision d;
  d.kind = DecisionKind::CapacitationRequired;
  d.strategy_key = kCapacitationSentinel;
  d.capacitation_need = std::move(need);
  return d;
}

StrategyDecision StrategyDecision::failed(std::string message) {
  StrategyDecision d;
  d.kind = DecisionKind::Error;
  d.error = std::move(message);
  return d;
}

bool extract_json_object(const std::string& text, json& out, std::string& error) {
  const auto begin = text.find('{');
  const auto end = text.rfind('}');
  if (begin == std::string::npos || end == std::string::npos || end < begin) {
    error = "no JSON object in output";
    return false;
  }
  try {
    out = json::parse(text.substr(begin, end - begin + 1));
  } catch (const json::parse_error& e) {
    error = std::string("invalid JSON: ") + e.what();
    return false;
  }
  return true;
}

FilePlanner::FilePlanner(std::filesystem::path plan_file) : plan_file_(std::move(plan_file)) {}

PlanResult FilePlanner::plan(const std::string& objective, const std::string&, const std::string&) {
  PlanResult result;
  json doc;
  if (!data::load_json_file(plan_file_, doc)) {
    result.error = "plan file unreadable: " + plan_file_.string();
    return result;
  }

  const json* chosen = &doc;
  if (doc.is_object() && doc.contains("plans") && doc["plans"].is_array()) {
    chosen = nullptr;
    for (const auto& entry : doc["plans"]) {
      if (!entry.is_object()) continue;
      if (!entry.contains("objective") || entry.value("objective", "") == objective) {
        chosen = &entry;
        break;
      }
    }
    if (!chosen) {
      result.error = "no plan for objective: " + clip(objective, 120);
      return result;
    }
  }

  result.ok = parse_action_plan(*chosen, result.plan, result.error);
  return result;
}

CommandPlanner::CommandPlanner(std::string command, std::filesystem::path working_dir,
                               std::filesystem::path manifest_file, double timeout_seconds)
    : command_(std::move(command)),
      working_dir_(std::move(working_dir)),
      manifest_file_(std::move(manifest_file)),
      timeout_seconds_(timeout_seconds) {}

PlanResult CommandPlanner::plan(const std::string& objective, const std::string& manifest, const std::string&) {
  PlanResult result;
  if (!manifest_file_.empty() && !data::write_text_file(manifest_file_, manifest)) {
    result.error = "failed to write manifest for planner";
    return result;
  }
  auto args = split_command_line(command_);
  if (args.empty()) {
    result.error = "planner command is empty";
    return result;
  }
  args = substitute_placeholder(args, "objective", objective);
  args = substitute_placeholder(args, "manifest_file", manifest_file_.string());

  const auto run = run_command(args, working_dir_, timeout_seconds_);
  if (!run.ok()) {
    result.error = "planner command failed: " + (run.error.empty() ? "exit " + std::to_string(run.exit_code) : run.error);
    return result;
  }
  json doc;
  if (!extract_json_object(run.output, doc, result.error)) {
    return result;
  }
  result.ok = parse_action_plan(doc, result.plan, result.error);
  return result;
}

PlanStrategySelector::PlanStrategySelector(std::string default_key) : default_key_(std::move(default_key)) {}

StrategyDecision PlanStrategySelector::select(const ActionPlan& plan, const std::string&) {
  if (plan.strategy_key == kCapacitationSentinel) {
    const auto need = plan.capacitation_need.empty() ? plan.analysis : plan.capacitation_need;
    return StrategyDecision::capacitation(need);
  }
  if (!plan.strategy_key.empty()) {
    return StrategyDecision::selected(plan.strategy_key);
  }
  if (!default_key_.empty()) {
    return StrategyDecision::selected(default_key_);
  }
  return StrategyDecision::failed("plan names no strategy and no default is configured");
}

TemplateObjectiveGenerator::TemplateObjectiveGenerator(std::vector<std::string> followups)
    : followups_(followups.begin(), followups.end()) {}

std::optional<std::string> TemplateObjectiveGenerator::next_objective(const std::string&, const std::string&,
                                                                      const std::optional<std::string>&) {
  if (followups_.empty()) {
    return std::nullopt;
  }
  auto next = followups_.front();
  followups_.pop_front();
  return next;
}

std::string TemplateObjectiveGenerator::capacitation_objective(const std::string& need,
                                                               const std::string& original_objective) {
  return std::string(kCapacitationPrefix) + " Acquire the capability: " + need +
         "\nRequired by objective: " + original_objective;
}

std::string TemplateObjectiveGenerator::correction_objective(const CorrectionRequest& request) {
  std::string text = kCorrectionPrefix;
  text += " The previous attempt failed and must be corrected.\n";
  text += "Original objective: " + request.objective + "\n";
  text += "Failure reason: " + request.reason_code + "\n";
  text += "Details:\n" + request.details + "\n";
  text += "Patches attempted:\n" + request.patches_json;
  return text;
}

std::string TemplateObjectiveGenerator::commit_message(const std::string& objective, const std::string& analysis) {
  std::string subject = first_line(objective);
  if (subject.empty()) {
    subject = first_line(analysis);
  }
  if (subject.empty()) {
    subject = "automated change";
  }
  return "evo: " + clip(subject, 72);
}

} // namespace evo
