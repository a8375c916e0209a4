#include "evo/collaborators.h"
#include "evo/config.h"
#include "evo/cycle_engine.h"
#include "evo/data_io.h"
#include "evo/evolution_log.h"
#include "evo/log.h"
#include "evo/manifest.h"
#include "evo/memory.h"
#include "evo/objective_queue.h"
#include "evo/patch.h"
#include "evo/strategy.h"
#include "evo/vcs.h"

#include <nlohmann/json.hpp>

#include <charconv>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

struct CliOptions {
  fs::path config_path;
  std::vector<std::string> objectives;
  bool continuous = false;
  std::optional<int> max_cycles;
  std::string plan_path;
  std::string strategy;
  std::string inbox;
  fs::path base_dir;
  fs::path out_path;
};

bool parse_int(const std::string& value, int& out) {
  const auto* begin = value.data();
  const auto* end = value.data() + value.size();
  const auto res = std::from_chars(begin, end, out);
  return res.ec == std::errc() && res.ptr == end;
}

void print_usage() {
  std::cout << "Usage:\n"
            << "  evoctl run [--config <file>] [--objective <text>]... [--continuous] [--max-cycles <n>]\n"
            << "             [--plan <plan.json>] [--strategy <key>] [--inbox <dir>]\n"
            << "  evoctl patch --plan <plan.json> [--base <dir>]\n"
            << "  evoctl strategies [--config <file>]\n"
            << "  evoctl status [--config <file>]\n"
            << "  evoctl rollback [--config <file>]\n"
            << "  evoctl manifest [--config <file>] [--out <file>]\n";
}

bool load_config(const CliOptions& opts, evo::EngineConfig& cfg) {
  const auto path = evo::resolve_config_path(opts.config_path);
  std::string error;
  if (!evo::load_engine_config(path, cfg, error)) {
    std::cerr << error << "\n";
    return false;
  }
  return true;
}

bool load_strategies(const evo::ResolvedPaths& paths, evo::StrategyTable& table) {
  table = evo::StrategyTable::builtin();
  if (paths.strategies.empty()) {
    return true;
  }
  std::string error;
  if (!table.load(paths.strategies, error)) {
    std::cerr << error << "\n";
    return false;
  }
  return true;
}

int run_command(const CliOptions& opts) {
  // Before any thread exists, so only the watcher ever receives them.
  if (!evo::StopSignalWatcher::block_signals()) {
    std::cerr << "failed to block stop signals\n";
    return 1;
  }
  evo::EngineConfig cfg;
  if (!load_config(opts, cfg)) {
    return 1;
  }
  if (opts.continuous) cfg.continuous_mode = true;
  if (opts.max_cycles) cfg.max_cycles = *opts.max_cycles;
  if (!opts.plan_path.empty()) cfg.planner.plan_file = opts.plan_path;
  if (!opts.strategy.empty()) cfg.default_strategy = opts.strategy;
  if (!opts.inbox.empty()) cfg.inbox_dir = opts.inbox;

  const auto paths = evo::resolve_paths(cfg);
  evo::log::init("evoctl", paths.logs_dir);
  evo::log::install_crash_handlers();

  evo::EngineContext ctx;
  ctx.config = cfg;
  ctx.paths = paths;
  if (!load_strategies(paths, ctx.strategies)) {
    evo::log::shutdown();
    return 1;
  }

  std::unique_ptr<evo::Planner> planner;
  if (!cfg.planner.command.empty()) {
    planner = std::make_unique<evo::CommandPlanner>(cfg.planner.command, paths.root, paths.manifest,
                                                    cfg.planner.timeout_seconds);
  } else if (!cfg.planner.plan_file.empty()) {
    fs::path plan_file(cfg.planner.plan_file);
    if (plan_file.is_relative()) plan_file = paths.root / plan_file;
    planner = std::make_unique<evo::FilePlanner>(plan_file);
  } else {
    std::cerr << "no planner configured (set planner.plan_file, planner.command or --plan)\n";
    evo::log::shutdown();
    return 1;
  }

  evo::PlanStrategySelector selector(cfg.default_strategy);
  evo::TemplateObjectiveGenerator generator;
  evo::GitGateway git(paths.root, cfg.tools.git_timeout_seconds);
  const bool has_git = git.is_repository();
  if (has_git) {
    const auto rel_state = paths.state.lexically_relative(paths.root);
    if (!rel_state.empty() && *rel_state.begin() != "..") {
      git.ensure_ignored("/" + rel_state.generic_string() + "/");
    }
  } else {
    evo::log::warn("project is not a git repository; sanity commits and rollback disabled");
  }

  evo::Memory memory(paths.memory, cfg.ledger_capacity);
  if (!memory.load()) {
    evo::log::warn("memory file was corrupt; starting with empty history");
  }
  evo::EvolutionLog evolution_log(paths.evolution_log);
  evo::ObjectiveQueue queue;
  for (const auto& objective : opts.objectives) {
    queue.push(objective);
  }

  ctx.queue = &queue;
  ctx.planner = planner.get();
  ctx.selector = &selector;
  ctx.generator = &generator;
  ctx.vcs = has_git ? &git : nullptr;
  ctx.memory = &memory;
  ctx.evolution_log = &evolution_log;

  evo::StopSignalWatcher stop_watcher(queue);
  if (!stop_watcher.start()) {
    evo::log::warn("SIGINT/SIGTERM will not stop the loop gracefully");
  }

  std::unique_ptr<evo::ObjectiveInbox> inbox;
  if (!paths.inbox.empty()) {
    inbox = std::make_unique<evo::ObjectiveInbox>(paths.inbox, queue);
    inbox->poll_once();
    if (cfg.continuous_mode && !inbox->start()) {
      evo::log::warn("objective inbox watcher not started: " + paths.inbox.string());
    }
  }

  evo::CycleEngine engine(ctx);
  const int cycles = engine.run();
  if (inbox) {
    inbox->stop();
  }
  stop_watcher.stop();

  const auto& last = engine.state().validation_result;
  std::cout << "cycles run: " << cycles << "\n";
  if (cycles > 0) {
    std::cout << "last result: " << (last.success ? "success" : "failure") << " (" << last.reason_code << ")\n";
  }
  evo::log::shutdown();
  return (cycles > 0 && !last.success) ? 2 : 0;
}

int patch_command(const CliOptions& opts) {
  if (opts.plan_path.empty()) {
    print_usage();
    return 1;
  }
  json plan_doc;
  if (!evo::data::load_json_file(opts.plan_path, plan_doc)) {
    std::cerr << "failed to read plan: " << opts.plan_path << "\n";
    return 1;
  }
  evo::ActionPlan plan;
  std::string error;
  if (!evo::parse_action_plan(plan_doc, plan, error)) {
    std::cerr << "invalid plan: " << error << "\n";
    return 1;
  }
  const fs::path base = opts.base_dir.empty() ? fs::current_path() : opts.base_dir;
  const auto result = evo::apply_patches(base, plan.patches);
  for (const auto& kv : result.file_status) {
    std::cout << "  " << kv.first << ": " << kv.second << "\n";
  }

  json audit;
  audit["time"] = evo::data::now_iso();
  audit["action_type"] = "apply_patch";
  audit["params_hash"] = evo::data::to_hex(evo::data::fnv1a_64(plan_doc.dump()));
  audit["result"] = result.success ? "ok" : result.reason_code;
  audit["message"] = result.message;
  audit["files_touched"] = evo::distinct_patch_paths(plan.patches);
  evo::data::append_audit_line(base / ".evo" / "audit.log", audit);

  if (!result.success) {
    std::cerr << result.reason_code << ": " << result.message << "\n";
    return 2;
  }
  std::cout << result.message << "\n";
  return 0;
}

int strategies_command(const CliOptions& opts) {
  evo::EngineConfig cfg;
  if (!load_config(opts, cfg)) {
    return 1;
  }
  const auto paths = evo::resolve_paths(cfg);
  evo::StrategyTable table;
  if (!load_strategies(paths, table)) {
    return 1;
  }
  for (const auto& key : table.keys()) {
    evo::ValidationStrategy strategy;
    std::string error;
    if (!table.resolve(key, strategy, error)) continue;
    std::cout << key << ":";
    for (const auto& step : strategy.step_names) {
      std::cout << " " << step;
    }
    std::cout << " | sanity: " << strategy.sanity_check_step;
    if (!strategy.unknown_steps.empty()) {
      std::cout << " | UNKNOWN:";
      for (const auto& step : strategy.unknown_steps) std::cout << " " << step;
    }
    std::cout << "\n";
  }
  std::cout << "registered steps:";
  for (const auto& name : evo::registered_step_names()) {
    std::cout << " " << name;
  }
  std::cout << "\n";
  return 0;
}

int status_command(const CliOptions& opts) {
  evo::EngineConfig cfg;
  if (!load_config(opts, cfg)) {
    return 1;
  }
  const auto paths = evo::resolve_paths(cfg);
  evo::Memory memory(paths.memory, cfg.ledger_capacity);
  if (!memory.load()) {
    std::cerr << "memory file is corrupt: " << paths.memory.string() << "\n";
  }
  std::cout << "root: " << paths.root.string() << "\n";
  std::cout << "head: " << evo::read_git_head_hash(paths.root) << "\n";
  std::cout << "completed: " << memory.completed().size() << "  failed: " << memory.failed().size()
            << "  capabilities: " << memory.capabilities().size() << "\n";
  std::cout << "recent outcomes (newest first):\n";
  for (const auto& entry : memory.ledger().newest_first()) {
    std::cout << "  [" << evo::outcome_status_name(entry.status) << "] " << entry.reason_code << "  "
              << entry.objective.substr(0, 80) << "\n";
  }

  evo::EvolutionLog evolution_log(paths.evolution_log);
  std::vector<evo::EvolutionRecord> records;
  std::string error;
  if (!evolution_log.read_all(records, error)) {
    std::cerr << error << "\n";
    return 1;
  }
  std::cout << "cycles logged: " << records.size() << "\n";
  if (!records.empty()) {
    const auto& last = records.back();
    std::cout << "last cycle: #" << last.cycle << " " << last.status << " " << last.reason_code << " ("
              << last.elapsed_seconds << "s)\n";
  }
  return 0;
}

int rollback_command(const CliOptions& opts) {
  evo::EngineConfig cfg;
  if (!load_config(opts, cfg)) {
    return 1;
  }
  const auto paths = evo::resolve_paths(cfg);
  evo::GitGateway git(paths.root, cfg.tools.git_timeout_seconds);
  if (!git.is_repository()) {
    std::cerr << "not a git repository: " << paths.root.string() << "\n";
    return 1;
  }
  const auto result = git.rollback({});

  json audit;
  audit["time"] = evo::data::now_iso();
  audit["action_type"] = "rollback";
  audit["params_hash"] = git.head_revision();
  audit["result"] = result.ok ? "ok" : "failed";
  audit["message"] = result.output;
  audit["files_touched"] = json::array();
  evo::data::append_audit_line(paths.audit_log, audit);

  std::cout << result.output;
  if (!result.ok) {
    std::cerr << "rollback failed\n";
    return 1;
  }
  std::cout << "working tree reset to " << git.head_revision() << "\n";
  return 0;
}

int manifest_command(const CliOptions& opts) {
  evo::EngineConfig cfg;
  if (!load_config(opts, cfg)) {
    return 1;
  }
  const auto paths = evo::resolve_paths(cfg);
  evo::GitGateway git(paths.root, cfg.tools.git_timeout_seconds);
  evo::ManifestOptions options;
  options.excludes = cfg.sandbox_excludes;
  const auto rel_state = paths.state.lexically_relative(paths.root);
  if (!rel_state.empty() && *rel_state.begin() != "..") {
    options.excludes.push_back(rel_state.generic_string());
  }
  const auto text = evo::render_manifest(paths.root, git.is_repository() ? &git : nullptr, options);
  if (opts.out_path.empty()) {
    std::cout << text;
    return 0;
  }
  if (!evo::data::write_text_file(opts.out_path, text)) {
    std::cerr << "failed to write " << opts.out_path.string() << "\n";
    return 1;
  }
  std::cout << "manifest written to " << opts.out_path.string() << "\n";
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string command = argv[1];
  CliOptions opts;
  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      opts.config_path = argv[++i];
    } else if (arg == "--objective" && i + 1 < argc) {
      opts.objectives.push_back(argv[++i]);
    } else if (arg == "--continuous") {
      opts.continuous = true;
    } else if (arg == "--max-cycles" && i + 1 < argc) {
      int value = 0;
      if (!parse_int(argv[++i], value) || value < 0) {
        std::cerr << "invalid --max-cycles\n";
        return 1;
      }
      opts.max_cycles = value;
    } else if (arg == "--plan" && i + 1 < argc) {
      opts.plan_path = argv[++i];
    } else if (arg == "--strategy" && i + 1 < argc) {
      opts.strategy = argv[++i];
    } else if (arg == "--inbox" && i + 1 < argc) {
      opts.inbox = argv[++i];
    } else if (arg == "--base" && i + 1 < argc) {
      opts.base_dir = argv[++i];
    } else if (arg == "--out" && i + 1 < argc) {
      opts.out_path = argv[++i];
    } else {
      std::cerr << "unknown argument: " << arg << "\n";
      print_usage();
      return 1;
    }
  }

  if (command == "run") {
    return run_command(opts);
  }
  if (command == "patch") {
    return patch_command(opts);
  }
  if (command == "strategies") {
    return strategies_command(opts);
  }
  if (command == "status") {
    return status_command(opts);
  }
  if (command == "rollback") {
    return rollback_command(opts);
  }
  if (command == "manifest") {
    return manifest_command(opts);
  }

  print_usage();
  return 1;
}
