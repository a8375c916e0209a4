#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace evo {

struct ToolConfig {
  // `{target}` is replaced by the new test file for run_pytest_new_file;
  // without the placeholder the file is appended as the last argument.
  std::string test_command = "python3 -m pytest -q";
  std::string python_syntax_command = "python3 -m py_compile {file}";
  std::string benchmark_command;
  double command_timeout_seconds = 600.0;
  double git_timeout_seconds = 120.0;
};

struct PlannerConfig {
  std::string plan_file;
  std::string command;
  double timeout_seconds = 300.0;
};

struct EngineConfig {
  std::filesystem::path project_root;
  std::string state_dir = ".evo";
  std::string memory_file = "memory.json";
  std::string evolution_log_file = "evolution_log.csv";
  std::string strategies_file;
  std::string inbox_dir;
  std::vector<std::string> sandbox_excludes;

  int degenerate_loop_threshold = 3;
  size_t ledger_capacity = 20;
  bool continuous_mode = false;
  double continuous_mode_delay_seconds = 5.0;
  double cycle_delay_seconds = 0.0;
  int max_cycles = 0;
  std::string correction_strategy = "AUTO_CORRECTION_STRATEGY";
  std::string default_strategy = "SYNTAX_ONLY";

  ToolConfig tools;
  PlannerConfig planner;
};

// Concrete locations derived from an EngineConfig. Relative file settings
// are taken relative to the state directory; strategies_file and
// inbox_dir relative to the project root.
struct ResolvedPaths {
  std::filesystem::path root;
  std::filesystem::path state;
  std::filesystem::path memory;
  std::filesystem::path evolution_log;
  std::filesystem::path audit_log;
  std::filesystem::path manifest;
  std::filesystem::path logs_dir;
  std::filesystem::path strategies;
  std::filesystem::path inbox;
};

// Missing file: defaults plus a warning, returns true. Parse or type
// errors return false with `error` set.
bool load_engine_config(const std::filesystem::path& path, EngineConfig& out, std::string& error);

// EVO_CONFIG wins over `requested`; falls back to <root>/config/evoloop.yaml.
std::filesystem::path resolve_config_path(const std::filesystem::path& requested);

// EVO_ROOT wins over cfg.project_root; empty means the working directory.
ResolvedPaths resolve_paths(const EngineConfig& cfg);

} // namespace evo
