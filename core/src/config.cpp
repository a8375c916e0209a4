#include "evo/config.h"

#include "evo/log.h"

#include <cstdlib>
#include <fstream>

#include <nlohmann/json.hpp>

#if EVO_ENABLE_YAML
#include <yaml-cpp/yaml.h>
#endif

namespace evo {

namespace {
bool file_exists(const std::filesystem::path& path) {
  std::error_code ec;
  return std::filesystem::exists(path, ec);
}

void read_json_fields(const nlohmann::json& root, EngineConfig& cfg) {
  if (root.contains("project_root")) cfg.project_root = root["project_root"].get<std::string>();
  if (root.contains("state_dir")) cfg.state_dir = root["state_dir"].get<std::string>();
  if (root.contains("memory_file")) cfg.memory_file = root["memory_file"].get<std::string>();
  if (root.contains("evolution_log_file")) cfg.evolution_log_file = root["evolution_log_file"].get<std::string>();
  if (root.contains("strategies_file")) cfg.strategies_file = root["strategies_file"].get<std::string>();
  if (root.contains("inbox_dir")) cfg.inbox_dir = root["inbox_dir"].get<std::string>();
  if (root.contains("sandbox_excludes") && root["sandbox_excludes"].is_array()) {
    cfg.sandbox_excludes.clear();
    for (const auto& v : root["sandbox_excludes"]) {
      cfg.sandbox_excludes.push_back(v.get<std::string>());
    }
  }
  if (root.contains("degenerate_loop_threshold")) {
    cfg.degenerate_loop_threshold = root["degenerate_loop_threshold"].get<int>();
  }
  if (root.contains("ledger_capacity")) cfg.ledger_capacity = root["ledger_capacity"].get<size_t>();
  if (root.contains("continuous_mode")) cfg.continuous_mode = root["continuous_mode"].get<bool>();
  if (root.contains("continuous_mode_delay_seconds")) {
    cfg.continuous_mode_delay_seconds = root["continuous_mode_delay_seconds"].get<double>();
  }
  if (root.contains("cycle_delay_seconds")) cfg.cycle_delay_seconds = root["cycle_delay_seconds"].get<double>();
  if (root.contains("max_cycles")) cfg.max_cycles = root["max_cycles"].get<int>();
  if (root.contains("correction_strategy")) cfg.correction_strategy = root["correction_strategy"].get<std::string>();

  if (root.contains("tools")) {
    const auto& tools = root["tools"];
    if (tools.contains("test_command")) cfg.tools.test_command = tools["test_command"].get<std::string>();
    if (tools.contains("python_syntax_command")) {
      cfg.tools.python_syntax_command = tools["python_syntax_command"].get<std::string>();
    }
    if (tools.contains("benchmark_command")) cfg.tools.benchmark_command = tools["benchmark_command"].get<std::string>();
    if (tools.contains("command_timeout_seconds")) {
      cfg.tools.command_timeout_seconds = tools["command_timeout_seconds"].get<double>();
    }
    if (tools.contains("git_timeout_seconds")) cfg.tools.git_timeout_seconds = tools["git_timeout_seconds"].get<double>();
  }
  if (root.contains("planner")) {
    const auto& planner = root["planner"];
    if (planner.contains("plan_file")) cfg.planner.plan_file = planner["plan_file"].get<std::string>();
    if (planner.contains("command")) cfg.planner.command = planner["command"].get<std::string>();
    if (planner.contains("timeout_seconds")) cfg.planner.timeout_seconds = planner["timeout_seconds"].get<double>();
  }
  if (root.contains("selector")) {
    const auto& selector = root["selector"];
    if (selector.contains("default_strategy")) cfg.default_strategy = selector["default_strategy"].get<std::string>();
  }
}

#if EVO_ENABLE_YAML
void read_yaml_fields(const YAML::Node& root, EngineConfig& cfg) {
  if (root["project_root"]) cfg.project_root = root["project_root"].as<std::string>();
  if (root["state_dir"]) cfg.state_dir = root["state_dir"].as<std::string>();
  if (root["memory_file"]) cfg.memory_file = root["memory_file"].as<std::string>();
  if (root["evolution_log_file"]) cfg.evolution_log_file = root["evolution_log_file"].as<std::string>();
  if (root["strategies_file"]) cfg.strategies_file = root["strategies_file"].as<std::string>();
  if (root["inbox_dir"]) cfg.inbox_dir = root["inbox_dir"].as<std::string>();
  if (root["sandbox_excludes"]) {
    cfg.sandbox_excludes.clear();
    for (const auto& v : root["sandbox_excludes"]) {
      cfg.sandbox_excludes.push_back(v.as<std::string>());
    }
  }
  if (root["degenerate_loop_threshold"]) {
    cfg.degenerate_loop_threshold = root["degenerate_loop_threshold"].as<int>();
  }
  if (root["ledger_capacity"]) cfg.ledger_capacity = root["ledger_capacity"].as<size_t>();
  if (root["continuous_mode"]) cfg.continuous_mode = root["continuous_mode"].as<bool>();
  if (root["continuous_mode_delay_seconds"]) {
    cfg.continuous_mode_delay_seconds = root["continuous_mode_delay_seconds"].as<double>();
  }
  if (root["cycle_delay_seconds"]) cfg.cycle_delay_seconds = root["cycle_delay_seconds"].as<double>();
  if (root["max_cycles"]) cfg.max_cycles = root["max_cycles"].as<int>();
  if (root["correction_strategy"]) cfg.correction_strategy = root["correction_strategy"].as<std::string>();

  if (root["tools"]) {
    auto tools = root["tools"];
    if (tools["test_command"]) cfg.tools.test_command = tools["test_command"].as<std::string>();
    if (tools["python_syntax_command"]) {
      cfg.tools.python_syntax_command = tools["python_syntax_command"].as<std::string>();
    }
    if (tools["benchmark_command"]) cfg.tools.benchmark_command = tools["benchmark_command"].as<std::string>();
    if (tools["command_timeout_seconds"]) {
      cfg.tools.command_timeout_seconds = tools["command_timeout_seconds"].as<double>();
    }
    if (tools["git_timeout_seconds"]) cfg.tools.git_timeout_seconds = tools["git_timeout_seconds"].as<double>();
  }
  if (root["planner"]) {
    auto planner = root["planner"];
    if (planner["plan_file"]) cfg.planner.plan_file = planner["plan_file"].as<std::string>();
    if (planner["command"]) cfg.planner.command = planner["command"].as<std::string>();
    if (planner["timeout_seconds"]) cfg.planner.timeout_seconds = planner["timeout_seconds"].as<double>();
  }
  if (root["selector"]) {
    auto selector = root["selector"];
    if (selector["default_strategy"]) cfg.default_strategy = selector["default_strategy"].as<std::string>();
  }
}
#endif

std::filesystem::path under(const std::filesystem::path& base, const std::string& value) {
  const std::filesystem::path p(value);
  if (p.is_absolute()) return p;
  return base / p;
}
} // namespace

bool load_engine_config(const std::filesystem::path& path, EngineConfig& out, std::string& error) {
  EngineConfig cfg;

  if (!file_exists(path)) {
    log::warn(std::string("config not found: ") + path.string());
    out = cfg;
    return true;
  }

  const auto ext = path.extension().string();
  if (ext == ".json") {
    try {
      std::ifstream in(path);
      nlohmann::json j;
      in >> j;
      const auto& root = j.contains("engine") ? j["engine"] : j;
      read_json_fields(root, cfg);
    } catch (const std::exception& e) {
      error = std::string("invalid config ") + path.string() + ": " + e.what();
      return false;
    }
    out = cfg;
    return true;
  }

  if (ext == ".yaml" || ext == ".yml") {
#if EVO_ENABLE_YAML
    try {
      YAML::Node doc = YAML::LoadFile(path.string());
      YAML::Node root = doc["engine"] ? doc["engine"] : doc;
      read_yaml_fields(root, cfg);
    } catch (const std::exception& e) {
      error = std::string("invalid config ") + path.string() + ": " + e.what();
      return false;
    }
#else
    log::warn("YAML config requested but YAML support is disabled.");
#endif
    out = cfg;
    return true;
  }

  log::warn("Unknown config extension; using defaults.");
  out = cfg;
  return true;
}

std::filesystem::path resolve_config_path(const std::filesystem::path& requested) {
  if (const char* env = std::getenv("EVO_CONFIG")) {
    return std::filesystem::path(env);
  }
  if (!requested.empty()) {
    return requested;
  }
  std::filesystem::path root = std::filesystem::current_path();
  if (const char* env_root = std::getenv("EVO_ROOT")) {
    root = env_root;
  }
  return root / "config" / "evoloop.yaml";
}

ResolvedPaths resolve_paths(const EngineConfig& cfg) {
  ResolvedPaths out;
  if (const char* env_root = std::getenv("EVO_ROOT")) {
    out.root = std::filesystem::path(env_root);
  } else if (!cfg.project_root.empty()) {
    out.root = cfg.project_root;
  } else {
    out.root = std::filesystem::current_path();
  }
  std::error_code ec;
  const auto absolute_root = std::filesystem::absolute(out.root, ec);
  if (!ec) {
    out.root = absolute_root.lexically_normal();
  }

  out.state = under(out.root, cfg.state_dir);
  out.memory = under(out.state, cfg.memory_file);
  out.evolution_log = under(out.state, cfg.evolution_log_file);
  out.audit_log = out.state / "audit.log";
  out.manifest = out.state / "manifest.md";
  out.logs_dir = out.state / "logs";
  if (!cfg.strategies_file.empty()) {
    out.strategies = under(out.root, cfg.strategies_file);
  }
  if (!cfg.inbox_dir.empty()) {
    out.inbox = under(out.root, cfg.inbox_dir);
  }

  if (!std::filesystem::exists(out.root)) {
    log::warn(std::string("project root not found: ") + out.root.string());
  }
  return out;
}

} // namespace evo
