#include "evo/strategy.h"

#include "evo/data_io.h"
#include "evo/log.h"

#include <algorithm>

#include <nlohmann/json.hpp>

#if EVO_ENABLE_YAML
#include <yaml-cpp/yaml.h>
#endif

namespace evo {

namespace {
constexpr const char* kApply = "PatchApplicatorStep";
constexpr const char* kSyntax = "validate_syntax";
constexpr const char* kJson = "ValidateJsonSyntax";
constexpr const char* kPytest = "run_pytest";
constexpr const char* kNewTest = "run_pytest_new_file";
constexpr const char* kBenchmark = "run_benchmark_validation";
constexpr const char* kExists = "check_file_existence";
constexpr const char* kSkip = "skip_sanity_check";

bool has_step(const ValidationStrategy& strategy, StepKind kind) {
  return std::find(strategy.steps.begin(), strategy.steps.end(), kind) != strategy.steps.end();
}
} // namespace

bool ValidationStrategy::modifies_disk() const {
  return has_step(*this, StepKind::ApplyPatches);
}

bool ValidationStrategy::runs_file_checks() const {
  return has_step(*this, StepKind::SyntaxCheck) || has_step(*this, StepKind::JsonSyntax) ||
         has_step(*this, StepKind::RunTests) || has_step(*this, StepKind::RunNewTestFile) ||
         has_step(*this, StepKind::CheckFileExistence);
}

bool ValidationStrategy::needs_sandbox(size_t patch_count) const {
  return (modifies_disk() || runs_file_checks()) && patch_count > 0 && !is_discard();
}

StrategyTable StrategyTable::builtin() {
  StrategyTable table;
  table.set("SYNTAX_ONLY", {{kApply, kSyntax}, kSkip});
  table.set("BENCHMARK_ONLY", {{kApply, kBenchmark}, kPytest});
  table.set("SYNTAX_AND_PYTEST", {{kApply, kSyntax, kPytest}, kPytest});
  table.set("FULL_VALIDATION", {{kApply, kSyntax, kJson, kPytest, kBenchmark}, kPytest});
  table.set("DOC_UPDATE_STRATEGY", {{kApply, kSyntax, kExists}, kExists});
  table.set("CONFIG_UPDATE_STRATEGY", {{kApply, kJson}, kExists});
  table.set("CONFIG_SYNTAX_CHECK", {{kJson}, kSkip});
  table.set("EVOLUTION_PERMISSIVE", {{kApply, kSyntax}, kSkip});
  table.set("NEW_FEATURE_STRATEGY", {{kApply, kSyntax}, kExists});
  table.set("CAPABILITY_EXPANSION", {{kApply, kSyntax}, kSkip});
  table.set("INNOVATION_STRATEGY", {{kApply, kSyntax}, kSkip});
  table.set(kDiscardStrategy, {{}, kSkip});
  table.set("TEST_FIX_STRATEGY", {{kApply, kSyntax}, kPytest});
  table.set("CREATE_NEW_TEST_FILE_STRATEGY", {{kApply, kSyntax, kNewTest}, kNewTest});
  table.set("AUTO_CORRECTION_STRATEGY", {{kApply, kSyntax, kPytest}, kPytest});
  return table;
}

bool StrategyTable::load(const std::filesystem::path& path, std::string& error) {
  std::map<std::string, StrategyDefinition> loaded;
  const auto ext = path.extension().string();

  if (ext == ".json") {
    nlohmann::json doc;
    if (!data::load_json_file(path, doc)) {
      error = "failed to read strategies: " + path.string();
      return false;
    }
    if (!doc.is_object()) {
      error = "strategies file must be a mapping: " + path.string();
      return false;
    }
    try {
      for (auto it = doc.begin(); it != doc.end(); ++it) {
        const auto& node = it.value();
        if (!node.is_object() || !node.contains("steps") || !node["steps"].is_array()) {
          continue;
        }
        StrategyDefinition def;
        for (const auto& step : node["steps"]) {
          def.steps.push_back(step.get<std::string>());
        }
        if (node.contains("sanity_check_step") && node["sanity_check_step"].is_string()) {
          def.sanity_check_step = node["sanity_check_step"].get<std::string>();
        }
        loaded[it.key()] = def;
      }
    } catch (const std::exception& e) {
      error = "invalid strategies file " + path.string() + ": " + e.what();
      return false;
    }
  } else if (ext == ".yaml" || ext == ".yml") {
#if EVO_ENABLE_YAML
    YAML::Node doc;
    if (!data::load_yaml_file(path, doc)) {
      error = "failed to read strategies: " + path.string();
      return false;
    }
    if (!doc.IsMap()) {
      error = "strategies file must be a mapping: " + path.string();
      return false;
    }
    try {
      for (const auto& kv : doc) {
        const auto node = kv.second;
        if (!node.IsMap() || !node["steps"] || !node["steps"].IsSequence()) {
          continue;
        }
        StrategyDefinition def;
        for (const auto& step : node["steps"]) {
          def.steps.push_back(step.as<std::string>());
        }
        if (node["sanity_check_step"]) {
          def.sanity_check_step = node["sanity_check_step"].as<std::string>();
        }
        loaded[kv.first.as<std::string>()] = def;
      }
    } catch (const std::exception& e) {
      error = "invalid strategies file " + path.string() + ": " + e.what();
      return false;
    }
#else
    error = "YAML strategies requested but YAML support is disabled";
    return false;
#endif
  } else {
    error = "unknown strategies file extension: " + path.string();
    return false;
  }

  if (loaded.empty()) {
    error = "no strategies defined in " + path.string();
    return false;
  }
  entries_ = std::move(loaded);
  log::info("strategies loaded: " + std::to_string(entries_.size()) + " from " + path.string());
  return true;
}

void StrategyTable::set(const std::string& key, StrategyDefinition definition) {
  entries_[key] = std::move(definition);
}

bool StrategyTable::contains(const std::string& key) const {
  return entries_.find(key) != entries_.end();
}

std::vector<std::string> StrategyTable::keys() const {
  std::vector<std::string> out;
  out.reserve(entries_.size());
  for (const auto& kv : entries_) {
    out.push_back(kv.first);
  }
  return out;
}

bool StrategyTable::resolve(const std::string& key, ValidationStrategy& out, std::string& error) const {
  const auto it = entries_.find(key);
  if (it == entries_.end()) {
    error = "unknown strategy: " + key;
    return false;
  }

  ValidationStrategy strategy;
  strategy.name = key;
  strategy.step_names = it->second.steps;
  for (const auto& name : it->second.steps) {
    const auto kind = lookup_step(name);
    if (kind) {
      strategy.steps.push_back(*kind);
    } else {
      strategy.unknown_steps.push_back(name);
    }
  }

  strategy.sanity_check_step = it->second.sanity_check_step.empty() ? kSkip : it->second.sanity_check_step;
  const auto sanity = lookup_step(strategy.sanity_check_step);
  if (sanity) {
    strategy.sanity_check = *sanity;
  } else {
    strategy.unknown_steps.push_back(strategy.sanity_check_step);
  }

  if (!strategy.unknown_steps.empty()) {
    log::warn("strategy " + key + " names unknown step(s): " + strategy.unknown_steps.front());
  }
  out = std::move(strategy);
  return true;
}

} // namespace evo
