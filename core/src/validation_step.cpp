#include "evo/validation_step.h"

#include "evo/data_io.h"
#include "evo/log.h"
#include "evo/subprocess.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

#include <nlohmann/json.hpp>

#if EVO_ENABLE_YAML
#include <yaml-cpp/yaml.h>
#endif

namespace evo {
namespace fs = std::filesystem;

namespace {

struct StepName {
  const char* name;
  StepKind kind;
};

constexpr std::array<StepName, 14> kStepNames = {{
    {"apply_patches_to_disk", StepKind::ApplyPatches},
    {"PatchApplicatorStep", StepKind::ApplyPatches},
    {"validate_syntax", StepKind::SyntaxCheck},
    {"ValidateJsonSyntax", StepKind::JsonSyntax},
    {"validate_json_syntax", StepKind::JsonSyntax},
    {"run_pytest_validation", StepKind::RunTests},
    {"run_pytest", StepKind::RunTests},
    {"run_tests", StepKind::RunTests},
    {"run_pytest_new_file", StepKind::RunNewTestFile},
    {"run_benchmark_validation", StepKind::Benchmark},
    {"check_file_existence", StepKind::CheckFileExistence},
    {"skip_sanity_check", StepKind::SkipSanityCheck},
    {"SkipSanityCheck", StepKind::SkipSanityCheck},
    {"CheckFileExistence", StepKind::CheckFileExistence},
}};

std::string lower_extension(const fs::path& path) {
  auto ext = path.extension().string();
  for (auto& c : ext) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return ext;
}

ValidationStepResult make_result(bool success, std::string reason_code, std::string details = {}) {
  ValidationStepResult result;
  result.success = success;
  result.reason_code = std::move(reason_code);
  result.details = std::move(details);
  return result;
}

// Patched paths that still exist under base, skipping unsafe ones.
std::vector<std::pair<std::string, fs::path>> existing_patched_files(const StepContext& ctx) {
  std::vector<std::pair<std::string, fs::path>> out;
  for (const auto& rel : distinct_patch_paths(ctx.patches)) {
    const auto full = resolve_patch_path(ctx.base_path, rel);
    if (!full) continue;
    std::error_code ec;
    if (fs::is_regular_file(*full, ec)) {
      out.emplace_back(rel, *full);
    }
  }
  return out;
}

class ApplyPatchesStep : public ValidationStep {
 public:
  using ValidationStep::ValidationStep;

  ValidationStepResult execute() override {
    if (ctx_.patches.empty()) {
      auto result = make_result(true, "NO_PATCHES_TO_APPLY", "plan contains no patches");
      result.nothing_to_promote = true;
      return result;
    }
    const auto applied = apply_patches(ctx_.base_path, ctx_.patches, ctx_.protected_paths);
    auto result = make_result(applied.success, applied.reason_code, applied.message);
    result.file_status = applied.file_status;
    return result;
  }
};

class SyntaxCheckStep : public ValidationStep {
 public:
  using ValidationStep::ValidationStep;

  ValidationStepResult execute() override {
    if (ctx_.patches.empty()) {
      return make_result(true, "SYNTAX_VALIDATION_SKIPPED", "no patches to check");
    }
    std::string errors;
    size_t checked = 0;
    for (const auto& entry : existing_patched_files(ctx_)) {
      const auto ext = lower_extension(entry.second);
      std::string error;
      if (ext == ".json") {
        ++checked;
        check_json(entry.second, error);
      } else if (ext == ".yaml" || ext == ".yml") {
        ++checked;
        check_yaml(entry.second, error);
      } else if (ext == ".py") {
        ++checked;
        check_python(entry.second, error);
      }
      if (!error.empty()) {
        errors += entry.first + ": " + error + "\n";
      }
    }
    if (!errors.empty()) {
      return make_result(false, failure_code("SYNTAX_VALIDATION_FAILED"), errors);
    }
    return make_result(true, "SYNTAX_VALIDATION_SUCCESS", std::to_string(checked) + " file(s) checked");
  }

 private:
  static void check_json(const fs::path& path, std::string& error) {
    try {
      (void)nlohmann::json::parse(data::read_text_file(path));
    } catch (const nlohmann::json::parse_error& e) {
      error = e.what();
    }
  }

  static void check_yaml(const fs::path& path, std::string& error) {
#if EVO_ENABLE_YAML
    try {
      (void)YAML::Load(data::read_text_file(path));
    } catch (const YAML::Exception& e) {
      error = e.what();
    }
#else
    (void)error;
    evo::log::warn("YAML syntax check skipped (YAML support disabled): " + path.string());
#endif
  }

  void check_python(const fs::path& path, std::string& error) const {
    const auto args = substitute_placeholder(split_command_line(ctx_.tools.python_syntax_command), "file",
                                             path.string());
    const auto run = run_command(args, ctx_.base_path, ctx_.tools.command_timeout_seconds);
    if (!run.ok()) {
      error = run.error.empty() ? tail_output(run.output, 2000) : run.error + "\n" + tail_output(run.output, 2000);
    }
  }
};

class JsonSyntaxStep : public ValidationStep {
 public:
  using ValidationStep::ValidationStep;

  ValidationStepResult execute() override {
    std::string errors;
    size_t checked = 0;
    for (const auto& entry : existing_patched_files(ctx_)) {
      if (lower_extension(entry.second) != ".json") continue;
      ++checked;
      try {
        (void)nlohmann::json::parse(data::read_text_file(entry.second));
      } catch (const nlohmann::json::parse_error& e) {
        errors += entry.first + ": " + e.what() + "\n";
      }
    }
    if (!errors.empty()) {
      return make_result(false, failure_code("JSON_SYNTAX_VALIDATION_FAILED"), errors);
    }
    if (checked == 0) {
      return make_result(true, "JSON_SYNTAX_VALIDATION_SKIPPED", "no JSON files patched");
    }
    return make_result(true, "JSON_SYNTAX_VALIDATION_SUCCESS", std::to_string(checked) + " JSON file(s) checked");
  }
};

class RunTestsStep : public ValidationStep {
 public:
  using ValidationStep::ValidationStep;

  ValidationStepResult execute() override {
    const auto args = split_command_line(ctx_.tools.test_command);
    if (args.empty()) {
      return make_result(true, "PYTEST_SKIPPED", "no test command configured");
    }
    const auto run = run_command(args, ctx_.base_path, ctx_.tools.command_timeout_seconds);
    if (run.timed_out) {
      return make_result(false, "TEST_COMMAND_TIMEOUT", run.error + "\n" + tail_output(run.output));
    }
    if (!run.ok()) {
      std::string details = "exit code " + std::to_string(run.exit_code);
      if (!run.error.empty()) details += " (" + run.error + ")";
      return make_result(false, failure_code("PYTEST_FAILURE"), details + "\n" + tail_output(run.output));
    }
    return make_result(true, "PYTEST_SUCCESS", tail_output(run.output));
  }
};

class RunNewTestFileStep : public ValidationStep {
 public:
  using ValidationStep::ValidationStep;

  ValidationStepResult execute() override {
    const PatchInstruction* target = nullptr;
    for (const auto& patch : ctx_.patches) {
      if (patch.operation == PatchOperation::Replace && !patch.match &&
          patch.file_path.find("test") != std::string::npos) {
        target = &patch;
        break;
      }
    }
    if (!target) {
      return make_result(false, "NO_NEW_TEST_FILE_PATCH", "plan does not create a test file");
    }
    const auto full = resolve_patch_path(ctx_.base_path, target->file_path);
    std::error_code ec;
    if (!full || !fs::is_regular_file(*full, ec)) {
      return make_result(false, "TEST_FILE_NOT_FOUND", target->file_path);
    }

    auto args = split_command_line(ctx_.tools.test_command);
    if (args.empty()) {
      return make_result(false, "PYTEST_NEW_FILE_FAILED", "no test command configured");
    }
    const bool has_placeholder = std::any_of(args.begin(), args.end(), [](const std::string& arg) {
      return arg.find("{target}") != std::string::npos;
    });
    if (has_placeholder) {
      args = substitute_placeholder(args, "target", target->file_path);
    } else {
      args.push_back(target->file_path);
    }

    const auto run = run_command(args, ctx_.base_path, ctx_.tools.command_timeout_seconds);
    if (run.timed_out) {
      return make_result(false, "TEST_COMMAND_TIMEOUT", run.error + "\n" + tail_output(run.output));
    }
    if (!run.ok()) {
      return make_result(false, "PYTEST_NEW_FILE_FAILED", tail_output(run.output));
    }
    return make_result(true, "PYTEST_NEW_FILE_PASSED", tail_output(run.output));
  }
};

class BenchmarkStep : public ValidationStep {
 public:
  using ValidationStep::ValidationStep;

  ValidationStepResult execute() override {
    const auto args = split_command_line(ctx_.tools.benchmark_command);
    if (args.empty()) {
      return make_result(true, "BENCHMARK_SKIPPED", "no benchmark command configured");
    }
    const auto run = run_command(args, ctx_.base_path, ctx_.tools.command_timeout_seconds);
    if (!run.ok()) {
      std::string details = run.timed_out ? run.error : "exit code " + std::to_string(run.exit_code);
      return make_result(false, "BENCHMARK_VALIDATION_FAILED", details + "\n" + tail_output(run.output));
    }
    return make_result(true, "BENCHMARK_VALIDATION_PASSED", tail_output(run.output));
  }
};

class CheckFileExistenceStep : public ValidationStep {
 public:
  using ValidationStep::ValidationStep;

  ValidationStepResult execute() override {
    // The last instruction per path decides whether the file should exist.
    std::map<std::string, bool> expect_file;
    for (const auto& patch : ctx_.patches) {
      const bool removes = patch.operation == PatchOperation::Delete && !patch.match;
      expect_file[patch.file_path] = !removes;
    }
    std::string missing;
    for (const auto& kv : expect_file) {
      if (!kv.second) continue;
      const auto full = resolve_patch_path(ctx_.base_path, kv.first);
      std::error_code ec;
      if (!full || !fs::exists(*full, ec)) {
        missing += kv.first + "\n";
      }
    }
    if (!missing.empty()) {
      return make_result(false, "FILE_EXISTENCE_CHECK_FAILED", "missing:\n" + missing);
    }
    return make_result(true, "FILE_EXISTENCE_CHECK_PASSED");
  }
};

class SkipSanityCheckStep : public ValidationStep {
 public:
  using ValidationStep::ValidationStep;

  ValidationStepResult execute() override {
    return make_result(true, "SANITY_CHECK_SKIPPED");
  }
};

} // namespace

std::string ValidationStep::failure_code(const char* base) const {
  std::string code(base);
  if (ctx_.in_sandbox) {
    code += "_IN_SANDBOX";
  }
  return code;
}

const char* step_kind_name(StepKind kind) {
  switch (kind) {
    case StepKind::ApplyPatches:
      return "apply_patches_to_disk";
    case StepKind::SyntaxCheck:
      return "validate_syntax";
    case StepKind::JsonSyntax:
      return "validate_json_syntax";
    case StepKind::RunTests:
      return "run_pytest_validation";
    case StepKind::RunNewTestFile:
      return "run_pytest_new_file";
    case StepKind::Benchmark:
      return "run_benchmark_validation";
    case StepKind::CheckFileExistence:
      return "check_file_existence";
    case StepKind::SkipSanityCheck:
      return "skip_sanity_check";
  }
  return "unknown";
}

std::optional<StepKind> lookup_step(const std::string& name) {
  for (const auto& entry : kStepNames) {
    if (name == entry.name) {
      return entry.kind;
    }
  }
  return std::nullopt;
}

std::vector<std::string> registered_step_names() {
  std::vector<std::string> names;
  names.reserve(kStepNames.size());
  for (const auto& entry : kStepNames) {
    names.emplace_back(entry.name);
  }
  return names;
}

std::unique_ptr<ValidationStep> create_step(StepKind kind, StepContext ctx) {
  switch (kind) {
    case StepKind::ApplyPatches:
      return std::make_unique<ApplyPatchesStep>(std::move(ctx));
    case StepKind::SyntaxCheck:
      return std::make_unique<SyntaxCheckStep>(std::move(ctx));
    case StepKind::JsonSyntax:
      return std::make_unique<JsonSyntaxStep>(std::move(ctx));
    case StepKind::RunTests:
      return std::make_unique<RunTestsStep>(std::move(ctx));
    case StepKind::RunNewTestFile:
      return std::make_unique<RunNewTestFileStep>(std::move(ctx));
    case StepKind::Benchmark:
      return std::make_unique<BenchmarkStep>(std::move(ctx));
    case StepKind::CheckFileExistence:
      return std::make_unique<CheckFileExistenceStep>(std::move(ctx));
    case StepKind::SkipSanityCheck:
      return std::make_unique<SkipSanityCheckStep>(std::move(ctx));
  }
  return nullptr;
}

std::string tail_output(const std::string& output, size_t max_chars) {
  if (output.size() <= max_chars) {
    return output;
  }
  return "..." + output.substr(data::utf8_ceil(output, output.size() - max_chars));
}

} // namespace evo
