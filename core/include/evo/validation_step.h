#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <utility>
#include <string>
#include <vector>

#include "evo/config.h"
#include "evo/patch.h"

namespace evo {

enum class StepKind {
  ApplyPatches,
  SyntaxCheck,
  JsonSyntax,
  RunTests,
  RunNewTestFile,
  Benchmark,
  CheckFileExistence,
  SkipSanityCheck
};

struct ValidationStepResult {
  bool success = false;
  std::string reason_code = "PENDING";
  std::string details;
  // Set by a step that succeeded without producing anything to promote.
  bool nothing_to_promote = false;
  std::map<std::string, std::string> file_status;
};

struct StepContext {
  std::filesystem::path base_path;
  std::vector<PatchInstruction> patches;
  bool in_sandbox = false;
  ToolConfig tools;
  // Sandbox excludes; patches may not target them.
  std::vector<std::string> protected_paths;
};

class ValidationStep {
 public:
  explicit ValidationStep(StepContext ctx) : ctx_(std::move(ctx)) {}
  virtual ~ValidationStep() = default;

  ValidationStep(const ValidationStep&) = delete;
  ValidationStep& operator=(const ValidationStep&) = delete;

  virtual ValidationStepResult execute() = 0;

 protected:
  // Appends _IN_SANDBOX when running against a sandbox copy.
  std::string failure_code(const char* base) const;

  StepContext ctx_;
};

const char* step_kind_name(StepKind kind);
// Accepts every registered alias, e.g. "PatchApplicatorStep" and
// "apply_patches_to_disk" both map to ApplyPatches.
std::optional<StepKind> lookup_step(const std::string& name);
std::vector<std::string> registered_step_names();
std::unique_ptr<ValidationStep> create_step(StepKind kind, StepContext ctx);

// Last `max_chars` characters of a command transcript.
std::string tail_output(const std::string& output, size_t max_chars = 4000);

} // namespace evo
