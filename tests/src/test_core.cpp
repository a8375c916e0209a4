#include "evo/config.h"
#include "evo/data_io.h"
#include "evo/evolution_log.h"
#include "evo/failure_ledger.h"
#include "evo/log.h"
#include "evo/memory.h"
#include "evo/objective_queue.h"
#include "evo/patch.h"
#include "evo/pipeline.h"
#include "evo/promotion.h"
#include "evo/reason_codes.h"
#include "evo/sandbox.h"
#include "evo/strategy.h"
#include "evo/subprocess.h"
#include "evo/validation_step.h"

#include "test_helpers.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;
using json = nlohmann::json;
using evo_test::make_temp_dir;
using evo_test::read_text;
using evo_test::write_text;

namespace {

evo::PatchInstruction make_patch(evo::PatchOperation op, const std::string& file, std::optional<std::string> match,
                                 std::optional<std::string> content, std::optional<int> line = std::nullopt) {
  evo::PatchInstruction patch;
  patch.operation = op;
  patch.file_path = file;
  patch.match = std::move(match);
  patch.content = std::move(content);
  patch.line_number = line;
  return patch;
}

evo::ValidationStrategy resolve_custom(const std::vector<std::string>& steps,
                                       const std::string& sanity = "skip_sanity_check") {
  evo::StrategyTable table;
  table.set("CUSTOM", {steps, sanity});
  evo::ValidationStrategy strategy;
  std::string error;
  table.resolve("CUSTOM", strategy, error);
  return strategy;
}

} // namespace

int main() {
  evo_test::clear_engine_env();
  const auto scratch = make_temp_dir("core");
  evo::log::init("evo_core_tests", scratch / "logs");

  int failures = 0;

  // Test: SIGTERM stops the queue through the watcher thread. Runs first: the
  // stop signals must be blocked before any other thread exists.
  {
    evo::ObjectiveQueue queue;
    evo::StopSignalWatcher watcher(queue);
    if (!evo::StopSignalWatcher::block_signals() || !watcher.start()) {
      std::cerr << "signal watcher did not start\n";
      ++failures;
    } else {
      ::kill(::getpid(), SIGTERM);
      if (!queue.wait_for_stop(std::chrono::milliseconds(3000)) || watcher.signals_seen() != 1) {
        std::cerr << "SIGTERM did not request a queue stop\n";
        ++failures;
      }
      watcher.stop();
    }
  }

  // Test: insert into a missing file creates it with exactly the content.
  {
    const auto dir = make_temp_dir("insert_new");
    const auto result = evo::apply_patch(
        dir, make_patch(evo::PatchOperation::Insert, "a.py", std::nullopt, std::string("print(1)")));
    if (!result.success || read_text(dir / "a.py") != "print(1)") {
      std::cerr << "insert into missing file did not create exact content\n";
      ++failures;
    }
    if (result.file_status.at("a.py") != "created") {
      std::cerr << "insert into missing file should report created\n";
      ++failures;
    }
  }

  // Test: whole-file replace overwrites existing content.
  {
    const auto dir = make_temp_dir("replace_whole");
    write_text(dir / "b.py", "old = 0\nold = 1\n");
    const auto result =
        evo::apply_patch(dir, make_patch(evo::PatchOperation::Replace, "b.py", std::nullopt, std::string("x=1")));
    if (!result.success || read_text(dir / "b.py") != "x=1") {
      std::cerr << "whole-file replace did not overwrite\n";
      ++failures;
    }
  }

  // Test: insert at a line then delete the same block restores the bytes.
  {
    const auto dir = make_temp_dir("inverse");
    const std::vector<std::string> originals = {"l1\nl2\nl3\nl4\nl5\nl6\n", "l1\nl2\n", "l1\nl2", ""};
    for (const auto& original : originals) {
      write_text(dir / "f.txt", original);
      const auto ins =
          evo::apply_patch(dir, make_patch(evo::PatchOperation::Insert, "f.txt", std::nullopt, std::string("X"), 5));
      const auto del =
          evo::apply_patch(dir, make_patch(evo::PatchOperation::Delete, "f.txt", std::string("X"), std::nullopt));
      if (!ins.success || !del.success || read_text(dir / "f.txt") != original) {
        std::cerr << "insert+delete not byte-identical for: [" << original << "] got ["
                  << read_text(dir / "f.txt") << "]\n";
        ++failures;
      }
    }
  }

  // Test: insert positions.
  {
    std::string text = "a\nb\nc\n";
    evo::insert_into_text(text, "first", 1);
    if (text != "first\na\nb\nc\n") {
      std::cerr << "insert at line 1 wrong: " << text << "\n";
      ++failures;
    }
    text = "a\nb\nc\n";
    evo::insert_into_text(text, "mid", 2);
    if (text != "a\nmid\nb\nc\n") {
      std::cerr << "insert at line 2 wrong: " << text << "\n";
      ++failures;
    }
    text = "a\nb";
    evo::insert_into_text(text, "tail", std::nullopt);
    if (text != "a\nb\ntail") {
      std::cerr << "append to unterminated file wrong: " << text << "\n";
      ++failures;
    }
  }

  // Test: regex replace and unmatched blocks.
  {
    const auto dir = make_temp_dir("regex");
    write_text(dir / "m.py", "value = 41\nother = 2\n");
    auto patch = make_patch(evo::PatchOperation::Replace, "m.py", std::string("value = \\d+"), std::string("value = 42"));
    patch.is_regex = true;
    if (!evo::apply_patch(dir, patch).success || read_text(dir / "m.py") != "value = 42\nother = 2\n") {
      std::cerr << "regex replace failed\n";
      ++failures;
    }
    const auto missing = evo::apply_patch(
        dir, make_patch(evo::PatchOperation::Replace, "m.py", std::string("absent"), std::string("x")));
    if (missing.success || missing.reason_code != evo::reason::kBlockNotFound) {
      std::cerr << "unmatched replace should be BLOCK_NOT_FOUND\n";
      ++failures;
    }
    auto bad = make_patch(evo::PatchOperation::Replace, "m.py", std::string("(unclosed"), std::string("x"));
    bad.is_regex = true;
    if (evo::apply_patch(dir, bad).reason_code != evo::reason::kInvalidPatch) {
      std::cerr << "bad regex should be INVALID_PATCH\n";
      ++failures;
    }
    const auto no_file = evo::apply_patch(
        dir, make_patch(evo::PatchOperation::Delete, "ghost.py", std::string("x"), std::nullopt));
    if (no_file.reason_code != evo::reason::kBlockNotFound) {
      std::cerr << "delete with match on missing file should be BLOCK_NOT_FOUND\n";
      ++failures;
    }
  }

  // Test: unsafe paths are rejected.
  {
    const auto dir = make_temp_dir("unsafe");
    for (const std::string path : {"../escape.txt", "/etc/passwd", "", ".git/config", "./.git/hooks/pre-commit"}) {
      const auto result =
          evo::apply_patch(dir, make_patch(evo::PatchOperation::Insert, path, std::nullopt, std::string("x")));
      if (result.success || result.reason_code != evo::reason::kInvalidPatch) {
        std::cerr << "unsafe path accepted: " << path << "\n";
        ++failures;
      }
    }
  }

  // Test: apply_patches stops at the first failure and marks the rest skipped.
  {
    const auto dir = make_temp_dir("batch");
    write_text(dir / "keep.txt", "keep\n");
    std::vector<evo::PatchInstruction> patches = {
        make_patch(evo::PatchOperation::Insert, "one.txt", std::nullopt, std::string("1")),
        make_patch(evo::PatchOperation::Replace, "keep.txt", std::string("nope"), std::string("x")),
        make_patch(evo::PatchOperation::Insert, "three.txt", std::nullopt, std::string("3")),
    };
    const auto result = evo::apply_patches(dir, patches);
    if (result.success || result.reason_code != evo::reason::kBlockNotFound) {
      std::cerr << "batch should fail with BLOCK_NOT_FOUND\n";
      ++failures;
    }
    if (fs::exists(dir / "three.txt") || result.file_status.at("three.txt") != "skipped") {
      std::cerr << "patch after a failure should be skipped\n";
      ++failures;
    }
    if (result.file_status.at("keep.txt").rfind("failed", 0) != 0) {
      std::cerr << "failing patch should report failed status\n";
      ++failures;
    }
  }

  // Test: plan patch parsing accepts aliases and rejects unknown operations.
  {
    json list = json::array();
    list.push_back({{"operation", "insert"}, {"file_path", "a.py"}, {"content", {"line1", "line2"}}, {"line_number", "3"}});
    list.push_back({{"operation", "DELETE_BLOCK"}, {"file_path", "b.py"}, {"block_to_delete", "x"}});
    std::vector<evo::PatchInstruction> parsed;
    std::string error;
    if (!evo::parse_patch_list(list, parsed, error) || parsed.size() != 2) {
      std::cerr << "patch list parse failed: " << error << "\n";
      ++failures;
    } else {
      if (parsed[0].content.value_or("") != "line1\nline2" || parsed[0].line_number.value_or(0) != 3) {
        std::cerr << "insert content/line_number not parsed\n";
        ++failures;
      }
      if (parsed[1].operation != evo::PatchOperation::Delete || parsed[1].match.value_or("") != "x") {
        std::cerr << "DELETE_BLOCK alias not parsed\n";
        ++failures;
      }
    }
    evo::PatchInstruction bad;
    if (evo::parse_patch_instruction({{"operation", "MOVE"}, {"file_path", "a"}}, bad, error)) {
      std::cerr << "unknown operation accepted\n";
      ++failures;
    }
  }

  // Test: step registry aliases and unknown names.
  {
    if (evo::lookup_step("PatchApplicatorStep") != evo::StepKind::ApplyPatches ||
        evo::lookup_step("apply_patches_to_disk") != evo::StepKind::ApplyPatches ||
        evo::lookup_step("run_pytest_validation") != evo::StepKind::RunTests) {
      std::cerr << "step aliases not registered\n";
      ++failures;
    }
    if (evo::lookup_step("no_such_step")) {
      std::cerr << "unknown step resolved\n";
      ++failures;
    }
    const auto strategy = resolve_custom({"apply_patches_to_disk", "no_such_step"});
    if (strategy.unknown_steps.size() != 1 || strategy.unknown_steps.front() != "no_such_step") {
      std::cerr << "unknown step not recorded on strategy\n";
      ++failures;
    }
    evo::StepContext ctx;
    ctx.base_path = make_temp_dir("unknown_step");
    ctx.patches = {make_patch(evo::PatchOperation::Insert, "new.txt", std::nullopt, std::string("x"))};
    const auto pipeline = evo::run_pipeline(strategy, ctx);
    if (pipeline.result.reason_code != evo::reason::kUnknownValidationStep || !pipeline.executed_steps.empty() ||
        fs::exists(ctx.base_path / "new.txt")) {
      std::cerr << "strategy with unknown step should fail before running anything\n";
      ++failures;
    }
  }

  // Test: a failing step stops every later step.
  {
    const auto dir = make_temp_dir("fail_fast");
    write_text(dir / "conf.json", "{ broken");
    evo::StepContext ctx;
    ctx.base_path = dir;
    ctx.patches = {make_patch(evo::PatchOperation::Insert, "conf.json", std::nullopt, std::string("tail"), 1)};
    const auto strategy = resolve_custom({"validate_json_syntax", "PatchApplicatorStep", "check_file_existence"});
    const auto pipeline = evo::run_pipeline(strategy, ctx);
    if (pipeline.result.success || pipeline.result.reason_code != "JSON_SYNTAX_VALIDATION_FAILED") {
      std::cerr << "json step should fail: " << pipeline.result.reason_code << "\n";
      ++failures;
    }
    if (pipeline.executed_steps.size() != 1 || read_text(dir / "conf.json") != "{ broken") {
      std::cerr << "steps after the failing one executed\n";
      ++failures;
    }
  }

  // Test: patch failure in the sandbox leaves the real tree untouched and skips tests.
  {
    const auto root = make_temp_dir("scenario_c");
    write_text(root / "app.py", "def f():\n    return 1\n");
    const auto strategy = resolve_custom({"apply_patches_to_disk", "run_pytest_validation"});
    evo::StrategyRunOptions options;
    options.project_root = root;
    options.tools.test_command = "false";
    const evo::SandboxManager sandboxes;
    options.sandbox = &sandboxes;
    const auto run = evo::execute_strategy(
        strategy, {make_patch(evo::PatchOperation::Replace, "app.py", std::string("return 2"), std::string("x"))},
        options);
    if (run.result.success || run.result.reason_code != evo::reason::kBlockNotFound) {
      std::cerr << "expected BLOCK_NOT_FOUND, got " << run.result.reason_code << "\n";
      ++failures;
    }
    if (run.executed_steps.size() != 1 || !run.used_sandbox || run.changed_project) {
      std::cerr << "test step ran after patch failure or project changed\n";
      ++failures;
    }
    if (read_text(root / "app.py") != "def f():\n    return 1\n") {
      std::cerr << "real tree modified after failed patch\n";
      ++failures;
    }
  }

  // Test: sandbox success is promoted; sandbox failure is not.
  {
    const auto root = make_temp_dir("promotion");
    write_text(root / "data.json", "{\"a\": 1}\n");
    write_text(root / "old.txt", "bye\n");
    const auto strategy = resolve_custom({"PatchApplicatorStep", "ValidateJsonSyntax"});
    evo::StrategyRunOptions options;
    options.project_root = root;
    options.audit_path = root / ".evo" / "audit.log";
    const evo::SandboxManager sandboxes({".evo"});
    options.sandbox = &sandboxes;

    const std::vector<evo::PatchInstruction> good = {
        make_patch(evo::PatchOperation::Replace, "data.json", std::string("1"), std::string("2")),
        make_patch(evo::PatchOperation::Delete, "old.txt", std::nullopt, std::nullopt),
        make_patch(evo::PatchOperation::Insert, "sub/new.txt", std::nullopt, std::string("hi")),
    };
    const auto run = evo::execute_strategy(strategy, good, options);
    if (!run.result.success || run.result.reason_code != evo::reason::kAppliedAndValidated || !run.changed_project) {
      std::cerr << "promotion expected, got " << run.result.reason_code << "\n";
      ++failures;
    }
    if (read_text(root / "data.json") != "{\"a\": 2}\n" || fs::exists(root / "old.txt") ||
        read_text(root / "sub" / "new.txt") != "hi") {
      std::cerr << "promoted tree content wrong\n";
      ++failures;
    }
    if (read_text(options.audit_path).find("\"promote\"") == std::string::npos) {
      std::cerr << "promotion audit line missing\n";
      ++failures;
    }

    const std::vector<evo::PatchInstruction> broken = {
        make_patch(evo::PatchOperation::Replace, "data.json", std::string("2}"), std::string("2")),
    };
    const auto rejected = evo::execute_strategy(strategy, broken, options);
    if (rejected.result.success || rejected.result.reason_code != "JSON_SYNTAX_VALIDATION_FAILED_IN_SANDBOX" ||
        rejected.changed_project) {
      std::cerr << "invalid json should fail in sandbox, got " << rejected.result.reason_code << "\n";
      ++failures;
    }
    if (read_text(root / "data.json") != "{\"a\": 2}\n") {
      std::cerr << "real tree changed by a failed sandbox run\n";
      ++failures;
    }
  }

  // Test: patches into excluded paths or .git are refused and the real files survive.
  {
    const auto root = make_temp_dir("excluded_targets");
    write_text(root / "vendor" / "lib.py", "line1\nline2\nline3\n");
    write_text(root / ".git" / "config", "[core]\n");
    write_text(root / "app.py", "x = 1\n");
    const auto strategy = resolve_custom({"PatchApplicatorStep"});
    evo::StrategyRunOptions options;
    options.project_root = root;
    const evo::SandboxManager sandboxes({"vendor/"});
    options.sandbox = &sandboxes;

    const auto vendor_run = evo::execute_strategy(
        strategy,
        {make_patch(evo::PatchOperation::Insert, "app.py", std::nullopt, std::string("y = 2"), 2),
         make_patch(evo::PatchOperation::Insert, "vendor/lib.py", std::nullopt, std::string("new"), 2)},
        options);
    if (vendor_run.result.success || vendor_run.result.reason_code != evo::reason::kInvalidPatch ||
        vendor_run.changed_project) {
      std::cerr << "patch into an excluded directory accepted: " << vendor_run.result.reason_code << "\n";
      ++failures;
    }
    const auto git_run = evo::execute_strategy(
        strategy, {make_patch(evo::PatchOperation::Delete, ".git/config", std::nullopt, std::nullopt)}, options);
    if (git_run.result.success || git_run.result.reason_code != evo::reason::kInvalidPatch || git_run.changed_project) {
      std::cerr << "patch into .git accepted: " << git_run.result.reason_code << "\n";
      ++failures;
    }
    if (read_text(root / "vendor" / "lib.py") != "line1\nline2\nline3\n" || !fs::exists(root / ".git" / "config") ||
        read_text(root / "app.py") != "x = 1\n") {
      std::cerr << "excluded files changed by a rejected plan\n";
      ++failures;
    }
    if (!evo::is_protected_patch_path("vendor/sub/../lib.py", {"vendor/"}) ||
        evo::is_protected_patch_path("vendored.py", {"vendor"})) {
      std::cerr << "protected path matching wrong\n";
      ++failures;
    }
  }

  // Test: a symlink leading out of the tree is not a patch target.
  {
    const auto root = make_temp_dir("symlink_root");
    const auto outside = make_temp_dir("symlink_target");
    write_text(outside / "real_cfg.py", "A = 1\n");
    std::error_code ec;
    fs::create_symlink(outside / "real_cfg.py", root / "cfg.py", ec);
    if (ec) {
      std::cerr << "symlink setup failed: " << ec.message() << "\n";
      ++failures;
    } else {
      const auto strategy = resolve_custom({"PatchApplicatorStep"});
      evo::StrategyRunOptions options;
      options.project_root = root;
      const evo::SandboxManager sandboxes;
      options.sandbox = &sandboxes;
      const auto run = evo::execute_strategy(
          strategy, {make_patch(evo::PatchOperation::Replace, "cfg.py", std::string("A = 1"), std::string("A = 2"))},
          options);
      if (run.result.success || run.result.reason_code != evo::reason::kInvalidPatch || run.changed_project) {
        std::cerr << "write through an escaping symlink accepted: " << run.result.reason_code << "\n";
        ++failures;
      }
      if (read_text(outside / "real_cfg.py") != "A = 1\n") {
        std::cerr << "symlink target modified\n";
        ++failures;
      }
    }
    fs::remove_all(outside, ec);
  }

  // Test: strategies without disk modification never promote.
  {
    const auto root = make_temp_dir("no_disk");
    write_text(root / "c.json", "{}");
    const auto strategy = resolve_custom({"ValidateJsonSyntax"});
    evo::StrategyRunOptions options;
    options.project_root = root;
    const auto run = evo::execute_strategy(
        strategy, {make_patch(evo::PatchOperation::Replace, "c.json", std::nullopt, std::string("[]"))}, options);
    if (!run.result.success || run.result.reason_code != evo::reason::kNoChanges || run.changed_project ||
        read_text(root / "c.json") != "{}") {
      std::cerr << "check-only strategy must not modify the tree\n";
      ++failures;
    }
  }

  // Test: DISCARD strategy touches nothing.
  {
    evo::ValidationStrategy strategy;
    std::string error;
    evo::StrategyTable::builtin().resolve(evo::kDiscardStrategy, strategy, error);
    evo::StepContext ctx;
    ctx.base_path = make_temp_dir("discard");
    ctx.patches = {make_patch(evo::PatchOperation::Insert, "x.txt", std::nullopt, std::string("x"))};
    const auto pipeline = evo::run_pipeline(strategy, ctx);
    if (!pipeline.result.success || pipeline.result.reason_code != evo::reason::kDiscarded ||
        fs::exists(ctx.base_path / "x.txt")) {
      std::cerr << "DISCARD should succeed without changes\n";
      ++failures;
    }
  }

  // Test: sandbox copies exclude .git and configured paths and clean up on release.
  {
    const auto root = make_temp_dir("sandbox_src");
    write_text(root / "src" / "main.py", "pass\n");
    write_text(root / ".git" / "HEAD", "ref: refs/heads/main\n");
    write_text(root / ".evo" / "memory.json", "{}");
    evo::SandboxManager manager({".evo"});
    evo::SandboxHandle handle;
    std::string error;
    if (!manager.acquire(root, handle, error)) {
      std::cerr << "sandbox acquire failed: " << error << "\n";
      ++failures;
    } else {
      const auto path = handle.path();
      if (read_text(path / "src" / "main.py") != "pass\n" || fs::exists(path / ".git") ||
          fs::exists(path / ".evo")) {
        std::cerr << "sandbox copy contents wrong\n";
        ++failures;
      }
      manager.release(handle);
      if (fs::exists(path) || handle.valid()) {
        std::cerr << "sandbox not removed on release\n";
        ++failures;
      }
    }
  }

  // Test: promotion copies and deletes against the real tree.
  {
    const auto sandbox = make_temp_dir("promote_sb");
    const auto real = make_temp_dir("promote_real");
    write_text(sandbox / "a.txt", "new\n");
    write_text(real / "a.txt", "old\n");
    write_text(real / "gone.txt", "x\n");
    const auto result = evo::promote_changes(
        sandbox, real,
        {make_patch(evo::PatchOperation::Replace, "a.txt", std::nullopt, std::string("new\n")),
         make_patch(evo::PatchOperation::Delete, "gone.txt", std::nullopt, std::nullopt)});
    if (!result.success || read_text(real / "a.txt") != "new\n" || fs::exists(real / "gone.txt") ||
        result.promoted.size() != 1 || result.deleted.size() != 1) {
      std::cerr << "promote_changes result wrong\n";
      ++failures;
    }
  }

  // Test: consecutive failure counting stops at a success of the same objective.
  {
    evo::FailureLedger ledger(20);
    const auto add = [&](const std::string& objective, evo::OutcomeStatus status) {
      ledger.append({objective, status, status == evo::OutcomeStatus::Success ? "OK" : "FAIL", evo::data::now_iso()});
    };
    add("O", evo::OutcomeStatus::Failure);
    add("O", evo::OutcomeStatus::Success);
    add("O", evo::OutcomeStatus::Failure);
    add("other", evo::OutcomeStatus::Failure);
    add("O", evo::OutcomeStatus::Failure);
    if (evo::is_degenerate(ledger, "O", 3)) {
      std::cerr << "success should break the failure streak\n";
      ++failures;
    }
    add("O", evo::OutcomeStatus::Failure);
    if (!evo::is_degenerate(ledger, "O", 3)) {
      std::cerr << "three failures should be degenerate\n";
      ++failures;
    }
    if (evo::is_degenerate(ledger, "other", 3)) {
      std::cerr << "other objective should not be degenerate\n";
      ++failures;
    }

    evo::FailureLedger small(2);
    small.append({"a", evo::OutcomeStatus::Failure, "X", ""});
    small.append({"b", evo::OutcomeStatus::Failure, "X", ""});
    small.append({"c", evo::OutcomeStatus::Failure, "X", ""});
    if (small.size() != 2 || small.newest_first().front().objective != "c" || small.entries().front().objective != "b") {
      std::cerr << "ledger capacity not enforced\n";
      ++failures;
    }
  }

  // Test: memory persists outcomes and tolerates a corrupt file.
  {
    const auto dir = make_temp_dir("memory");
    const auto path = dir / "memory.json";
    {
      evo::Memory memory(path);
      memory.record_success("build parser", "SYNTAX_ONLY", evo::reason::kAppliedAndValidated, "ok");
      memory.record_failure("add cache", evo::reason::kBlockNotFound, "no block");
      memory.record_discard("loop", evo::reason::kDegenerativeLoop, "discarded");
      memory.add_capability("json parsing", std::string("build parser"));
      if (!memory.save()) {
        std::cerr << "memory save failed\n";
        ++failures;
      }
    }
    evo::Memory loaded(path);
    if (!loaded.load() || loaded.completed().size() != 1 || loaded.failed().size() != 2 ||
        loaded.capabilities().size() != 1 || loaded.ledger().size() != 2) {
      std::cerr << "memory did not round-trip\n";
      ++failures;
    }
    if (loaded.history_summary().find("build parser") == std::string::npos) {
      std::cerr << "history summary missing completed objective\n";
      ++failures;
    }

    write_text(path, "{ not json");
    evo::Memory corrupt(path);
    if (corrupt.load() || !corrupt.completed().empty()) {
      std::cerr << "corrupt memory should report failure and reset\n";
      ++failures;
    }
    evo::Memory absent(dir / "absent.json");
    if (!absent.load()) {
      std::cerr << "missing memory file should load empty\n";
      ++failures;
    }
  }

  // Test: objective queue is LIFO and honors stop requests.
  {
    evo::ObjectiveQueue queue;
    queue.push("first");
    queue.push("second");
    if (queue.snapshot().front() != "second" || queue.try_pop().value_or("") != "second" ||
        queue.try_pop().value_or("") != "first" || !queue.is_empty()) {
      std::cerr << "queue is not LIFO\n";
      ++failures;
    }
    if (queue.wait_pop(std::chrono::milliseconds(10))) {
      std::cerr << "wait_pop on empty queue returned a value\n";
      ++failures;
    }
    queue.request_stop();
    if (!queue.stop_requested() || !queue.wait_for_stop(std::chrono::milliseconds(1000))) {
      std::cerr << "stop request not observed\n";
      ++failures;
    }
  }

  // Test: inbox turns text files into objectives.
  {
    const auto dir = make_temp_dir("inbox");
    write_text(dir / "01.txt", "  add logging  \n");
    write_text(dir / "02.txt", "\n");
    write_text(dir / "notes.md", "ignored");
    evo::ObjectiveQueue queue;
    evo::ObjectiveInbox inbox(dir, queue);
    if (inbox.poll_once() != 1 || queue.try_pop().value_or("") != "add logging") {
      std::cerr << "inbox objective not queued\n";
      ++failures;
    }
    if (fs::exists(dir / "01.txt") || !fs::exists(dir / "processed" / "01.txt") || !fs::exists(dir / "notes.md")) {
      std::cerr << "inbox files not moved to processed\n";
      ++failures;
    }
    if (inbox.poll_once() != 0) {
      std::cerr << "inbox re-queued consumed files\n";
      ++failures;
    }
  }

  // Test: engine config loading from JSON, defaults for a missing file.
  {
    const auto dir = make_temp_dir("config");
    write_text(dir / "engine.json", R"({"engine": {"state_dir": "state", "degenerate_loop_threshold": 5,
      "max_cycles": 2, "tools": {"test_command": "make check"}, "selector": {"default_strategy": "FULL_VALIDATION"},
      "project_root": ")" + dir.string() + R"("}})");
    evo::EngineConfig cfg;
    std::string error;
    if (!evo::load_engine_config(dir / "engine.json", cfg, error) || cfg.degenerate_loop_threshold != 5 ||
        cfg.max_cycles != 2 || cfg.tools.test_command != "make check" || cfg.default_strategy != "FULL_VALIDATION") {
      std::cerr << "json config not loaded: " << error << "\n";
      ++failures;
    }
    const auto paths = evo::resolve_paths(cfg);
    if (paths.state != dir / "state" || paths.memory != dir / "state" / "memory.json") {
      std::cerr << "resolved paths wrong: " << paths.state.string() << "\n";
      ++failures;
    }
    evo::EngineConfig defaults;
    if (!evo::load_engine_config(dir / "missing.yaml", defaults, error) || defaults.degenerate_loop_threshold != 3) {
      std::cerr << "missing config should yield defaults\n";
      ++failures;
    }
    write_text(dir / "bad.json", "{\"engine\": {\"max_cycles\": \"many\"}}");
    evo::EngineConfig bad;
    if (evo::load_engine_config(dir / "bad.json", bad, error)) {
      std::cerr << "mistyped config accepted\n";
      ++failures;
    }
#if EVO_ENABLE_YAML
    write_text(dir / "engine.yaml", "engine:\n  continuous_mode: true\n  sandbox_excludes: [venv, build]\n");
    evo::EngineConfig yaml_cfg;
    if (!evo::load_engine_config(dir / "engine.yaml", yaml_cfg, error) || !yaml_cfg.continuous_mode ||
        yaml_cfg.sandbox_excludes.size() != 2) {
      std::cerr << "yaml config not loaded: " << error << "\n";
      ++failures;
    }
#endif
  }

  // Test: evolution log writes one header and quotes awkward fields.
  {
    const auto dir = make_temp_dir("evolog");
    evo::EvolutionLog log(dir / "evolution_log.csv");
    evo::EvolutionRecord record;
    record.cycle = 1;
    record.objective = "fix \"quoted\", thing\nsecond line";
    record.status = "failure";
    record.elapsed_seconds = 1.5;
    record.reason_code = evo::reason::kBlockNotFound;
    log.append(record);
    record.cycle = 2;
    record.objective = "plain";
    record.status = "success";
    log.append(record);

    std::vector<evo::EvolutionRecord> rows;
    std::string error;
    if (!log.read_all(rows, error) || rows.size() != 2) {
      std::cerr << "evolution log read failed: " << error << "\n";
      ++failures;
    } else if (rows[0].objective != "fix \"quoted\", thing\nsecond line" || rows[1].status != "success" ||
               rows[0].quality != "N/A") {
      std::cerr << "evolution log fields not preserved\n";
      ++failures;
    }
    const auto text = read_text(log.path());
    if (text.find("1.50") == std::string::npos || text.find("cycle") != 0) {
      std::cerr << "evolution log header or elapsed format wrong\n";
      ++failures;
    }
  }

  // Test: shipped strategies file loads with every step registered.
#if EVO_ENABLE_YAML
  {
    evo::StrategyTable table;
    std::string error;
    const fs::path path = fs::path(EVO_SOURCE_DIR) / "config" / "validation_strategies" / "main.yaml";
    if (!table.load(path, error)) {
      std::cerr << "strategies file failed to load: " << error << "\n";
      ++failures;
    } else {
      if (table.contains("CYCLOMATIC_COMPLEXITY_CHECK") || !table.contains("AUTO_CORRECTION_STRATEGY") ||
          table.size() != evo::StrategyTable::builtin().size()) {
        std::cerr << "strategies file contents unexpected\n";
        ++failures;
      }
      for (const auto& key : table.keys()) {
        evo::ValidationStrategy strategy;
        if (!table.resolve(key, strategy, error) || !strategy.unknown_steps.empty()) {
          std::cerr << "strategy " << key << " has unknown steps\n";
          ++failures;
        }
      }
    }
  }
#endif

  // Test: subprocess helpers.
  {
    const auto args = evo::split_command_line("python3 -c 'print(1)' \"a b\"");
    if (args.size() != 4 || args[2] != "print(1)" || args[3] != "a b") {
      std::cerr << "command line split wrong\n";
      ++failures;
    }
    const auto substituted = evo::substitute_placeholder({"check", "--file={file}"}, "file", "x.py");
    if (substituted[1] != "--file=x.py") {
      std::cerr << "placeholder substitution wrong\n";
      ++failures;
    }
    const auto echo = evo::run_command({"sh", "-c", "echo hello; exit 3"}, scratch, 10.0);
    if (!echo.started || echo.exit_code != 3 || echo.output.find("hello") == std::string::npos) {
      std::cerr << "run_command did not capture output/exit code\n";
      ++failures;
    }
    const auto missing = evo::run_command({"evo-no-such-binary"}, scratch, 10.0);
    if (missing.ok()) {
      std::cerr << "missing binary reported success\n";
      ++failures;
    }
    const auto slow = evo::run_command({"sleep", "5"}, scratch, 0.2);
    if (!slow.timed_out) {
      std::cerr << "timeout not enforced\n";
      ++failures;
    }
  }

  // Test: timeouts reach every process the command spawned.
  {
    const auto begin = std::chrono::steady_clock::now();
    const auto forked = evo::run_command({"sh", "-c", "sleep 15 & sleep 15"}, scratch, 1.0);
    const auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - begin).count();
    if (!forked.timed_out || elapsed > 8.0) {
      std::cerr << "timeout waited for a grandchild: " << elapsed << "s\n";
      ++failures;
    }
  }

  // Test: commands run in their own process group with stop signals unblocked.
  {
    const auto group = evo::run_command(
        {"sh", "-c", "read -r pid comm state ppid pgrp rest < /proc/$$/stat; [ \"$pgrp\" = \"$$\" ]"}, scratch, 10.0);
    if (!group.ok()) {
      std::cerr << "command shares the caller's process group\n";
      ++failures;
    }
    const auto term = evo::run_command({"sh", "-c", "kill -TERM $$; sleep 1; exit 0"}, scratch, 10.0);
    if (term.exit_code != 128 + SIGTERM) {
      std::cerr << "SIGTERM stayed blocked in the child: exit " << term.exit_code << "\n";
      ++failures;
    }
  }

  // Test: clipped output and JSON dumps stay valid UTF-8.
  {
    std::string accents = "x";
    for (int i = 0; i < 10; ++i) accents += "\xC3\xA9";
    if (evo::tail_output(accents, 5) != "...\xC3\xA9\xC3\xA9") {
      std::cerr << "tail_output split a multibyte character\n";
      ++failures;
    }
    if (evo::data::utf8_floor(accents, 2) != 1 || evo::data::utf8_ceil(accents, 2) != 3) {
      std::cerr << "utf8 boundary helpers wrong\n";
      ++failures;
    }
    json record;
    record["details"] = std::string("bad \xFF byte");
    std::string dumped;
    try {
      dumped = evo::data::dump_json(record);
    } catch (const std::exception& e) {
      std::cerr << "dump_json threw: " << e.what() << "\n";
      ++failures;
    }
    if (dumped.find("\xEF\xBF\xBD") == std::string::npos) {
      std::cerr << "invalid byte not replaced in JSON dump\n";
      ++failures;
    }
    const auto memory_path = scratch / "utf8_memory.json";
    evo::Memory memory(memory_path);
    memory.record_failure("objective", "PYTEST_FAILURE", std::string("tail \xE9\xFF"));
    evo::Memory reloaded(memory_path);
    if (!memory.save() || !reloaded.load() || reloaded.failed().size() != 1) {
      std::cerr << "memory with invalid UTF-8 details did not round-trip\n";
      ++failures;
    }
  }

  // Test: a crash signal writes its line to stderr and exits with status 1.
  {
    int pipefd[2];
    if (::pipe(pipefd) != 0) {
      std::cerr << "pipe failed\n";
      ++failures;
    } else {
      const pid_t pid = ::fork();
      if (pid == 0) {
        ::dup2(pipefd[1], STDERR_FILENO);
        ::close(pipefd[0]);
        ::close(pipefd[1]);
        evo::log::install_crash_handlers();
        std::raise(SIGSEGV);
        std::_Exit(3);
      }
      ::close(pipefd[1]);
      std::string captured;
      char buffer[256];
      ssize_t n = 0;
      while ((n = ::read(pipefd[0], buffer, sizeof(buffer))) > 0) {
        captured.append(buffer, static_cast<size_t>(n));
      }
      ::close(pipefd[0]);
      int status = 0;
      if (pid < 0 || ::waitpid(pid, &status, 0) != pid || !WIFEXITED(status) || WEXITSTATUS(status) != 1 ||
          captured.find("crash signal: " + std::to_string(SIGSEGV)) == std::string::npos) {
        std::cerr << "crash handler output or exit status wrong: " << captured << "\n";
        ++failures;
      }
    }
  }

  // Test: correctable reasons.
  {
    if (!evo::reason::is_correctable(evo::reason::kBlockNotFound) ||
        !evo::reason::is_correctable(evo::reason::regression_reason("run_pytest")) ||
        evo::reason::is_correctable(evo::reason::kDegenerativeLoop) ||
        evo::reason::is_correctable(evo::reason::kCapacitationRequired)) {
      std::cerr << "correctable reason table wrong\n";
      ++failures;
    }
  }

  evo::log::shutdown();
  std::error_code ec;
  fs::remove_all(scratch, ec);

  if (failures == 0) {
    std::cout << "evo_core_tests: all tests passed\n";
  }
  return failures == 0 ? 0 : 1;
}
