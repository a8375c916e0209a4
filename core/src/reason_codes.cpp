#include "evo/reason_codes.h"

#include <algorithm>
#include <array>
#include <cctype>

namespace evo::reason {

namespace {
constexpr std::array<const char*, 20> kCorrectable = {
    kBlockNotFound,
    "PATCH_APPLICATION_FAILED",
    kInvalidPatch,
    kPatchIoError,
    "SYNTAX_VALIDATION_FAILED",
    "SYNTAX_VALIDATION_FAILED_IN_SANDBOX",
    "JSON_SYNTAX_VALIDATION_FAILED",
    "JSON_SYNTAX_VALIDATION_FAILED_IN_SANDBOX",
    "PYTEST_FAILURE",
    "PYTEST_FAILURE_IN_SANDBOX",
    "PYTEST_NEW_FILE_FAILED",
    "NO_NEW_TEST_FILE_PATCH",
    "TEST_FILE_NOT_FOUND",
    "TEST_COMMAND_TIMEOUT",
    "BENCHMARK_VALIDATION_FAILED",
    "FILE_EXISTENCE_CHECK_FAILED",
    kUnknownValidationStep,
    kPromotionFailed,
    kCommitFailed,
    "APPLY_PATCHES_TO_DISK_FAILED_IN_SANDBOX",
};
} // namespace

bool is_correctable(const std::string& reason_code) {
  if (reason_code.rfind(kRegressionPrefix, 0) == 0) {
    return true;
  }
  return std::any_of(kCorrectable.begin(), kCorrectable.end(),
                     [&](const char* code) { return reason_code == code; });
}

std::string regression_reason(const std::string& sanity_step_name) {
  std::string upper = sanity_step_name;
  for (auto& c : upper) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  return std::string(kRegressionPrefix) + upper;
}

} // namespace evo::reason
