#pragma once

#include <string>

namespace evo::reason {

// Pipeline / strategy outcomes.
inline constexpr const char* kPending = "PENDING";
inline constexpr const char* kStrategySucceeded = "STRATEGY_SUCCEEDED";
inline constexpr const char* kNoChanges = "VALIDATION_SUCCESS_NO_CHANGES";
inline constexpr const char* kDiscarded = "DISCARDED";
inline constexpr const char* kAppliedAndValidated = "APPLIED_AND_VALIDATED_SANDBOX";
inline constexpr const char* kUnknownValidationStep = "UNKNOWN_VALIDATION_STEP";

// Patch application.
inline constexpr const char* kPatchesApplied = "PATCHES_APPLIED";
inline constexpr const char* kBlockNotFound = "BLOCK_NOT_FOUND";
inline constexpr const char* kInvalidPatch = "INVALID_PATCH";
inline constexpr const char* kPatchIoError = "PATCH_IO_ERROR";

// Cycle level.
inline constexpr const char* kDegenerativeLoop = "DEGENERATIVE_LOOP_DETECTED";
inline constexpr const char* kPlanningFailed = "PLANNING_FAILED";
inline constexpr const char* kStrategySelectionFailed = "STRATEGY_SELECTION_FAILED";
inline constexpr const char* kCapacitationRequired = "CAPACITATION_REQUIRED";
inline constexpr const char* kConfigError = "CONFIG_ERROR";
inline constexpr const char* kPromotionFailed = "PROMOTION_FAILED";
inline constexpr const char* kCommitFailed = "COMMIT_FAILED_POST_SANITY";
inline constexpr const char* kRegressionPrefix = "REGRESSION_DETECTED_BY_";
inline constexpr const char* kCycleException = "CYCLE_EXCEPTION";

// Failures worth a synthesized correction objective. Anything else is
// logged and the engine moves on.
bool is_correctable(const std::string& reason_code);

std::string regression_reason(const std::string& sanity_step_name);

} // namespace evo::reason
