#include "core/outcome.hpp"

#include <kj/debug.h>

namespace core {

const char* FailureCategoryName(FailureCategory category) {
  switch (category) {
    case FailureCategory::NONE:
      return "None";
    case FailureCategory::ENVIRONMENT_UNAVAILABLE:
      return "EnvironmentUnavailable";
    case FailureCategory::PROVISIONING_FAILED:
      return "ProvisioningFailed";
    case FailureCategory::START_FAILED:
      return "StartFailed";
    case FailureCategory::TIMED_OUT:
      return "TimedOut";
    case FailureCategory::EXITED_NON_ZERO:
      return "ExitedNonZero";
    case FailureCategory::RUNTIME_FAULT:
      return "RuntimeFault";
  }
  return "Unknown";
}

ExecutionOutcome ExecutionOutcome::Failed(FailureCategory category,
                                          std::string output,
                                          int32_t exit_code) {
  KJ_REQUIRE(category != FailureCategory::NONE,
             "A failed outcome needs a failure category");
  return ExecutionOutcome(category, std::move(output), exit_code);
}

ExecutionOutcome ExecutionOutcome::WithMove(MoveCandidate move) const {
  ExecutionOutcome outcome = *this;
  outcome.move_ = std::move(move);
  return outcome;
}

ExecutionOutcome ExecutionOutcome::WithTeardownError(
    const std::string& error) const {
  ExecutionOutcome outcome = *this;
  if (!outcome.teardown_error_.empty()) outcome.teardown_error_ += "\n";
  outcome.teardown_error_ += error;
  return outcome;
}

}  // namespace core
