#ifndef CORE_OUTCOME_HPP
#define CORE_OUTCOME_HPP

#include <cstdint>
#include <string>
#include <utility>

namespace core {

// Why an execution did not succeed. Exactly one category describes each
// outcome; NONE is used for, and only for, successful executions.
enum class FailureCategory {
  NONE,
  // The container runtime or the image is missing, and pulling it failed.
  ENVIRONMENT_UNAVAILABLE,
  // The isolated environment could not be prepared or created.
  PROVISIONING_FAILED,
  // The workload could not be launched.
  START_FAILED,
  // The wall clock limit was exceeded and the execution was stopped.
  TIMED_OUT,
  // The program ran to completion but returned a non-zero exit code.
  EXITED_NON_ZERO,
  // The in-process execution raised an error.
  RUNTIME_FAULT
};

const char* FailureCategoryName(FailureCategory category);

// Exit code sentinels for outcomes that do not have a real exit code.
static const constexpr int32_t kExitTimedOut = -1;
static const constexpr int32_t kExitSetupFailed = -2;
static const constexpr int32_t kExitNotApplicable = -3;

// A (row, col) pair found in free text. The coordinates are not validated
// against any board.
struct MoveCandidate {
  bool has_move = false;
  int32_t row = 0;
  int32_t col = 0;
  // The text the move was extracted from.
  std::string raw;

  static MoveCandidate Empty(std::string raw) {
    MoveCandidate move;
    move.raw = std::move(raw);
    return move;
  }
  static MoveCandidate Of(int32_t row, int32_t col, std::string raw) {
    MoveCandidate move;
    move.has_move = true;
    move.row = row;
    move.col = col;
    move.raw = std::move(raw);
    return move;
  }
  bool SameMove(const MoveCandidate& other) const {
    if (has_move != other.has_move) return false;
    return !has_move || (row == other.row && col == other.col);
  }
};

// Result of running one submission. Instances are only built through the
// factory functions, which keep Success() == (Category() == NONE).
class ExecutionOutcome {
 public:
  static ExecutionOutcome Succeeded(std::string output, int32_t exit_code = 0) {
    return ExecutionOutcome(FailureCategory::NONE, std::move(output),
                            exit_code);
  }
  static ExecutionOutcome Failed(FailureCategory category, std::string output,
                                 int32_t exit_code);

  // Copies of this outcome with extra information attached.
  ExecutionOutcome WithMove(MoveCandidate move) const;
  ExecutionOutcome WithTeardownError(const std::string& error) const;

  bool Success() const { return category_ == FailureCategory::NONE; }
  FailureCategory Category() const { return category_; }
  const std::string& Output() const { return output_; }
  int32_t ExitCode() const { return exit_code_; }
  const MoveCandidate& Move() const { return move_; }
  // Errors that happened while cleaning up. They never change the category.
  const std::string& TeardownError() const { return teardown_error_; }

 private:
  ExecutionOutcome(FailureCategory category, std::string output,
                   int32_t exit_code)
      : category_(category), output_(std::move(output)), exit_code_(exit_code) {}

  FailureCategory category_;
  std::string output_;
  int32_t exit_code_;
  MoveCandidate move_;
  std::string teardown_error_;
};

}  // namespace core

#endif
