#include "orchestrator/orchestrator.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::_;
using ::testing::Return;
using ::testing::StrictMock;

using core::ExecutionOutcome;
using core::FailureCategory;
using orchestrator::MoveFromOutput;
using orchestrator::Orchestrator;

class MockExecutor : public core::Executor {
 public:
  MOCK_METHOD1(Run, ExecutionOutcome(const core::CodeSubmission& submission));
};

class OrchestratorTest : public ::testing::Test {
 protected:
  OrchestratorTest()
      : strong_(new StrictMock<MockExecutor>),
        weak_(new StrictMock<MockExecutor>),
        orchestrator_(std::unique_ptr<core::Executor>(strong_),
                      std::unique_ptr<core::Executor>(weak_)) {}

  static core::CodeSubmission Submission(core::IsolationLevel level) {
    return core::CodeSubmission("next_move = (1, 2)", level,
                                core::RuntimeContext());
  }

  StrictMock<MockExecutor>* strong_;
  StrictMock<MockExecutor>* weak_;
  Orchestrator orchestrator_;
};

// NOLINTNEXTLINE
TEST(MoveFromOutput, AfterLastMarker) {
  core::MoveCandidate move =
      MoveFromOutput("1 2\n__next_move__ (3, 4)\n__next_move__ (5, 6)\n");
  ASSERT_TRUE(move.has_move);
  EXPECT_EQ(move.row, 5);
  EXPECT_EQ(move.col, 6);
}

// NOLINTNEXTLINE
TEST(MoveFromOutput, OnlyTheMarkerLine) {
  core::MoveCandidate move = MoveFromOutput("__next_move__ None\n8 9\n");
  EXPECT_FALSE(move.has_move);
}

// NOLINTNEXTLINE
TEST(MoveFromOutput, WholeOutputWithoutMarker) {
  core::MoveCandidate move = MoveFromOutput("I would play 14,3\n");
  ASSERT_TRUE(move.has_move);
  EXPECT_EQ(move.row, 14);
  EXPECT_EQ(move.col, 3);
}

// NOLINTNEXTLINE
TEST_F(OrchestratorTest, StrongExtractsMove) {
  EXPECT_CALL(*strong_, Run(_))
      .WillOnce(Return(ExecutionOutcome::Succeeded("__next_move__ (1, 2)\n")));
  ExecutionOutcome outcome =
      orchestrator_.Execute(Submission(core::IsolationLevel::STRONG));
  EXPECT_TRUE(outcome.Success());
  ASSERT_TRUE(outcome.Move().has_move);
  EXPECT_EQ(outcome.Move().row, 1);
  EXPECT_EQ(outcome.Move().col, 2);
}

// NOLINTNEXTLINE
TEST_F(OrchestratorTest, StrongFailureHasNoMoveAndNoFallback) {
  EXPECT_CALL(*strong_, Run(_))
      .WillOnce(Return(ExecutionOutcome::Failed(
          FailureCategory::TIMED_OUT, "1 2 3", core::kExitTimedOut)));
  ExecutionOutcome outcome =
      orchestrator_.Execute(Submission(core::IsolationLevel::STRONG));
  EXPECT_EQ(outcome.Category(), FailureCategory::TIMED_OUT);
  EXPECT_FALSE(outcome.Move().has_move);
}

// NOLINTNEXTLINE
TEST_F(OrchestratorTest, WeakKeepsItsMove) {
  EXPECT_CALL(*weak_, Run(_))
      .WillOnce(Return(ExecutionOutcome::Succeeded("7 7\n").WithMove(
          core::MoveCandidate::Of(1, 2, "(1, 2)"))));
  ExecutionOutcome outcome =
      orchestrator_.Execute(Submission(core::IsolationLevel::WEAK));
  ASSERT_TRUE(outcome.Move().has_move);
  EXPECT_EQ(outcome.Move().row, 1);
  EXPECT_EQ(outcome.Move().col, 2);
}

// NOLINTNEXTLINE
TEST_F(OrchestratorTest, WeakFaultIsNotRetried) {
  EXPECT_CALL(*weak_, Run(_))
      .WillOnce(Return(ExecutionOutcome::Failed(
          FailureCategory::RUNTIME_FAULT, "boom", core::kExitNotApplicable)));
  ExecutionOutcome outcome =
      orchestrator_.Execute(Submission(core::IsolationLevel::WEAK));
  EXPECT_EQ(outcome.Category(), FailureCategory::RUNTIME_FAULT);
}

}  // namespace
