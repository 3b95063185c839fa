#include "core/submission.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::HasSubstr;

// NOLINTNEXTLINE
TEST(Submission, IsolationLevel) {
  core::IsolationLevel level = core::IsolationLevel::STRONG;
  EXPECT_TRUE(core::ParseIsolationLevel("weak", &level));
  EXPECT_EQ(level, core::IsolationLevel::WEAK);
  EXPECT_STREQ(core::IsolationLevelName(level), "weak");
  EXPECT_FALSE(core::ParseIsolationLevel("medium", &level));
  EXPECT_EQ(level, core::IsolationLevel::WEAK);
}

// NOLINTNEXTLINE
TEST(Submission, EmptyBoard) {
  core::Board board = core::EmptyBoard();
  ASSERT_EQ(board.size(), 15U);
  for (const auto& row : board) {
    EXPECT_EQ(row, std::vector<int32_t>(15, 0));
  }
}

// NOLINTNEXTLINE
TEST(Submission, ParseBoard) {
  core::Board board;
  std::string error_msg;
  ASSERT_TRUE(core::ParseBoard("0 0 1\n\n 2 0 0 \n0 0 0", &board, &error_msg))
      << error_msg;
  EXPECT_EQ(board, (core::Board{{0, 0, 1}, {2, 0, 0}, {0, 0, 0}}));
}

// NOLINTNEXTLINE
TEST(Submission, ParseBoardErrors) {
  core::Board board;
  std::string error_msg;
  EXPECT_FALSE(core::ParseBoard("0 0\n\n0 x\n", &board, &error_msg));
  EXPECT_THAT(error_msg, HasSubstr("line 3"));
  EXPECT_FALSE(core::ParseBoard("0 0\n0\n", &board, &error_msg));
  EXPECT_THAT(error_msg, HasSubstr("Line 2 has 1 cells instead of 2"));
  EXPECT_FALSE(core::ParseBoard("\n  \n", &board, &error_msg));
  EXPECT_TRUE(board.empty());
}

// NOLINTNEXTLINE
TEST(Submission, CodeSubmission) {
  core::RuntimeContext context;
  context.board = core::EmptyBoard(3);
  context.current_player = 1;
  core::CodeSubmission submission("pass", core::IsolationLevel::STRONG,
                                  context);
  EXPECT_EQ(submission.Code(), "pass");
  EXPECT_EQ(submission.Isolation(), core::IsolationLevel::STRONG);
  EXPECT_EQ(submission.Context().board.size(), 3U);
  EXPECT_EQ(submission.Context().current_player, 1);
}

}  // namespace
