#include "extractor/extractor.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using extractor::Extract;
using extractor::FormatMove;

void ExpectMove(const core::MoveCandidate& move, int32_t row, int32_t col) {
  ASSERT_TRUE(move.has_move);
  EXPECT_EQ(move.row, row);
  EXPECT_EQ(move.col, col);
}

// NOLINTNEXTLINE
TEST(Extractor, Parenthesized) {
  ExpectMove(Extract("I think (7, 7) is best"), 7, 7);
}

// NOLINTNEXTLINE
TEST(Extractor, ParenthesizedWithSpaces) {
  ExpectMove(Extract("go to (  3 ,12 )"), 3, 12);
}

// NOLINTNEXTLINE
TEST(Extractor, BarePair) { ExpectMove(Extract("14,3"), 14, 3); }

// NOLINTNEXTLINE
TEST(Extractor, ParenthesizedWinsOverEarlierBarePair) {
  ExpectMove(Extract("not 1, 2 but (5, 6)"), 5, 6);
}

// NOLINTNEXTLINE
TEST(Extractor, FirstTwoIntegers) {
  ExpectMove(Extract("row 4 and column 9, maybe 11"), 4, 9);
}

// NOLINTNEXTLINE
TEST(Extractor, NoMove) {
  core::MoveCandidate move = Extract("no idea");
  EXPECT_FALSE(move.has_move);
  EXPECT_EQ(move.raw, "no idea");
}

// NOLINTNEXTLINE
TEST(Extractor, SingleInteger) { EXPECT_FALSE(Extract("only 7").has_move); }

// NOLINTNEXTLINE
TEST(Extractor, EmptyText) { EXPECT_FALSE(Extract("").has_move); }

// NOLINTNEXTLINE
TEST(Extractor, MinusIsNotPartOfTheNumber) {
  ExpectMove(Extract("(-1, 2)"), 1, 2);
}

// NOLINTNEXTLINE
TEST(Extractor, NoBoundsCheck) { ExpectMove(Extract("(99, 100)"), 99, 100); }

// NOLINTNEXTLINE
TEST(Extractor, OverflowingIntegersAreSkipped) {
  ExpectMove(Extract("(99999999999, 1) or (2, 3)"), 2, 3);
  ExpectMove(Extract("12345678901234567890 then 4 5"), 4, 5);
}

// NOLINTNEXTLINE
TEST(Extractor, LongDigitRun) {
  core::MoveCandidate move = Extract("thinking " + std::string(1 << 20, '1'));
  EXPECT_FALSE(move.has_move);
  ExpectMove(Extract(std::string(1 << 20, '9') + " 3, 4"), 3, 4);
}

// NOLINTNEXTLINE
TEST(Extractor, LongWhitespaceRun) {
  ExpectMove(Extract("(" + std::string(200000, ' ') + "7, 7)"), 7, 7);
  ExpectMove(Extract("1" + std::string(200000, '\n') + ", 2"), 1, 2);
}

// NOLINTNEXTLINE
TEST(Extractor, ManyOpenParentheses) {
  ExpectMove(Extract(std::string(100000, '(') + "2,5)"), 2, 5);
}

// NOLINTNEXTLINE
TEST(Extractor, KeepsRawText) {
  EXPECT_EQ(Extract("answer: 1,1").raw, "answer: 1,1");
}

// NOLINTNEXTLINE
TEST(Extractor, FormatMove) {
  EXPECT_EQ(FormatMove(core::MoveCandidate::Of(7, 3, "")), "(7, 3)");
  EXPECT_EQ(FormatMove(core::MoveCandidate::Empty("")), "");
}

// NOLINTNEXTLINE
TEST(Extractor, FormattedMoveIsExtractedBack) {
  for (int32_t row : {0, 7, 14, 2147483647}) {
    core::MoveCandidate move = core::MoveCandidate::Of(row, 14 - row % 15, "");
    EXPECT_TRUE(Extract(FormatMove(move)).SameMove(move)) << FormatMove(move);
  }
}

}  // namespace
