#include "util/misc.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::ElementsAreArray;
using ::testing::IsEmpty;

/*
 * Split
 */

// NOLINTNEXTLINE
TEST(Misc, Split) {
  std::string str = "this is some text";
  auto pieces = util::split(str, ' ');
  EXPECT_THAT(pieces, ElementsAreArray({"this", "is", "some", "text"}));
}

// NOLINTNEXTLINE
TEST(Misc, SplitEmpty) {
  std::string str;
  auto pieces = util::split(str, ' ');
  EXPECT_THAT(pieces, IsEmpty());
}

// NOLINTNEXTLINE
TEST(Misc, SplitSkipEmpty) {
  std::string str = "  wow  much lol  ";
  auto pieces = util::split(str, ' ');
  EXPECT_THAT(pieces, ElementsAreArray({"wow", "much", "lol"}));
}

/*
 * Trim
 */

// NOLINTNEXTLINE
TEST(Misc, Trim) {
  EXPECT_EQ(util::trim("  some text\n\t"), "some text");
  EXPECT_EQ(util::trim("   "), "");
  EXPECT_EQ(util::trim("x"), "x");
}

/*
 * Setters
 */

// NOLINTNEXTLINE
TEST(Misc, SetBool) {
  bool x = false;
  EXPECT_TRUE(util::setBool(x)());
  EXPECT_TRUE(x);
}

// NOLINTNEXTLINE
TEST(Misc, SetString) {
  std::string x;
  EXPECT_TRUE(util::setString(x)("wow"));
  EXPECT_EQ(x, "wow");
}

// NOLINTNEXTLINE
TEST(Misc, SetInt) {
  int32_t x = 0;
  EXPECT_TRUE(util::setInt(x)("-42"));
  EXPECT_EQ(x, -42);
  EXPECT_FALSE(util::setInt(x)("lots"));
  EXPECT_FALSE(util::setInt(x)("99999999999"));
  EXPECT_EQ(x, -42);
}

// NOLINTNEXTLINE
TEST(Misc, SetInt64) {
  int64_t x = 0;
  EXPECT_TRUE(util::setInt64(x)("99999999999"));
  EXPECT_EQ(x, 99999999999LL);
}

// NOLINTNEXTLINE
TEST(Misc, SetUInt) {
  uint32_t x = 0;
  EXPECT_TRUE(util::setUint(x)("42"));
  EXPECT_EQ(x, 42U);
  EXPECT_FALSE(util::setUint(x)("99999999999"));
}

}  // namespace
