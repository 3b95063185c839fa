#include "restricted/capabilities.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using restricted::CapabilitySet;

// NOLINTNEXTLINE
TEST(CapabilitySet, DefaultAllowsPureHelpers) {
  CapabilitySet capabilities = CapabilitySet::Default();
  for (const char* name : {"print", "len", "range", "min", "max", "sorted"}) {
    EXPECT_TRUE(capabilities.Allows(name)) << name;
  }
}

// NOLINTNEXTLINE
TEST(CapabilitySet, DefaultGrantsNothingForbidden) {
  CapabilitySet capabilities = CapabilitySet::Default();
  for (const std::string& name : CapabilitySet::Forbidden()) {
    EXPECT_FALSE(capabilities.Allows(name)) << name;
  }
  EXPECT_FALSE(capabilities.Allows("__import__"));
  EXPECT_FALSE(capabilities.Allows("open"));
}

// NOLINTNEXTLINE
TEST(CapabilitySet, ForbiddenNamesAreRejected) {
  EXPECT_ANY_THROW(CapabilitySet({"len", "open"}));
  EXPECT_ANY_THROW(CapabilitySet({"__import__"}));
}

// NOLINTNEXTLINE
TEST(CapabilitySet, Custom) {
  CapabilitySet capabilities({"len"});
  EXPECT_TRUE(capabilities.Allows("len"));
  EXPECT_FALSE(capabilities.Allows("print"));
  EXPECT_EQ(capabilities.Builtins().size(), 1U);
}

// NOLINTNEXTLINE
TEST(CapabilitySet, Attributes) {
  EXPECT_TRUE(CapabilitySet::AllowsAttribute("append"));
  EXPECT_TRUE(CapabilitySet::AllowsAttribute("_private"));
  for (const char* name : {"__class__", "__subclasses__", "__globals__",
                           "__dict__", "gi_frame", "f_globals", "tb_frame",
                           "format", "mro"}) {
    EXPECT_FALSE(CapabilitySet::AllowsAttribute(name)) << name;
  }
}

// NOLINTNEXTLINE
TEST(CapabilitySet, Names) {
  EXPECT_TRUE(CapabilitySet::AllowsName("board"));
  EXPECT_TRUE(CapabilitySet::AllowsName("__name__"));
  EXPECT_FALSE(CapabilitySet::AllowsName("__builtins__"));
  EXPECT_FALSE(CapabilitySet::AllowsName("__loader__"));
}

}  // namespace
