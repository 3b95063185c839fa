#include "util/notebook.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

// NOLINTNEXTLINE
TEST(Notebook, CodeCellsInOrder) {
  std::string json = R"({
    "cells": [
      {"cell_type": "markdown", "source": ["# Title\n"]},
      {"cell_type": "code", "source": ["x = 1\n", "y = 2"]},
      {"cell_type": "code", "source": "next_move = (x, y)\n"}
    ],
    "metadata": {}, "nbformat": 4, "nbformat_minor": 5
  })";
  EXPECT_EQ(util::NotebookToScript(json),
            "x = 1\ny = 2\nnext_move = (x, y)\n");
}

// NOLINTNEXTLINE
TEST(Notebook, MagicsAreCommentedOut) {
  std::string json = R"({"cells": [{"cell_type": "code", "source":
    ["%matplotlib inline\n", "!pip install numpy\n", "  %time f()\n",
     "a = 5 % 2\n"]}]})";
  EXPECT_EQ(util::NotebookToScript(json),
            "# %matplotlib inline\n# !pip install numpy\n  # %time f()\n"
            "a = 5 % 2\n");
}

// NOLINTNEXTLINE
TEST(Notebook, NoCodeCells) {
  EXPECT_EQ(util::NotebookToScript(R"({"cells": []})"), "");
}

// NOLINTNEXTLINE
TEST(Notebook, NotANotebook) {
  EXPECT_ANY_THROW(util::NotebookToScript("[1, 2]"));
  EXPECT_ANY_THROW(util::NotebookToScript(R"({"metadata": {}})"));
  EXPECT_ANY_THROW(util::NotebookToScript(R"({"cells": 3})"));
  EXPECT_ANY_THROW(util::NotebookToScript("not json"));
}

}  // namespace
