#include "core/submission.hpp"

#include <sstream>

#include "util/misc.hpp"

namespace core {

const char* IsolationLevelName(IsolationLevel level) {
  switch (level) {
    case IsolationLevel::STRONG:
      return "strong";
    case IsolationLevel::WEAK:
      return "weak";
  }
  return "unknown";
}

bool ParseIsolationLevel(const std::string& name, IsolationLevel* level) {
  if (name == "strong") {
    *level = IsolationLevel::STRONG;
    return true;
  }
  if (name == "weak") {
    *level = IsolationLevel::WEAK;
    return true;
  }
  return false;
}

Board EmptyBoard(size_t size) {
  return Board(size, std::vector<int32_t>(size, 0));
}

bool ParseBoard(const std::string& text, Board* board, std::string* error_msg) {
  Board parsed;
  size_t line_number = 0;
  std::istringstream lines(text);
  std::string line;
  while (std::getline(lines, line)) {
    line_number++;
    std::string row_text = util::trim(line);
    if (row_text.empty()) continue;
    std::istringstream in(row_text);
    std::vector<int32_t> row;
    int32_t cell = 0;
    while (in >> cell) row.push_back(cell);
    if (!in.eof()) {
      *error_msg = "Invalid cell at line " + std::to_string(line_number);
      return false;
    }
    if (!parsed.empty() && row.size() != parsed.front().size()) {
      *error_msg = "Line " + std::to_string(line_number) + " has " +
                   std::to_string(row.size()) + " cells instead of " +
                   std::to_string(parsed.front().size());
      return false;
    }
    parsed.push_back(std::move(row));
  }
  if (parsed.empty()) {
    *error_msg = "The board is empty";
    return false;
  }
  *board = std::move(parsed);
  return true;
}

}  // namespace core
