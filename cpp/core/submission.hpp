#ifndef CORE_SUBMISSION_HPP
#define CORE_SUBMISSION_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace core {

enum class IsolationLevel {
  // Separate container with resource ceilings and no network.
  STRONG,
  // Inside the calling process, with a reduced set of visible names only.
  WEAK
};

const char* IsolationLevelName(IsolationLevel level);
// Parses "strong" or "weak". Returns false on any other value.
bool ParseIsolationLevel(const std::string& name, IsolationLevel* level);

// Board snapshot, indexed as board[row][col]. 0 is an empty cell, 1 and 2
// are the stones of the two players.
using Board = std::vector<std::vector<int32_t>>;

static const constexpr size_t kDefaultBoardSize = 15;

Board EmptyBoard(size_t size = kDefaultBoardSize);

// Parses a board written as one row per line, with whitespace separated
// cells. All the rows must have the same length. Returns false and sets
// error_msg on malformed input.
bool ParseBoard(const std::string& text, Board* board, std::string* error_msg);

// State of the game that is made visible to the submitted code.
struct RuntimeContext {
  Board board;
  int32_t current_player = 2;
};

// Code to be executed, together with the requested isolation level and its
// runtime context.
class CodeSubmission {
 public:
  CodeSubmission(std::string code, IsolationLevel isolation,
                 RuntimeContext context)
      : code_(std::move(code)),
        isolation_(isolation),
        context_(std::move(context)) {}

  const std::string& Code() const { return code_; }
  IsolationLevel Isolation() const { return isolation_; }
  const RuntimeContext& Context() const { return context_; }

 private:
  std::string code_;
  IsolationLevel isolation_;
  RuntimeContext context_;
};

}  // namespace core

#endif
