#include "extractor/extractor.hpp"

#include <cctype>
#include <cstdint>
#include <vector>

namespace {

// Every rule is a single forward scan, so the cost is linear in the size of
// the text whatever it contains.

bool IsDigit(char c) { return c >= '0' && c <= '9'; }

bool IsSpace(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

size_t SkipSpaces(const std::string& text, size_t pos) {
  while (pos < text.size() && IsSpace(text[pos])) ++pos;
  return pos;
}

// Reads the run of digits starting at *pos and moves *pos past it. Returns
// false if there is no digit at *pos. fits is false if the run does not fit
// an int32_t, and value is only set otherwise.
bool ReadInteger(const std::string& text, size_t* pos, int32_t* value,
                 bool* fits) {
  size_t start = *pos;
  int64_t result = 0;
  *fits = true;
  for (; *pos < text.size() && IsDigit(text[*pos]); ++*pos) {
    if (!*fits) continue;
    result = result * 10 + (text[*pos] - '0');
    if (result > INT32_MAX) *fits = false;
  }
  if (*fits) *value = static_cast<int32_t>(result);
  return *pos > start;
}

// Matches "row <spaces> , <spaces> col" at pos. On a match, *end is the
// position after col.
bool MatchPair(const std::string& text, size_t pos, size_t* end, int32_t* row,
               int32_t* col, bool* fits) {
  bool row_fits = false;
  bool col_fits = false;
  if (!ReadInteger(text, &pos, row, &row_fits)) return false;
  pos = SkipSpaces(text, pos);
  if (pos >= text.size() || text[pos] != ',') return false;
  pos = SkipSpaces(text, pos + 1);
  if (!ReadInteger(text, &pos, col, &col_fits)) return false;
  *end = pos;
  *fits = row_fits && col_fits;
  return true;
}

bool FindParenthesizedPair(const std::string& text, int32_t* row,
                           int32_t* col) {
  for (size_t open = text.find('('); open != std::string::npos;
       open = text.find('(', open + 1)) {
    size_t pos = SkipSpaces(text, open + 1);
    bool fits = false;
    if (!MatchPair(text, pos, &pos, row, col, &fits)) continue;
    pos = SkipSpaces(text, pos);
    if (pos < text.size() && text[pos] == ')' && fits) return true;
  }
  return false;
}

bool FindBarePair(const std::string& text, int32_t* row, int32_t* col) {
  size_t pos = 0;
  while (pos < text.size()) {
    bool run_start =
        IsDigit(text[pos]) && (pos == 0 || !IsDigit(text[pos - 1]));
    size_t end = 0;
    bool fits = false;
    if (run_start && MatchPair(text, pos, &end, row, col, &fits)) {
      if (fits) return true;
      // The search goes on after a pair that does not fit.
      pos = end;
      continue;
    }
    ++pos;
  }
  return false;
}

}  // namespace

namespace extractor {

core::MoveCandidate Extract(const std::string& text) {
  int32_t row = 0;
  int32_t col = 0;
  if (FindParenthesizedPair(text, &row, &col) ||
      FindBarePair(text, &row, &col)) {
    return core::MoveCandidate::Of(row, col, text);
  }
  std::vector<int32_t> numbers;
  size_t pos = 0;
  while (pos < text.size() && numbers.size() < 2) {
    int32_t value = 0;
    bool fits = false;
    if (ReadInteger(text, &pos, &value, &fits)) {
      if (fits) numbers.push_back(value);
    } else {
      ++pos;
    }
  }
  if (numbers.size() == 2) {
    return core::MoveCandidate::Of(numbers[0], numbers[1], text);
  }
  return core::MoveCandidate::Empty(text);
}

std::string FormatMove(const core::MoveCandidate& move) {
  if (!move.has_move) return "";
  return "(" + std::to_string(move.row) + ", " + std::to_string(move.col) +
         ")";
}

}  // namespace extractor
