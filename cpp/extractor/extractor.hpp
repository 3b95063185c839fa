#ifndef EXTRACTOR_EXTRACTOR_HPP
#define EXTRACTOR_EXTRACTOR_HPP

#include <string>

#include "core/outcome.hpp"

namespace extractor {

// Finds a move in free text. The rules are tried in order, and the first
// one that matches wins:
//  1. the first "(row, col)", with optional whitespace;
//  2. the first "row, col";
//  3. the first two integers anywhere in the text.
// Integers are runs of digits; runs that do not fit an int32_t are ignored.
// The coordinates are not checked against any board.
core::MoveCandidate Extract(const std::string& text);

// Renders a move as "(row, col)", or an empty string for no move.
std::string FormatMove(const core::MoveCandidate& move);

}  // namespace extractor

#endif
