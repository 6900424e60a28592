#pragma once

#include <menuscan/core/token.hpp>
#include <span>
#include <string>
#include <vector>

namespace menuscan::core {

/// Groups tokens into visual lines, top line first, each line left to right.
/// A token starts a new line when its top edge sits more than
/// `line_tolerance * font size` below the current line's top.
[[nodiscard]] std::vector<std::vector<Token>> group_into_lines(std::span<const Token> tokens,
                                                               double line_tolerance = 0.5);

/// Tokens flattened in reading order (lines top to bottom, left to right within a line).
[[nodiscard]] std::vector<Token> in_reading_order(std::span<const Token> tokens);

/// Page text, one string per visual line, token texts joined with single spaces.
[[nodiscard]] std::vector<std::string> page_lines(const Page& page);

}  // namespace menuscan::core
