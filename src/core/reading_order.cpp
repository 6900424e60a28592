#include <menuscan/core/reading_order.hpp>
#include <menuscan/core/text_utils.hpp>
#include <algorithm>

namespace menuscan::core {

std::vector<std::vector<Token>> group_into_lines(std::span<const Token> tokens,
                                                 double line_tolerance) {
  std::vector<Token> sorted(tokens.begin(), tokens.end());
  std::stable_sort(sorted.begin(), sorted.end(), [](const Token& a, const Token& b) {
    if (a.top() != b.top()) return a.top() > b.top();
    return a.x < b.x;
  });

  std::vector<std::vector<Token>> lines;
  double line_top = 0.0;
  for (auto& t : sorted) {
    const double tol = line_tolerance * t.effective_font_size();
    if (lines.empty() || line_top - t.top() > tol) {
      lines.emplace_back();
      line_top = t.top();
    }
    lines.back().push_back(std::move(t));
  }
  for (auto& line : lines) {
    std::stable_sort(line.begin(), line.end(),
                     [](const Token& a, const Token& b) { return a.x < b.x; });
  }
  return lines;
}

std::vector<Token> in_reading_order(std::span<const Token> tokens) {
  std::vector<Token> out;
  out.reserve(tokens.size());
  for (auto& line : group_into_lines(tokens)) {
    for (auto& t : line) out.push_back(std::move(t));
  }
  return out;
}

std::vector<std::string> page_lines(const Page& page) {
  std::vector<Token> usable;
  for (const auto& t : page.tokens) {
    if (is_usable(t)) usable.push_back(t);
  }
  std::vector<std::string> out;
  for (const auto& line : group_into_lines(usable)) {
    std::vector<std::string> parts;
    parts.reserve(line.size());
    for (const auto& t : line) parts.push_back(t.text);
    out.push_back(collapse_whitespace(join_trimmed(parts)));
  }
  return out;
}

}  // namespace menuscan::core
