#include <menuscan/core/token.hpp>
#include <menuscan/core/text_utils.hpp>
#include <algorithm>

namespace menuscan::core {

std::size_t Document::token_count() const noexcept {
  std::size_t n = 0;
  for (const auto& p : pages) n += p.tokens.size();
  return n;
}

Page make_page(std::uint32_t index,
               double width,
               double height,
               std::vector<Token> tokens) {
  Page page;
  page.index = index;
  page.width = width;
  page.height = height;
  for (std::size_t i = 0; i < tokens.size(); ++i) {
    tokens[i].page_index = index;
    tokens[i].ordinal = static_cast<std::uint32_t>(i);
  }
  page.tokens = std::move(tokens);
  return page;
}

double page_width(const Page& page) noexcept {
  if (page.width > 0.0) return page.width;
  double w = 0.0;
  for (const auto& t : page.tokens) w = std::max(w, t.right());
  return w;
}

double page_height(const Page& page) noexcept {
  if (page.height > 0.0) return page.height;
  double h = 0.0;
  for (const auto& t : page.tokens) h = std::max(h, t.top());
  return h;
}

bool is_usable(const Token& token) noexcept {
  return token.width > 0.0 && token.height > 0.0 && !trim_view(token.text).empty();
}

double average_font_size(const std::vector<Token>& tokens) noexcept {
  double sum = 0.0;
  std::size_t n = 0;
  for (const auto& t : tokens) {
    if (!is_usable(t)) continue;
    sum += t.effective_font_size();
    ++n;
  }
  return n == 0 ? 0.0 : sum / static_cast<double>(n);
}

}  // namespace menuscan::core
