#include <menuscan/core/region.hpp>
#include <menuscan/core/text_utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <limits>

namespace menuscan::core {

bool BBox::contains(const Token& t, double tolerance) const noexcept {
  return t.x >= x - tolerance && t.right() <= right() + tolerance &&
         t.y >= y - tolerance && t.top() <= top() + tolerance;
}

BBox bounding_box_of(std::span<const Token> tokens) noexcept {
  if (tokens.empty()) return {};
  double min_x = std::numeric_limits<double>::max();
  double min_y = std::numeric_limits<double>::max();
  double max_x = std::numeric_limits<double>::lowest();
  double max_y = std::numeric_limits<double>::lowest();
  for (const auto& t : tokens) {
    min_x = std::min(min_x, t.x);
    min_y = std::min(min_y, t.y);
    max_x = std::max(max_x, t.right());
    max_y = std::max(max_y, t.top());
  }
  return {min_x, min_y, max_x - min_x, max_y - min_y};
}

std::string to_string(const BBox& box) {
  return fmt::format("({:.1f},{:.1f} {:.1f}x{:.1f})", box.x, box.y, box.width, box.height);
}

double Region::average_font_size() const noexcept {
  if (tokens.empty()) return 0.0;
  double sum = 0.0;
  for (const auto& t : tokens) sum += t.effective_font_size();
  return sum / static_cast<double>(tokens.size());
}

std::string Region::text() const {
  std::vector<std::string> parts;
  parts.reserve(tokens.size());
  for (const auto& t : tokens) parts.push_back(t.text);
  return join_trimmed(parts);
}

Region make_region(std::vector<Token> tokens,
                   std::uint32_t page_index,
                   double page_height,
                   RegionSource source,
                   float confidence) {
  Region r;
  r.bbox = bounding_box_of(tokens);
  r.tokens = std::move(tokens);
  r.confidence = clamp_confidence(confidence);
  r.page_index = page_index;
  r.page_height = page_height;
  r.source = source;
  return r;
}

}  // namespace menuscan::core
