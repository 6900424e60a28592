#pragma once

#include <menuscan/core/menu_item.hpp>
#include <menuscan/core/pipeline_config.hpp>
#include <menuscan/core/token.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace menuscan::analysis {

/// Raw fields matched on one line (or a line and the one after it).
struct LineMatch {
  std::string name;
  std::string description;
  double price{0.0};
  std::size_t lines_consumed{1};
};

/// One entry of the line rule table: matcher over (lines, index), outcome confidence.
struct LineRule {
  std::string_view name;
  std::function<std::optional<LineMatch>(const std::vector<std::string>&, std::size_t)> match;
  float confidence{0.f};
};

/// Rules in priority order: name-dash-description-price, price at end of line, price in the
/// middle with a trailing description, price first, price alone on the following line.
[[nodiscard]] std::vector<LineRule> make_line_rules();

/// Line-oriented parsing over reading-order page text; used when region assembly yields too
/// little.
class FallbackParser {
 public:
  explicit FallbackParser(const core::PipelineConfig& config);

  /// Items from one page's lines. Ids are "line-p<page>-<line>".
  [[nodiscard]] std::vector<core::MenuItem> parse_lines(const std::vector<std::string>& lines,
                                                        std::uint32_t page_index) const;

  /// Items from every page, in page then line order.
  [[nodiscard]] std::vector<core::MenuItem> parse(const core::Document& document) const;

  [[nodiscard]] const std::vector<LineRule>& rules() const noexcept { return rules_; }

 private:
  [[nodiscard]] std::optional<core::MenuItem> to_item(const LineMatch& match,
                                                      const LineRule& rule,
                                                      std::uint32_t page_index,
                                                      std::size_t line_index) const;

  const core::PipelineConfig& config_;
  std::vector<LineRule> rules_;
};

}  // namespace menuscan::analysis
