#include <menuscan/analysis/fallback_parser.hpp>
#include <menuscan/analysis/menu_semantics.hpp>
#include <menuscan/core/reading_order.hpp>
#include <menuscan/core/text_utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <regex>
#include <string>

namespace menuscan::analysis {

namespace nc = menuscan::core;

namespace {

// Optional currency marker followed by an amount with up to two decimals.
constexpr std::string_view kPrice = R"((?:\$|€|£|¥)?\s?(\d{1,4}(?:[.,]\d{1,2})?))";

std::regex around_price(std::string_view head, std::string_view tail) {
  std::string pattern(head);
  pattern += kPrice;
  pattern += tail;
  return std::regex(pattern);
}

const std::regex& dash_rule() {
  static const std::regex re = around_price(R"(^(.+?)\s+(?:-|–|—)\s+(.+?)\s+)", "$");
  return re;
}

const std::regex& price_end_rule() {
  static const std::regex re = around_price(R"(^(.+?)\s+)", "$");
  return re;
}

const std::regex& price_middle_rule() {
  static const std::regex re(R"(^(.+?)\s+(?:\$|€|£|¥)\s?(\d{1,4}(?:[.,]\d{1,2})?)\s+(.+)$)");
  return re;
}

const std::regex& price_first_rule() {
  static const std::regex re = around_price("^", R"(\s+(.+)$)");
  return re;
}

const std::regex& price_only_line() {
  static const std::regex re = around_price("^", "$");
  return re;
}

double parse_amount(std::string text) {
  std::replace(text.begin(), text.end(), ',', '.');
  try {
    return std::stod(text);
  } catch (const std::exception&) {
    return 0.0;
  }
}

}  // namespace

std::vector<LineRule> make_line_rules() {
  std::vector<LineRule> rules;
  rules.push_back({"name - description price",
                   [](const std::vector<std::string>& lines, std::size_t i) -> std::optional<LineMatch> {
                     std::smatch m;
                     if (!std::regex_match(lines[i], m, dash_rule())) return std::nullopt;
                     return LineMatch{m.str(1), m.str(2), parse_amount(m.str(3)), 1};
                   },
                   0.65f});
  rules.push_back({"price at end of line",
                   [](const std::vector<std::string>& lines, std::size_t i) -> std::optional<LineMatch> {
                     std::smatch m;
                     if (!std::regex_match(lines[i], m, price_end_rule())) return std::nullopt;
                     return LineMatch{m.str(1), {}, parse_amount(m.str(2)), 1};
                   },
                   0.6f});
  rules.push_back({"price in middle with trailing description",
                   [](const std::vector<std::string>& lines, std::size_t i) -> std::optional<LineMatch> {
                     std::smatch m;
                     if (!std::regex_match(lines[i], m, price_middle_rule())) return std::nullopt;
                     return LineMatch{m.str(1), m.str(3), parse_amount(m.str(2)), 1};
                   },
                   0.55f});
  rules.push_back({"price first",
                   [](const std::vector<std::string>& lines, std::size_t i) -> std::optional<LineMatch> {
                     std::smatch m;
                     if (!std::regex_match(lines[i], m, price_first_rule())) return std::nullopt;
                     return LineMatch{m.str(2), {}, parse_amount(m.str(1)), 1};
                   },
                   0.5f});
  rules.push_back({"price on following line",
                   [](const std::vector<std::string>& lines, std::size_t i) -> std::optional<LineMatch> {
                     if (i + 1 >= lines.size() || !nc::contains_letter(lines[i])) return std::nullopt;
                     std::smatch m;
                     if (!std::regex_match(lines[i + 1], m, price_only_line())) return std::nullopt;
                     return LineMatch{lines[i], {}, parse_amount(m.str(1)), 2};
                   },
                   0.5f});
  return rules;
}

FallbackParser::FallbackParser(const nc::PipelineConfig& config)
    : config_(config), rules_(make_line_rules()) {}

std::optional<nc::MenuItem> FallbackParser::to_item(const LineMatch& match,
                                                    const LineRule& rule,
                                                    std::uint32_t page_index,
                                                    std::size_t line_index) const {
  if (match.price < config_.price_min || match.price > config_.price_max) return std::nullopt;

  const std::string name = clean_item_name(match.name);
  const std::size_t len = nc::utf8_length(name);
  if (!nc::contains_letter(name) || len < config_.name_min_length || len > config_.name_max_length) {
    return std::nullopt;
  }

  nc::MenuItem item;
  item.id = fmt::format("line-p{}-{}", page_index, line_index);
  item.name = name;
  const std::string description = nc::collapse_whitespace(match.description);
  if (!description.empty()) item.description = description;
  item.price = match.price;
  item.category = categorize(item.name, description);
  item.serving_size = estimate_serving_size(item.name, description);
  item.confidence = nc::clamp_confidence(rule.confidence);
  item.provenance.phase = nc::ProcessingPhase::LineFallback;
  item.provenance.page_index = page_index;
  return item;
}

std::vector<nc::MenuItem> FallbackParser::parse_lines(const std::vector<std::string>& lines,
                                                      std::uint32_t page_index) const {
  std::vector<nc::MenuItem> items;
  std::size_t i = 0;
  while (i < lines.size()) {
    std::size_t consumed = 1;
    for (const auto& rule : rules_) {
      auto match = rule.match(lines, i);
      if (!match) continue;
      if (auto item = to_item(*match, rule, page_index, i)) {
        items.push_back(std::move(*item));
        consumed = match->lines_consumed;
        break;
      }
    }
    i += consumed;
  }
  return items;
}

std::vector<nc::MenuItem> FallbackParser::parse(const nc::Document& document) const {
  std::vector<nc::MenuItem> items;
  for (const auto& page : document.pages) {
    auto page_items = parse_lines(nc::page_lines(page), page.index);
    items.insert(items.end(), std::make_move_iterator(page_items.begin()),
                 std::make_move_iterator(page_items.end()));
  }
  return items;
}

}  // namespace menuscan::analysis
