#include <menuscan/core/text_patterns.hpp>
#include <menuscan/core/text_utils.hpp>
#include <array>
#include <regex>
#include <string>

namespace menuscan::core {

namespace {

const std::regex& currency_regex() {
  static const std::regex re(
      R"((?:\$|€|£|¥|USD|EUR)\s?\d|\b\d{1,4}[.,]\d{2}\b)",
      std::regex::ECMAScript | std::regex::icase);
  return re;
}

const std::regex& currency_marker_regex() {
  static const std::regex re(R"(\$|€|£|¥|USD|EUR)",
                             std::regex::ECMAScript | std::regex::icase);
  return re;
}

const std::regex& unit_suffix_regex() {
  static const std::regex re(
      R"(\d\s*(?:kcal|calories|calorie|cals?|ounces?|oz|lbs?|pounds?|inch(?:es)?|in\.|feet|foot|ft|lit(?:er|re)s?|ml|l|"|')(?![a-z]))",
      std::regex::ECMAScript | std::regex::icase);
  return re;
}

constexpr std::array<std::string_view, 16> kMeasurementUnits = {
    "oz", "ounce", "ounces", "lb", "lbs", "pound", "pounds", "\"",
    "'", "inch", "inches", "foot", "feet", "ft", "ml", "liter",
};

constexpr std::array<std::string_view, 4> kExtraLiterUnits = {
    "liters", "litre", "litres", "l",
};

constexpr std::array<std::string_view, 5> kCalorieUnits = {
    "cal", "cals", "calorie", "calories", "kcal",
};

constexpr std::array<std::string_view, 22> kPreparationVerbs = {
    "grilled", "fried",   "roasted", "baked",     "steamed",  "sauteed",
    "sautéed", "braised", "smoked",  "seared",    "poached",  "glazed",
    "marinated", "stuffed", "crispy", "charred",  "tossed",   "topped",
    "served",  "simmered", "slow-cooked", "pan-seared",
};

constexpr std::array<std::string_view, 20> kCategoryWords = {
    "appetizer", "appetizers", "starter", "starters", "salad",   "salads",
    "soup",      "soups",      "main",    "mains",    "entree",  "entrees",
    "side",      "sides",      "dessert", "desserts", "beverage", "beverages",
    "drinks",    "specials",
};

template <std::size_t N>
bool in_list(const std::array<std::string_view, N>& list, std::string_view w) {
  for (auto item : list) {
    if (item == w) return true;
  }
  return false;
}

/// Splits into lowercase words on anything that is not a letter, digit, '-' or UTF-8 byte.
template <typename Fn>
bool any_word(std::string_view text, Fn&& pred) {
  const std::string lower = to_lower_ascii(text);
  std::string word;
  auto flush = [&]() {
    const bool hit = !word.empty() && pred(std::string_view(word));
    word.clear();
    return hit;
  };
  for (char c : lower) {
    const auto u = static_cast<unsigned char>(c);
    const bool word_char = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
                           c == '-' || u >= 0x80;
    if (word_char) {
      word.push_back(c);
    } else if (flush()) {
      return true;
    }
  }
  return flush();
}

}  // namespace

bool matches_currency(std::string_view text) {
  return std::regex_search(text.begin(), text.end(), currency_regex());
}

bool has_currency_marker(std::string_view text) {
  return std::regex_search(text.begin(), text.end(), currency_marker_regex());
}

bool is_measurement_unit(std::string_view word) {
  const std::string w = to_lower_ascii(trim_view(word));
  return in_list(kMeasurementUnits, w) || in_list(kExtraLiterUnits, w);
}

bool is_calorie_unit(std::string_view word) {
  return in_list(kCalorieUnits, to_lower_ascii(trim_view(word)));
}

bool has_unit_suffix(std::string_view text) {
  return std::regex_search(text.begin(), text.end(), unit_suffix_regex());
}

bool contains_preparation_verb(std::string_view text) {
  return any_word(text, [](std::string_view w) { return in_list(kPreparationVerbs, w); });
}

bool contains_category_word(std::string_view text) {
  return any_word(text, [](std::string_view w) { return in_list(kCategoryWords, w); });
}

}  // namespace menuscan::core
