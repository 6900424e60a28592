#include <menuscan/analysis/menu_semantics.hpp>
#include <menuscan/core/text_utils.hpp>
#include <array>
#include <vector>
#include <regex>
#include <utility>

namespace menuscan::analysis {

namespace nc = menuscan::core;

namespace {

struct CategoryKeywords {
  std::string_view category;
  std::vector<std::string_view> keywords;
};

const std::array<CategoryKeywords, 7>& category_table() {
  static const std::array<CategoryKeywords, 7> table = {{
      {"Appetizers", {"appetizer", "starter", "wings", "nachos", "dip", "bread", "bruschetta", "calamari"}},
      {"Salads", {"salad", "caesar", "greens", "lettuce"}},
      {"Soups", {"soup", "bisque", "chowder", "broth"}},
      {"Mains", {"entree", "main", "chicken", "beef", "pork", "fish", "salmon", "steak", "pasta",
                 "pizza", "burger", "sandwich"}},
      {"Sides", {"side", "fries", "rice", "potato", "vegetable", "beans"}},
      {"Desserts", {"dessert", "cake", "pie", "ice cream", "chocolate", "cookie", "tiramisu"}},
      {"Beverages", {"drink", "coffee", "tea", "soda", "juice", "beer", "wine", "cocktail", "water"}},
  }};
  return table;
}

std::string lowered_text(std::string_view name, std::string_view description) {
  std::string text = nc::to_lower_ascii(name);
  text.push_back(' ');
  text += nc::to_lower_ascii(description);
  return text;
}

bool has(const std::string& text, std::string_view word) {
  return text.find(word) != std::string::npos;
}

}  // namespace

std::string categorize(std::string_view name, std::string_view description) {
  const std::string text = lowered_text(name, description);
  for (const auto& entry : category_table()) {
    for (auto keyword : entry.keywords) {
      if (has(text, keyword)) return std::string(entry.category);
    }
  }
  return "Other";
}

int estimate_serving_size(std::string_view name, std::string_view description) {
  const std::string text = lowered_text(name, description);
  if (has(text, "family") || has(text, "large")) return 4;
  if (has(text, "sharing") || has(text, "platter")) return 6;
  if (has(text, "individual") || has(text, "personal")) return 1;
  if (has(text, "pizza")) {
    if (has(text, "medium")) return 3;
    if (has(text, "small")) return 2;
  }

  const std::string category = categorize(name, description);
  if (category == "Appetizers" || category == "Sides") return 2;
  return 1;
}

std::string clean_item_name(std::string_view name) {
  static const std::regex numbering(R"(^\s*\d+\.\s*)");
  static const std::regex dot_leader(R"(\s*\.{2,}\s*$)");
  std::string out = std::regex_replace(std::string(name), numbering, "");
  out = std::regex_replace(out, dot_leader, "");
  return nc::collapse_whitespace(out);
}

}  // namespace menuscan::analysis
