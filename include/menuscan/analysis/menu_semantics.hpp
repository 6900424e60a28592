#pragma once

#include <string>
#include <string_view>

namespace menuscan::analysis {

/// Menu category from keywords in name and description: Appetizers, Salads, Soups, Mains,
/// Sides, Desserts, Beverages, or Other. The first category with a matching keyword wins.
[[nodiscard]] std::string categorize(std::string_view name, std::string_view description);

/// Servings per order, from size words ("family", "platter", "personal", pizza sizes),
/// else a per-category default.
[[nodiscard]] int estimate_serving_size(std::string_view name, std::string_view description);

/// Strips list numbering ("12. ") and trailing dot leaders, collapses whitespace.
[[nodiscard]] std::string clean_item_name(std::string_view name);

}  // namespace menuscan::analysis
