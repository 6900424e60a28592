#pragma once

#include <string_view>

namespace menuscan::core {

/// Currency shape: a currency marker ($, €, £, ¥, USD, EUR) followed by digits, or a
/// number with exactly two decimals ("12.95").
[[nodiscard]] bool matches_currency(std::string_view text);

/// Explicit currency marker anywhere in the text.
[[nodiscard]] bool has_currency_marker(std::string_view text);

/// Standalone measurement unit word (oz, lb, ", ', inch, foot, liter, ml, ...).
/// Case-insensitive; surrounding whitespace ignored.
[[nodiscard]] bool is_measurement_unit(std::string_view word);

/// Standalone calorie word (cal, cals, calories, kcal).
[[nodiscard]] bool is_calorie_unit(std::string_view word);

/// Number immediately followed by a measurement or calorie unit ("12oz", "450 kcal").
[[nodiscard]] bool has_unit_suffix(std::string_view text);

/// Cooking / preparation vocabulary ("grilled", "braised", ...), whole words.
[[nodiscard]] bool contains_preparation_verb(std::string_view text);

/// Menu section vocabulary ("appetizers", "desserts", ...), whole words.
[[nodiscard]] bool contains_category_word(std::string_view text);

}  // namespace menuscan::core
