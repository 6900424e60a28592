#pragma once

#include <menuscan/core/menu_item.hpp>
#include <cstddef>
#include <vector>

namespace menuscan::analysis {

/// Keeps one item per normalized name; the higher-confidence item wins and takes the slot
/// of the first occurrence.
[[nodiscard]] std::vector<core::MenuItem> enforce_unique_names(std::vector<core::MenuItem> items);

/// Drops items priced above mean + sigma * stddev (population) of the priced items.
/// Priceless items are never dropped. `dropped` receives the number removed.
[[nodiscard]] std::vector<core::MenuItem> drop_price_outliers(std::vector<core::MenuItem> items,
                                                              double sigma,
                                                              std::size_t* dropped = nullptr);

/// Removes repeats of (normalized name, price in cents), keeping the first.
[[nodiscard]] std::vector<core::MenuItem> deduplicate(std::vector<core::MenuItem> items);

/// Region items by page, top to bottom, left to right; line-fallback items after them in
/// their original order.
[[nodiscard]] std::vector<core::MenuItem> order_items(std::vector<core::MenuItem> items);

/// Union of two item sets, the higher-confidence item winning per normalized name. A
/// secondary item that restates a primary item (same page and price, name contained in the
/// primary's name or description) is dropped.
[[nodiscard]] std::vector<core::MenuItem> merge_item_sets(std::vector<core::MenuItem> primary,
                                                          const std::vector<core::MenuItem>& secondary);

}  // namespace menuscan::analysis
