#include <menuscan/analysis/document_validator.hpp>
#include <menuscan/core/text_utils.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>

namespace menuscan::analysis {

namespace nc = menuscan::core;

namespace {

std::optional<long long> price_cents(const nc::MenuItem& item) {
  if (!item.price) return std::nullopt;
  return std::llround(*item.price * 100.0);
}

bool restates(const nc::MenuItem& secondary, const nc::MenuItem& primary) {
  if (price_cents(secondary) != price_cents(primary)) return false;
  if (secondary.provenance.page_index != primary.provenance.page_index) return false;
  const std::string name = nc::normalize_name(secondary.name);
  if (name.empty()) return false;
  const std::string text =
      nc::normalize_name(primary.name + " " + primary.description.value_or(""));
  return text.find(name) != std::string::npos;
}

}  // namespace

std::vector<nc::MenuItem> enforce_unique_names(std::vector<nc::MenuItem> items) {
  std::map<std::string, std::size_t> slot;
  std::vector<nc::MenuItem> out;
  out.reserve(items.size());
  for (auto& item : items) {
    const std::string key = nc::normalize_name(item.name);
    auto it = slot.find(key);
    if (it == slot.end()) {
      slot.emplace(key, out.size());
      out.push_back(std::move(item));
    } else if (item.confidence > out[it->second].confidence) {
      out[it->second] = std::move(item);
    }
  }
  return out;
}

std::vector<nc::MenuItem> drop_price_outliers(std::vector<nc::MenuItem> items,
                                              double sigma,
                                              std::size_t* dropped) {
  if (dropped) *dropped = 0;
  double sum = 0.0;
  std::size_t n = 0;
  for (const auto& item : items) {
    if (!item.price) continue;
    sum += *item.price;
    ++n;
  }
  if (n < 2) return items;

  const double mean = sum / static_cast<double>(n);
  double var = 0.0;
  for (const auto& item : items) {
    if (item.price) var += (*item.price - mean) * (*item.price - mean);
  }
  const double stddev = std::sqrt(var / static_cast<double>(n));
  if (stddev <= 0.0) return items;

  const double limit = mean + sigma * stddev;
  const auto before = items.size();
  std::erase_if(items, [&](const nc::MenuItem& item) { return item.price && *item.price > limit; });
  if (dropped) *dropped = before - items.size();
  return items;
}

std::vector<nc::MenuItem> deduplicate(std::vector<nc::MenuItem> items) {
  std::set<std::pair<std::string, long long>> seen;
  std::vector<nc::MenuItem> out;
  out.reserve(items.size());
  for (auto& item : items) {
    const long long cents = price_cents(item).value_or(std::numeric_limits<long long>::min());
    if (seen.emplace(nc::normalize_name(item.name), cents).second) {
      out.push_back(std::move(item));
    }
  }
  return out;
}

std::vector<nc::MenuItem> order_items(std::vector<nc::MenuItem> items) {
  std::stable_partition(items.begin(), items.end(),
                        [](const nc::MenuItem& item) { return item.provenance.region_box.has_value(); });
  const auto region_end = std::find_if(items.begin(), items.end(), [](const nc::MenuItem& item) {
    return !item.provenance.region_box.has_value();
  });
  std::stable_sort(items.begin(), region_end, [](const nc::MenuItem& a, const nc::MenuItem& b) {
    const auto pa = a.provenance.page_index.value_or(0);
    const auto pb = b.provenance.page_index.value_or(0);
    if (pa != pb) return pa < pb;
    const auto& ba = *a.provenance.region_box;
    const auto& bb = *b.provenance.region_box;
    if (ba.top() != bb.top()) return ba.top() > bb.top();
    return ba.x < bb.x;
  });
  return items;
}

std::vector<nc::MenuItem> merge_item_sets(std::vector<nc::MenuItem> primary,
                                          const std::vector<nc::MenuItem>& secondary) {
  std::vector<nc::MenuItem> merged = std::move(primary);
  const std::size_t primary_count = merged.size();
  for (const auto& item : secondary) {
    const bool redundant = std::any_of(merged.begin(), merged.begin() + static_cast<std::ptrdiff_t>(primary_count),
                                       [&](const nc::MenuItem& p) { return restates(item, p); });
    if (!redundant) merged.push_back(item);
  }
  return enforce_unique_names(std::move(merged));
}

}  // namespace menuscan::analysis
