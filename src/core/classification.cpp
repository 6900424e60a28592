#include <menuscan/core/classification.hpp>

namespace menuscan::core {

std::string_view to_string(NumberType t) noexcept {
  switch (t) {
    case NumberType::Price:
      return "Price";
    case NumberType::Calorie:
      return "Calorie";
    case NumberType::Measurement:
      return "Measurement";
    case NumberType::Count:
      return "Count";
    case NumberType::ItemNumber:
      return "ItemNumber";
    case NumberType::Unknown:
    default:
      return "Unknown";
  }
}

std::string_view to_string(ContentPattern p) noexcept {
  switch (p) {
    case ContentPattern::PreparationVerb:
      return "PreparationVerb";
    case ContentPattern::CurrencyShape:
      return "CurrencyShape";
    case ContentPattern::UnitShape:
      return "UnitShape";
    case ContentPattern::CategoryWord:
      return "CategoryWord";
  }
  return "Unknown";
}

void ClassificationIndex::add(NumberClassification c) {
  by_token_[key(c.page_index, c.ordinal)].push_back(all_.size());
  all_.push_back(std::move(c));
}

void ClassificationIndex::clear() noexcept {
  all_.clear();
  by_token_.clear();
}

std::vector<NumberClassification> ClassificationIndex::for_token(const Token& token) const {
  std::vector<NumberClassification> out;
  auto it = by_token_.find(key(token.page_index, token.ordinal));
  if (it == by_token_.end()) return out;
  out.reserve(it->second.size());
  for (std::size_t idx : it->second) out.push_back(all_[idx]);
  return out;
}

std::optional<NumberClassification> ClassificationIndex::best_price(
    const Token& token, float min_confidence) const {
  auto it = by_token_.find(key(token.page_index, token.ordinal));
  if (it == by_token_.end()) return std::nullopt;
  const NumberClassification* best = nullptr;
  for (std::size_t idx : it->second) {
    const auto& c = all_[idx];
    if (c.type != NumberType::Price || c.confidence <= min_confidence) continue;
    if (!best || c.confidence > best->confidence) best = &c;
  }
  if (!best) return std::nullopt;
  return *best;
}

std::size_t ClassificationIndex::count(NumberType type, float min_confidence) const noexcept {
  std::size_t n = 0;
  for (const auto& c : all_) {
    if (c.type == type && c.confidence >= min_confidence) ++n;
  }
  return n;
}

}  // namespace menuscan::core
