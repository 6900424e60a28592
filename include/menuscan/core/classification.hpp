#pragma once

#include <menuscan/core/token.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace menuscan::core {

/// Semantic type of a numeric substring.
enum class NumberType : std::uint8_t {
  Price,
  Calorie,
  Measurement,
  Count,
  ItemNumber,
  Unknown,
};

[[nodiscard]] std::string_view to_string(NumberType t) noexcept;

/// One classified number. Not owned by the token; keyed back to it by (page_index, ordinal).
struct NumberClassification {
  double value{0.0};
  NumberType type{NumberType::Unknown};
  float confidence{0.f};
  std::string reasoning;
  std::string matched_text;
  std::uint32_t page_index{0};
  std::uint32_t ordinal{0};

  friend bool operator==(const NumberClassification&, const NumberClassification&) = default;
};

/// Recurring content shapes detected inside a font group.
enum class ContentPattern : std::uint8_t {
  PreparationVerb,
  CurrencyShape,
  UnitShape,
  CategoryWord,
};

[[nodiscard]] std::string_view to_string(ContentPattern p) noexcept;

/// (family, size, weight) key; size is rounded to 0.1 units.
struct FingerprintKey {
  std::string font_family;
  double font_size{0.0};
  int font_weight{400};

  friend auto operator<=>(const FingerprintKey&, const FingerprintKey&) = default;
};

/// Statistical summary of same-styled tokens.
struct TypographyFingerprint {
  std::string font_family;
  double font_size{0.0};
  int font_weight{400};
  std::size_t sample_count{0};
  double average_text_length{0.0};
  std::set<ContentPattern> patterns;
  float confidence{0.f};
};

using FingerprintMap = std::map<FingerprintKey, TypographyFingerprint>;

/// Session-owned lookup from tokens to their number classifications.
class ClassificationIndex {
 public:
  void add(NumberClassification c);
  void clear() noexcept;

  [[nodiscard]] std::vector<NumberClassification> for_token(const Token& token) const;

  /// Highest-confidence Price classification of the token strictly above min_confidence.
  [[nodiscard]] std::optional<NumberClassification> best_price(const Token& token,
                                                               float min_confidence) const;

  [[nodiscard]] bool has_price(const Token& token, float min_confidence) const {
    return best_price(token, min_confidence).has_value();
  }

  [[nodiscard]] std::size_t count(NumberType type, float min_confidence = 0.f) const noexcept;

  [[nodiscard]] const std::vector<NumberClassification>& all() const noexcept { return all_; }
  [[nodiscard]] std::size_t size() const noexcept { return all_.size(); }

 private:
  [[nodiscard]] static std::uint64_t key(std::uint32_t page, std::uint32_t ordinal) noexcept {
    return (static_cast<std::uint64_t>(page) << 32) | ordinal;
  }

  std::vector<NumberClassification> all_;
  std::unordered_map<std::uint64_t, std::vector<std::size_t>> by_token_;
};

}  // namespace menuscan::core
