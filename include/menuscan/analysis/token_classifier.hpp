#pragma once

#include <menuscan/core/classification.hpp>
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

/// Unit attached to a number, either as a suffix inside the token or as the next token.
enum class UnitKind : std::uint8_t {
  None,
  Calorie,
  Measurement,
};

/// Numeric substring found in a token, before classification.
struct NumberCandidate {
  double value{0.0};
  std::string text;           // matched text including marker/unit
  bool is_integer{true};
  bool two_decimals{false};
  bool currency_marker{false};
  UnitKind unit{UnitKind::None};
  bool item_number_token{false};  // whole token is "#12", "12" or contains "No. 12"
  bool numeric_token{false};      // whole token is the bare number
};

/// Patterns learned in Phase 3 and re-injected for the single refinement pass.
struct ClassifierPatterns {
  std::optional<double> learned_price_min;
  std::optional<double> learned_price_max;

  [[nodiscard]] bool has_price_range() const noexcept {
    return learned_price_min.has_value() && learned_price_max.has_value();
  }
};

/// One entry of the first-match-wins rule table.
struct NumberRule {
  std::string_view name;
  std::function<bool(const NumberCandidate&)> predicate;
  core::NumberType type{core::NumberType::Unknown};
  float confidence{0.f};
};

/// Ordered rule table for the given thresholds. The learned-price rule is present only
/// when `patterns` carries a price range.
[[nodiscard]] std::vector<NumberRule> make_number_rules(const core::PipelineConfig& config,
                                                        const ClassifierPatterns& patterns = {});

/// Extracts numbers with layered patterns: currency-prefixed, then unit-suffixed, then
/// bare. Spans claimed by an earlier layer are skipped by later ones. `next_text` is the
/// following token's text, used to attach a standalone unit word.
[[nodiscard]] std::vector<NumberCandidate> extract_numbers(std::string_view text,
                                                           std::string_view next_text = {});

/// Output of classify_document.
struct ClassificationOutput {
  core::ClassificationIndex index;
  core::FingerprintMap fingerprints;
};

/// Phase 0: classifies every numeric substring and fingerprints font groups.
/// Pure: the same input and config always produce the same output.
class TokenClassifier {
 public:
  explicit TokenClassifier(const core::PipelineConfig& config,
                           ClassifierPatterns patterns = {});

  /// Classifies every number in `token`; `next` is the following token on the page.
  [[nodiscard]] std::vector<core::NumberClassification> classify(
      const core::Token& token, const core::Token* next = nullptr) const;

  /// Applies the rule table to one candidate.
  [[nodiscard]] core::NumberClassification classify_candidate(const NumberCandidate& c) const;

  [[nodiscard]] ClassificationOutput classify_document(const core::Document& document) const;

  [[nodiscard]] const std::vector<NumberRule>& rules() const noexcept { return rules_; }

 private:
  core::PipelineConfig config_;
  ClassifierPatterns patterns_;
  std::vector<NumberRule> rules_;
};

/// Groups tokens by (family, size, weight) and summarizes groups with at least
/// `fingerprint_min_tokens` members.
[[nodiscard]] core::FingerprintMap build_fingerprints(const std::vector<core::Token>& tokens,
                                                      const core::PipelineConfig& config);

[[nodiscard]] core::FingerprintKey fingerprint_key(const core::Token& token);

}  // namespace menuscan::analysis
