#pragma once

#include <menuscan/analysis/token_classifier.hpp>
#include <menuscan/core/error.hpp>
#include <menuscan/core/menu_item.hpp>
#include <menuscan/core/parse_log.hpp>
#include <menuscan/core/pipeline_config.hpp>
#include <menuscan/core/session.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace menuscan::analysis {

/// States of the Phase 3 bootstrap loop.
enum class BootstrapState : std::uint8_t {
  Assemble,
  AssessBootstrap,
  Fallback,
  Reprocess,
  Converge,
  Validate,
  Dedup,
  Done,
};

[[nodiscard]] std::string_view to_string(BootstrapState s) noexcept;

/// Yield of one item set.
struct QualityAssessment {
  std::size_t count{0};
  double mean_confidence{0.0};
  double coverage{0.0};  // items / price-classified numbers, capped at 1
  double quality{0.0};
  bool sufficient{false};
};

/// quality = 0.4 * mean confidence + 0.3 * min(count / floor, 1) + 0.3 * coverage.
[[nodiscard]] QualityAssessment assess_quality(const std::vector<core::MenuItem>& items,
                                               std::size_t price_count,
                                               const core::PipelineConfig& config);

/// Shapes learned from the fallback item set.
struct LearnedPatterns {
  std::optional<std::size_t> name_length_min;
  std::optional<std::size_t> name_length_max;
  std::optional<double> price_min;
  std::optional<double> price_max;
  std::map<std::string, std::size_t> categories;

  [[nodiscard]] ClassifierPatterns classifier_patterns() const;
};

[[nodiscard]] LearnedPatterns learn_patterns(const std::vector<core::MenuItem>& items);

/// Adjusts each item's confidence by +/-0.05 per check against the learned name-length
/// range, price range and category distribution.
[[nodiscard]] std::vector<core::MenuItem> rescore(std::vector<core::MenuItem> items,
                                                  const LearnedPatterns& patterns);

/// Explicit state machine over assembly, fallback parsing and refinement. Terminates within
/// max_bootstrap_iterations; no recursion.
class BootstrapController {
 public:
  struct Hooks {
    std::function<std::vector<core::MenuItem>()> assemble;
    std::function<std::vector<core::MenuItem>()> fallback;
    /// Re-runs classification with learned patterns and re-assembles; called at most once.
    std::function<std::vector<core::MenuItem>(const ClassifierPatterns&)> refine;
    /// Price count after refine reclassified the document; unset keeps the count given to run().
    std::function<std::size_t()> count_prices;
  };

  BootstrapController(const core::PipelineConfig& config, Hooks hooks);

  /// Runs to Done. `price_count` is the number of price-classified numbers in the document.
  [[nodiscard]] std::expected<std::vector<core::MenuItem>, core::PipelineError> run(
      std::size_t price_count,
      std::stop_token stop_token,
      core::ParseLog& log,
      core::BootstrapReport& report) const;

 private:
  const core::PipelineConfig& config_;
  Hooks hooks_;
};

}  // namespace menuscan::analysis
