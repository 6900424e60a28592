#pragma once

#include <menuscan/core/classification.hpp>
#include <menuscan/core/page_cache.hpp>
#include <menuscan/core/parse_log.hpp>
#include <menuscan/core/pipeline_config.hpp>
#include <menuscan/core/region.hpp>
#include <menuscan/core/token.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace menuscan::analysis {

/// Why a region failed Phase 2.
enum class RejectReason : std::uint8_t {
  None,
  TooNarrow,
  TooShort,
  TooFewTokens,
  TooLittleText,
  TooSparse,
  MissingPrice,
  LowExtractionQuality,
};

[[nodiscard]] std::string_view to_string(RejectReason r) noexcept;

/// Result of one gate, or of all gates for validate().
struct RegionVerdict {
  bool accepted{true};
  RejectReason reason{RejectReason::None};
  double extraction_quality{0.0};  // heuristic gate only
  std::string detail;
};

/// Output of validate_all, in input order.
struct ValidationOutcome {
  std::vector<core::Region> accepted;
  std::vector<core::Region> price_rejected;  // failed only for lacking a price
  std::size_t rejected{0};
};

/// Phase 2: dimensional, content and heuristic gates plus thumbnail capture.
class RegionValidator {
 public:
  RegionValidator(const core::PipelineConfig& config, const core::ClassificationIndex& classifications);

  [[nodiscard]] RegionVerdict check_dimensions(const core::Region& region) const;
  [[nodiscard]] RegionVerdict check_content(const core::Region& region) const;
  [[nodiscard]] RegionVerdict check_heuristics(const core::Region& region) const;

  /// All gates in order; the first failure wins.
  [[nodiscard]] RegionVerdict validate(const core::Region& region) const;

  /// Validates every region on at most validation_batch_size threads. Accepted regions get
  /// a thumbnail when `cache` is set and thumbnails are enabled; a failed capture keeps the
  /// region with its confidence scaled by thumbnail_failure_penalty.
  [[nodiscard]] ValidationOutcome validate_all(std::vector<core::Region> regions,
                                               core::PageCache* cache,
                                               core::ParseLog& log) const;

 private:
  [[nodiscard]] bool is_price_token(const core::Token& token) const;

  const core::PipelineConfig& config_;
  const core::ClassificationIndex& classifications_;
};

/// Joins a region in the bottom margin of page N with an aligned region in the top margin
/// of page N+1 when one has a name but no price and the other has the price. The page N+1
/// tokens are moved below page N (y -= height of page N+1). Unmatched regions pass through.
[[nodiscard]] std::vector<core::Region> merge_cross_page_continuations(
    std::vector<core::Region> regions,
    const core::Document& document,
    const core::ClassificationIndex& classifications,
    const core::PipelineConfig& config);

}  // namespace menuscan::analysis
