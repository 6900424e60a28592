#pragma once

#include <menuscan/core/pipeline_config.hpp>
#include <menuscan/core/region.hpp>
#include <menuscan/core/token.hpp>
#include <span>
#include <vector>

namespace menuscan::analysis {

/// Phase 1, proximity mode: groups tokens into horizontal bands, then clusters each band
/// by horizontal gap. Em distances use the page's average font size.
class RegionDetector {
 public:
  explicit RegionDetector(const core::PipelineConfig& config);

  /// Splits tokens (sorted top to bottom) into bands of vertically close tokens.
  [[nodiscard]] std::vector<std::vector<core::Token>> form_bands(
      std::span<const core::Token> tokens, double average_font_size) const;

  /// Splits one band into runs of horizontally close tokens; runs of one token are dropped.
  [[nodiscard]] std::vector<std::vector<core::Token>> cluster_band(
      std::vector<core::Token> band, double average_font_size) const;

  /// Candidate regions for one page, in band order, low-confidence regions removed.
  [[nodiscard]] std::vector<core::Region> detect(const core::Page& page) const;

  /// Heuristic region confidence in [0, 1].
  [[nodiscard]] static float score_region(std::span<const core::Token> tokens);

 private:
  core::PipelineConfig config_;
};

}  // namespace menuscan::analysis
