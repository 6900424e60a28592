#pragma once

#include <menuscan/core/error.hpp>
#include <menuscan/core/pipeline_config.hpp>
#include <menuscan/core/raster.hpp>
#include <menuscan/core/region.hpp>
#include <menuscan/core/token.hpp>
#include <menuscan/vision/pixel_geometry.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <vector>

namespace menuscan::vision {

enum class LineOrientation : std::uint8_t {
  Horizontal,
  Vertical,
};

/// Straight run of strong edge pixels. `position` is the row (horizontal) or column
/// (vertical); the run covers [start, end] along the other axis.
struct EdgeLine {
  LineOrientation orientation{LineOrientation::Horizontal};
  double position{0.0};
  double start{0.0};
  double end{0.0};
  float strength{0.f};  // mean normalized edge magnitude

  [[nodiscard]] double length() const noexcept { return end - start + 1.0; }
};

/// Ruled rectangle found on a page raster.
struct BoxCandidate {
  PixelRect rect;
  float confidence{0.f};
};

/// Phase 1, bordered-box mode: finds ruled boxes on a rendered page and turns those with a
/// plausible menu-item layout into regions.
class BoxDetector {
 public:
  explicit BoxDetector(const menuscan::core::PipelineConfig& config);

  /// Horizontal and vertical lines from the Sobel edge map, adjacent parallels fused.
  [[nodiscard]] std::expected<std::vector<EdgeLine>, menuscan::core::PipelineError>
  detect_lines(const menuscan::core::Raster& raster) const;

  /// Rectangles closed by two horizontal and two vertical lines.
  [[nodiscard]] std::vector<BoxCandidate> find_rectangles(const std::vector<EdgeLine>& lines) const;

  /// Merges rectangles overlapping by more than `overlap` of the smaller area until stable.
  [[nodiscard]] static std::vector<BoxCandidate> merge_overlapping(std::vector<BoxCandidate> boxes,
                                                                   double overlap);

  /// Size, aspect ratio and page-edge margin checks.
  [[nodiscard]] bool is_valid_box(const PixelRect& rect,
                                  std::uint32_t raster_width,
                                  std::uint32_t raster_height) const noexcept;

  /// Collects the page's tokens inside the box and applies the layout gate.
  [[nodiscard]] std::optional<menuscan::core::Region> region_from_box(
      const BoxCandidate& box, const menuscan::core::Page& page, double scale) const;

  /// Full detection for one page. `scale` is the raster's pixels per document unit.
  [[nodiscard]] std::expected<std::vector<menuscan::core::Region>, menuscan::core::PipelineError>
  detect(const menuscan::core::Raster& raster, const menuscan::core::Page& page, double scale) const;

 private:
  menuscan::core::PipelineConfig config_;
};

}  // namespace menuscan::vision
