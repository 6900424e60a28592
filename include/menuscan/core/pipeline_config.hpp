#pragma once

#include <menuscan/core/error.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace menuscan::core {

/// How Phase 1 finds candidate regions.
enum class DetectionMode : std::uint8_t {
  Proximity,    // token banding and horizontal clustering
  BorderedBox,  // ruled boxes on the rendered page
  Auto,         // bordered boxes where a page yields any, proximity elsewhere
};

/// How Phase 3 splits a region into fields.
enum class AssemblyMode : std::uint8_t {
  Triple,  // name, description, price
  Pair,    // name, price
  Auto,    // pair when most regions hold two tokens or fewer
};

[[nodiscard]] std::string_view to_string(DetectionMode m) noexcept;
[[nodiscard]] std::string_view to_string(AssemblyMode m) noexcept;

/// All thresholds for one run. Supplied whole and never modified while a document is
/// being parsed; an external tuner replaces the whole struct between runs.
/// Em distances are relative to the prevailing font size.
struct PipelineConfig {
  // Phase 0: number classification and typography
  double price_min{0.5};
  double price_max{200.0};
  double calorie_min{100.0};
  double calorie_max{2000.0};
  double count_max{20.0};
  double price_classification_threshold{0.7};  // a price must be strictly above this
  double pattern_min_support{0.3};
  std::size_t fingerprint_min_tokens{3};
  std::size_t fingerprint_saturation{10};

  // Phase 1: region detection
  DetectionMode detection_mode{DetectionMode::Proximity};
  double y_proximity_em{1.5};
  double x_distance_em{6.0};
  double min_region_confidence{0.5};
  double render_scale{2.0};          // pixels per document unit for page rasters
  double edge_threshold{0.25};       // normalized Sobel magnitude
  double line_threshold{0.35};       // mean edge strength along a line
  std::uint32_t min_line_length_px{40};
  std::uint32_t min_box_size_px{40};
  double box_aspect_min{0.3};
  double box_aspect_max{3.0};
  std::uint32_t box_edge_margin_px{5};
  double box_merge_overlap{0.3};     // fraction of the smaller box
  double box_token_padding{2.0};     // document units

  // Phase 2: region validation
  double min_width_em{2.0};
  double min_height_em{0.8};
  std::size_t min_text_length{5};
  double min_text_density{0.0002};   // characters per square document unit
  double name_length_weight{0.3};
  double description_weight{0.3};
  double price_weight{0.4};
  double extraction_quality_threshold{0.7};
  bool capture_thumbnails{true};
  double thumbnail_padding{10.0};    // document units
  double thumbnail_failure_penalty{0.9};
  std::size_t validation_batch_size{16};
  bool merge_cross_page_regions{true};
  double page_margin_fraction{0.12};
  double cross_page_alignment_em{2.0};

  // Phase 3: assembly and bootstrap
  AssemblyMode assembly_mode{AssemblyMode::Triple};
  std::size_t name_min_length{2};
  std::size_t name_max_length{50};
  std::size_t min_item_floor{5};
  double bootstrap_quality_threshold{0.7};
  double min_coverage{0.6};
  double convergence_threshold{0.02};
  std::size_t max_bootstrap_iterations{3};
  double revert_margin{0.05};
  double outlier_sigma{3.0};
  bool allow_priceless_items{false};
};

/// Checks ranges and orderings. Returns InvalidConfig with a reason logged on failure.
[[nodiscard]] std::expected<void, PipelineError> validate_config(const PipelineConfig& config);

}  // namespace menuscan::core
