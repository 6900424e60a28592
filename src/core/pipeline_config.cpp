#include <menuscan/core/pipeline_config.hpp>
#include <spdlog/spdlog.h>

namespace menuscan::core {

std::string_view to_string(DetectionMode m) noexcept {
  switch (m) {
    case DetectionMode::Proximity:
      return "proximity";
    case DetectionMode::BorderedBox:
      return "box";
    case DetectionMode::Auto:
      return "auto";
  }
  return "unknown";
}

std::string_view to_string(AssemblyMode m) noexcept {
  switch (m) {
    case AssemblyMode::Triple:
      return "triple";
    case AssemblyMode::Pair:
      return "pair";
    case AssemblyMode::Auto:
      return "auto";
  }
  return "unknown";
}

namespace {

bool unit_interval(double v) { return v >= 0.0 && v <= 1.0; }

}  // namespace

std::expected<void, PipelineError> validate_config(const PipelineConfig& c) {
  auto fail = [](std::string_view what) -> std::expected<void, PipelineError> {
    spdlog::error("invalid pipeline config: {}", what);
    return std::unexpected(PipelineError::InvalidConfig);
  };

  if (!(c.price_min > 0.0 && c.price_min < c.price_max)) return fail("price_min/price_max");
  if (!(c.calorie_min > 0.0 && c.calorie_min < c.calorie_max)) return fail("calorie_min/calorie_max");
  if (c.count_max < 0.0) return fail("count_max");
  if (!unit_interval(c.price_classification_threshold)) return fail("price_classification_threshold");
  if (!unit_interval(c.pattern_min_support)) return fail("pattern_min_support");
  if (c.fingerprint_min_tokens == 0 || c.fingerprint_saturation == 0) return fail("fingerprint sizes");

  if (!(c.y_proximity_em > 0.0)) return fail("y_proximity_em");
  if (!(c.x_distance_em > 0.0)) return fail("x_distance_em");
  if (!unit_interval(c.min_region_confidence)) return fail("min_region_confidence");
  if (!(c.render_scale > 0.0)) return fail("render_scale");
  if (!unit_interval(c.edge_threshold) || !unit_interval(c.line_threshold)) return fail("edge/line threshold");
  if (c.min_line_length_px == 0 || c.min_box_size_px == 0) return fail("min line/box size");
  if (!(c.box_aspect_min > 0.0 && c.box_aspect_min < c.box_aspect_max)) return fail("box aspect range");
  if (!unit_interval(c.box_merge_overlap)) return fail("box_merge_overlap");
  if (c.box_token_padding < 0.0) return fail("box_token_padding");

  if (c.min_width_em < 0.0 || c.min_height_em < 0.0) return fail("min_width_em/min_height_em");
  if (c.min_text_density < 0.0) return fail("min_text_density");
  if (c.name_length_weight < 0.0 || c.description_weight < 0.0 || c.price_weight < 0.0 ||
      c.name_length_weight + c.description_weight + c.price_weight <= 0.0) {
    return fail("heuristic weights");
  }
  if (!unit_interval(c.extraction_quality_threshold)) return fail("extraction_quality_threshold");
  if (c.thumbnail_padding < 0.0) return fail("thumbnail_padding");
  if (!unit_interval(c.thumbnail_failure_penalty)) return fail("thumbnail_failure_penalty");
  if (c.validation_batch_size == 0) return fail("validation_batch_size");
  if (!unit_interval(c.page_margin_fraction)) return fail("page_margin_fraction");
  if (c.cross_page_alignment_em < 0.0) return fail("cross_page_alignment_em");

  if (c.name_min_length == 0 || c.name_min_length > c.name_max_length) return fail("name length range");
  if (!unit_interval(c.bootstrap_quality_threshold)) return fail("bootstrap_quality_threshold");
  if (!unit_interval(c.min_coverage)) return fail("min_coverage");
  if (c.convergence_threshold < 0.0) return fail("convergence_threshold");
  if (c.max_bootstrap_iterations == 0) return fail("max_bootstrap_iterations");
  if (c.revert_margin < 0.0) return fail("revert_margin");
  if (!(c.outlier_sigma > 0.0)) return fail("outlier_sigma");
  return {};
}

}  // namespace menuscan::core
