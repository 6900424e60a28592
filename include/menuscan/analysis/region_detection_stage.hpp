#pragma once

#include <menuscan/analysis/region_detector.hpp>
#include <menuscan/core/error.hpp>
#include <menuscan/core/pipeline_config.hpp>
#include <menuscan/core/pipeline_stage.hpp>
#include <menuscan/vision/box_detector.hpp>
#include <expected>
#include <string_view>
#include <vector>

namespace menuscan::analysis {

/// Phase 1: candidate regions per page. Bordered-box detection needs the session's renderer;
/// without one, or when a page fails to render, that page uses proximity detection.
class RegionDetectionStage : public menuscan::core::IPipelineStage {
 public:
  explicit RegionDetectionStage(const menuscan::core::PipelineConfig& config);

  [[nodiscard]] std::string_view name() const noexcept override { return "regions"; }

  [[nodiscard]] std::expected<void, menuscan::core::PipelineError>
  process(menuscan::core::ParseSession& session) const override;

 private:
  [[nodiscard]] std::vector<menuscan::core::Region> detect_page(
      menuscan::core::ParseSession& session, const menuscan::core::Page& page) const;

  menuscan::core::PipelineConfig config_;
  RegionDetector proximity_;
  menuscan::vision::BoxDetector boxes_;
};

}  // namespace menuscan::analysis
