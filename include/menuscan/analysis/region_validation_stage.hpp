#pragma once

#include <menuscan/core/error.hpp>
#include <menuscan/core/pipeline_config.hpp>
#include <menuscan/core/pipeline_stage.hpp>
#include <expected>
#include <string_view>

namespace menuscan::analysis {

/// Phase 2: merges cross-page continuations, then gates candidate regions.
class RegionValidationStage : public menuscan::core::IPipelineStage {
 public:
  explicit RegionValidationStage(const menuscan::core::PipelineConfig& config);

  [[nodiscard]] std::string_view name() const noexcept override { return "validation"; }

  [[nodiscard]] std::expected<void, menuscan::core::PipelineError>
  process(menuscan::core::ParseSession& session) const override;

 private:
  menuscan::core::PipelineConfig config_;
};

}  // namespace menuscan::analysis
