#pragma once

#include <menuscan/core/error.hpp>
#include <menuscan/core/pipeline_config.hpp>
#include <menuscan/core/pipeline_stage.hpp>
#include <expected>
#include <string_view>

namespace menuscan::analysis {

/// Phase 0: fills the session's classification index and typography fingerprints.
class ClassificationStage : public menuscan::core::IPipelineStage {
 public:
  explicit ClassificationStage(const menuscan::core::PipelineConfig& config);

  [[nodiscard]] std::string_view name() const noexcept override { return "classification"; }

  [[nodiscard]] std::expected<void, menuscan::core::PipelineError>
  process(menuscan::core::ParseSession& session) const override;

 private:
  menuscan::core::PipelineConfig config_;
};

}  // namespace menuscan::analysis
