#pragma once

#include <menuscan/core/error.hpp>
#include <menuscan/core/pipeline_config.hpp>
#include <menuscan/core/pipeline_stage.hpp>
#include <expected>
#include <string_view>

namespace menuscan::analysis {

/// Phase 3: region assembly, the bootstrap loop (line fallback, one refinement pass) and
/// document-wide validation. Stores the final ordered items and the bootstrap report.
class ItemAssemblyStage : public menuscan::core::IPipelineStage {
 public:
  explicit ItemAssemblyStage(const menuscan::core::PipelineConfig& config);

  [[nodiscard]] std::string_view name() const noexcept override { return "assembly"; }

  [[nodiscard]] std::expected<void, menuscan::core::PipelineError>
  process(menuscan::core::ParseSession& session) const override;

 private:
  menuscan::core::PipelineConfig config_;
};

}  // namespace menuscan::analysis
