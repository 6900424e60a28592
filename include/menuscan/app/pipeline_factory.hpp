#pragma once

#include <menuscan/core/pipeline.hpp>
#include <menuscan/core/pipeline_config.hpp>

namespace menuscan::app {

/// Classification, region detection, region validation and item assembly, in that order.
[[nodiscard]] menuscan::core::Pipeline build_pipeline(const menuscan::core::PipelineConfig& config);

}  // namespace menuscan::app
