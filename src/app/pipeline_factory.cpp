#include <menuscan/app/pipeline_factory.hpp>
#include <menuscan/analysis/classification_stage.hpp>
#include <menuscan/analysis/item_assembly_stage.hpp>
#include <menuscan/analysis/region_detection_stage.hpp>
#include <menuscan/analysis/region_validation_stage.hpp>
#include <memory>

namespace menuscan::app {

menuscan::core::Pipeline build_pipeline(const menuscan::core::PipelineConfig& config) {
  using namespace menuscan::analysis;

  menuscan::core::Pipeline pipeline(config);
  pipeline.add_stage(std::make_unique<ClassificationStage>(config));
  pipeline.add_stage(std::make_unique<RegionDetectionStage>(config));
  pipeline.add_stage(std::make_unique<RegionValidationStage>(config));
  pipeline.add_stage(std::make_unique<ItemAssemblyStage>(config));
  return pipeline;
}

}  // namespace menuscan::app
