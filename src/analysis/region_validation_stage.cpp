#include <menuscan/analysis/region_validation_stage.hpp>
#include <menuscan/analysis/region_validator.hpp>

namespace menuscan::analysis {

namespace nc = menuscan::core;

RegionValidationStage::RegionValidationStage(const nc::PipelineConfig& config) : config_(config) {}

std::expected<void, nc::PipelineError> RegionValidationStage::process(nc::ParseSession& session) const {
  std::vector<nc::Region> regions = session.candidate_regions();
  if (config_.merge_cross_page_regions && session.document().pages.size() > 1) {
    const std::size_t before = regions.size();
    regions = merge_cross_page_continuations(std::move(regions), session.document(),
                                             session.classifications(), config_);
    if (regions.size() != before) {
      session.log().info(name(), "{} cross-page continuations merged", before - regions.size());
    }
  }

  RegionValidator validator(config_, session.classifications());
  auto outcome = validator.validate_all(std::move(regions), session.page_cache(), session.log());
  session.validated_regions() = std::move(outcome.accepted);
  session.price_rejected_regions() = std::move(outcome.price_rejected);
  return {};
}

}  // namespace menuscan::analysis
