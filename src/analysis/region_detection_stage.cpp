#include <menuscan/analysis/region_detection_stage.hpp>
#include <menuscan/core/region.hpp>

namespace menuscan::analysis {

namespace nc = menuscan::core;

RegionDetectionStage::RegionDetectionStage(const nc::PipelineConfig& config)
    : config_(config), proximity_(config), boxes_(config) {}

std::vector<nc::Region> RegionDetectionStage::detect_page(nc::ParseSession& session,
                                                          const nc::Page& page) const {
  if (config_.detection_mode == nc::DetectionMode::Proximity) {
    return proximity_.detect(page);
  }

  auto* cache = session.page_cache();
  if (!cache) {
    session.log().debug(name(), "page {}: no renderer, using proximity detection", page.index);
    return proximity_.detect(page);
  }
  auto raster = cache->page(page.index, config_.render_scale);
  if (!raster) {
    session.log().warn(name(), "page {}: render failed ({}), using proximity detection", page.index,
                       nc::to_string(raster.error()));
    return proximity_.detect(page);
  }
  auto regions = boxes_.detect(**raster, page, config_.render_scale);
  if (!regions) {
    session.log().warn(name(), "page {}: box detection failed ({}), using proximity detection",
                       page.index, nc::to_string(regions.error()));
    return proximity_.detect(page);
  }
  if (regions->empty() && config_.detection_mode == nc::DetectionMode::Auto) {
    session.log().debug(name(), "page {}: no bordered boxes, using proximity detection", page.index);
    return proximity_.detect(page);
  }
  return std::move(*regions);
}

std::expected<void, nc::PipelineError> RegionDetectionStage::process(nc::ParseSession& session) const {
  auto& out = session.candidate_regions();
  out.clear();
  const auto& pages = session.document().pages;
  for (std::size_t i = 0; i < pages.size(); ++i) {
    if (session.stop_requested()) {
      session.log().info(name(), "cancelled before page {}", pages[i].index);
      return std::unexpected(nc::PipelineError::Cancelled);
    }
    auto regions = detect_page(session, pages[i]);
    session.log().debug(name(), "page {}: {} candidate regions", pages[i].index, regions.size());
    out.insert(out.end(), std::make_move_iterator(regions.begin()),
               std::make_move_iterator(regions.end()));
  }
  session.log().info(name(), "{} candidate regions over {} pages ({} mode)", out.size(), pages.size(),
                     nc::to_string(config_.detection_mode));
  return {};
}

}  // namespace menuscan::analysis
