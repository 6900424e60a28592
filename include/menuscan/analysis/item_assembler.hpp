#pragma once

#include <menuscan/core/classification.hpp>
#include <menuscan/core/menu_item.hpp>
#include <menuscan/core/parse_log.hpp>
#include <menuscan/core/pipeline_config.hpp>
#include <menuscan/core/region.hpp>
#include <optional>
#include <string>
#include <vector>

namespace menuscan::analysis {

/// Fields pulled out of one region before cleaning and scoring.
struct ItemComponents {
  std::optional<std::string> name;
  std::optional<std::string> description;
  std::optional<double> price;
  float price_confidence{0.f};
  bool anchored{false};  // price came from a price-classified token
};

/// Phase 3 component extraction: turns validated regions into menu items.
class ItemAssembler {
 public:
  ItemAssembler(const core::PipelineConfig& config, const core::ClassificationIndex& classifications);

  /// Name, description and price, anchored on the strongest price token.
  [[nodiscard]] ItemComponents extract_triple(const core::Region& region) const;

  /// Name and price only; prefers a bilingual name.
  [[nodiscard]] ItemComponents extract_pair(const core::Region& region) const;

  /// One item, or nullopt when the region yields no usable name or (unless priceless items
  /// are allowed) no price. `mode` must be Triple or Pair.
  [[nodiscard]] std::optional<core::MenuItem> assemble(const core::Region& region,
                                                       core::AssemblyMode mode,
                                                       core::ProcessingPhase phase) const;

  /// Items for all regions in order, with the configured mode resolved against `regions`.
  [[nodiscard]] std::vector<core::MenuItem> assemble_all(
      const std::vector<core::Region>& regions,
      core::ParseLog& log,
      core::ProcessingPhase phase = core::ProcessingPhase::RegionAssembly) const;

  /// Auto becomes Pair when most regions hold two tokens or fewer, else Triple.
  [[nodiscard]] static core::AssemblyMode resolve_mode(core::AssemblyMode mode,
                                                       const std::vector<core::Region>& regions);

 private:
  const core::PipelineConfig& config_;
  const core::ClassificationIndex& classifications_;
};

/// "region-p<page>-<x>-<y>" from the region's page and box origin.
[[nodiscard]] std::string region_item_id(const core::Region& region);

}  // namespace menuscan::analysis
