#pragma once

#include <menuscan/core/region.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace menuscan::core {

/// Processing step that produced an item.
enum class ProcessingPhase : std::uint8_t {
  RegionAssembly,  // triple extraction from a validated region
  PairAssembly,    // name/price extraction from a validated region
  LineFallback,    // line-oriented fallback parsing
  Refinement,      // region assembly after the pattern re-injection pass
};

[[nodiscard]] std::string_view to_string(ProcessingPhase p) noexcept;

/// Where an item came from: the phase, and the source region when there was one.
struct Provenance {
  ProcessingPhase phase{ProcessingPhase::RegionAssembly};
  std::optional<std::uint32_t> page_index;
  std::optional<BBox> region_box;
};

/// Structured menu record.
struct MenuItem {
  std::string id;
  std::string name;  // 2-50 code points after cleaning
  std::optional<std::string> description;
  std::optional<double> price;  // absent only for explicitly priceless items
  std::string category{"Other"};
  int serving_size{1};
  float confidence{0.f};
  Provenance provenance{};
  std::optional<Thumbnail> thumbnail;
};

}  // namespace menuscan::core
