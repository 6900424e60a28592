#include <menuscan/core/menu_item.hpp>

namespace menuscan::core {

std::string_view to_string(ProcessingPhase p) noexcept {
  switch (p) {
    case ProcessingPhase::RegionAssembly:
      return "RegionAssembly";
    case ProcessingPhase::PairAssembly:
      return "PairAssembly";
    case ProcessingPhase::LineFallback:
      return "LineFallback";
    case ProcessingPhase::Refinement:
      return "Refinement";
  }
  return "Unknown";
}

}  // namespace menuscan::core
