#pragma once

#include <menuscan/core/error.hpp>
#include <menuscan/core/raster.hpp>
#include <cstdint>
#include <expected>

namespace menuscan::core {

/// Page-rendering collaborator: rasterizes one page at `scale` pixels per document unit,
/// top-down pixel rows. May fail; callers degrade gracefully.
/// Implementations need not be thread-safe; PageCache serializes calls.
class IPageRenderer {
 public:
  virtual ~IPageRenderer() = default;

  [[nodiscard]] virtual std::expected<Raster, PipelineError> render_page(
      std::uint32_t page_index, double scale) = 0;
};

}  // namespace menuscan::core
