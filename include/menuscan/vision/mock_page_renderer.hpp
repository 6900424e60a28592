#pragma once

#include <menuscan/core/page_renderer.hpp>
#include <menuscan/core/raster.hpp>
#include <cstddef>
#include <cstdint>
#include <map>
#include <set>

namespace menuscan::vision {

/// Renderer returning configured rasters (for tests/demo). Pages without a raster render
/// as a blank white grayscale page of `default_width` x `default_height` pixels.
class MockPageRenderer : public menuscan::core::IPageRenderer {
 public:
  MockPageRenderer(std::uint32_t default_width = 64, std::uint32_t default_height = 64);

  /// Raster to return for `page_index`, whatever the requested scale.
  void set_page(std::uint32_t page_index, menuscan::core::Raster raster);

  /// Make render_page fail with RenderFailed for `page_index`.
  void fail_page(std::uint32_t page_index);

  /// Make every page fail.
  void fail_all() { fail_all_ = true; }

  [[nodiscard]] std::expected<menuscan::core::Raster, menuscan::core::PipelineError>
  render_page(std::uint32_t page_index, double scale) override;

  [[nodiscard]] std::size_t calls() const noexcept { return calls_; }

 private:
  std::uint32_t default_width_;
  std::uint32_t default_height_;
  std::map<std::uint32_t, menuscan::core::Raster> pages_;
  std::set<std::uint32_t> failing_;
  bool fail_all_{false};
  std::size_t calls_{0};
};

}  // namespace menuscan::vision
