#include <menuscan/vision/mock_page_renderer.hpp>
#include <menuscan/core/error.hpp>
#include <cstddef>
#include <utility>

namespace menuscan::vision {

namespace nc = menuscan::core;

MockPageRenderer::MockPageRenderer(std::uint32_t default_width, std::uint32_t default_height)
    : default_width_(default_width), default_height_(default_height) {}

void MockPageRenderer::set_page(std::uint32_t page_index, nc::Raster raster) {
  pages_.insert_or_assign(page_index, std::move(raster));
}

void MockPageRenderer::fail_page(std::uint32_t page_index) {
  failing_.insert(page_index);
}

std::expected<nc::Raster, nc::PipelineError> MockPageRenderer::render_page(
    std::uint32_t page_index, double /*scale*/) {
  ++calls_;
  if (fail_all_ || failing_.contains(page_index)) {
    return std::unexpected(nc::PipelineError::RenderFailed);
  }
  if (auto it = pages_.find(page_index); it != pages_.end()) {
    return it->second;
  }
  return nc::Raster::filled(default_width_, default_height_, nc::PixelFormat::Grayscale8,
                            std::byte{0xFF});
}

}  // namespace menuscan::vision
