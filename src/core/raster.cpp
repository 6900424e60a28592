#include <menuscan/core/raster.hpp>
#include <cstddef>

namespace menuscan::core {

Raster Raster::filled(std::uint32_t width,
                      std::uint32_t height,
                      PixelFormat format,
                      std::byte value) {
  std::vector<std::byte> buffer(min_bytes(width, height, format), value);
  return Raster(width, height, format, std::move(buffer));
}

bool Raster::is_consistent() const noexcept {
  const std::size_t need = min_bytes(width_, height_, format_);
  return need > 0 && buffer_.size() >= need;
}

std::size_t Raster::channels(PixelFormat format) noexcept {
  switch (format) {
    case PixelFormat::Grayscale8:
      return 1;
    case PixelFormat::RGB8:
    case PixelFormat::BGR8:
      return 3;
    case PixelFormat::RGBA8:
      return 4;
    case PixelFormat::Unknown:
    default:
      return 0;
  }
}

std::size_t Raster::min_bytes(std::uint32_t width,
                              std::uint32_t height,
                              PixelFormat format) {
  const std::size_t pixels = static_cast<std::size_t>(width) * height;
  return pixels * channels(format);
}

}  // namespace menuscan::core
