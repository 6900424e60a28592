#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace menuscan::core {

/// Memory: Raster owns a single contiguous, tightly packed buffer (std::vector<std::byte>).
/// Distinct Raster instances are independent; a Raster handed out by the page cache is
/// shared read-only (std::shared_ptr<const Raster>).

/// Pixel layout of a rendered page or thumbnail.
enum class PixelFormat : std::uint8_t {
  Unknown,
  Grayscale8,
  RGB8,
  BGR8,
  RGBA8,
};

/// Rasterized page or page region: dimensions, format and owned pixel buffer.
class Raster {
 public:
  Raster() = default;

  Raster(std::uint32_t width,
         std::uint32_t height,
         PixelFormat format,
         std::vector<std::byte> buffer)
      : width_(width),
        height_(height),
        format_(format),
        buffer_(std::move(buffer)) {}

  /// Blank raster filled with one byte value (e.g. 0xFF for a white page).
  [[nodiscard]] static Raster filled(std::uint32_t width,
                                     std::uint32_t height,
                                     PixelFormat format,
                                     std::byte value);

  [[nodiscard]] std::uint32_t width() const noexcept { return width_; }
  [[nodiscard]] std::uint32_t height() const noexcept { return height_; }
  [[nodiscard]] PixelFormat format() const noexcept { return format_; }

  [[nodiscard]] std::span<std::byte> data() noexcept {
    return std::span<std::byte>(buffer_.data(), buffer_.size());
  }
  [[nodiscard]] std::span<const std::byte> data() const noexcept {
    return std::span<const std::byte>(buffer_.data(), buffer_.size());
  }

  [[nodiscard]] bool empty() const noexcept { return buffer_.empty(); }
  [[nodiscard]] std::size_t size_bytes() const noexcept { return buffer_.size(); }

  /// True when the buffer holds at least width * height * channels bytes.
  [[nodiscard]] bool is_consistent() const noexcept;

  [[nodiscard]] static std::size_t channels(PixelFormat format) noexcept;

  /// Minimum bytes required for given dimensions and format (for validation).
  [[nodiscard]] static std::size_t min_bytes(std::uint32_t width,
                                             std::uint32_t height,
                                             PixelFormat format);

 private:
  std::uint32_t width_{0};
  std::uint32_t height_{0};
  PixelFormat format_{PixelFormat::Unknown};
  std::vector<std::byte> buffer_;
};

}  // namespace menuscan::core
