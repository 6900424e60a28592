#pragma once

#include <menuscan/core/raster.hpp>
#include <menuscan/core/token.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace menuscan::core {

/// Axis-aligned box in document units, bottom-up y (y is the bottom edge).
struct BBox {
  double x{0.0};
  double y{0.0};
  double width{0.0};
  double height{0.0};

  [[nodiscard]] double right() const noexcept { return x + width; }
  [[nodiscard]] double top() const noexcept { return y + height; }
  [[nodiscard]] double area() const noexcept { return width * height; }

  /// True if `t` lies inside this box grown by `tolerance` on every side.
  [[nodiscard]] bool contains(const Token& t, double tolerance = 0.0) const noexcept;
};

/// Minimal box containing every token; zero box for an empty span.
[[nodiscard]] BBox bounding_box_of(std::span<const Token> tokens) noexcept;

[[nodiscard]] std::string to_string(const BBox& box);

/// Which detector produced a region.
enum class RegionSource : std::uint8_t {
  Proximity,
  BorderedBox,
  CrossPage,  // merged continuation across a page break
};

/// Cropped page image for a region, in the renderer's top-down pixel space.
struct Thumbnail {
  Raster image;
  double scale{1.0};       // pixels per document unit
  std::int32_t pixel_x{0};  // crop origin on the rendered page
  std::int32_t pixel_y{0};
};

/// Geometric cluster of tokens hypothesized to form one menu record.
/// bbox is always the minimal box over `tokens`; build regions with make_region.
struct Region {
  std::vector<Token> tokens;
  BBox bbox{};
  float confidence{0.f};
  std::uint32_t page_index{0};
  double page_height{0.0};
  RegionSource source{RegionSource::Proximity};
  std::optional<Thumbnail> thumbnail;

  [[nodiscard]] double average_font_size() const noexcept;

  /// Member texts joined with single spaces, in stored order.
  [[nodiscard]] std::string text() const;
};

[[nodiscard]] Region make_region(std::vector<Token> tokens,
                                 std::uint32_t page_index,
                                 double page_height,
                                 RegionSource source,
                                 float confidence);

[[nodiscard]] constexpr float clamp_confidence(double v) noexcept {
  return v < 0.0 ? 0.f : (v > 1.0 ? 1.f : static_cast<float>(v));
}

}  // namespace menuscan::core
