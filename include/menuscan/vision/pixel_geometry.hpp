#pragma once

#include <menuscan/core/region.hpp>
#include <cstdint>

namespace menuscan::vision {

/// Rectangle in top-down pixel space of a rendered page.
struct PixelRect {
  double x{0.0};
  double y{0.0};  // top edge
  double width{0.0};
  double height{0.0};

  [[nodiscard]] double right() const noexcept { return x + width; }
  [[nodiscard]] double bottom() const noexcept { return y + height; }
  [[nodiscard]] double area() const noexcept { return width * height; }
};

/// Area of the intersection, 0 when disjoint.
[[nodiscard]] double intersection_area(const PixelRect& a, const PixelRect& b) noexcept;

[[nodiscard]] PixelRect union_rect(const PixelRect& a, const PixelRect& b) noexcept;

/// Bottom-up document box -> top-down pixels at `scale` pixels per unit.
[[nodiscard]] PixelRect document_to_pixels(const menuscan::core::BBox& box,
                                           double page_height,
                                           double scale) noexcept;

/// Top-down pixels -> bottom-up document box.
[[nodiscard]] menuscan::core::BBox pixels_to_document(const PixelRect& rect,
                                                      double page_height,
                                                      double scale) noexcept;

}  // namespace menuscan::vision
