#include <menuscan/vision/pixel_geometry.hpp>
#include <algorithm>

namespace menuscan::vision {

double intersection_area(const PixelRect& a, const PixelRect& b) noexcept {
  const double w = std::min(a.right(), b.right()) - std::max(a.x, b.x);
  const double h = std::min(a.bottom(), b.bottom()) - std::max(a.y, b.y);
  return (w > 0.0 && h > 0.0) ? w * h : 0.0;
}

PixelRect union_rect(const PixelRect& a, const PixelRect& b) noexcept {
  const double x = std::min(a.x, b.x);
  const double y = std::min(a.y, b.y);
  return {x, y, std::max(a.right(), b.right()) - x, std::max(a.bottom(), b.bottom()) - y};
}

PixelRect document_to_pixels(const menuscan::core::BBox& box,
                             double page_height,
                             double scale) noexcept {
  return {box.x * scale, (page_height - box.top()) * scale, box.width * scale,
          box.height * scale};
}

menuscan::core::BBox pixels_to_document(const PixelRect& rect,
                                        double page_height,
                                        double scale) noexcept {
  if (scale <= 0.0) return {};
  return {rect.x / scale, page_height - rect.bottom() / scale, rect.width / scale,
          rect.height / scale};
}

}  // namespace menuscan::vision
