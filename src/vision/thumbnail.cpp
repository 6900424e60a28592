#include <menuscan/vision/thumbnail.hpp>
#include "raster_cv_utils.hpp"
#include <menuscan/vision/pixel_geometry.hpp>
#include <opencv2/core.hpp>
#include <algorithm>
#include <cmath>

namespace menuscan::vision {

namespace nc = menuscan::core;

std::expected<nc::Thumbnail, nc::PipelineError> extract_thumbnail(nc::PageCache& cache,
                                                                   const nc::Region& region,
                                                                   double padding,
                                                                   double scale) {
  auto page = cache.page(region.page_index, scale);
  if (!page) {
    return std::unexpected(page.error());
  }
  const nc::Raster& raster = **page;

  nc::BBox padded = region.bbox;
  padded.x -= padding;
  padded.y -= padding;
  padded.width += 2.0 * padding;
  padded.height += 2.0 * padding;
  const PixelRect rect = document_to_pixels(padded, region.page_height, scale);

  const int x0 = std::max(0, static_cast<int>(std::floor(rect.x)));
  const int y0 = std::max(0, static_cast<int>(std::floor(rect.y)));
  const int x1 = std::min(static_cast<int>(raster.width()), static_cast<int>(std::ceil(rect.right())));
  const int y1 = std::min(static_cast<int>(raster.height()), static_cast<int>(std::ceil(rect.bottom())));
  if (x1 <= x0 || y1 <= y0) {
    return std::unexpected(nc::PipelineError::RenderFailed);
  }

  auto mat = detail::raster_to_mat(raster);
  if (!mat) {
    return std::unexpected(nc::PipelineError::RenderFailed);
  }
  const cv::Mat crop = (*mat)(cv::Rect(x0, y0, x1 - x0, y1 - y0)).clone();

  nc::Thumbnail thumb;
  thumb.image = detail::mat_to_raster(crop, raster.format());
  thumb.scale = scale;
  thumb.pixel_x = x0;
  thumb.pixel_y = y0;
  return thumb;
}

}  // namespace menuscan::vision
