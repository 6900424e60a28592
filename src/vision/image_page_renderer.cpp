#include <menuscan/vision/image_page_renderer.hpp>
#include "raster_cv_utils.hpp"
#include <menuscan/core/error.hpp>
#include <menuscan/vision/load_image.hpp>
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <cmath>
#include <utility>

namespace menuscan::vision {

namespace nc = menuscan::core;

void ImagePageRenderer::add_page(std::uint32_t page_index, PageImage image) {
  pages_.insert_or_assign(page_index, std::move(image));
}

std::expected<nc::Raster, nc::PipelineError> ImagePageRenderer::render_page(
    std::uint32_t page_index, double scale) {
  const auto it = pages_.find(page_index);
  if (it == pages_.end() || scale <= 0.0) {
    return std::unexpected(nc::PipelineError::RenderFailed);
  }

  auto raster = load_raster_from_image(it->second.path);
  if (!raster) {
    spdlog::warn("could not load page image '{}'", it->second.path);
    return std::unexpected(nc::PipelineError::RenderFailed);
  }

  const auto& image = it->second;
  if (image.page_width <= 0.0 || image.page_height <= 0.0) {
    return std::move(*raster);
  }

  const int target_w = static_cast<int>(std::lround(image.page_width * scale));
  const int target_h = static_cast<int>(std::lround(image.page_height * scale));
  if (target_w <= 0 || target_h <= 0) {
    return std::unexpected(nc::PipelineError::RenderFailed);
  }
  if (static_cast<int>(raster->width()) == target_w &&
      static_cast<int>(raster->height()) == target_h) {
    return std::move(*raster);
  }

  auto mat_in = detail::raster_to_mat(*raster);
  if (!mat_in) {
    return std::unexpected(nc::PipelineError::RenderFailed);
  }
  cv::Mat mat_out;
  cv::resize(*mat_in, mat_out, cv::Size(target_w, target_h), 0, 0, cv::INTER_AREA);
  return detail::mat_to_raster(mat_out, raster->format());
}

}  // namespace menuscan::vision
