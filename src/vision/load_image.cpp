#include <menuscan/vision/load_image.hpp>
#include "raster_cv_utils.hpp"
#include <menuscan/core/raster.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace menuscan::vision {

std::optional<menuscan::core::Raster> load_raster_from_image(const std::string& path) {
  cv::Mat mat = cv::imread(path, cv::IMREAD_UNCHANGED);
  if (mat.empty() || mat.depth() != CV_8U) return std::nullopt;

  menuscan::core::PixelFormat format = menuscan::core::PixelFormat::BGR8;
  if (mat.channels() == 1) {
    format = menuscan::core::PixelFormat::Grayscale8;
  } else if (mat.channels() == 4) {
    cv::Mat bgr;
    cv::cvtColor(mat, bgr, cv::COLOR_BGRA2BGR);
    mat = bgr;
  }

  return detail::mat_to_raster(mat, format);
}

}  // namespace menuscan::vision
