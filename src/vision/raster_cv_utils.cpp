#include "raster_cv_utils.hpp"
#include <menuscan/core/raster.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <cstddef>
#include <cstring>
#include <vector>

namespace menuscan::vision::detail {

namespace nc = menuscan::core;

std::optional<cv::Mat> raster_to_mat(const nc::Raster& raster) {
  if (raster.empty() || !raster.is_consistent()) return std::nullopt;

  const int w = static_cast<int>(raster.width());
  const int h = static_cast<int>(raster.height());
  auto* data = const_cast<std::byte*>(raster.data().data());
  const std::size_t step = static_cast<std::size_t>(raster.width()) *
                           nc::Raster::channels(raster.format());

  switch (raster.format()) {
    case nc::PixelFormat::Grayscale8:
      return cv::Mat(h, w, CV_8UC1, data, step);
    case nc::PixelFormat::RGB8:
    case nc::PixelFormat::BGR8:
      return cv::Mat(h, w, CV_8UC3, data, step);
    case nc::PixelFormat::RGBA8:
      return cv::Mat(h, w, CV_8UC4, data, step);
    case nc::PixelFormat::Unknown:
    default:
      return std::nullopt;
  }
}

nc::Raster mat_to_raster(const cv::Mat& mat, nc::PixelFormat format) {
  if (mat.empty()) return nc::Raster();

  const cv::Mat packed = mat.isContinuous() ? mat : mat.clone();
  const auto w = static_cast<std::uint32_t>(packed.cols);
  const auto h = static_cast<std::uint32_t>(packed.rows);
  const std::size_t len = packed.total() * packed.elemSize();
  std::vector<std::byte> buffer(len);
  std::memcpy(buffer.data(), packed.ptr(), len);
  return nc::Raster(w, h, format, std::move(buffer));
}

std::optional<cv::Mat> raster_to_gray(const nc::Raster& raster) {
  auto mat = raster_to_mat(raster);
  if (!mat) return std::nullopt;

  cv::Mat gray;
  switch (raster.format()) {
    case nc::PixelFormat::Grayscale8:
      gray = mat->clone();
      break;
    case nc::PixelFormat::RGB8:
      cv::cvtColor(*mat, gray, cv::COLOR_RGB2GRAY);
      break;
    case nc::PixelFormat::BGR8:
      cv::cvtColor(*mat, gray, cv::COLOR_BGR2GRAY);
      break;
    case nc::PixelFormat::RGBA8:
      cv::cvtColor(*mat, gray, cv::COLOR_RGBA2GRAY);
      break;
    case nc::PixelFormat::Unknown:
    default:
      return std::nullopt;
  }
  return gray;
}

}  // namespace menuscan::vision::detail
