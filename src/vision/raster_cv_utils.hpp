#pragma once

#include <menuscan/core/raster.hpp>
#include <opencv2/core/mat.hpp>
#include <optional>

namespace menuscan::vision::detail {

/// Wraps a Raster as a cv::Mat view (no copy). Returns nullopt if the format is unsupported
/// or the buffer is inconsistent.
std::optional<cv::Mat> raster_to_mat(const menuscan::core::Raster& raster);

/// Copies a cv::Mat into a Raster.
menuscan::core::Raster mat_to_raster(const cv::Mat& mat,
                                     menuscan::core::PixelFormat format);

/// Single-channel 8-bit copy of the raster, or nullopt if the format is unsupported.
std::optional<cv::Mat> raster_to_gray(const menuscan::core::Raster& raster);

}  // namespace menuscan::vision::detail
