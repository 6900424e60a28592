#pragma once

#include <menuscan/core/raster.hpp>
#include <optional>
#include <string>

namespace menuscan::vision {

/// Load an image file into a Raster (BGR8 or Grayscale8). Returns nullopt on failure.
std::optional<menuscan::core::Raster> load_raster_from_image(const std::string& path);

}  // namespace menuscan::vision
