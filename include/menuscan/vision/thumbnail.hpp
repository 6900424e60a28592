#pragma once

#include <menuscan/core/error.hpp>
#include <menuscan/core/page_cache.hpp>
#include <menuscan/core/region.hpp>
#include <expected>

namespace menuscan::vision {

/// Crops the region's box, grown by `padding` document units, from its rendered page.
/// The crop is clipped to the page; RenderFailed if rendering fails or nothing is left.
[[nodiscard]] std::expected<menuscan::core::Thumbnail, menuscan::core::PipelineError>
extract_thumbnail(menuscan::core::PageCache& cache,
                  const menuscan::core::Region& region,
                  double padding,
                  double scale);

}  // namespace menuscan::vision
