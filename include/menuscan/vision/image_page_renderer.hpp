#pragma once

#include <menuscan/core/page_renderer.hpp>
#include <menuscan/core/raster.hpp>
#include <cstdint>
#include <map>
#include <string>

namespace menuscan::vision {

/// Renderer backed by pre-rendered page images on disk. Each image is resized to
/// (page width x page height) * scale so pixel coordinates line up with document units.
class ImagePageRenderer : public menuscan::core::IPageRenderer {
 public:
  struct PageImage {
    std::string path;
    double page_width{0.0};   // document units
    double page_height{0.0};
  };

  void add_page(std::uint32_t page_index, PageImage image);

  [[nodiscard]] std::expected<menuscan::core::Raster, menuscan::core::PipelineError>
  render_page(std::uint32_t page_index, double scale) override;

  [[nodiscard]] bool has_page(std::uint32_t page_index) const {
    return pages_.contains(page_index);
  }

 private:
  std::map<std::uint32_t, PageImage> pages_;
};

}  // namespace menuscan::vision
