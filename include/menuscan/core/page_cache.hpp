#pragma once

#include <menuscan/core/error.hpp>
#include <menuscan/core/page_renderer.hpp>
#include <menuscan/core/raster.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <map>
#include <memory>
#include <mutex>
#include <utility>

namespace menuscan::core {

/// Rendered pages for one parse session. Owned by the session and dropped with it;
/// never shared between sessions. Failed renders are cached too, so a broken page is
/// attempted once per scale.
class PageCache {
 public:
  explicit PageCache(IPageRenderer& renderer) : renderer_(renderer) {}

  PageCache(const PageCache&) = delete;
  PageCache& operator=(const PageCache&) = delete;

  /// Rendered page, rendering on first request. Thread-safe.
  [[nodiscard]] std::expected<std::shared_ptr<const Raster>, PipelineError> page(
      std::uint32_t page_index, double scale);

  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] std::size_t render_calls() const;

  void clear();

 private:
  using Key = std::pair<std::uint32_t, double>;
  using Entry = std::expected<std::shared_ptr<const Raster>, PipelineError>;

  IPageRenderer& renderer_;
  mutable std::mutex mutex_;
  std::map<Key, Entry> pages_;
  std::size_t render_calls_{0};
};

}  // namespace menuscan::core
