#include <menuscan/core/page_cache.hpp>

namespace menuscan::core {

std::expected<std::shared_ptr<const Raster>, PipelineError> PageCache::page(
    std::uint32_t page_index, double scale) {
  std::lock_guard lock(mutex_);
  const Key key{page_index, scale};
  if (auto it = pages_.find(key); it != pages_.end()) {
    return it->second;
  }

  ++render_calls_;
  auto rendered = renderer_.render_page(page_index, scale);
  Entry entry = std::unexpected(PipelineError::RenderFailed);
  if (rendered && rendered->is_consistent()) {
    entry = std::make_shared<const Raster>(std::move(*rendered));
  } else if (!rendered) {
    entry = std::unexpected(rendered.error());
  }
  pages_.emplace(key, entry);
  return entry;
}

std::size_t PageCache::size() const {
  std::lock_guard lock(mutex_);
  return pages_.size();
}

std::size_t PageCache::render_calls() const {
  std::lock_guard lock(mutex_);
  return render_calls_;
}

void PageCache::clear() {
  std::lock_guard lock(mutex_);
  pages_.clear();
}

}  // namespace menuscan::core
