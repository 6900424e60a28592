#include <menuscan/core/session.hpp>
#include <algorithm>

namespace menuscan::core {

ParseSession::ParseSession(const Document& document, const RunOptions& options)
    : document_(document),
      stop_token_(options.stop_token),
      progress_(options.progress) {
  if (options.renderer) {
    page_cache_ = std::make_unique<PageCache>(*options.renderer);
  }
}

void ParseSession::report_progress(std::string_view phase, int percent, std::string message) const {
  if (!progress_) return;
  progress_(ProgressSnapshot{std::string(phase), std::clamp(percent, 0, 100), std::move(message)});
}

ParseResult ParseSession::take_result() {
  ParseResult r;
  r.items = std::move(items_);
  r.log = log_.entries();
  r.bootstrap = std::move(bootstrap_report_);
  r.fingerprints = std::move(fingerprints_);
  r.candidate_regions = candidate_regions_.size();
  r.validated_regions = validated_regions_.size();
  if (page_cache_) page_cache_->clear();
  return r;
}

}  // namespace menuscan::core
