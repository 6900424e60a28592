#pragma once

#include <menuscan/core/classification.hpp>
#include <menuscan/core/menu_item.hpp>
#include <menuscan/core/page_cache.hpp>
#include <menuscan/core/page_renderer.hpp>
#include <menuscan/core/parse_log.hpp>
#include <menuscan/core/region.hpp>
#include <menuscan/core/token.hpp>
#include <cstddef>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

namespace menuscan::core {

/// Outcome of the Phase 3 bootstrap loop.
struct BootstrapReport {
  bool triggered{false};
  bool converged{false};
  bool reverted{false};
  bool cap_reached{false};
  std::size_t iterations{0};
  double initial_quality{0.0};
  double final_quality{0.0};
  std::vector<std::string> state_trace;
};

/// Caller-supplied collaborators and hooks for one run.
struct RunOptions {
  IPageRenderer* renderer{nullptr};  // optional; not owned
  std::stop_token stop_token{};
  ProgressCallback progress{};
};

/// Final output of one parse.
struct ParseResult {
  std::vector<MenuItem> items;
  std::vector<LogEntry> log;
  BootstrapReport bootstrap;
  FingerprintMap fingerprints;  // font groups found by classification
  std::size_t candidate_regions{0};
  std::size_t validated_regions{0};
};

/// Everything one document parse owns: classification index, fingerprints, regions,
/// items, log and page cache. Passed by reference to each stage; never shared between
/// concurrent parses.
class ParseSession {
 public:
  ParseSession(const Document& document, const RunOptions& options);

  ParseSession(const ParseSession&) = delete;
  ParseSession& operator=(const ParseSession&) = delete;

  [[nodiscard]] const Document& document() const noexcept { return document_; }

  [[nodiscard]] ClassificationIndex& classifications() noexcept { return classifications_; }
  [[nodiscard]] const ClassificationIndex& classifications() const noexcept { return classifications_; }

  [[nodiscard]] FingerprintMap& fingerprints() noexcept { return fingerprints_; }

  [[nodiscard]] std::vector<Region>& candidate_regions() noexcept { return candidate_regions_; }
  [[nodiscard]] std::vector<Region>& validated_regions() noexcept { return validated_regions_; }
  /// Regions that failed Phase 2 only for lacking a price; revisited once by refinement.
  [[nodiscard]] std::vector<Region>& price_rejected_regions() noexcept { return price_rejected_regions_; }

  [[nodiscard]] std::vector<MenuItem>& items() noexcept { return items_; }
  [[nodiscard]] BootstrapReport& bootstrap_report() noexcept { return bootstrap_report_; }

  [[nodiscard]] ParseLog& log() noexcept { return log_; }

  /// Null when the run has no renderer.
  [[nodiscard]] PageCache* page_cache() noexcept { return page_cache_.get(); }

  [[nodiscard]] bool stop_requested() const noexcept { return stop_token_.stop_requested(); }
  [[nodiscard]] std::stop_token stop_token() const noexcept { return stop_token_; }

  void report_progress(std::string_view phase, int percent, std::string message) const;

  /// Moves the final artifacts out; the session is spent afterwards.
  [[nodiscard]] ParseResult take_result();

 private:
  const Document& document_;
  ClassificationIndex classifications_;
  FingerprintMap fingerprints_;
  std::vector<Region> candidate_regions_;
  std::vector<Region> validated_regions_;
  std::vector<Region> price_rejected_regions_;
  std::vector<MenuItem> items_;
  BootstrapReport bootstrap_report_;
  ParseLog log_;
  std::unique_ptr<PageCache> page_cache_;
  std::stop_token stop_token_;
  ProgressCallback progress_;
};

}  // namespace menuscan::core
