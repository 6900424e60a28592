#pragma once

#include <menuscan/core/error.hpp>
#include <menuscan/core/pipeline_config.hpp>
#include <menuscan/core/pipeline_stage.hpp>
#include <menuscan/core/session.hpp>
#include <menuscan/core/token.hpp>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace menuscan::core {

/// Callback for per-stage timing: (stage_index, duration_ms). Optional; pass to run().
using StageTimingCallback = std::function<void(std::size_t stage_index, double duration_ms)>;

/// Runs a sequence of stages over one ParseSession per document.
class Pipeline {
 public:
  Pipeline() = default;

  /// Pipeline whose stages were built from `config`; run() rejects it with InvalidConfig
  /// when validate_config fails.
  explicit Pipeline(PipelineConfig config);

  void add_stage(std::unique_ptr<IPipelineStage> stage);

  /// Parse one document. Fails fast on an invalid config, on structurally invalid input
  /// (no pages, no tokens) and on cancellation; every other failure is handled inside the stages.
  /// If timing_cb is non-null, it is called after each stage with (stage_index, duration_ms).
  /// Thread-safe: safe to call run() from multiple threads concurrently
  /// (stages are not modified during process()).
  [[nodiscard]] std::expected<ParseResult, PipelineError> run(
      const Document& document,
      const RunOptions& options = {},
      StageTimingCallback* timing_cb = nullptr) const;

  [[nodiscard]] std::size_t stage_count() const noexcept {
    return stages_.size();
  }

 private:
  std::vector<std::unique_ptr<IPipelineStage>> stages_;
  std::optional<PipelineConfig> config_;
};

/// Structural input check: EmptyDocument without pages, NoTokens without a usable token.
[[nodiscard]] std::expected<void, PipelineError> check_document(const Document& document);

}  // namespace menuscan::core
