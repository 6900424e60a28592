#include <menuscan/core/pipeline.hpp>
#include <algorithm>
#include <chrono>
#include <utility>

namespace menuscan::core {

Pipeline::Pipeline(PipelineConfig config) : config_(std::move(config)) {}

void Pipeline::add_stage(std::unique_ptr<IPipelineStage> stage) {
  if (stage) {
    stages_.push_back(std::move(stage));
  }
}

std::expected<void, PipelineError> check_document(const Document& document) {
  if (document.pages.empty()) {
    return std::unexpected(PipelineError::EmptyDocument);
  }
  const bool any_usable = std::any_of(document.pages.begin(), document.pages.end(), [](const Page& p) {
    return std::any_of(p.tokens.begin(), p.tokens.end(), [](const Token& t) { return is_usable(t); });
  });
  if (!any_usable) {
    return std::unexpected(PipelineError::NoTokens);
  }
  return {};
}

std::expected<ParseResult, PipelineError> Pipeline::run(
    const Document& document,
    const RunOptions& options,
    StageTimingCallback* timing_cb) const {
  if (stages_.empty()) {
    return std::unexpected(PipelineError::InvalidConfig);
  }
  if (config_) {
    if (auto valid = validate_config(*config_); !valid) {
      return std::unexpected(valid.error());
    }
  }

  ParseSession session(document, options);
  if (auto valid = check_document(document); !valid) {
    session.log().error("input", "document '{}' rejected: {}", document.source_name,
                        to_string(valid.error()));
    return std::unexpected(valid.error());
  }

  session.log().info("input", "document '{}': {} pages, {} tokens", document.source_name,
                     document.pages.size(), document.token_count());
  session.report_progress("input", 0, "starting");

  for (std::size_t i = 0; i < stages_.size(); ++i) {
    if (session.stop_requested()) {
      return std::unexpected(PipelineError::Cancelled);
    }

    const auto stage_start = std::chrono::steady_clock::now();
    auto result = stages_[i]->process(session);
    if (timing_cb) {
      const auto stage_end = std::chrono::steady_clock::now();
      const double ms = 1e-6 * static_cast<double>(
          std::chrono::duration_cast<std::chrono::nanoseconds>(stage_end - stage_start).count());
      (*timing_cb)(i, ms);
    }

    if (!result) {
      session.log().error(stages_[i]->name(), "stage failed: {}", to_string(result.error()));
      return std::unexpected(result.error());
    }

    const int percent = static_cast<int>(((i + 1) * 100) / stages_.size());
    session.report_progress(stages_[i]->name(), percent, "complete");
  }

  if (session.stop_requested()) {
    return std::unexpected(PipelineError::Cancelled);
  }
  return session.take_result();
}

}  // namespace menuscan::core
