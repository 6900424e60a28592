#pragma once

#include <menuscan/core/error.hpp>
#include <menuscan/core/pipeline.hpp>
#include <menuscan/core/session.hpp>
#include <menuscan/core/token.hpp>
#include <cstddef>
#include <expected>
#include <functional>
#include <vector>

namespace menuscan::app {

/// Outcome of one document in a batch.
using ParseOutcome = std::expected<menuscan::core::ParseResult, menuscan::core::PipelineError>;

/// Callback for each document's outcome with its index in the batch; may be invoked from
/// worker threads. Must be thread-safe if using run_pipeline_batch_parallel.
using ParseResultCallback = std::function<void(std::size_t index, const ParseOutcome& outcome)>;

/// Optional per-stage timing: (stage_index, duration_ms). Pass to run_pipeline to get timings.
using StageTimingCallback = menuscan::core::StageTimingCallback;

/// Runs pipeline on a single document. No threading; direct call.
[[nodiscard]] ParseOutcome run_pipeline(const menuscan::core::Pipeline& pipeline,
                                        const menuscan::core::Document& document,
                                        const menuscan::core::RunOptions& options = {},
                                        StageTimingCallback* timing_cb = nullptr);

/// Runs pipeline on multiple documents sequentially; calls callback for each outcome.
/// options.renderer, when set, is used for every document.
void run_pipeline_batch(const menuscan::core::Pipeline& pipeline,
                        const std::vector<menuscan::core::Document>& documents,
                        ParseResultCallback callback,
                        const menuscan::core::RunOptions& options = {});

/// Runs pipeline on multiple documents in parallel using a thread pool. Each document gets
/// its own session; callback may be invoked from any worker. num_workers 0 = hardware
/// concurrency. options.renderer must be null or safe to call from several threads.
void run_pipeline_batch_parallel(const menuscan::core::Pipeline& pipeline,
                                 const std::vector<menuscan::core::Document>& documents,
                                 ParseResultCallback callback,
                                 std::size_t num_workers = 0,
                                 const menuscan::core::RunOptions& options = {});

}  // namespace menuscan::app
