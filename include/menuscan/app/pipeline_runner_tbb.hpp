#pragma once

#include <menuscan/app/pipeline_runner.hpp>
#include <menuscan/core/pipeline.hpp>
#include <menuscan/core/session.hpp>
#include <menuscan/core/token.hpp>
#include <vector>

#ifdef MENUSCAN_HAS_TBB

namespace menuscan::app {

/// Runs the pipeline over a batch of documents with tbb::parallel_for.
///
/// Each document gets its own ParseSession, so sessions never share classification state
/// or page caches. callback(index, outcome) is invoked from TBB worker threads and must be
/// thread-safe. options.renderer must be null or safe to call from several threads.
void run_pipeline_batch_tbb(const menuscan::core::Pipeline& pipeline,
                            const std::vector<menuscan::core::Document>& documents,
                            ParseResultCallback callback,
                            const menuscan::core::RunOptions& options = {});

}  // namespace menuscan::app

#endif  // MENUSCAN_HAS_TBB
