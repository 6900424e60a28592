#include <menuscan/app/pipeline_runner.hpp>
#include <menuscan/core/worker_pool.hpp>
#include <spdlog/spdlog.h>

namespace menuscan::app {

namespace nc = menuscan::core;

ParseOutcome run_pipeline(const nc::Pipeline& pipeline,
                          const nc::Document& document,
                          const nc::RunOptions& options,
                          StageTimingCallback* timing_cb) {
  auto result = pipeline.run(document, options, timing_cb);
  if (!result) {
    spdlog::warn("document '{}' failed: {}", document.source_name, nc::to_string(result.error()));
  }
  return result;
}

void run_pipeline_batch(const nc::Pipeline& pipeline,
                        const std::vector<nc::Document>& documents,
                        ParseResultCallback callback,
                        const nc::RunOptions& options) {
  for (std::size_t i = 0; i < documents.size(); ++i) {
    auto result = run_pipeline(pipeline, documents[i], options);
    if (callback) callback(i, result);
  }
}

void run_pipeline_batch_parallel(const nc::Pipeline& pipeline,
                                 const std::vector<nc::Document>& documents,
                                 ParseResultCallback callback,
                                 std::size_t num_workers,
                                 const nc::RunOptions& options) {
  if (documents.empty() || !callback) return;

  nc::parallel_for_bounded(documents.size(), num_workers, [&](std::size_t i) {
    auto result = run_pipeline(pipeline, documents[i], options);
    callback(i, result);
  });
}

}  // namespace menuscan::app
