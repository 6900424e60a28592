#include <menuscan/app/pipeline_runner_tbb.hpp>

#ifdef MENUSCAN_HAS_TBB

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <cstddef>

namespace menuscan::app {

void run_pipeline_batch_tbb(const menuscan::core::Pipeline& pipeline,
                            const std::vector<menuscan::core::Document>& documents,
                            ParseResultCallback callback,
                            const menuscan::core::RunOptions& options) {
  if (documents.empty() || !callback) return;

  tbb::parallel_for(
      tbb::blocked_range<std::size_t>(0, documents.size()),
      [&pipeline, &documents, &callback, &options](const tbb::blocked_range<std::size_t>& range) {
        for (std::size_t i = range.begin(); i != range.end(); ++i) {
          auto result = run_pipeline(pipeline, documents[i], options);
          callback(i, result);
        }
      });
}

}  // namespace menuscan::app

#endif  // MENUSCAN_HAS_TBB
