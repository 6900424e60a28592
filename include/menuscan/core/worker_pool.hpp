#pragma once

#include <cstddef>
#include <functional>

namespace menuscan::core {

/// Worker count to use: `requested`, or hardware concurrency when 0 (at least 1).
[[nodiscard]] std::size_t effective_workers(std::size_t requested);

/// Runs task(i) for every i in [0, n) on at most `max_workers` threads (0 = hardware
/// concurrency). Blocks until all tasks finish. task must be thread-safe; indices are
/// handed out in increasing order but may complete in any order.
void parallel_for_bounded(std::size_t n,
                          std::size_t max_workers,
                          const std::function<void(std::size_t)>& task);

}  // namespace menuscan::core
