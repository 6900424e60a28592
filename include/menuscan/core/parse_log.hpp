#pragma once

#include <fmt/format.h>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace menuscan::core {

enum class Severity : std::uint8_t {
  Debug,
  Info,
  Warning,
  Error,
};

[[nodiscard]] std::string_view to_string(Severity s) noexcept;

/// One structured log record.
struct LogEntry {
  std::string phase;
  Severity severity{Severity::Info};
  std::string message;
};

/// Progress snapshot emitted at phase boundaries for a presentation layer.
struct ProgressSnapshot {
  std::string phase;
  int percent{0};  // 0-100
  std::string message;
};

using ProgressCallback = std::function<void(const ProgressSnapshot&)>;

/// Per-session structured log stream. Every entry is kept for the caller and mirrored to
/// spdlog as "[phase] message". Thread-safe: regions are validated on worker threads.
class ParseLog {
 public:
  void record(std::string_view phase, Severity severity, std::string message);

  template <typename... Args>
  void debug(std::string_view phase, fmt::format_string<Args...> f, Args&&... args) {
    record(phase, Severity::Debug, fmt::format(f, std::forward<Args>(args)...));
  }
  template <typename... Args>
  void info(std::string_view phase, fmt::format_string<Args...> f, Args&&... args) {
    record(phase, Severity::Info, fmt::format(f, std::forward<Args>(args)...));
  }
  template <typename... Args>
  void warn(std::string_view phase, fmt::format_string<Args...> f, Args&&... args) {
    record(phase, Severity::Warning, fmt::format(f, std::forward<Args>(args)...));
  }
  template <typename... Args>
  void error(std::string_view phase, fmt::format_string<Args...> f, Args&&... args) {
    record(phase, Severity::Error, fmt::format(f, std::forward<Args>(args)...));
  }

  /// Snapshot copy of all entries so far.
  [[nodiscard]] std::vector<LogEntry> entries() const;
  [[nodiscard]] std::size_t size() const;

 private:
  mutable std::mutex mutex_;
  std::vector<LogEntry> entries_;
};

}  // namespace menuscan::core
