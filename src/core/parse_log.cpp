#include <menuscan/core/parse_log.hpp>
#include <spdlog/spdlog.h>

namespace menuscan::core {

std::string_view to_string(Severity s) noexcept {
  switch (s) {
    case Severity::Debug:
      return "debug";
    case Severity::Info:
      return "info";
    case Severity::Warning:
      return "warning";
    case Severity::Error:
      return "error";
  }
  return "unknown";
}

namespace {

spdlog::level::level_enum to_spdlog(Severity s) {
  switch (s) {
    case Severity::Debug:
      return spdlog::level::debug;
    case Severity::Info:
      return spdlog::level::info;
    case Severity::Warning:
      return spdlog::level::warn;
    case Severity::Error:
      return spdlog::level::err;
  }
  return spdlog::level::info;
}

}  // namespace

void ParseLog::record(std::string_view phase, Severity severity, std::string message) {
  spdlog::log(to_spdlog(severity), "[{}] {}", phase, message);
  std::lock_guard lock(mutex_);
  entries_.push_back(LogEntry{std::string(phase), severity, std::move(message)});
}

std::vector<LogEntry> ParseLog::entries() const {
  std::lock_guard lock(mutex_);
  return entries_;
}

std::size_t ParseLog::size() const {
  std::lock_guard lock(mutex_);
  return entries_.size();
}

}  // namespace menuscan::core
