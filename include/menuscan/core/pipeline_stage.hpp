#pragma once

#include <menuscan/core/error.hpp>
#include <menuscan/core/session.hpp>
#include <expected>
#include <string_view>

namespace menuscan::core {

/// Abstract pipeline stage: consumes the previous phase's artifacts from the session and
/// stores its own. Stages hold only configuration, so one stage instance may serve
/// concurrent sessions.
class IPipelineStage {
 public:
  virtual ~IPipelineStage() = default;

  /// Short phase name used in logs and progress snapshots.
  [[nodiscard]] virtual std::string_view name() const noexcept = 0;

  [[nodiscard]] virtual std::expected<void, PipelineError> process(ParseSession& session) const = 0;
};

}  // namespace menuscan::core
