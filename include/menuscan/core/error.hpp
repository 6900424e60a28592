#pragma once

#include <string_view>

namespace menuscan::core {

/// Pipeline error codes; used with std::expected for recoverable and fatal failures.
enum class PipelineError {
  None = 0,
  EmptyDocument,   // no pages
  NoTokens,        // pages present but no usable tokens
  MalformedInput,  // token dump could not be parsed
  LoadFailed,
  InvalidConfig,
  RenderFailed,
  Cancelled,
};

[[nodiscard]] constexpr std::string_view to_string(PipelineError e) noexcept {
  switch (e) {
    case PipelineError::None:
      return "None";
    case PipelineError::EmptyDocument:
      return "EmptyDocument";
    case PipelineError::NoTokens:
      return "NoTokens";
    case PipelineError::MalformedInput:
      return "MalformedInput";
    case PipelineError::LoadFailed:
      return "LoadFailed";
    case PipelineError::InvalidConfig:
      return "InvalidConfig";
    case PipelineError::RenderFailed:
      return "RenderFailed";
    case PipelineError::Cancelled:
      return "Cancelled";
  }
  return "Unknown";
}

}  // namespace menuscan::core
