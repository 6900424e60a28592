#pragma once

#include <menuscan/core/error.hpp>
#include <menuscan/core/pipeline_config.hpp>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace menuscan::app {

/// Default config when no file is provided.
menuscan::core::PipelineConfig default_config();

/// Load config from a key=value file (one per line, '#' comments). Unknown keys are
/// logged and skipped; a malformed value or a config failing validate_config gives
/// InvalidConfig. A missing file gives the defaults with a warning.
[[nodiscard]] std::expected<menuscan::core::PipelineConfig, menuscan::core::PipelineError>
load_config(const std::string& path);

/// Sets one field by its config-file key. InvalidConfig for a malformed value or unknown key.
[[nodiscard]] std::expected<void, menuscan::core::PipelineError>
apply_config_value(menuscan::core::PipelineConfig& config, std::string_view key, std::string_view value);

/// "proximity", "box" or "auto".
[[nodiscard]] std::optional<menuscan::core::DetectionMode> parse_detection_mode(std::string_view s);

/// "triple", "pair" or "auto".
[[nodiscard]] std::optional<menuscan::core::AssemblyMode> parse_assembly_mode(std::string_view s);

}  // namespace menuscan::app
