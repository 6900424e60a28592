#pragma once

#include <menuscan/core/error.hpp>
#include <menuscan/core/token.hpp>
#include <expected>
#include <istream>
#include <string>

namespace menuscan::app {

/// Reads a token dump: "#page <index> <width> <height>" starts a page, each following
/// tab-separated row is "x y w h font_size family weight text" ("-" for an unknown
/// family or weight). Other '#' lines and blank lines are skipped. Rows before the first
/// #page go to page 0. MalformedInput names the offending line in the log.
[[nodiscard]] std::expected<menuscan::core::Document, menuscan::core::PipelineError>
parse_token_stream(std::istream& in, const std::string& source_name);

/// parse_token_stream over a file; LoadFailed if it cannot be opened.
[[nodiscard]] std::expected<menuscan::core::Document, menuscan::core::PipelineError>
load_token_file(const std::string& path);

}  // namespace menuscan::app
