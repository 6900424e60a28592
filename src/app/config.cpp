#include <menuscan/app/config.hpp>
#include <menuscan/core/text_utils.hpp>
#include <spdlog/spdlog.h>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <map>
#include <string_view>
#include <type_traits>
#include <variant>

namespace menuscan::app {

namespace nc = menuscan::core;

namespace {

using Field = std::variant<double nc::PipelineConfig::*,
                           std::size_t nc::PipelineConfig::*,
                           std::uint32_t nc::PipelineConfig::*,
                           bool nc::PipelineConfig::*>;

const std::map<std::string_view, Field>& field_table() {
  using C = nc::PipelineConfig;
  static const std::map<std::string_view, Field> table = {
      {"price_min", &C::price_min},
      {"price_max", &C::price_max},
      {"calorie_min", &C::calorie_min},
      {"calorie_max", &C::calorie_max},
      {"count_max", &C::count_max},
      {"price_classification_threshold", &C::price_classification_threshold},
      {"pattern_min_support", &C::pattern_min_support},
      {"fingerprint_min_tokens", &C::fingerprint_min_tokens},
      {"fingerprint_saturation", &C::fingerprint_saturation},
      {"y_proximity_em", &C::y_proximity_em},
      {"x_distance_em", &C::x_distance_em},
      {"min_region_confidence", &C::min_region_confidence},
      {"render_scale", &C::render_scale},
      {"edge_threshold", &C::edge_threshold},
      {"line_threshold", &C::line_threshold},
      {"min_line_length_px", &C::min_line_length_px},
      {"min_box_size_px", &C::min_box_size_px},
      {"box_aspect_min", &C::box_aspect_min},
      {"box_aspect_max", &C::box_aspect_max},
      {"box_edge_margin_px", &C::box_edge_margin_px},
      {"box_merge_overlap", &C::box_merge_overlap},
      {"box_token_padding", &C::box_token_padding},
      {"min_width_em", &C::min_width_em},
      {"min_height_em", &C::min_height_em},
      {"min_text_length", &C::min_text_length},
      {"min_text_density", &C::min_text_density},
      {"name_length_weight", &C::name_length_weight},
      {"description_weight", &C::description_weight},
      {"price_weight", &C::price_weight},
      {"extraction_quality_threshold", &C::extraction_quality_threshold},
      {"capture_thumbnails", &C::capture_thumbnails},
      {"thumbnail_padding", &C::thumbnail_padding},
      {"thumbnail_failure_penalty", &C::thumbnail_failure_penalty},
      {"validation_batch_size", &C::validation_batch_size},
      {"merge_cross_page_regions", &C::merge_cross_page_regions},
      {"page_margin_fraction", &C::page_margin_fraction},
      {"cross_page_alignment_em", &C::cross_page_alignment_em},
      {"name_min_length", &C::name_min_length},
      {"name_max_length", &C::name_max_length},
      {"min_item_floor", &C::min_item_floor},
      {"bootstrap_quality_threshold", &C::bootstrap_quality_threshold},
      {"min_coverage", &C::min_coverage},
      {"convergence_threshold", &C::convergence_threshold},
      {"max_bootstrap_iterations", &C::max_bootstrap_iterations},
      {"revert_margin", &C::revert_margin},
      {"outlier_sigma", &C::outlier_sigma},
      {"allow_priceless_items", &C::allow_priceless_items},
  };
  return table;
}

template <typename T>
bool parse_number(std::string_view s, T& out) {
  const char* end = s.data() + s.size();
  auto [ptr, ec] = std::from_chars(s.data(), end, out);
  return ec == std::errc{} && ptr == end;
}

bool parse_bool(std::string_view s, bool& out) {
  const std::string v = nc::to_lower_ascii(s);
  if (v == "true" || v == "1" || v == "yes" || v == "on") {
    out = true;
    return true;
  }
  if (v == "false" || v == "0" || v == "no" || v == "off") {
    out = false;
    return true;
  }
  return false;
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key = nc::trim(line.substr(0, pos));
  value = nc::trim(line.substr(pos + 1));
  return !key.empty();
}

}  // namespace

nc::PipelineConfig default_config() {
  return nc::PipelineConfig{};
}

std::optional<nc::DetectionMode> parse_detection_mode(std::string_view s) {
  if (s == "proximity") return nc::DetectionMode::Proximity;
  if (s == "box") return nc::DetectionMode::BorderedBox;
  if (s == "auto") return nc::DetectionMode::Auto;
  return std::nullopt;
}

std::optional<nc::AssemblyMode> parse_assembly_mode(std::string_view s) {
  if (s == "triple") return nc::AssemblyMode::Triple;
  if (s == "pair") return nc::AssemblyMode::Pair;
  if (s == "auto") return nc::AssemblyMode::Auto;
  return std::nullopt;
}

std::expected<void, nc::PipelineError> apply_config_value(nc::PipelineConfig& config,
                                                          std::string_view key,
                                                          std::string_view value) {
  if (key == "detection_mode") {
    auto mode = parse_detection_mode(value);
    if (!mode) return std::unexpected(nc::PipelineError::InvalidConfig);
    config.detection_mode = *mode;
    return {};
  }
  if (key == "assembly_mode") {
    auto mode = parse_assembly_mode(value);
    if (!mode) return std::unexpected(nc::PipelineError::InvalidConfig);
    config.assembly_mode = *mode;
    return {};
  }

  const auto& table = field_table();
  const auto it = table.find(key);
  if (it == table.end()) return std::unexpected(nc::PipelineError::InvalidConfig);

  const bool ok = std::visit(
      [&](auto member) {
        auto& field = config.*member;
        if constexpr (std::is_same_v<std::remove_reference_t<decltype(field)>, bool>) {
          return parse_bool(value, field);
        } else {
          return parse_number(value, field);
        }
      },
      it->second);
  if (!ok) return std::unexpected(nc::PipelineError::InvalidConfig);
  return {};
}

std::expected<nc::PipelineConfig, nc::PipelineError> load_config(const std::string& path) {
  nc::PipelineConfig c = default_config();
  std::ifstream f(path);
  if (!f) {
    spdlog::warn("config file '{}' not found, using defaults", path);
    return c;
  }

  std::string line;
  std::string key;
  std::string value;
  std::size_t line_no = 0;
  while (std::getline(f, line)) {
    ++line_no;
    const auto trimmed = nc::trim_view(line);
    if (trimmed.empty() || trimmed.front() == '#') continue;
    if (!parse_line(trimmed, key, value)) {
      spdlog::warn("{}:{}: ignoring line without key=value", path, line_no);
      continue;
    }
    if (key != "detection_mode" && key != "assembly_mode" && !field_table().contains(key)) {
      spdlog::warn("{}:{}: unknown key '{}' ignored", path, line_no, key);
      continue;
    }
    if (!apply_config_value(c, key, value)) {
      spdlog::error("{}:{}: invalid value '{}' for '{}'", path, line_no, value, key);
      return std::unexpected(nc::PipelineError::InvalidConfig);
    }
  }

  if (auto valid = nc::validate_config(c); !valid) {
    return std::unexpected(valid.error());
  }
  return c;
}

}  // namespace menuscan::app
