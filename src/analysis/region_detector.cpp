#include <menuscan/analysis/region_detector.hpp>
#include <menuscan/core/reading_order.hpp>
#include <menuscan/core/text_patterns.hpp>
#include <menuscan/core/text_utils.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <set>
#include <string>

namespace menuscan::analysis {

namespace nc = menuscan::core;

RegionDetector::RegionDetector(const nc::PipelineConfig& config) : config_(config) {}

std::vector<std::vector<nc::Token>> RegionDetector::form_bands(
    std::span<const nc::Token> tokens, double average_font_size) const {
  const double max_dy = config_.y_proximity_em * average_font_size;
  std::vector<std::vector<nc::Token>> bands;
  for (const auto& t : tokens) {
    if (bands.empty() || std::abs(bands.back().back().top() - t.top()) > max_dy) {
      bands.emplace_back();
    }
    bands.back().push_back(t);
  }
  return bands;
}

std::vector<std::vector<nc::Token>> RegionDetector::cluster_band(
    std::vector<nc::Token> band, double average_font_size) const {
  std::stable_sort(band.begin(), band.end(),
                   [](const nc::Token& a, const nc::Token& b) { return a.x < b.x; });

  const double max_dx = config_.x_distance_em * average_font_size;
  std::vector<std::vector<nc::Token>> clusters;
  std::vector<nc::Token> current;
  auto emit = [&]() {
    if (current.size() >= 2) clusters.push_back(std::move(current));
    current.clear();
  };
  for (auto& t : band) {
    if (!current.empty() && t.x - current.back().right() > max_dx) {
      emit();
    }
    current.push_back(std::move(t));
  }
  emit();
  return clusters;
}

std::vector<nc::Region> RegionDetector::detect(const nc::Page& page) const {
  std::vector<nc::Token> tokens;
  tokens.reserve(page.tokens.size());
  for (const auto& t : page.tokens) {
    if (nc::is_usable(t)) tokens.push_back(t);
  }
  if (tokens.empty()) return {};

  std::stable_sort(tokens.begin(), tokens.end(),
                   [](const nc::Token& a, const nc::Token& b) { return a.top() > b.top(); });

  const double avg_font = nc::average_font_size(tokens);
  const double height = nc::page_height(page);

  std::vector<nc::Region> regions;
  for (auto& band : form_bands(tokens, avg_font)) {
    for (auto& cluster : cluster_band(std::move(band), avg_font)) {
      const float confidence = score_region(cluster);
      if (confidence < config_.min_region_confidence) {
        spdlog::debug("[regions] page {}: dropped cluster of {} tokens, confidence {:.2f}",
                      page.index, cluster.size(), confidence);
        continue;
      }
      regions.push_back(nc::make_region(nc::in_reading_order(cluster), page.index, height,
                                        nc::RegionSource::Proximity, confidence));
    }
  }
  return regions;
}

float RegionDetector::score_region(std::span<const nc::Token> tokens) {
  if (tokens.empty()) return 0.f;

  double score = 0.5;

  std::size_t min_len = std::string::npos;
  std::size_t max_len = 0;
  bool currency = false;
  std::set<std::string> fonts;
  for (const auto& t : tokens) {
    const std::size_t len = nc::utf8_length(nc::trim_view(t.text));
    min_len = std::min(min_len, len);
    max_len = std::max(max_len, len);
    currency = currency || nc::matches_currency(t.text);
    fonts.insert(t.family_or_unknown());
  }

  if (static_cast<double>(max_len) > 1.5 * static_cast<double>(min_len)) score += 0.2;
  if (currency) score += 0.3;
  if (tokens.size() >= 2 && tokens.size() <= 5) score += 0.2;
  if (fonts.size() <= 3) score += 0.1;

  return nc::clamp_confidence(score);
}

}  // namespace menuscan::analysis
