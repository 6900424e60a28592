#include <menuscan/analysis/region_validator.hpp>
#include <menuscan/core/reading_order.hpp>
#include <menuscan/core/text_utils.hpp>
#include <menuscan/core/worker_pool.hpp>
#include <menuscan/vision/thumbnail.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <map>

namespace menuscan::analysis {

namespace nc = menuscan::core;

namespace {

constexpr double kScoreEpsilon = 1e-9;
constexpr std::string_view kPhase = "validation";

RegionVerdict reject(RejectReason reason, std::string detail) {
  return RegionVerdict{false, reason, 0.0, std::move(detail)};
}

}  // namespace

std::string_view to_string(RejectReason r) noexcept {
  switch (r) {
    case RejectReason::None:
      return "none";
    case RejectReason::TooNarrow:
      return "too narrow";
    case RejectReason::TooShort:
      return "too short";
    case RejectReason::TooFewTokens:
      return "too few tokens";
    case RejectReason::TooLittleText:
      return "too little text";
    case RejectReason::TooSparse:
      return "text too sparse";
    case RejectReason::MissingPrice:
      return "missing price";
    case RejectReason::LowExtractionQuality:
      return "low extraction quality";
    default:
      return "unknown";
  }
}

RegionValidator::RegionValidator(const nc::PipelineConfig& config,
                                 const nc::ClassificationIndex& classifications)
    : config_(config), classifications_(classifications) {}

bool RegionValidator::is_price_token(const nc::Token& token) const {
  return classifications_.has_price(token,
                                    static_cast<float>(config_.price_classification_threshold));
}

RegionVerdict RegionValidator::check_dimensions(const nc::Region& region) const {
  const double em = region.average_font_size();
  if (region.bbox.width < config_.min_width_em * em) {
    return reject(RejectReason::TooNarrow,
                  fmt::format("width {:.1f} < {:.1f}", region.bbox.width, config_.min_width_em * em));
  }
  if (region.bbox.height < config_.min_height_em * em) {
    return reject(RejectReason::TooShort, fmt::format("height {:.1f} < {:.1f}", region.bbox.height,
                                                      config_.min_height_em * em));
  }
  return {};
}

RegionVerdict RegionValidator::check_content(const nc::Region& region) const {
  if (region.tokens.size() < 2) {
    return reject(RejectReason::TooFewTokens, fmt::format("{} tokens", region.tokens.size()));
  }
  const std::size_t chars = nc::utf8_length(nc::trim_view(region.text()));
  if (chars < config_.min_text_length) {
    return reject(RejectReason::TooLittleText, fmt::format("{} characters", chars));
  }
  const double area = region.bbox.area();
  const double density = area > 0.0 ? static_cast<double>(chars) / area : 0.0;
  if (density < config_.min_text_density) {
    return reject(RejectReason::TooSparse, fmt::format("density {:.5f}", density));
  }
  return {};
}

RegionVerdict RegionValidator::check_heuristics(const nc::Region& region) const {
  const auto ordered = nc::in_reading_order(region.tokens);

  bool has_price = false;
  std::optional<std::string> name;
  std::vector<std::string> rest;
  for (const auto& t : ordered) {
    if (is_price_token(t)) {
      has_price = true;
      continue;
    }
    if (!name) {
      name = nc::trim(t.text);
    } else {
      rest.push_back(t.text);
    }
  }

  const std::size_t name_len = name ? nc::utf8_length(*name) : 0;
  const bool name_ok = name_len >= config_.name_min_length && name_len <= config_.name_max_length;
  const std::string description = nc::join_trimmed(rest);
  const bool description_ok = description.empty() || nc::utf8_length(description) >= name_len;

  const double score = (name_ok ? config_.name_length_weight : 0.0) +
                       (description_ok ? config_.description_weight : 0.0) +
                       (has_price ? config_.price_weight : 0.0);

  if (!has_price) {
    const auto reason = (name_ok && description_ok) ? RejectReason::MissingPrice
                                                    : RejectReason::LowExtractionQuality;
    auto verdict = reject(reason, fmt::format("no price above {:.2f}",
                                              config_.price_classification_threshold));
    verdict.extraction_quality = score;
    return verdict;
  }
  if (score + kScoreEpsilon < config_.extraction_quality_threshold) {
    auto verdict = reject(RejectReason::LowExtractionQuality,
                          fmt::format("quality {:.2f} (name {}, description {})", score,
                                      name_ok ? "ok" : "bad", description_ok ? "ok" : "bad"));
    verdict.extraction_quality = score;
    return verdict;
  }
  return RegionVerdict{true, RejectReason::None, score, {}};
}

RegionVerdict RegionValidator::validate(const nc::Region& region) const {
  if (auto v = check_dimensions(region); !v.accepted) return v;
  if (auto v = check_content(region); !v.accepted) return v;
  return check_heuristics(region);
}

ValidationOutcome RegionValidator::validate_all(std::vector<nc::Region> regions,
                                                nc::PageCache* cache,
                                                nc::ParseLog& log) const {
  std::vector<RegionVerdict> verdicts(regions.size());
  const bool thumbnails = cache != nullptr && config_.capture_thumbnails;

  nc::parallel_for_bounded(regions.size(), config_.validation_batch_size, [&](std::size_t i) {
    verdicts[i] = validate(regions[i]);
    if (!verdicts[i].accepted || !thumbnails) return;

    auto thumb = vision::extract_thumbnail(*cache, regions[i], config_.thumbnail_padding,
                                           config_.render_scale);
    if (thumb) {
      regions[i].thumbnail = std::move(*thumb);
      return;
    }
    regions[i].confidence = nc::clamp_confidence(regions[i].confidence *
                                                 config_.thumbnail_failure_penalty);
    log.warn(kPhase, "thumbnail failed for region {} on page {}: {}",
             nc::to_string(regions[i].bbox), regions[i].page_index, nc::to_string(thumb.error()));
  });

  ValidationOutcome out;
  for (std::size_t i = 0; i < regions.size(); ++i) {
    const auto& v = verdicts[i];
    if (v.accepted) {
      out.accepted.push_back(std::move(regions[i]));
      continue;
    }
    ++out.rejected;
    log.debug(kPhase, "rejected region {} on page {}: {} ({})", nc::to_string(regions[i].bbox),
              regions[i].page_index, to_string(v.reason), v.detail);
    if (v.reason == RejectReason::MissingPrice) {
      out.price_rejected.push_back(std::move(regions[i]));
    }
  }
  log.info(kPhase, "{} regions accepted, {} rejected ({} for missing price)", out.accepted.size(),
           out.rejected, out.price_rejected.size());
  return out;
}

std::vector<nc::Region> merge_cross_page_continuations(
    std::vector<nc::Region> regions,
    const nc::Document& document,
    const nc::ClassificationIndex& classifications,
    const nc::PipelineConfig& config) {
  std::map<std::uint32_t, double> heights;
  for (const auto& p : document.pages) heights[p.index] = nc::page_height(p);

  const auto min_conf = static_cast<float>(config.price_classification_threshold);
  auto has_price = [&](const nc::Region& r) {
    return std::any_of(r.tokens.begin(), r.tokens.end(),
                       [&](const nc::Token& t) { return classifications.has_price(t, min_conf); });
  };
  auto has_name = [&](const nc::Region& r) {
    return std::any_of(r.tokens.begin(), r.tokens.end(), [&](const nc::Token& t) {
      return !classifications.has_price(t, min_conf) && nc::contains_letter(t.text);
    });
  };

  std::vector<bool> consumed(regions.size(), false);
  std::vector<nc::Region> out;
  out.reserve(regions.size());
  for (std::size_t i = 0; i < regions.size(); ++i) {
    if (consumed[i]) continue;
    consumed[i] = true;
    const auto& a = regions[i];
    const auto next_height = heights.find(a.page_index + 1);
    const bool in_bottom_margin = a.bbox.y <= config.page_margin_fraction * a.page_height;
    if (next_height == heights.end() || !in_bottom_margin) {
      out.push_back(std::move(regions[i]));
      continue;
    }

    const bool a_price = has_price(a);
    const double tolerance = config.cross_page_alignment_em * a.average_font_size();
    std::optional<std::size_t> match;
    for (std::size_t j = 0; j < regions.size(); ++j) {
      if (j == i || consumed[j]) continue;
      const auto& b = regions[j];
      if (b.page_index != a.page_index + 1) continue;
      if (b.bbox.top() < (1.0 - config.page_margin_fraction) * next_height->second) continue;
      if (std::abs(b.bbox.x - a.bbox.x) > tolerance) continue;
      const bool b_price = has_price(b);
      const bool completes = (has_name(a) && !a_price && b_price) ||
                             (has_name(b) && !b_price && a_price);
      if (completes) {
        match = j;
        break;
      }
    }
    if (!match) {
      out.push_back(std::move(regions[i]));
      continue;
    }

    consumed[*match] = true;
    std::vector<nc::Token> tokens = a.tokens;
    for (auto t : regions[*match].tokens) {
      t.y -= next_height->second;
      tokens.push_back(std::move(t));
    }
    spdlog::debug("[validation] merged region on page {} with continuation on page {}",
                  a.page_index, a.page_index + 1);
    const float confidence = std::max(a.confidence, regions[*match].confidence);
    out.push_back(nc::make_region(nc::in_reading_order(tokens), a.page_index, a.page_height,
                                  nc::RegionSource::CrossPage, confidence));
  }
  return out;
}

}  // namespace menuscan::analysis
