#include <menuscan/analysis/bootstrap.hpp>
#include <menuscan/analysis/document_validator.hpp>
#include <menuscan/core/text_utils.hpp>
#include <algorithm>
#include <utility>

namespace menuscan::analysis {

namespace nc = menuscan::core;

namespace {

constexpr double kRescoreStep = 0.05;
constexpr std::string_view kPhase = "bootstrap";

}  // namespace

std::string_view to_string(BootstrapState s) noexcept {
  switch (s) {
    case BootstrapState::Assemble:
      return "Assemble";
    case BootstrapState::AssessBootstrap:
      return "AssessBootstrap";
    case BootstrapState::Fallback:
      return "Fallback";
    case BootstrapState::Reprocess:
      return "Reprocess";
    case BootstrapState::Converge:
      return "Converge";
    case BootstrapState::Validate:
      return "Validate";
    case BootstrapState::Dedup:
      return "Dedup";
    case BootstrapState::Done:
      return "Done";
  }
  return "Unknown";
}

QualityAssessment assess_quality(const std::vector<nc::MenuItem>& items,
                                 std::size_t price_count,
                                 const nc::PipelineConfig& config) {
  QualityAssessment a;
  a.count = items.size();
  if (!items.empty()) {
    double sum = 0.0;
    for (const auto& item : items) sum += item.confidence;
    a.mean_confidence = sum / static_cast<double>(items.size());
  }
  if (price_count == 0) {
    a.coverage = items.empty() ? 0.0 : 1.0;
  } else {
    a.coverage = std::min(1.0, static_cast<double>(items.size()) / static_cast<double>(price_count));
  }
  const double floor = static_cast<double>(std::max<std::size_t>(config.min_item_floor, 1));
  a.quality = 0.4 * a.mean_confidence + 0.3 * std::min(static_cast<double>(a.count) / floor, 1.0) +
              0.3 * a.coverage;
  a.sufficient = a.count >= config.min_item_floor &&
                 a.mean_confidence >= config.bootstrap_quality_threshold &&
                 a.coverage >= config.min_coverage;
  return a;
}

ClassifierPatterns LearnedPatterns::classifier_patterns() const {
  ClassifierPatterns p;
  p.learned_price_min = price_min;
  p.learned_price_max = price_max;
  return p;
}

LearnedPatterns learn_patterns(const std::vector<nc::MenuItem>& items) {
  LearnedPatterns p;
  for (const auto& item : items) {
    const std::size_t len = nc::utf8_length(item.name);
    p.name_length_min = std::min(p.name_length_min.value_or(len), len);
    p.name_length_max = std::max(p.name_length_max.value_or(len), len);
    if (item.price) {
      p.price_min = std::min(p.price_min.value_or(*item.price), *item.price);
      p.price_max = std::max(p.price_max.value_or(*item.price), *item.price);
    }
    ++p.categories[item.category];
  }
  return p;
}

std::vector<nc::MenuItem> rescore(std::vector<nc::MenuItem> items, const LearnedPatterns& patterns) {
  for (auto& item : items) {
    double delta = 0.0;
    if (patterns.name_length_min && patterns.name_length_max) {
      const std::size_t len = nc::utf8_length(item.name);
      const bool fits = len >= *patterns.name_length_min && len <= *patterns.name_length_max;
      delta += fits ? kRescoreStep : -kRescoreStep;
    }
    if (patterns.price_min && patterns.price_max && item.price) {
      const bool fits = *item.price >= *patterns.price_min && *item.price <= *patterns.price_max;
      delta += fits ? kRescoreStep : -kRescoreStep;
    }
    if (!patterns.categories.empty()) {
      delta += patterns.categories.contains(item.category) ? kRescoreStep : -kRescoreStep;
    }
    item.confidence = nc::clamp_confidence(item.confidence + delta);
  }
  return items;
}

BootstrapController::BootstrapController(const nc::PipelineConfig& config, Hooks hooks)
    : config_(config), hooks_(std::move(hooks)) {}

std::expected<std::vector<nc::MenuItem>, nc::PipelineError> BootstrapController::run(
    std::size_t price_count,
    std::stop_token stop_token,
    nc::ParseLog& log,
    nc::BootstrapReport& report) const {
  report = nc::BootstrapReport{};

  std::vector<nc::MenuItem> current;
  std::vector<nc::MenuItem> primary_base;
  std::vector<nc::MenuItem> fallback_items;
  std::vector<nc::MenuItem> best;
  double best_quality = -1.0;
  double last_quality = 0.0;
  bool fallback_done = false;
  bool refined = false;
  bool assessed = false;

  // Every transition costs one step; the cap bounds the loop even if the table is wrong.
  const std::size_t max_steps = 8 * (config_.max_bootstrap_iterations + 2);
  std::size_t steps = 0;

  BootstrapState state = BootstrapState::Assemble;
  while (state != BootstrapState::Done) {
    report.state_trace.emplace_back(to_string(state));
    if (++steps > max_steps && state != BootstrapState::Validate && state != BootstrapState::Dedup) {
      log.warn(kPhase, "step cap reached in state {}", to_string(state));
      report.cap_reached = true;
      state = BootstrapState::Validate;
    }

    switch (state) {
      case BootstrapState::Assemble:
        primary_base = hooks_.assemble ? hooks_.assemble() : std::vector<nc::MenuItem>{};
        current = primary_base;
        state = BootstrapState::AssessBootstrap;
        break;

      case BootstrapState::AssessBootstrap: {
        if (stop_token.stop_requested()) {
          log.info(kPhase, "cancelled after {} iterations", report.iterations);
          return std::unexpected(nc::PipelineError::Cancelled);
        }
        const auto a = assess_quality(current, price_count, config_);
        if (!assessed) {
          report.initial_quality = a.quality;
          best = current;
          best_quality = a.quality;
          assessed = true;
        }
        last_quality = a.quality;
        log.info(kPhase, "{} items, mean confidence {:.2f}, coverage {:.2f}, quality {:.2f}",
                 a.count, a.mean_confidence, a.coverage, a.quality);
        if (a.sufficient) {
          state = BootstrapState::Validate;
        } else if (report.iterations >= config_.max_bootstrap_iterations) {
          report.cap_reached = true;
          log.info(kPhase, "iteration cap {} reached", config_.max_bootstrap_iterations);
          state = BootstrapState::Validate;
        } else {
          state = BootstrapState::Fallback;
        }
        break;
      }

      case BootstrapState::Fallback:
        report.triggered = true;
        ++report.iterations;
        if (!fallback_done) {
          fallback_items = hooks_.fallback ? hooks_.fallback() : std::vector<nc::MenuItem>{};
          fallback_done = true;
          log.info(kPhase, "line fallback found {} items", fallback_items.size());
        }
        state = BootstrapState::Reprocess;
        break;

      case BootstrapState::Reprocess: {
        const auto patterns = learn_patterns(fallback_items);
        if (!refined && hooks_.refine && patterns.price_min && patterns.price_max) {
          refined = true;
          log.info(kPhase, "refining with learned price range {:.2f}-{:.2f}", *patterns.price_min,
                   *patterns.price_max);
          primary_base = hooks_.refine(patterns.classifier_patterns());
          if (hooks_.count_prices) {
            price_count = hooks_.count_prices();
            log.debug(kPhase, "{} prices after refinement", price_count);
          }
        }
        current = merge_item_sets(rescore(primary_base, patterns), fallback_items);
        state = BootstrapState::Converge;
        break;
      }

      case BootstrapState::Converge: {
        const auto a = assess_quality(current, price_count, config_);
        const double improvement = a.quality - last_quality;
        last_quality = a.quality;
        if (a.quality < best_quality - config_.revert_margin) {
          log.info(kPhase, "quality {:.2f} fell below best {:.2f}, reverting", a.quality, best_quality);
          report.reverted = true;
          current = best;
          state = BootstrapState::Validate;
          break;
        }
        if (a.quality > best_quality) {
          best = current;
          best_quality = a.quality;
        }
        if (improvement < config_.convergence_threshold) {
          report.converged = true;
          log.info(kPhase, "converged at quality {:.2f}", a.quality);
          state = BootstrapState::Validate;
        } else if (report.iterations >= config_.max_bootstrap_iterations) {
          report.cap_reached = true;
          log.info(kPhase, "not converged after {} iterations", report.iterations);
          state = BootstrapState::Validate;
        } else {
          state = BootstrapState::AssessBootstrap;
        }
        if (state == BootstrapState::Validate && best_quality > a.quality) {
          current = best;
        }
        break;
      }

      case BootstrapState::Validate: {
        const std::size_t before = current.size();
        current = enforce_unique_names(std::move(current));
        std::size_t outliers = 0;
        current = drop_price_outliers(std::move(current), config_.outlier_sigma, &outliers);
        log.info(kPhase, "document validation: {} duplicates by name, {} price outliers removed",
                 before - current.size() - outliers, outliers);
        state = BootstrapState::Dedup;
        break;
      }

      case BootstrapState::Dedup:
        current = order_items(deduplicate(std::move(current)));
        state = BootstrapState::Done;
        break;

      case BootstrapState::Done:
        break;
    }
  }
  report.state_trace.emplace_back(to_string(BootstrapState::Done));
  report.final_quality = assess_quality(current, price_count, config_).quality;
  return current;
}

}  // namespace menuscan::analysis
