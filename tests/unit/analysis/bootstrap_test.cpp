#include <menuscan/analysis/bootstrap.hpp>
#include <menuscan/core/parse_log.hpp>
#include <menuscan/core/session.hpp>
#include <gtest/gtest.h>
#include <algorithm>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace na = menuscan::analysis;
namespace nc = menuscan::core;

namespace {

nc::MenuItem region_item(std::string name, double price, double y, float confidence = 0.9f) {
  nc::MenuItem it;
  it.id = "region-" + name;
  it.name = std::move(name);
  it.price = price;
  it.confidence = confidence;
  it.provenance.page_index = 0;
  it.provenance.region_box = nc::BBox{50, y, 200, 12};
  return it;
}

nc::MenuItem line_item(std::string name, double price) {
  nc::MenuItem it;
  it.id = "line-" + name;
  it.name = std::move(name);
  it.price = price;
  it.confidence = 0.6f;
  it.provenance.phase = nc::ProcessingPhase::LineFallback;
  it.provenance.page_index = 0;
  return it;
}

std::vector<nc::MenuItem> five_items() {
  return {region_item("Pad Thai", 12.95, 700), region_item("Green Curry", 14.5, 650),
          region_item("Tom Yum Soup", 9.0, 600), region_item("Spring Rolls", 6.0, 550),
          region_item("Mango Sticky Rice", 8.5, 500)};
}

bool traced(const nc::BootstrapReport& report, std::string_view state) {
  return std::find(report.state_trace.begin(), report.state_trace.end(), state) !=
         report.state_trace.end();
}

}  // namespace

TEST(Bootstrap, QualityFormula) {
  nc::PipelineConfig config;
  const auto a = na::assess_quality(five_items(), 5, config);
  EXPECT_EQ(a.count, 5u);
  EXPECT_NEAR(a.mean_confidence, 0.9, 1e-6);
  EXPECT_DOUBLE_EQ(a.coverage, 1.0);
  EXPECT_NEAR(a.quality, 0.4 * 0.9 + 0.3 + 0.3, 1e-6);
  EXPECT_TRUE(a.sufficient);
}

TEST(Bootstrap, CoverageCappedAndEmptyCases) {
  nc::PipelineConfig config;
  const auto few = na::assess_quality({region_item("Pad Thai", 12.95, 700)}, 4, config);
  EXPECT_DOUBLE_EQ(few.coverage, 0.25);
  EXPECT_FALSE(few.sufficient);

  const auto none = na::assess_quality({}, 0, config);
  EXPECT_DOUBLE_EQ(none.coverage, 0.0);
  EXPECT_DOUBLE_EQ(none.quality, 0.0);

  const auto unpriced_doc = na::assess_quality({region_item("Pad Thai", 12.95, 700)}, 0, config);
  EXPECT_DOUBLE_EQ(unpriced_doc.coverage, 1.0);
}

TEST(Bootstrap, LearnAndRescore) {
  const std::vector<nc::MenuItem> learned_from = {line_item("Tom Yum Soup", 9.0),
                                                  line_item("Mango Sticky Rice", 8.5)};
  const auto patterns = na::learn_patterns(learned_from);
  ASSERT_TRUE(patterns.price_min && patterns.price_max);
  EXPECT_DOUBLE_EQ(*patterns.price_min, 8.5);
  EXPECT_DOUBLE_EQ(*patterns.price_max, 9.0);
  EXPECT_EQ(*patterns.name_length_min, 12u);
  EXPECT_EQ(*patterns.name_length_max, 17u);
  EXPECT_TRUE(patterns.classifier_patterns().has_price_range());

  auto fits = region_item("Massaman Curry", 8.75, 700, 0.5f);
  auto misfit = region_item("Lobster", 60.0, 650, 0.5f);
  misfit.category = "Mains";
  const auto out = na::rescore({fits, misfit}, patterns);
  EXPECT_NEAR(out[0].confidence, 0.65f, 1e-6);
  EXPECT_NEAR(out[1].confidence, 0.35f, 1e-6);
}

TEST(Bootstrap, SufficientYieldSkipsFallback) {
  nc::PipelineConfig config;
  int fallback_calls = 0;
  na::BootstrapController::Hooks hooks;
  hooks.assemble = [] { return five_items(); };
  hooks.fallback = [&] {
    ++fallback_calls;
    return std::vector<nc::MenuItem>{};
  };
  na::BootstrapController controller(config, hooks);
  nc::ParseLog log;
  nc::BootstrapReport report;
  auto items = controller.run(5, {}, log, report);
  ASSERT_TRUE(items.has_value());
  EXPECT_EQ(items->size(), 5u);
  EXPECT_EQ(fallback_calls, 0);
  EXPECT_FALSE(report.triggered);
  EXPECT_EQ(report.state_trace,
            (std::vector<std::string>{"Assemble", "AssessBootstrap", "Validate", "Dedup", "Done"}));
}

TEST(Bootstrap, FallbackMergedAndRefinedOnce) {
  nc::PipelineConfig config;
  int fallback_calls = 0;
  int refine_calls = 0;
  std::optional<na::ClassifierPatterns> seen_patterns;
  const std::vector<nc::MenuItem> primary = {region_item("Pad Thai", 12.95, 700),
                                             region_item("Green Curry", 14.5, 650)};
  na::BootstrapController::Hooks hooks;
  hooks.assemble = [&] { return primary; };
  hooks.fallback = [&] {
    ++fallback_calls;
    return std::vector<nc::MenuItem>{line_item("Tom Yum Soup", 9.0), line_item("Pad Thai", 12.95),
                                     line_item("Mango Sticky Rice", 8.5)};
  };
  hooks.refine = [&](const na::ClassifierPatterns& p) {
    ++refine_calls;
    seen_patterns = p;
    return primary;
  };
  na::BootstrapController controller(config, hooks);
  nc::ParseLog log;
  nc::BootstrapReport report;
  auto items = controller.run(4, {}, log, report);
  ASSERT_TRUE(items.has_value());

  EXPECT_EQ(fallback_calls, 1);
  EXPECT_EQ(refine_calls, 1);
  ASSERT_TRUE(seen_patterns.has_value());
  EXPECT_DOUBLE_EQ(*seen_patterns->learned_price_min, 8.5);
  EXPECT_TRUE(report.triggered);
  EXPECT_TRUE(report.converged);
  EXPECT_LE(report.iterations, config.max_bootstrap_iterations);
  EXPECT_GT(report.final_quality, report.initial_quality);
  EXPECT_TRUE(traced(report, "Reprocess"));
  EXPECT_EQ(report.state_trace.back(), "Done");

  ASSERT_EQ(items->size(), 4u);
  EXPECT_EQ((*items)[0].name, "Pad Thai");
  EXPECT_EQ((*items)[0].provenance.phase, nc::ProcessingPhase::RegionAssembly);
  EXPECT_EQ((*items)[1].name, "Green Curry");
  EXPECT_EQ((*items)[2].name, "Tom Yum Soup");
  EXPECT_EQ((*items)[3].name, "Mango Sticky Rice");
}

TEST(Bootstrap, WorseRefinementIsReverted) {
  nc::PipelineConfig config;
  const std::vector<nc::MenuItem> primary = {region_item("Pad Thai", 12.95, 700),
                                             region_item("Green Curry", 14.5, 650),
                                             region_item("Tom Yum Soup", 9.0, 600)};
  na::BootstrapController::Hooks hooks;
  hooks.assemble = [&] { return primary; };
  hooks.fallback = [] { return std::vector<nc::MenuItem>{line_item("Iced Tea", 3.0)}; };
  hooks.refine = [](const na::ClassifierPatterns&) { return std::vector<nc::MenuItem>{}; };
  na::BootstrapController controller(config, hooks);
  nc::ParseLog log;
  nc::BootstrapReport report;
  auto items = controller.run(3, {}, log, report);
  ASSERT_TRUE(items.has_value());
  EXPECT_TRUE(report.reverted);
  ASSERT_EQ(items->size(), 3u);
  EXPECT_EQ((*items)[0].name, "Pad Thai");
}

TEST(Bootstrap, CoverageUsesPriceCountAfterRefinement) {
  nc::PipelineConfig config;
  const std::vector<nc::MenuItem> primary = {region_item("Pad Thai", 12.95, 700),
                                             region_item("Green Curry", 14.5, 650),
                                             region_item("Tom Yum Soup", 9.0, 600)};
  int refines = 0;
  int recounts = 0;
  na::BootstrapController::Hooks hooks;
  hooks.assemble = [&] { return primary; };
  hooks.fallback = [] { return std::vector<nc::MenuItem>{line_item("Spring Rolls", 6.0)}; };
  hooks.refine = [&](const na::ClassifierPatterns&) {
    ++refines;
    return primary;
  };
  hooks.count_prices = [&] {
    ++recounts;
    return std::size_t{4};
  };
  na::BootstrapController controller(config, hooks);
  nc::ParseLog log;
  nc::BootstrapReport report;
  auto items = controller.run(12, {}, log, report);
  ASSERT_TRUE(items.has_value());
  EXPECT_EQ(refines, 1);
  EXPECT_EQ(recounts, 1);
  EXPECT_DOUBLE_EQ(report.final_quality, na::assess_quality(*items, 4, config).quality);
}

TEST(Bootstrap, IterationCapTerminates) {
  nc::PipelineConfig config;
  config.max_bootstrap_iterations = 1;
  config.convergence_threshold = 0.0;
  na::BootstrapController::Hooks hooks;
  hooks.assemble = [] { return std::vector<nc::MenuItem>{region_item("Pad Thai", 12.95, 700)}; };
  hooks.fallback = [] { return std::vector<nc::MenuItem>{}; };
  na::BootstrapController controller(config, hooks);
  nc::ParseLog log;
  nc::BootstrapReport report;
  auto items = controller.run(1, {}, log, report);
  ASSERT_TRUE(items.has_value());
  EXPECT_TRUE(report.cap_reached);
  EXPECT_FALSE(report.converged);
  EXPECT_EQ(report.iterations, 1u);
  EXPECT_EQ(items->size(), 1u);
}

TEST(Bootstrap, CancellationStopsLoop) {
  nc::PipelineConfig config;
  na::BootstrapController::Hooks hooks;
  hooks.assemble = [] { return std::vector<nc::MenuItem>{}; };
  na::BootstrapController controller(config, hooks);
  std::stop_source source;
  source.request_stop();
  nc::ParseLog log;
  nc::BootstrapReport report;
  auto items = controller.run(0, source.get_token(), log, report);
  ASSERT_FALSE(items.has_value());
  EXPECT_EQ(items.error(), nc::PipelineError::Cancelled);
}

TEST(Bootstrap, StateNames) {
  EXPECT_EQ(na::to_string(na::BootstrapState::AssessBootstrap), "AssessBootstrap");
  EXPECT_EQ(na::to_string(na::BootstrapState::Done), "Done");
}
