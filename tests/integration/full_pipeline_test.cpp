#include <menuscan/analysis/token_classifier.hpp>
#include <menuscan/app/config.hpp>
#include <menuscan/app/pipeline_factory.hpp>
#include <menuscan/app/pipeline_runner.hpp>
#include <menuscan/vision/mock_page_renderer.hpp>
#include <support/menu_fixtures.hpp>
#include <gtest/gtest.h>
#include <cstddef>
#include <mutex>
#include <stop_token>
#include <utility>
#include <vector>

namespace {

using namespace menuscan::core;
using namespace menuscan::app;
using menuscan::test::single_page;

}  // namespace

TEST(FullPipeline, TripleMenuYieldsStructuredItems) {
  const Pipeline pipeline = build_pipeline(default_config());
  const Document doc = single_page(menuscan::test::triple_menu_tokens());

  auto result = run_pipeline(pipeline, doc);
  ASSERT_TRUE(result.has_value()) << "Pipeline run failed";
  ASSERT_EQ(result->items.size(), 3u);

  EXPECT_EQ(result->items[0].name, "Grilled Salmon");
  EXPECT_EQ(result->items[0].description, "with lemon butter");
  ASSERT_TRUE(result->items[0].price.has_value());
  EXPECT_DOUBLE_EQ(*result->items[0].price, 18.95);
  EXPECT_EQ(result->items[0].category, "Mains");

  EXPECT_EQ(result->items[1].name, "Caesar Salad");
  EXPECT_DOUBLE_EQ(result->items[1].price.value_or(0.0), 9.50);
  EXPECT_EQ(result->items[1].category, "Salads");

  EXPECT_EQ(result->items[2].name, "Chocolate Cake");
  EXPECT_DOUBLE_EQ(result->items[2].price.value_or(0.0), 7.25);
  EXPECT_EQ(result->items[2].category, "Desserts");

  EXPECT_EQ(result->validated_regions, 3u);
  EXPECT_TRUE(result->bootstrap.triggered);
  EXPECT_FALSE(result->log.empty());
  for (const auto& item : result->items) {
    EXPECT_FALSE(item.id.empty());
    EXPECT_GE(item.confidence, 0.f);
    EXPECT_LE(item.confidence, 1.f);
  }
}

TEST(FullPipeline, ResultCarriesTypographyFingerprints) {
  const Pipeline pipeline = build_pipeline(default_config());
  const Document doc = single_page(menuscan::test::triple_menu_tokens());

  auto result = run_pipeline(pipeline, doc);
  ASSERT_TRUE(result.has_value());
  ASSERT_EQ(result->fingerprints.size(), 2u);

  const auto bold = result->fingerprints.find(FingerprintKey{"Helvetica", 12.0, 700});
  ASSERT_NE(bold, result->fingerprints.end());
  EXPECT_EQ(bold->second.sample_count, 3u);
  EXPECT_NEAR(bold->second.confidence, 0.3f, 1e-6);

  const auto regular = result->fingerprints.find(FingerprintKey{"Helvetica", 12.0, 400});
  ASSERT_NE(regular, result->fingerprints.end());
  EXPECT_EQ(regular->second.sample_count, 6u);
  EXPECT_TRUE(regular->second.patterns.contains(ContentPattern::CurrencyShape));
  EXPECT_NEAR(regular->second.confidence, 0.6f, 1e-6);
}

TEST(FullPipeline, ConfidencesStayInUnitInterval) {
  std::vector<Document> docs;
  docs.push_back(single_page(menuscan::test::triple_menu_tokens()));
  docs.push_back(single_page(menuscan::test::pair_menu_tokens()));
  auto mixed = menuscan::test::triple_menu_tokens();
  for (const auto& t : menuscan::test::pair_menu_tokens()) {
    auto moved = t;
    moved.y -= 300.0;
    mixed.push_back(moved);
  }
  mixed.push_back(menuscan::test::tok("450 cal", 400, 200));
  mixed.push_back(menuscan::test::tok("Serves 4", 400, 150));
  docs.push_back(single_page(std::move(mixed)));

  auto config = default_config();
  config.assembly_mode = AssemblyMode::Auto;
  const Pipeline pipeline = build_pipeline(config);
  for (const auto& doc : docs) {
    const auto classified = menuscan::analysis::TokenClassifier(config).classify_document(doc);
    for (const auto& c : classified.index.all()) {
      EXPECT_GE(c.confidence, 0.f);
      EXPECT_LE(c.confidence, 1.f);
    }

    auto result = run_pipeline(pipeline, doc);
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->items.empty());
    for (const auto& item : result->items) {
      EXPECT_GE(item.confidence, 0.f) << item.name;
      EXPECT_LE(item.confidence, 1.f) << item.name;
    }
    for (const auto& [key, fp] : result->fingerprints) {
      EXPECT_GE(fp.confidence, 0.f);
      EXPECT_LE(fp.confidence, 1.f);
    }
    EXPECT_GE(result->bootstrap.final_quality, 0.0);
    EXPECT_LE(result->bootstrap.final_quality, 1.0);
  }
}

TEST(FullPipeline, PairMenuWithAutoAssembly) {
  auto config = default_config();
  config.assembly_mode = AssemblyMode::Auto;
  const Pipeline pipeline = build_pipeline(config);
  const Document doc = single_page(menuscan::test::pair_menu_tokens());

  auto result = run_pipeline(pipeline, doc);
  ASSERT_TRUE(result.has_value());
  ASSERT_EQ(result->items.size(), 3u);
  EXPECT_EQ(result->items[0].name, "Espresso");
  EXPECT_DOUBLE_EQ(result->items[0].price.value_or(0.0), 3.50);
  EXPECT_EQ(result->items[0].provenance.phase, ProcessingPhase::PairAssembly);
  EXPECT_FALSE(result->items[0].description.has_value());
  EXPECT_EQ(result->items[2].name, "Green Tea");
  EXPECT_EQ(result->items[2].category, "Beverages");
  EXPECT_EQ(result->items[1].category, "Other");
}

TEST(FullPipeline, ProgressReportedAtPhaseBoundaries) {
  const Pipeline pipeline = build_pipeline(default_config());
  const Document doc = single_page(menuscan::test::triple_menu_tokens());

  std::vector<int> percents;
  RunOptions options;
  options.progress = [&](const ProgressSnapshot& p) { percents.push_back(p.percent); };

  auto result = run_pipeline(pipeline, doc, options);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(percents, (std::vector<int>{0, 25, 50, 75, 100}));
}

TEST(FullPipeline, EmptyDocumentIsRejected) {
  const Pipeline pipeline = build_pipeline(default_config());
  Document doc;
  doc.source_name = "blank";
  auto result = run_pipeline(pipeline, doc);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), PipelineError::EmptyDocument);
}

TEST(FullPipeline, StopRequestCancelsRun) {
  const Pipeline pipeline = build_pipeline(default_config());
  const Document doc = single_page(menuscan::test::triple_menu_tokens());

  std::stop_source stop;
  stop.request_stop();
  RunOptions options;
  options.stop_token = stop.get_token();

  auto result = run_pipeline(pipeline, doc, options);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), PipelineError::Cancelled);
}

TEST(FullPipeline, BoxModeWithoutRuledBoxesFallsBackToProximity) {
  auto config = default_config();
  config.detection_mode = DetectionMode::BorderedBox;
  const Pipeline pipeline = build_pipeline(config);
  const Document doc = single_page(menuscan::test::triple_menu_tokens());

  menuscan::vision::MockPageRenderer renderer(1224, 1584);
  RunOptions options;
  options.renderer = &renderer;

  auto result = run_pipeline(pipeline, doc, options);
  ASSERT_TRUE(result.has_value());
  EXPECT_GE(renderer.calls(), 1u);
  ASSERT_EQ(result->items.size(), 3u);
  EXPECT_EQ(result->items[0].name, "Grilled Salmon");
}

TEST(FullPipeline, BatchParallel) {
  const Pipeline pipeline = build_pipeline(default_config());
  std::vector<Document> docs;
  for (int i = 0; i < 8; ++i) {
    docs.push_back(single_page(menuscan::test::triple_menu_tokens()));
  }

  std::vector<std::size_t> item_counts;
  std::mutex results_mutex;
  run_pipeline_batch_parallel(
      pipeline, docs,
      [&](std::size_t, const ParseOutcome& r) {
        std::lock_guard lock(results_mutex);
        item_counts.push_back(r ? r->items.size() : 0u);
      },
      2);

  ASSERT_EQ(item_counts.size(), 8u);
  for (auto n : item_counts) EXPECT_EQ(n, 3u);
}
