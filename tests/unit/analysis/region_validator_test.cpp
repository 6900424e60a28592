#include <menuscan/analysis/region_validator.hpp>
#include <menuscan/analysis/token_classifier.hpp>
#include <menuscan/core/page_cache.hpp>
#include <menuscan/core/parse_log.hpp>
#include <menuscan/vision/mock_page_renderer.hpp>
#include <support/menu_fixtures.hpp>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace na = menuscan::analysis;
namespace nc = menuscan::core;
namespace nv = menuscan::vision;
using menuscan::test::tok;

namespace {

/// Classifies a page of tokens and wraps all of them into one region.
struct Fixture {
  nc::PipelineConfig config;
  nc::Document doc;
  nc::ClassificationIndex index;

  explicit Fixture(std::vector<nc::Token> tokens, double page_height = 792.0) {
    doc = menuscan::test::single_page(std::move(tokens), 612.0, page_height);
    index = na::TokenClassifier(config).classify_document(doc).index;
  }

  [[nodiscard]] nc::Region region() const {
    return nc::make_region(doc.pages[0].tokens, 0, nc::page_height(doc.pages[0]),
                           nc::RegionSource::Proximity, 0.9f);
  }
};

}  // namespace

TEST(RegionValidator, AcceptsCompleteRecord) {
  Fixture f({tok("Grilled Salmon", 50, 700), tok("with lemon butter", 140, 700), tok("$18.95", 250, 700)});
  na::RegionValidator validator(f.config, f.index);
  const auto v = validator.validate(f.region());
  EXPECT_TRUE(v.accepted);
  EXPECT_EQ(v.reason, na::RejectReason::None);
  EXPECT_DOUBLE_EQ(v.extraction_quality, 1.0);
}

TEST(RegionValidator, TooNarrow) {
  Fixture f({tok("Ab", 0, 100, 12, 400, 5), tok("$1.00", 6, 100, 12, 400, 10)});
  na::RegionValidator validator(f.config, f.index);
  EXPECT_EQ(validator.validate(f.region()).reason, na::RejectReason::TooNarrow);
}

TEST(RegionValidator, TooShort) {
  auto a = tok("Garden Salad", 0, 100);
  auto b = tok("$8.00", 100, 100);
  a.height = 5.0;
  b.height = 5.0;
  Fixture f({a, b});
  na::RegionValidator validator(f.config, f.index);
  EXPECT_EQ(validator.check_dimensions(f.region()).reason, na::RejectReason::TooShort);
}

TEST(RegionValidator, TooFewTokens) {
  Fixture f({tok("Grilled Salmon $18.95", 0, 100)});
  na::RegionValidator validator(f.config, f.index);
  EXPECT_EQ(validator.validate(f.region()).reason, na::RejectReason::TooFewTokens);
}

TEST(RegionValidator, TooLittleText) {
  Fixture f({tok("A", 0, 100, 12, 400, 40), tok("$1", 60, 100, 12, 400, 20)});
  na::RegionValidator validator(f.config, f.index);
  EXPECT_EQ(validator.check_content(f.region()).reason, na::RejectReason::TooLittleText);
}

TEST(RegionValidator, TooSparse) {
  Fixture f({tok("Soup", 0, 100), tok("Bread", 500, 700)});
  f.config.min_text_density = 0.01;
  na::RegionValidator validator(f.config, f.index);
  EXPECT_EQ(validator.check_content(f.region()).reason, na::RejectReason::TooSparse);
}

TEST(RegionValidator, MissingPriceIsRecoverable) {
  Fixture f({tok("Garden Salad", 50, 700), tok("fresh greens and herbs", 140, 700)});
  na::RegionValidator validator(f.config, f.index);
  const auto v = validator.validate(f.region());
  EXPECT_FALSE(v.accepted);
  EXPECT_EQ(v.reason, na::RejectReason::MissingPrice);
  EXPECT_NEAR(v.extraction_quality, 0.6, 1e-9);
}

TEST(RegionValidator, SixTokensWithoutCurrencyFailHeuristics) {
  Fixture f({tok("Daily Specials", 50, 700), tok("ask", 150, 700), tok("your", 180, 700),
             tok("server", 215, 700), tok("for", 260, 700), tok("details", 290, 700)});
  na::RegionValidator validator(f.config, f.index);
  const auto region = f.region();
  ASSERT_EQ(region.tokens.size(), 6u);
  EXPECT_TRUE(validator.check_dimensions(region).accepted);
  EXPECT_TRUE(validator.check_content(region).accepted);
  const auto heuristics = validator.check_heuristics(region);
  EXPECT_FALSE(heuristics.accepted);
  EXPECT_LT(heuristics.extraction_quality, f.config.extraction_quality_threshold);
  EXPECT_FALSE(validator.validate(region).accepted);
}

TEST(RegionValidator, MissingPriceWithBadDescriptionIsLowQuality) {
  Fixture f({tok("Garden Salad", 50, 700), tok("mix", 140, 700)});
  na::RegionValidator validator(f.config, f.index);
  EXPECT_EQ(validator.validate(f.region()).reason, na::RejectReason::LowExtractionQuality);
}

TEST(RegionValidator, QualityExactlyAtThresholdPasses) {
  // Name ok, description shorter than the name, price present: 0.3 + 0.4 = 0.7.
  Fixture f({tok("Garden Salad", 50, 700), tok("mix", 140, 700), tok("$8.00", 200, 700)});
  na::RegionValidator validator(f.config, f.index);
  const auto v = validator.check_heuristics(f.region());
  EXPECT_TRUE(v.accepted);
  EXPECT_NEAR(v.extraction_quality, 0.7, 1e-9);
}

TEST(RegionValidator, LowQualityWithPrice) {
  const std::string long_name(60, 'x');
  Fixture f({tok(long_name, 50, 700), tok("short", 450, 700), tok("$8.00", 500, 700)});
  na::RegionValidator validator(f.config, f.index);
  const auto v = validator.check_heuristics(f.region());
  EXPECT_FALSE(v.accepted);
  EXPECT_EQ(v.reason, na::RejectReason::LowExtractionQuality);
}

TEST(RegionValidator, ValidateAllCapturesThumbnails) {
  Fixture f({tok("Grilled Salmon", 50, 700), tok("with lemon butter", 140, 700), tok("$18.95", 250, 700),
             tok("Garden Salad", 50, 600), tok("fresh greens and herbs", 140, 600)});
  nc::Region priced = nc::make_region({f.doc.pages[0].tokens[0], f.doc.pages[0].tokens[1],
                                       f.doc.pages[0].tokens[2]},
                                      0, 792.0, nc::RegionSource::Proximity, 0.9f);
  nc::Region priceless = nc::make_region({f.doc.pages[0].tokens[3], f.doc.pages[0].tokens[4]}, 0,
                                         792.0, nc::RegionSource::Proximity, 0.9f);
  nv::MockPageRenderer renderer(1224, 1584);
  nc::PageCache cache(renderer);
  nc::ParseLog log;
  na::RegionValidator validator(f.config, f.index);

  auto outcome = validator.validate_all({priced, priceless}, &cache, log);
  ASSERT_EQ(outcome.accepted.size(), 1u);
  EXPECT_TRUE(outcome.accepted[0].thumbnail.has_value());
  EXPECT_FLOAT_EQ(outcome.accepted[0].confidence, 0.9f);
  ASSERT_EQ(outcome.price_rejected.size(), 1u);
  EXPECT_EQ(outcome.rejected, 1u);
  EXPECT_EQ(renderer.calls(), 1u);
}

TEST(RegionValidator, ThumbnailFailureKeepsRegionWithPenalty) {
  Fixture f({tok("Grilled Salmon", 50, 700), tok("with lemon butter", 140, 700), tok("$18.95", 250, 700)});
  nv::MockPageRenderer renderer;
  renderer.fail_all();
  nc::PageCache cache(renderer);
  nc::ParseLog log;
  na::RegionValidator validator(f.config, f.index);

  auto outcome = validator.validate_all({f.region()}, &cache, log);
  ASSERT_EQ(outcome.accepted.size(), 1u);
  EXPECT_FALSE(outcome.accepted[0].thumbnail.has_value());
  EXPECT_NEAR(outcome.accepted[0].confidence, 0.81f, 1e-6);
  bool warned = false;
  for (const auto& e : log.entries()) {
    if (e.severity == nc::Severity::Warning) warned = true;
  }
  EXPECT_TRUE(warned);
}

TEST(RegionValidator, NoThumbnailsWithoutCache) {
  Fixture f({tok("Grilled Salmon", 50, 700), tok("with lemon butter", 140, 700), tok("$18.95", 250, 700)});
  nc::ParseLog log;
  na::RegionValidator validator(f.config, f.index);
  auto outcome = validator.validate_all({f.region()}, nullptr, log);
  ASSERT_EQ(outcome.accepted.size(), 1u);
  EXPECT_FALSE(outcome.accepted[0].thumbnail.has_value());
}

TEST(CrossPageMerge, JoinsNameAndPriceAcrossPageBreak) {
  nc::Document doc;
  doc.source_name = "two-pages";
  doc.pages.push_back(nc::make_page(0, 612, 792, {tok("Seafood Platter", 50, 40), tok("for two", 150, 40)}));
  doc.pages.push_back(nc::make_page(1, 612, 792, {tok("shrimp and crab", 52, 760), tok("$38.00", 160, 760)}));
  nc::PipelineConfig config;
  const auto index = na::TokenClassifier(config).classify_document(doc).index;

  std::vector<nc::Region> regions = {
      nc::make_region(doc.pages[0].tokens, 0, 792, nc::RegionSource::Proximity, 0.8f),
      nc::make_region(doc.pages[1].tokens, 1, 792, nc::RegionSource::Proximity, 0.9f),
  };
  const auto merged = na::merge_cross_page_continuations(regions, doc, index, config);
  ASSERT_EQ(merged.size(), 1u);
  const auto& r = merged[0];
  EXPECT_EQ(r.source, nc::RegionSource::CrossPage);
  EXPECT_EQ(r.page_index, 0u);
  EXPECT_EQ(r.tokens.size(), 4u);
  EXPECT_EQ(r.tokens.front().text, "Seafood Platter");
  EXPECT_FLOAT_EQ(r.confidence, 0.9f);
  EXPECT_LT(r.bbox.y, 0.0);
}

TEST(CrossPageMerge, UnalignedRegionsPassThrough) {
  nc::Document doc;
  doc.pages.push_back(nc::make_page(0, 612, 792, {tok("Seafood Platter", 50, 40), tok("for two", 150, 40)}));
  doc.pages.push_back(nc::make_page(1, 612, 792, {tok("shrimp and crab", 300, 760), tok("$38.00", 410, 760)}));
  nc::PipelineConfig config;
  const auto index = na::TokenClassifier(config).classify_document(doc).index;

  std::vector<nc::Region> regions = {
      nc::make_region(doc.pages[0].tokens, 0, 792, nc::RegionSource::Proximity, 0.8f),
      nc::make_region(doc.pages[1].tokens, 1, 792, nc::RegionSource::Proximity, 0.9f),
  };
  const auto merged = na::merge_cross_page_continuations(regions, doc, index, config);
  EXPECT_EQ(merged.size(), 2u);
}
