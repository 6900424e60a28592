#include <menuscan/analysis/fallback_parser.hpp>
#include <support/menu_fixtures.hpp>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace na = menuscan::analysis;
namespace nc = menuscan::core;
using menuscan::test::tok;

TEST(FallbackParser, RuleTableOrder) {
  const auto rules = na::make_line_rules();
  ASSERT_EQ(rules.size(), 5u);
  EXPECT_EQ(rules.front().name, "name - description price");
  EXPECT_EQ(rules.back().name, "price on following line");
}

TEST(FallbackParser, DashDescriptionPrice) {
  nc::PipelineConfig config;
  na::FallbackParser parser(config);
  const auto items = parser.parse_lines({"Pad Thai - rice noodles with peanuts $12.95"}, 0);
  ASSERT_EQ(items.size(), 1u);
  EXPECT_EQ(items[0].name, "Pad Thai");
  EXPECT_EQ(items[0].description.value_or(""), "rice noodles with peanuts");
  EXPECT_DOUBLE_EQ(*items[0].price, 12.95);
  EXPECT_FLOAT_EQ(items[0].confidence, 0.65f);
  EXPECT_EQ(items[0].id, "line-p0-0");
  EXPECT_EQ(items[0].provenance.phase, nc::ProcessingPhase::LineFallback);
  EXPECT_FALSE(items[0].provenance.region_box.has_value());
}

TEST(FallbackParser, PriceAtEndOfLine) {
  nc::PipelineConfig config;
  na::FallbackParser parser(config);
  const auto items = parser.parse_lines({"Green Curry 14.50"}, 2);
  ASSERT_EQ(items.size(), 1u);
  EXPECT_EQ(items[0].name, "Green Curry");
  EXPECT_DOUBLE_EQ(*items[0].price, 14.5);
  EXPECT_FLOAT_EQ(items[0].confidence, 0.6f);
  EXPECT_EQ(items[0].id, "line-p2-0");
}

TEST(FallbackParser, PriceInMiddle) {
  nc::PipelineConfig config;
  na::FallbackParser parser(config);
  const auto items = parser.parse_lines({"Spring Rolls $6.00 crispy vegetable rolls"}, 0);
  ASSERT_EQ(items.size(), 1u);
  EXPECT_EQ(items[0].name, "Spring Rolls");
  EXPECT_EQ(items[0].description.value_or(""), "crispy vegetable rolls");
  EXPECT_FLOAT_EQ(items[0].confidence, 0.55f);
}

TEST(FallbackParser, PriceFirst) {
  nc::PipelineConfig config;
  na::FallbackParser parser(config);
  const auto items = parser.parse_lines({"$8.50 Mango Sticky Rice"}, 0);
  ASSERT_EQ(items.size(), 1u);
  EXPECT_EQ(items[0].name, "Mango Sticky Rice");
  EXPECT_DOUBLE_EQ(*items[0].price, 8.5);
  EXPECT_FLOAT_EQ(items[0].confidence, 0.5f);
}

TEST(FallbackParser, PriceOnFollowingLineConsumesBoth) {
  nc::PipelineConfig config;
  na::FallbackParser parser(config);
  const auto items = parser.parse_lines({"Tom Yum Soup", "$9.00", "Green Curry 14.50"}, 0);
  ASSERT_EQ(items.size(), 2u);
  EXPECT_EQ(items[0].name, "Tom Yum Soup");
  EXPECT_EQ(items[0].category, "Soups");
  EXPECT_EQ(items[1].name, "Green Curry");
  EXPECT_EQ(items[1].id, "line-p0-2");
}

TEST(FallbackParser, RejectsHeadersAndOutOfRangePrices) {
  nc::PipelineConfig config;
  na::FallbackParser parser(config);
  EXPECT_TRUE(parser.parse_lines({"APPETIZERS", "Wagyu Platter 450"}, 0).empty());
}

TEST(FallbackParser, ParsesDocumentPages) {
  nc::PipelineConfig config;
  na::FallbackParser parser(config);
  nc::Document doc;
  doc.pages.push_back(nc::make_page(0, 612, 792, {tok("Green", 50, 700), tok("Curry", 90, 700),
                                                  tok("14.50", 140, 700)}));
  doc.pages.push_back(nc::make_page(1, 612, 792, {tok("Tom Yum Soup", 50, 700), tok("$9.00", 50, 680)}));
  const auto items = parser.parse(doc);
  ASSERT_EQ(items.size(), 2u);
  EXPECT_EQ(items[0].name, "Green Curry");
  EXPECT_EQ(items[1].name, "Tom Yum Soup");
  EXPECT_EQ(items[1].provenance.page_index, 1u);
}
