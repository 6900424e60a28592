#include <menuscan/core/region.hpp>
#include <menuscan/core/token.hpp>
#include <support/menu_fixtures.hpp>
#include <gtest/gtest.h>
#include <vector>

namespace nc = menuscan::core;
using menuscan::test::tok;

TEST(BBox, BoundingBoxOfTokens) {
  std::vector<nc::Token> tokens = {tok("Soup", 10, 100, 12, 400, 30), tok("$4.00", 60, 95, 10, 400, 25)};
  const auto box = nc::bounding_box_of(tokens);
  EXPECT_DOUBLE_EQ(box.x, 10.0);
  EXPECT_DOUBLE_EQ(box.y, 95.0);
  EXPECT_DOUBLE_EQ(box.right(), 85.0);
  EXPECT_DOUBLE_EQ(box.top(), 112.0);
  EXPECT_DOUBLE_EQ(box.area(), 75.0 * 17.0);
}

TEST(BBox, EmptySpanGivesZeroBox) {
  const auto box = nc::bounding_box_of({});
  EXPECT_DOUBLE_EQ(box.width, 0.0);
  EXPECT_DOUBLE_EQ(box.height, 0.0);
}

TEST(BBox, ContainsWithTolerance) {
  nc::BBox box{0, 0, 100, 50};
  EXPECT_TRUE(box.contains(tok("a", 10, 10, 12, 400, 20)));
  const auto outside = tok("b", 95, 10, 12, 400, 10);
  EXPECT_FALSE(box.contains(outside));
  EXPECT_TRUE(box.contains(outside, 5.0));
}

TEST(Region, MakeRegionKeepsMinimalBoxAndClampsConfidence) {
  std::vector<nc::Token> tokens = {tok("Pasta", 20, 300), tok("$12.00", 80, 300)};
  const auto r = nc::make_region(tokens, 2, 792.0, nc::RegionSource::Proximity, 1.4f);
  EXPECT_EQ(r.page_index, 2u);
  EXPECT_FLOAT_EQ(r.confidence, 1.0f);
  EXPECT_DOUBLE_EQ(r.bbox.x, 20.0);
  EXPECT_DOUBLE_EQ(r.bbox.right(), 116.0);
  EXPECT_EQ(r.text(), "Pasta $12.00");
  EXPECT_DOUBLE_EQ(r.average_font_size(), 12.0);
}

TEST(Token, EffectiveFontSizeFallsBackToHeight) {
  nc::Token t = tok("x", 0, 0);
  t.font_size = 0.0;
  t.height = 9.0;
  EXPECT_DOUBLE_EQ(t.effective_font_size(), 9.0);
}

TEST(Token, UsableRequiresTextAndBox) {
  EXPECT_TRUE(nc::is_usable(tok("Soup", 0, 0)));
  EXPECT_FALSE(nc::is_usable(tok("   ", 0, 0, 12, 400, 10)));
  nc::Token flat = tok("Soup", 0, 0);
  flat.height = 0.0;
  EXPECT_FALSE(nc::is_usable(flat));
}

TEST(Page, MakePageStampsOrdinalsAndDerivesExtent) {
  auto page = nc::make_page(3, 0.0, 0.0, {tok("a", 0, 10), tok("bb", 100, 40)});
  EXPECT_EQ(page.tokens[0].page_index, 3u);
  EXPECT_EQ(page.tokens[1].ordinal, 1u);
  EXPECT_DOUBLE_EQ(nc::page_width(page), 112.0);
  EXPECT_DOUBLE_EQ(nc::page_height(page), 52.0);
}
