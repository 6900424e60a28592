#include <menuscan/app/token_loader.hpp>
#include <gtest/gtest.h>
#include <expected>
#include <sstream>
#include <string>

namespace {

namespace ma = menuscan::app;
namespace nc = menuscan::core;

std::expected<nc::Document, nc::PipelineError> parse(const std::string& text) {
  std::istringstream in(text);
  return ma::parse_token_stream(in, "dump.tsv");
}

}  // namespace

TEST(TokenLoaderTest, ParsesPagesAndRows) {
  auto doc = parse("# exported menu\n"
                   "#page 0 612 792\n"
                   "50\t700\t84\t12\t12\tHelvetica-Bold\t700\tGrilled Salmon\n"
                   "270\t700\t36\t12\t12\t-\t-\t$18.95\n"
                   "\n"
                   "#page 1 612 792\n"
                   "50\t700\t72\t12\t12\tTimes\t400\tCaesar Salad\n");
  ASSERT_TRUE(doc.has_value());
  EXPECT_EQ(doc->source_name, "dump.tsv");
  ASSERT_EQ(doc->pages.size(), 2u);
  EXPECT_EQ(doc->token_count(), 3u);

  const auto& p0 = doc->pages[0];
  EXPECT_EQ(p0.index, 0u);
  EXPECT_DOUBLE_EQ(p0.width, 612.0);
  EXPECT_DOUBLE_EQ(p0.height, 792.0);
  ASSERT_EQ(p0.tokens.size(), 2u);
  EXPECT_EQ(p0.tokens[0].text, "Grilled Salmon");
  EXPECT_DOUBLE_EQ(p0.tokens[0].x, 50.0);
  EXPECT_DOUBLE_EQ(p0.tokens[0].width, 84.0);
  EXPECT_EQ(p0.tokens[0].font_family, "Helvetica-Bold");
  EXPECT_EQ(p0.tokens[0].font_weight, 700);
  EXPECT_EQ(p0.tokens[1].text, "$18.95");
  EXPECT_FALSE(p0.tokens[1].font_family.has_value());
  EXPECT_FALSE(p0.tokens[1].font_weight.has_value());

  EXPECT_EQ(doc->pages[1].index, 1u);
  EXPECT_EQ(doc->pages[1].tokens[0].text, "Caesar Salad");
}

TEST(TokenLoaderTest, TextKeepsEmbeddedTabsAndCarriageReturnsAreStripped) {
  auto doc = parse("#page 0 100 100\r\n"
                   "1\t2\t3\t4\t5\t-\t-\tfish\tchips\r\n");
  ASSERT_TRUE(doc.has_value());
  ASSERT_EQ(doc->pages.size(), 1u);
  ASSERT_EQ(doc->pages[0].tokens.size(), 1u);
  EXPECT_EQ(doc->pages[0].tokens[0].text, "fish\tchips");
}

TEST(TokenLoaderTest, RowsBeforeFirstPageGoToPageZero) {
  auto doc = parse("10\t20\t30\t12\t12\t-\t-\tSoup\n");
  ASSERT_TRUE(doc.has_value());
  ASSERT_EQ(doc->pages.size(), 1u);
  EXPECT_EQ(doc->pages[0].index, 0u);
  EXPECT_EQ(doc->pages[0].tokens.size(), 1u);
}

TEST(TokenLoaderTest, EmptyStreamGivesEmptyDocument) {
  auto doc = parse("");
  ASSERT_TRUE(doc.has_value());
  EXPECT_TRUE(doc->pages.empty());
}

TEST(TokenLoaderTest, MalformedRowIsRejected) {
  auto short_row = parse("#page 0 612 792\n10\t20\tSoup\n");
  ASSERT_FALSE(short_row.has_value());
  EXPECT_EQ(short_row.error(), nc::PipelineError::MalformedInput);

  auto bad_number = parse("#page 0 612 792\nten\t20\t30\t12\t12\t-\t-\tSoup\n");
  ASSERT_FALSE(bad_number.has_value());
  EXPECT_EQ(bad_number.error(), nc::PipelineError::MalformedInput);

  auto bad_weight = parse("#page 0 612 792\n10\t20\t30\t12\t12\t-\theavy\tSoup\n");
  ASSERT_FALSE(bad_weight.has_value());
  EXPECT_EQ(bad_weight.error(), nc::PipelineError::MalformedInput);
}

TEST(TokenLoaderTest, MalformedPageDirectiveIsRejected) {
  auto doc = parse("#page 0 wide\n");
  ASSERT_FALSE(doc.has_value());
  EXPECT_EQ(doc.error(), nc::PipelineError::MalformedInput);
}

TEST(TokenLoaderTest, MissingFileIsLoadFailed) {
  auto doc = ma::load_token_file("/nonexistent/menuscan/tokens.tsv");
  ASSERT_FALSE(doc.has_value());
  EXPECT_EQ(doc.error(), nc::PipelineError::LoadFailed);
}
