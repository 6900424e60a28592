#include <menuscan/analysis/item_assembler.hpp>
#include <menuscan/analysis/token_classifier.hpp>
#include <menuscan/core/parse_log.hpp>
#include <support/menu_fixtures.hpp>
#include <gtest/gtest.h>
#include <vector>

namespace na = menuscan::analysis;
namespace nc = menuscan::core;
using menuscan::test::tok;

namespace {

/// One classified region holding all the given tokens.
struct Fixture {
  nc::PipelineConfig config;
  nc::Document doc;
  nc::ClassificationIndex index;

  explicit Fixture(std::vector<nc::Token> tokens) {
    doc = menuscan::test::single_page(std::move(tokens));
    index = na::TokenClassifier(config).classify_document(doc).index;
  }

  [[nodiscard]] nc::Region region(float confidence = 0.9f) const {
    return nc::make_region(doc.pages[0].tokens, 0, 792.0, nc::RegionSource::Proximity, confidence);
  }
};

}  // namespace

TEST(ItemAssembler, TripleFromThreeTokens) {
  Fixture f({tok("Grilled Salmon", 50, 700, 12, 700), tok("with lemon butter", 140, 700),
             tok("$18.95", 250, 700)});
  na::ItemAssembler assembler(f.config, f.index);
  const auto parts = assembler.extract_triple(f.region());
  ASSERT_TRUE(parts.name && parts.description && parts.price);
  EXPECT_EQ(*parts.name, "Grilled Salmon");
  EXPECT_EQ(*parts.description, "with lemon butter");
  EXPECT_DOUBLE_EQ(*parts.price, 18.95);
  EXPECT_TRUE(parts.anchored);
}

TEST(ItemAssembler, AssembledItemCarriesSemanticsAndProvenance) {
  Fixture f({tok("Grilled Salmon", 50, 700, 12, 700), tok("with lemon butter", 140, 700),
             tok("$18.95", 250, 700)});
  na::ItemAssembler assembler(f.config, f.index);
  const auto region = f.region();
  const auto item = assembler.assemble(region, nc::AssemblyMode::Triple,
                                       nc::ProcessingPhase::RegionAssembly);
  ASSERT_TRUE(item.has_value());
  EXPECT_EQ(item->id, "region-p0-50-700");
  EXPECT_EQ(item->category, "Mains");
  EXPECT_EQ(item->serving_size, 1);
  EXPECT_NEAR(item->confidence, 0.9f, 1e-6);
  EXPECT_EQ(item->provenance.phase, nc::ProcessingPhase::RegionAssembly);
  ASSERT_TRUE(item->provenance.region_box.has_value());
  EXPECT_DOUBLE_EQ(item->provenance.region_box->x, region.bbox.x);
}

TEST(ItemAssembler, SeparatorSplitsNameAndDescription) {
  Fixture f({tok("Lobster Bisque - creamy and rich", 50, 700), tok("$11.00", 260, 700)});
  na::ItemAssembler assembler(f.config, f.index);
  const auto parts = assembler.extract_triple(f.region());
  ASSERT_TRUE(parts.name && parts.description);
  EXPECT_EQ(*parts.name, "Lobster Bisque");
  EXPECT_EQ(*parts.description, "creamy and rich");
}

TEST(ItemAssembler, EmphasizedTokenBecomesName) {
  Fixture f({tok("served with fries", 50, 700), tok("Fish Tacos", 160, 700, 12, 700),
             tok("$14.00", 230, 700)});
  na::ItemAssembler assembler(f.config, f.index);
  const auto parts = assembler.extract_triple(f.region());
  ASSERT_TRUE(parts.name && parts.description);
  EXPECT_EQ(*parts.name, "Fish Tacos");
  EXPECT_EQ(*parts.description, "served with fries");
}

TEST(ItemAssembler, TextBesidePriceInSameTokenIsKept) {
  Fixture f({tok("Market Salad $9.00", 50, 700), tok("seasonal greens", 170, 700)});
  na::ItemAssembler assembler(f.config, f.index);
  const auto parts = assembler.extract_triple(f.region());
  ASSERT_TRUE(parts.name && parts.price);
  EXPECT_EQ(*parts.name, "Market Salad");
  EXPECT_EQ(parts.description.value_or(""), "seasonal greens");
  EXPECT_DOUBLE_EQ(*parts.price, 9.0);
}

TEST(ItemAssembler, PositionalPriceWithoutAnchor) {
  Fixture f({tok("House Wine", 50, 700), tok("12", 130, 700)});
  na::ItemAssembler assembler(f.config, f.index);
  const auto parts = assembler.extract_triple(f.region());
  EXPECT_FALSE(parts.anchored);
  ASSERT_TRUE(parts.price.has_value());
  EXPECT_DOUBLE_EQ(*parts.price, 12.0);

  const auto item = assembler.assemble(f.region(), nc::AssemblyMode::Triple,
                                       nc::ProcessingPhase::RegionAssembly);
  ASSERT_TRUE(item.has_value());
  EXPECT_NEAR(item->confidence, 0.54f, 1e-6);
  EXPECT_FALSE(item->description.has_value());
}

TEST(ItemAssembler, PairPrefersBilingualToken) {
  Fixture f({tok("牛肉面 Beef Noodles", 50, 700), tok("$12.00", 200, 700)});
  na::ItemAssembler assembler(f.config, f.index);
  const auto parts = assembler.extract_pair(f.region());
  ASSERT_TRUE(parts.name && parts.price);
  EXPECT_EQ(*parts.name, "牛肉面 Beef Noodles");
  EXPECT_DOUBLE_EQ(*parts.price, 12.0);
}

TEST(ItemAssembler, PairJoinsSameLineScripts) {
  Fixture f({tok("Dumplings", 120, 700), tok("饺子", 50, 700), tok("$8.00", 200, 700)});
  na::ItemAssembler assembler(f.config, f.index);
  const auto item = assembler.assemble(f.region(), nc::AssemblyMode::Pair,
                                       nc::ProcessingPhase::RegionAssembly);
  ASSERT_TRUE(item.has_value());
  EXPECT_EQ(item->name, "饺子 Dumplings");
  EXPECT_FALSE(item->description.has_value());
  EXPECT_EQ(item->provenance.phase, nc::ProcessingPhase::PairAssembly);
}

TEST(ItemAssembler, PricelessRegionGated) {
  Fixture f({tok("Chef Special", 50, 700), tok("ask your server", 140, 700)});
  na::ItemAssembler strict(f.config, f.index);
  EXPECT_FALSE(strict.assemble(f.region(), nc::AssemblyMode::Triple,
                               nc::ProcessingPhase::RegionAssembly).has_value());

  f.config.allow_priceless_items = true;
  na::ItemAssembler lenient(f.config, f.index);
  const auto item = lenient.assemble(f.region(), nc::AssemblyMode::Triple,
                                     nc::ProcessingPhase::RegionAssembly);
  ASSERT_TRUE(item.has_value());
  EXPECT_FALSE(item->price.has_value());
}

TEST(ItemAssembler, OverlongNameRejected) {
  Fixture f({tok(std::string(60, 'x'), 50, 700), tok("$9.00", 450, 700)});
  na::ItemAssembler assembler(f.config, f.index);
  EXPECT_FALSE(assembler.assemble(f.region(), nc::AssemblyMode::Triple,
                                  nc::ProcessingPhase::RegionAssembly).has_value());
}

TEST(ItemAssembler, NumberingStrippedFromName) {
  Fixture f({tok("12. Pad Thai", 50, 700), tok("rice noodles, peanuts", 140, 700), tok("$12.95", 280, 700)});
  na::ItemAssembler assembler(f.config, f.index);
  const auto item = assembler.assemble(f.region(), nc::AssemblyMode::Triple,
                                       nc::ProcessingPhase::RegionAssembly);
  ASSERT_TRUE(item.has_value());
  EXPECT_EQ(item->name, "Pad Thai");
}

TEST(ItemAssembler, ResolveMode) {
  nc::Region two;
  two.tokens.resize(2);
  nc::Region three;
  three.tokens.resize(3);
  EXPECT_EQ(na::ItemAssembler::resolve_mode(nc::AssemblyMode::Auto, {two, two, three}),
            nc::AssemblyMode::Pair);
  EXPECT_EQ(na::ItemAssembler::resolve_mode(nc::AssemblyMode::Auto, {two, three, three}),
            nc::AssemblyMode::Triple);
  EXPECT_EQ(na::ItemAssembler::resolve_mode(nc::AssemblyMode::Auto, {}), nc::AssemblyMode::Triple);
  EXPECT_EQ(na::ItemAssembler::resolve_mode(nc::AssemblyMode::Pair, {three}), nc::AssemblyMode::Pair);
}

TEST(ItemAssembler, AssembleAllSkipsEmptyRegions) {
  Fixture f({tok("Grilled Salmon", 50, 700, 12, 700), tok("with lemon butter", 140, 700),
             tok("$18.95", 250, 700)});
  na::ItemAssembler assembler(f.config, f.index);
  nc::ParseLog log;
  auto numbers_only = nc::make_region({tok("42", 50, 600), tok("7", 80, 600)}, 0, 792.0,
                                      nc::RegionSource::Proximity, 0.7f);
  const auto items = assembler.assemble_all({f.region(), numbers_only}, log);
  ASSERT_EQ(items.size(), 1u);
  EXPECT_EQ(items[0].name, "Grilled Salmon");
}

TEST(ItemAssembler, LongDescriptionRecord) {
  Fixture f({tok("Grilled Salmon Fillet", 50, 700), tok("Fresh Atlantic salmon with lemon butter sauce", 190, 700),
             tok("$24.95", 480, 700)});
  na::ItemAssembler assembler(f.config, f.index);
  const auto item = assembler.assemble(f.region(), nc::AssemblyMode::Triple,
                                       nc::ProcessingPhase::RegionAssembly);
  ASSERT_TRUE(item.has_value());
  EXPECT_EQ(item->name, "Grilled Salmon Fillet");
  ASSERT_TRUE(item->price.has_value());
  EXPECT_DOUBLE_EQ(*item->price, 24.95);
  ASSERT_TRUE(item->description.has_value());
  EXPECT_EQ(*item->description, "Fresh Atlantic salmon with lemon butter sauce");
}

TEST(ItemAssembler, BilingualPairRecord) {
  Fixture f({tok("宫保鸡丁 Kung Pao Chicken", 50, 700), tok("$12.95", 250, 700)});
  na::ItemAssembler assembler(f.config, f.index);
  const auto item = assembler.assemble(f.region(), nc::AssemblyMode::Pair,
                                       nc::ProcessingPhase::RegionAssembly);
  ASSERT_TRUE(item.has_value());
  EXPECT_EQ(item->name, "宫保鸡丁 Kung Pao Chicken");
  EXPECT_DOUBLE_EQ(item->price.value_or(0.0), 12.95);
  EXPECT_FALSE(item->description.has_value());
  EXPECT_GE(item->confidence, 0.f);
  EXPECT_LE(item->confidence, 1.f);
}
