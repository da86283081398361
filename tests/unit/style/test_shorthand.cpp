#include <gtest/gtest.h>
#include "facet/style/shorthand.hpp"

using namespace facet;
using namespace facet::style;

namespace {

std::unique_ptr<ShorthandStrategy> make_strategy(const char* name) {
    ShorthandSelection selection;
    selection.name = name;
    auto strategy = ShorthandStrategy::create(selection);
    EXPECT_TRUE(strategy.is_ok());
    return std::move(strategy).value();
}

} // anonymous namespace

// ============================================================================
// Value splitting
// ============================================================================

TEST(ShorthandTest, SplitCssValue) {
    auto parts = split_css_value("calc(1px + 2px) 4px");
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0], "calc(1px + 2px)");
    EXPECT_EQ(parts[1], "4px");
}

TEST(ShorthandTest, SplitCssValueImportant) {
    auto parts = split_css_value("1px 2px !important");
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0], "1px !important");
    EXPECT_EQ(parts[1], "2px !important");
}

// ============================================================================
// Strategy selection
// ============================================================================

TEST(ShorthandTest, CreateByNameAndAlias) {
    EXPECT_EQ(make_strategy("keep-shorthands")->name(), "keep-shorthands");
    EXPECT_EQ(make_strategy("flatten")->name(), "expand-to-longhands");
    EXPECT_EQ(make_strategy("Expand_To_Longhands")->name(), "expand-to-longhands");
    EXPECT_EQ(make_strategy("forbid")->name(), "reject-shorthands");
}

TEST(ShorthandTest, CreateUnknown) {
    ShorthandSelection selection;
    selection.name = "shrink";
    auto strategy = ShorthandStrategy::create(selection);

    ASSERT_TRUE(strategy.is_err());
    EXPECT_EQ(strategy.error().kind, ErrorKind::Configuration);
    EXPECT_EQ(strategy.error().message, "Unknown shorthand strategy \"shrink\"");
}

// ============================================================================
// Keep shorthands
// ============================================================================

TEST(ShorthandTest, KeepLeavesShorthandsAlone) {
    auto strategy = make_strategy("keep");
    auto result = strategy->expand("margin", StyleValue("10px 20px"));

    ASSERT_TRUE(result.is_ok());
    ASSERT_EQ(result.value().size(), 1u);
    EXPECT_EQ(result.value()[0], (StyleDeclaration{"margin", StyleValue("10px 20px")}));
}

TEST(ShorthandTest, KeepRewritesLegacyAliases) {
    auto strategy = make_strategy("keep");
    auto result = strategy->expand("margin-horizontal", StyleValue(8));

    ASSERT_TRUE(result.is_ok());
    ASSERT_EQ(result.value().size(), 1u);
    EXPECT_EQ(result.value()[0].property, "margin-inline");
}

TEST(ShorthandTest, KeepSplitsOverscrollBehavior) {
    auto strategy = make_strategy("keep");
    auto result = strategy->expand("overscroll-behavior", StyleValue("auto contain"));

    ASSERT_TRUE(result.is_ok());
    ASSERT_EQ(result.value().size(), 2u);
    EXPECT_EQ(result.value()[0], (StyleDeclaration{"overscroll-behavior-x", StyleValue("auto")}));
    EXPECT_EQ(result.value()[1], (StyleDeclaration{"overscroll-behavior-y", StyleValue("contain")}));
}

TEST(ShorthandTest, KeepSplitsContainIntrinsicSize) {
    auto strategy = make_strategy("keep");
    auto result = strategy->expand("contain-intrinsic-size", StyleValue("auto 10px 20px"));

    ASSERT_TRUE(result.is_ok());
    ASSERT_EQ(result.value().size(), 2u);
    EXPECT_EQ(result.value()[0].value, StyleValue("auto 10px"));
    EXPECT_EQ(result.value()[1].value, StyleValue("20px"));
}

// ============================================================================
// Expand to longhands
// ============================================================================

TEST(ShorthandTest, ExpandBoxValues) {
    auto strategy = make_strategy("expand-to-longhands");
    auto result = strategy->expand("margin", StyleValue("10px 20px"));

    ASSERT_TRUE(result.is_ok());
    const auto& decls = result.value();
    ASSERT_EQ(decls.size(), 4u);
    EXPECT_EQ(decls[0], (StyleDeclaration{"margin-top", StyleValue("10px")}));
    EXPECT_EQ(decls[1], (StyleDeclaration{"margin-right", StyleValue("20px")}));
    EXPECT_EQ(decls[2], (StyleDeclaration{"margin-bottom", StyleValue("10px")}));
    EXPECT_EQ(decls[3], (StyleDeclaration{"margin-left", StyleValue("20px")}));
}

TEST(ShorthandTest, ExpandNumberToEveryLonghand) {
    auto strategy = make_strategy("expand-to-longhands");
    auto result = strategy->expand("padding", StyleValue(4));

    ASSERT_TRUE(result.is_ok());
    ASSERT_EQ(result.value().size(), 4u);
    for (const auto& decl : result.value()) {
        EXPECT_EQ(decl.value, StyleValue(4));
    }
}

TEST(ShorthandTest, ExpandKeepsImportant) {
    auto strategy = make_strategy("expand-to-longhands");
    auto result = strategy->expand("gap", StyleValue("1px 2px !important"));

    ASSERT_TRUE(result.is_ok());
    ASSERT_EQ(result.value().size(), 2u);
    EXPECT_EQ(result.value()[0], (StyleDeclaration{"row-gap", StyleValue("1px !important")}));
    EXPECT_EQ(result.value()[1], (StyleDeclaration{"column-gap", StyleValue("2px !important")}));
}

TEST(ShorthandTest, ExpandBorderRadiusWithSlash) {
    auto strategy = make_strategy("expand-to-longhands");
    auto result = strategy->expand("border-radius", StyleValue("10px 20px / 5px"));

    ASSERT_TRUE(result.is_ok());
    const auto& decls = result.value();
    ASSERT_EQ(decls.size(), 4u);
    EXPECT_EQ(decls[0], (StyleDeclaration{"border-top-left-radius", StyleValue("10px 5px")}));
    EXPECT_EQ(decls[1], (StyleDeclaration{"border-top-right-radius", StyleValue("20px 5px")}));
}

TEST(ShorthandTest, ExpandListStyle) {
    auto strategy = make_strategy("expand-to-longhands");
    auto result = strategy->expand("list-style", StyleValue("inside square"));

    ASSERT_TRUE(result.is_ok());
    ASSERT_EQ(result.value().size(), 2u);
    EXPECT_EQ(result.value()[0], (StyleDeclaration{"list-style-type", StyleValue("square")}));
    EXPECT_EQ(result.value()[1], (StyleDeclaration{"list-style-position", StyleValue("inside")}));
}

TEST(ShorthandTest, ExpandConditionsRegroupsBranches) {
    auto strategy = make_strategy("expand-to-longhands");
    auto value = StyleValue::conditional({{"default", "1px"}, {":hover", "2px 4px"}});
    auto result = strategy->expand_conditions("margin", value);

    ASSERT_TRUE(result.is_ok());
    const auto& decls = result.value();
    ASSERT_EQ(decls.size(), 4u);
    EXPECT_EQ(decls[0].property, "margin-top");
    EXPECT_EQ(decls[0].value, StyleValue::conditional({{"default", "1px"}, {":hover", "2px"}}));
    EXPECT_EQ(decls[1].property, "margin-right");
    EXPECT_EQ(decls[1].value, StyleValue::conditional({{"default", "1px"}, {":hover", "4px"}}));
}

TEST(ShorthandTest, ExpandLeavesOtherPropertiesAlone) {
    auto strategy = make_strategy("expand-to-longhands");
    auto result = strategy->expand("color", StyleValue("red"));

    ASSERT_TRUE(result.is_ok());
    ASSERT_EQ(result.value().size(), 1u);
    EXPECT_EQ(result.value()[0].property, "color");
}

// ============================================================================
// Reject shorthands
// ============================================================================

TEST(ShorthandTest, RejectDisallowedShorthand) {
    auto strategy = make_strategy("reject-shorthands");
    auto result = strategy->expand("border", StyleValue("1px solid red"));

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().kind, ErrorKind::RejectedShorthand);
    EXPECT_EQ(result.error().message, "'border' is not supported. Use longhand properties instead.");
    EXPECT_EQ(result.error().hint, "Replace 'border' with: border-width, border-style, border-color");
}

TEST(ShorthandTest, RejectAllowsSimpleShorthands) {
    auto strategy = make_strategy("reject-shorthands");
    auto result = strategy->expand_conditions(
        "margin", StyleValue::conditional({{"default", "0"}, {":hover", "4px"}}));

    ASSERT_TRUE(result.is_ok());
    ASSERT_EQ(result.value().size(), 1u);
    EXPECT_EQ(result.value()[0].property, "margin");
}
