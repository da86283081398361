#include <gtest/gtest.h>
#include "facet/css/priority.hpp"
#include "facet/css/property.hpp"

using namespace facet;
using namespace facet::css;

// ============================================================================
// Property priority
// ============================================================================

TEST(PriorityTest, PropertyCategories) {
    EXPECT_EQ(property_priority("--brand"), 1);
    EXPECT_EQ(property_priority("margin"), 1000);
    EXPECT_EQ(property_priority("border"), 1000);
    EXPECT_EQ(property_priority("margin-block"), 2000);
    EXPECT_EQ(property_priority("border-color"), 2000);
    EXPECT_EQ(property_priority("margin-top"), 3000);
    EXPECT_EQ(property_priority("margin-inline-start"), 3000);
    EXPECT_EQ(property_priority("color"), 3000);
}

TEST(PriorityTest, AtRules) {
    EXPECT_EQ(at_rule_priority("@supports (display: grid)"), 30);
    EXPECT_EQ(at_rule_priority("@media (max-width: 600px)"), 200);
    EXPECT_EQ(at_rule_priority("@container (min-width: 10em)"), 300);
    EXPECT_EQ(at_rule_priority("@layer base"), 0);
}

TEST(PriorityTest, Combined) {
    EXPECT_EQ(calculate_priority("color", {}, {}), 3000);
    EXPECT_EQ(calculate_priority("color", {":hover"}, {}), 3130);
    EXPECT_EQ(calculate_priority("color", {}, {"@media (max-width: 600px)"}), 3200);
    EXPECT_EQ(calculate_priority("color", {":hover"}, {"@media (max-width: 600px)"}), 3330);
    EXPECT_EQ(calculate_priority("color", {"::before"}, {}), 8000);
    EXPECT_EQ(calculate_priority("margin", {":focus", ":active"}, {}), 1320);
}

TEST(PriorityTest, HoverLosesToActive) {
    EXPECT_LT(calculate_priority("color", {":hover"}, {}),
              calculate_priority("color", {":active"}, {}));
}

// ============================================================================
// Property tables
// ============================================================================

TEST(PropertyTest, Units) {
    EXPECT_EQ(unit_suffix("width"), "px");
    EXPECT_EQ(unit_suffix("opacity"), "");
    EXPECT_EQ(unit_suffix("z-index"), "");
    EXPECT_EQ(unit_suffix("--size"), "");
    EXPECT_EQ(unit_suffix("transition-duration"), "ms");
}

TEST(PropertyTest, ToCssProperty) {
    EXPECT_EQ(to_css_property("background_color"), "background-color");
    EXPECT_EQ(to_css_property("color"), "color");
    EXPECT_EQ(to_css_property("--my_var"), "--my_var");
    EXPECT_EQ(to_css_property("var(--brand)"), "--brand");
}

TEST(PropertyTest, DisallowedShorthands) {
    EXPECT_TRUE(is_disallowed_shorthand("border"));
    EXPECT_FALSE(is_disallowed_shorthand("margin"));

    auto longhands = disallowed_shorthand_longhands("flex-flow");
    ASSERT_EQ(longhands.size(), 2u);
    EXPECT_EQ(longhands[0], "flex-direction");
    EXPECT_EQ(longhands[1], "flex-wrap");

    EXPECT_TRUE(disallowed_shorthand_longhands("color").empty());
}

TEST(PropertyTest, PositionTryProperties) {
    EXPECT_TRUE(is_position_try_property("top"));
    EXPECT_TRUE(is_position_try_property("position-area"));
    EXPECT_FALSE(is_position_try_property("color"));
}
