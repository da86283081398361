#include <gtest/gtest.h>
#include "facet/css/selector.hpp"

using namespace facet;
using namespace facet::css;

// ============================================================================
// Atomic selectors
// ============================================================================

TEST(SelectorTest, PlainClass) {
    CompilerConfig config;
    EXPECT_EQ(atomic_selector(config, "x1", {}, false), ".x1");
}

TEST(SelectorTest, PseudoClassBumpsSpecificity) {
    CompilerConfig config;
    EXPECT_EQ(atomic_selector(config, "x1", {":hover"}, false), ".x1:not(#\\#):hover");
}

TEST(SelectorTest, AtRuleBumpsSpecificity) {
    CompilerConfig config;
    EXPECT_EQ(atomic_selector(config, "x1", {}, true), ".x1:not(#\\#)");
}

TEST(SelectorTest, LayersDoubleTheClass) {
    CompilerConfig config;
    config.use_css_layers = true;
    EXPECT_EQ(atomic_selector(config, "x1", {":hover"}, false), ".x1.x1:hover");
}

TEST(SelectorTest, PseudoElementsKeepTheirPosition) {
    CompilerConfig config;
    EXPECT_EQ(atomic_selector(config, "x1", {":hover", "::before", ":active"}, false),
              ".x1:not(#\\#):hover::before:active");
    EXPECT_EQ(atomic_selector(config, "x1", {":hover", "::before"}, false),
              ".x1:not(#\\#):hover::before");
    EXPECT_EQ(atomic_selector(config, "x1", {"::before", ":hover"}, false),
              ".x1:not(#\\#)::before:hover");
}

TEST(SelectorTest, PseudoClassRunsAreSorted) {
    CompilerConfig config;
    EXPECT_EQ(atomic_selector(config, "x1", {":hover", ":active", "::after"}, false),
              ".x1:not(#\\#):active:hover::after");
}

TEST(SelectorTest, VendorPrefixedPseudoElement) {
    CompilerConfig config;
    EXPECT_EQ(atomic_selector(config, "x1", {"::placeholder"}, false),
              ".x1:not(#\\#)::-webkit-input-placeholder, .x1:not(#\\#)::-moz-placeholder, "
              ".x1:not(#\\#):-ms-input-placeholder, .x1:not(#\\#)::placeholder");
}

// ============================================================================
// RTL prefix and at-rules
// ============================================================================

TEST(SelectorTest, PrefixRtl) {
    EXPECT_EQ(prefix_rtl(".x1"), "html[dir=\"rtl\"] .x1");
    EXPECT_EQ(prefix_rtl(".a, .b"), "html[dir=\"rtl\"] .a,html[dir=\"rtl\"] .b");
}

TEST(SelectorTest, PrefixRtlKeepsNestedSelectorLists) {
    EXPECT_EQ(prefix_rtl(".x1:where(.m:hover ~ *, :has(~ .m:hover))"),
              "html[dir=\"rtl\"] .x1:where(.m:hover ~ *, :has(~ .m:hover))");
    EXPECT_EQ(prefix_rtl(".a:is(.b, .c), .d"),
              "html[dir=\"rtl\"] .a:is(.b, .c),html[dir=\"rtl\"] .d");
}

TEST(SelectorTest, WrapAtRules) {
    EXPECT_EQ(wrap_at_rules(".x1{color:red}", {}), ".x1{color:red}");
    EXPECT_EQ(wrap_at_rules(".x1{color:red}", {"@supports (display: grid)", "@media print"}),
              "@supports (display: grid){@media print{.x1{color:red}}}");
}

// ============================================================================
// Vendor prefixes
// ============================================================================

TEST(SelectorTest, SelectorVariants) {
    auto variants = selector_variants(":autofill");
    ASSERT_EQ(variants.size(), 2u);
    EXPECT_EQ(variants[0], ":-webkit-autofill");
    EXPECT_EQ(variants[1], ":autofill");
    EXPECT_TRUE(selector_variants(":hover").empty());
}

TEST(SelectorTest, PrefixSelector) {
    EXPECT_EQ(prefix_selector(".x1:hover"), ".x1:hover");
    EXPECT_EQ(prefix_selector(".x1:placeholder-shown"),
              ".x1:-moz-placeholder-shown, .x1:placeholder-shown");
}
