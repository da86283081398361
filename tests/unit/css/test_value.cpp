#include <gtest/gtest.h>
#include "facet/css/value.hpp"
#include <limits>

using namespace facet;
using namespace facet::css;

// ============================================================================
// normalize_value
// ============================================================================

TEST(ValueTest, CollapsesWhitespace) {
    EXPECT_EQ(normalize_value("  1px   solid  red "), "1px solid red");
}

TEST(ValueTest, WhitespaceAroundCommasAndParentheses) {
    EXPECT_EQ(normalize_value("rgba( 0 , 0 , 0 , 0.5 )"), "rgba(0,0,0,.5)");
}

TEST(ValueTest, Important) {
    EXPECT_EQ(normalize_value("red !important"), "red!important");
}

TEST(ValueTest, Timings) {
    EXPECT_EQ(normalize_value("500ms"), ".5s");
    EXPECT_EQ(normalize_value("1500ms"), "1.5s");
    EXPECT_EQ(normalize_value("5ms"), "5ms");
}

TEST(ValueTest, LeadingZeros) {
    EXPECT_EQ(normalize_value("0.25em"), ".25em");
    EXPECT_EQ(normalize_value("10.5px"), "10.5px");
}

TEST(ValueTest, ZeroDimensions) {
    EXPECT_EQ(normalize_value("0px"), "0");
    EXPECT_EQ(normalize_value("0rad"), "0deg");
    EXPECT_EQ(normalize_value("0ms"), "0s");
    EXPECT_EQ(normalize_value("0px 10px"), "0 10px");
    EXPECT_EQ(normalize_value("10px"), "10px");
}

TEST(ValueTest, EmptyQuotes) {
    EXPECT_EQ(normalize_value("''"), "\"\"");
}

// ============================================================================
// Numbers
// ============================================================================

TEST(ValueTest, FormatNumber) {
    EXPECT_EQ(format_number(2.0), "2");
    EXPECT_EQ(format_number(1.5), "1.5");
    EXPECT_EQ(format_number(-0.25), "-0.25");
    EXPECT_EQ(format_number(1.0 / 3.0), "0.3333");
    EXPECT_EQ(format_number(1023.99, 2), "1023.99");
}

TEST(ValueTest, FormatNumberOutsideIntegerRange) {
    EXPECT_EQ(format_number(1e20), "100000000000000000000");
    EXPECT_EQ(format_number(1e30), "1000000000000000019884624838656");
    EXPECT_EQ(format_number(-1e20), "-100000000000000000000");
    EXPECT_EQ(format_number(9007199254740991.0), "9007199254740991");
    EXPECT_EQ(format_number(std::numeric_limits<f64>::infinity()), "0");
    EXPECT_EQ(format_number(std::numeric_limits<f64>::quiet_NaN()), "0");
}

TEST(ValueTest, NumberToCss) {
    CompilerConfig config;
    EXPECT_EQ(number_to_css(10, "width", config), "10px");
    EXPECT_EQ(number_to_css(0, "margin", config), "0");
    EXPECT_EQ(number_to_css(0.5, "opacity", config), ".5");
    EXPECT_EQ(number_to_css(2, "z-index", config), "2");
    EXPECT_EQ(number_to_css(500, "transition-duration", config), ".5s");
}

TEST(ValueTest, FontSizeToRem) {
    CompilerConfig config;
    EXPECT_EQ(number_to_css(24, "font-size", config), "24px");

    config.font_size_px_to_rem = true;
    EXPECT_EQ(number_to_css(24, "font-size", config), "1.5rem");
    EXPECT_EQ(number_to_css(16, "font-size", config), "1rem");
}

// ============================================================================
// Strings
// ============================================================================

TEST(ValueTest, ContentIsQuoted) {
    EXPECT_EQ(string_to_css("hello", "content"), "\"hello\"");
    EXPECT_EQ(string_to_css("\"hello\"", "content"), "\"hello\"");
    EXPECT_EQ(string_to_css("none", "content"), "none");
    EXPECT_EQ(string_to_css("attr(title)", "content"), "attr(title)");
}

TEST(ValueTest, HyphenateCharacter) {
    EXPECT_EQ(string_to_css("-", "hyphenate-character"), "\"-\"");
    EXPECT_EQ(string_to_css("auto", "hyphenate-character"), "auto");
}

TEST(ValueTest, PropertyLists) {
    EXPECT_EQ(string_to_css("background_color, opacity", "transition-property"),
              "background-color,opacity");
    EXPECT_EQ(string_to_css("--my_var", "will-change"), "--my_var");
}

TEST(ValueTest, IsCssVar) {
    EXPECT_TRUE(is_css_var("var(--x)"));
    EXPECT_FALSE(is_css_var("calc(var(--x))"));
}
