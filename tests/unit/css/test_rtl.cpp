#include <gtest/gtest.h>
#include "facet/css/rtl.hpp"

using namespace facet;
using namespace facet::css;

TEST(RtlTest, LogicalPropertiesBecomePhysical) {
    EXPECT_EQ(to_ltr("margin-start", "10px"), (Declaration{"margin-left", "10px"}));

    auto rtl = to_rtl("margin-start", "10px");
    ASSERT_TRUE(rtl.has_value());
    EXPECT_EQ(*rtl, (Declaration{"margin-right", "10px"}));
}

TEST(RtlTest, CornerRadius) {
    EXPECT_EQ(to_ltr("border-top-start-radius", "4px").property, "border-top-left-radius");
    EXPECT_EQ(to_rtl("border-top-start-radius", "4px")->property, "border-top-right-radius");
}

TEST(RtlTest, FloatValues) {
    EXPECT_EQ(to_ltr("float", "start"), (Declaration{"float", "left"}));
    EXPECT_EQ(to_rtl("float", "start"), (Declaration{"float", "right"}));
    EXPECT_EQ(to_rtl("clear", "inline-end"), (Declaration{"clear", "left"}));
    EXPECT_FALSE(to_rtl("float", "none").has_value());
}

TEST(RtlTest, BackgroundPosition) {
    EXPECT_EQ(to_ltr("background-position", "top start").value, "top left");
    EXPECT_EQ(to_rtl("background-position", "top start")->value, "top right");
    EXPECT_FALSE(to_rtl("background-position", "top center").has_value());
}

TEST(RtlTest, NativeLogicalPropertiesUnchanged) {
    EXPECT_EQ(to_ltr("margin-inline-start", "10px"), (Declaration{"margin-inline-start", "10px"}));
    EXPECT_FALSE(to_rtl("margin-inline-start", "10px").has_value());
    EXPECT_FALSE(to_rtl("color", "red").has_value());
}
