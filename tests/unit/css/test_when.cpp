#include <gtest/gtest.h>
#include "facet/css/when.hpp"

using namespace facet;
using namespace facet::css;

// ============================================================================
// Markers
// ============================================================================

TEST(WhenTest, DefaultMarker) {
    CompilerConfig config;
    EXPECT_EQ(default_marker(config).class_name, "x-default-marker");
}

TEST(WhenTest, NamedMarkersAreStable) {
    CompilerConfig config;
    EXPECT_EQ(define_marker(config, "card"), define_marker(config, "card"));
    EXPECT_EQ(define_marker(config, "card").class_name, "xk6oyf8");
    EXPECT_NE(define_marker(config, "card"), define_marker(config, "row"));
}

// ============================================================================
// Contextual selectors
// ============================================================================

TEST(WhenTest, Ancestor) {
    auto result = ancestor(":hover", Marker{"m"});
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), ":where(.m:hover *)");
}

TEST(WhenTest, Descendant) {
    EXPECT_EQ(descendant(":focus", Marker{"m"}).value(), ":where(:has(.m:focus))");
}

TEST(WhenTest, Siblings) {
    EXPECT_EQ(sibling_before(":hover", Marker{"m"}).value(), ":where(.m:hover ~ *)");
    EXPECT_EQ(sibling_after(":hover", Marker{"m"}).value(), ":where(:has(~ .m:hover))");
    EXPECT_EQ(any_sibling(":hover", Marker{"m"}).value(),
              ":where(.m:hover ~ *, :has(~ .m:hover))");
}

TEST(WhenTest, RejectsPseudoElements) {
    auto result = ancestor("::before", Marker{"m"});
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().kind, ErrorKind::InvalidSelector);
}

TEST(WhenTest, RejectsMissingColon) {
    auto result = any_sibling("hover", Marker{"m"});
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().kind, ErrorKind::InvalidSelector);
    EXPECT_EQ(result.error().message, "Pseudo selector must start with ':' (got \"hover\")");
}

TEST(WhenTest, DefaultMarkerWhenOmitted) {
    CompilerConfig config;
    EXPECT_EQ(ancestor(":hover", config).value(), ":where(.x-default-marker:hover *)");
    EXPECT_EQ(descendant(":focus", config).value(), ":where(:has(.x-default-marker:focus))");
    EXPECT_EQ(sibling_before(":hover", config).value(), ":where(.x-default-marker:hover ~ *)");
    EXPECT_EQ(sibling_after(":hover", config).value(), ":where(:has(~ .x-default-marker:hover))");
    EXPECT_EQ(any_sibling(":hover", config).value(),
              ":where(.x-default-marker:hover ~ *, :has(~ .x-default-marker:hover))");

    config.class_name_prefix = "app";
    EXPECT_EQ(ancestor(":hover", config).value(), ":where(.app-default-marker:hover *)");
    EXPECT_TRUE(ancestor("::after", config).is_err());
}
