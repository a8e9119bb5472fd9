#include "gtest/gtest.h"
#include "color_map.hpp"

using namespace pairwise_heatmap;

TEST(coolwarm, endpoints) {
    EXPECT_EQ((Color {59, 76, 192}), coolwarm(0.0));
    EXPECT_EQ((Color {221, 221, 221}), coolwarm(0.5));
    EXPECT_EQ((Color {180, 4, 38}), coolwarm(1.0));
}

TEST(coolwarm, clips) {
    EXPECT_EQ(coolwarm(0.0), coolwarm(-3.0));
    EXPECT_EQ(coolwarm(1.0), coolwarm(7.0));
}

TEST(identityColor, fixed_domain) {
    EXPECT_EQ(coolwarm(0.0), identityColor(60.0));
    EXPECT_EQ(coolwarm(1.0), identityColor(100.0));
    EXPECT_EQ(coolwarm(0.5), identityColor(80.0));
    // Everything below 60 shares the colour of 60
    EXPECT_EQ(identityColor(60.0), identityColor(12.5));
    EXPECT_EQ(identityColor(60.0), identityColor(0.0));
    EXPECT_NE(identityColor(60.0), identityColor(61.0));
}

TEST(Color, hex) {
    EXPECT_EQ("#3b4cc0", (Color {59, 76, 192}).hex());
    EXPECT_EQ("#000000", BLACK.hex());
    EXPECT_EQ("#ffffff", WHITE.hex());
}

TEST(annotationColor, contrast) {
    EXPECT_NEAR(0.0, relativeLuminance(BLACK), 1e-9);
    EXPECT_NEAR(1.0, relativeLuminance(WHITE), 1e-9);
    EXPECT_EQ(BLACK, annotationColor(identityColor(80.0)));
    EXPECT_EQ(WHITE, annotationColor(identityColor(100.0)));
    EXPECT_EQ(WHITE, annotationColor(identityColor(60.0)));
}
