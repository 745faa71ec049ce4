#include "../libming/include/page_layout.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <string>

using namespace ming;

TEST(PageLayoutTest, OrientationFollowsAspect) {
    EXPECT_EQ(orientation_for(200, 100), PageOrientation::Landscape);
    EXPECT_EQ(orientation_for(100, 200), PageOrientation::Portrait);
    EXPECT_EQ(orientation_for(64, 64), PageOrientation::Portrait);
    EXPECT_EQ(orientation_for(101, 100), PageOrientation::Landscape);
}

TEST(PageLayoutTest, TallImageOnPortraitPage) {
    const PageSpec spec = compute_a4_layout(100, 200);
    EXPECT_EQ(spec.orientation, PageOrientation::Portrait);
    EXPECT_DOUBLE_EQ(spec.page_width, 210.0);
    EXPECT_DOUBLE_EQ(spec.page_height, 297.0);
    // height-bound: 277 / 200
    EXPECT_NEAR(spec.width, 138.5, 1e-9);
    EXPECT_NEAR(spec.height, 277.0, 1e-9);
    EXPECT_NEAR(spec.x, 35.75, 1e-9);
    EXPECT_NEAR(spec.y, 10.0, 1e-9);
}

TEST(PageLayoutTest, WideImageOnLandscapePage) {
    const PageSpec spec = compute_a4_layout(200, 100);
    EXPECT_EQ(spec.orientation, PageOrientation::Landscape);
    EXPECT_DOUBLE_EQ(spec.page_width, 297.0);
    EXPECT_DOUBLE_EQ(spec.page_height, 210.0);
    EXPECT_NEAR(spec.width, 277.0, 1e-9);
    EXPECT_NEAR(spec.height, 138.5, 1e-9);
    EXPECT_NEAR(spec.x, 10.0, 1e-9);
    EXPECT_NEAR(spec.y, 35.75, 1e-9);
}

TEST(PageLayoutTest, SquareImageIsPortraitAndWidthBound) {
    const PageSpec spec = compute_a4_layout(50, 50);
    EXPECT_EQ(spec.orientation, PageOrientation::Portrait);
    EXPECT_NEAR(spec.width, 190.0, 1e-9);
    EXPECT_NEAR(spec.height, 190.0, 1e-9);
    EXPECT_NEAR(spec.x, 10.0, 1e-9);
    EXPECT_NEAR(spec.y, 53.5, 1e-9);
}

TEST(PageLayoutTest, SmallImagesAreUpscaled) {
    const PageSpec spec = compute_a4_layout(1, 1);
    EXPECT_GT(spec.width, 1.0);
    EXPECT_NEAR(spec.width, 190.0, 1e-9);
}

TEST(PageLayoutTest, CustomPageAndMargin) {
    const PageSpec spec = compute_layout(100.0, 200.0, 0.0, 10, 10);
    EXPECT_NEAR(spec.width, 100.0, 1e-9);
    EXPECT_NEAR(spec.height, 100.0, 1e-9);
    EXPECT_NEAR(spec.y, 50.0, 1e-9);
    EXPECT_EQ(spec.image_width, 10);
    EXPECT_EQ(spec.image_height, 10);
}

TEST(PageLayoutTest, PlacementStaysInsideMarginsAndKeepsAspect) {
    const int sizes[][2] = {
        {1, 1}, {1, 5000}, {5000, 1}, {640, 480}, {480, 640}, {3000, 2999},
        {2999, 3000}, {1920, 1080}, {190, 277}, {277, 190}, {12345, 678}
    };
    for (const auto& s : sizes) {
        const int w = s[0];
        const int h = s[1];
        SCOPED_TRACE(std::to_string(w) + "x" + std::to_string(h));
        const PageSpec spec = compute_a4_layout(w, h);

        EXPECT_GE(spec.x, kPageMarginMm - 1e-9);
        EXPECT_GE(spec.y, kPageMarginMm - 1e-9);
        EXPECT_LE(spec.x + spec.width, spec.page_width - kPageMarginMm + 1e-9);
        EXPECT_LE(spec.y + spec.height, spec.page_height - kPageMarginMm + 1e-9);

        // centered
        EXPECT_NEAR(spec.x, spec.page_width - spec.x - spec.width, 1e-9);
        EXPECT_NEAR(spec.y, spec.page_height - spec.y - spec.height, 1e-9);

        EXPECT_NEAR(spec.width / spec.height, static_cast<double>(w) / h, 1e-9 * w / h + 1e-12);

        // one dimension touches the margin box
        const bool width_bound = std::abs(spec.width - (spec.page_width - 2 * kPageMarginMm)) < 1e-9;
        const bool height_bound = std::abs(spec.height - (spec.page_height - 2 * kPageMarginMm)) < 1e-9;
        EXPECT_TRUE(width_bound || height_bound);
    }
}
