// =============================================================================
// ShimmerAnimator Unit Tests
// Triangle-wave easing, band placement and spinner frames
// =============================================================================

#include <gtest/gtest.h>
#include "../src/render/shimmer.hpp"

#include <cstdlib>

using namespace quotadash;

namespace {
const Rgb kAccent{0xcc, 0x78, 0x5c};
}

// -----------------------------------------------------------------------------
// Phase
// -----------------------------------------------------------------------------
TEST(ShimmerTest, Phase_TriangleWaveWithSmoothstep) {
    EXPECT_DOUBLE_EQ(shimmer_phase(0, 120), 0.0);
    EXPECT_DOUBLE_EQ(shimmer_phase(30, 120), 0.5);    // p = 0.5 is a fixed point of smoothstep
    EXPECT_DOUBLE_EQ(shimmer_phase(60, 120), 1.0);
    EXPECT_DOUBLE_EQ(shimmer_phase(90, 120), 0.5);
    EXPECT_DOUBLE_EQ(shimmer_phase(120, 120), 0.0);   // wraps
}

TEST(ShimmerTest, Phase_EasesNearTheEnds) {
    // Linear p would be 0.2; smoothstep lags behind it near zero
    EXPECT_LT(shimmer_phase(12, 120), 0.2);
    EXPECT_GT(shimmer_phase(12, 120), 0.0);
}

TEST(ShimmerTest, Phase_NonPositiveCycleIsSafe) {
    EXPECT_DOUBLE_EQ(shimmer_phase(17, 0), 0.0);
    EXPECT_DOUBLE_EQ(shimmer_phase(17, -4), 0.0);
}

// -----------------------------------------------------------------------------
// Band placement
// -----------------------------------------------------------------------------
TEST(ShimmerTest, Center_ForwardAndReverse) {
    EXPECT_EQ(shimmer_center(20, 0, 120, false), 0);
    EXPECT_EQ(shimmer_center(20, 0, 120, true), 20);
    EXPECT_EQ(shimmer_center(20, 30, 120, false), 10);
    EXPECT_EQ(shimmer_center(20, 60, 120, false), 20);
}

TEST(ShimmerTest, Render_BandAroundCenter) {
    const auto& palette = default_palette();
    const auto row = render_shimmer(20, 30, 120, kAccent, false);   // center 10

    ASSERT_EQ(row.size(), 20u);
    for (int i = 0; i < 20; ++i) {
        const int dist = std::abs(i - 10);
        if (dist < 3) {
            EXPECT_EQ(row[i].glyph, kShimmerSolid) << i;
            EXPECT_EQ(row[i].color, kAccent) << i;
        } else if (dist < 5) {
            EXPECT_EQ(row[i].glyph, kShimmerDim) << i;
            EXPECT_EQ(row[i].color, palette.text_secondary) << i;
        } else {
            EXPECT_EQ(row[i].glyph, kShimmerBackground) << i;
            EXPECT_EQ(row[i].color, palette.bg_light) << i;
        }
    }
}

TEST(ShimmerTest, Render_ReverseStartsAtTheRightEdge) {
    const auto row = render_shimmer(20, 0, 80, kAccent, true);   // center 20
    EXPECT_EQ(row[19].glyph, kShimmerSolid);
    EXPECT_EQ(row[18].glyph, kShimmerSolid);
    EXPECT_EQ(row[17].glyph, kShimmerDim);
    EXPECT_EQ(row[0].glyph, kShimmerBackground);
}

TEST(ShimmerTest, Render_IsDeterministicPerFrame) {
    EXPECT_EQ(render_shimmer(30, 47, 100, kAccent, true), render_shimmer(30, 47, 100, kAccent, true));
}

TEST(ShimmerTest, Render_NonPositiveWidthIsEmpty) {
    EXPECT_TRUE(render_shimmer(0, 5, 120, kAccent, false).empty());
}

// -----------------------------------------------------------------------------
// Spinner
// -----------------------------------------------------------------------------
TEST(ShimmerTest, Spinner_AdvancesEveryTwoFrames) {
    EXPECT_EQ(spinner_glyph(0), "⠋");
    EXPECT_EQ(spinner_glyph(1), "⠋");
    EXPECT_EQ(spinner_glyph(2), "⠙");
    EXPECT_EQ(spinner_glyph(19), "⠏");
    EXPECT_EQ(spinner_glyph(20), "⠋");
}
