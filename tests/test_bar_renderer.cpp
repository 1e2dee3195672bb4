// =============================================================================
// BarRenderer Unit Tests
// Quota gradient bars: width, fill rounding, clamping and gradient direction
// =============================================================================

#include <gtest/gtest.h>
#include "../src/render/bar_renderer.hpp"

#include <cmath>
#include <limits>

using namespace quotadash;

namespace {

int count_glyph(const GlyphRow& row, std::string_view glyph) {
    int count = 0;
    for (const auto& cell : row) {
        if (cell.glyph == glyph) ++count;
    }
    return count;
}

} // namespace

// -----------------------------------------------------------------------------
// Width and fill
// -----------------------------------------------------------------------------
TEST(BarRendererTest, RenderBar_WidthAndFillForAllPercentages) {
    for (int width : {1, 7, 20, 33}) {
        for (int percent = 0; percent <= 100; percent += 5) {
            const auto row = render_bar(percent, width);
            ASSERT_EQ(static_cast<int>(row.size()), width);
            const int expected = static_cast<int>(std::lround(width * percent / 100.0));
            EXPECT_EQ(count_glyph(row, kGlyphFull), expected) << "width=" << width << " percent=" << percent;
        }
    }
}

TEST(BarRendererTest, RenderBar_SeventyFivePercent_FifteenOfTwenty) {
    const auto& palette = default_palette();
    const auto row = render_bar(75.0, 20);

    ASSERT_EQ(row.size(), 20u);
    for (int i = 0; i < 15; ++i) EXPECT_EQ(row[i].glyph, kGlyphFull);
    for (int i = 15; i < 20; ++i) {
        EXPECT_EQ(row[i].glyph, kGlyphLight);
        EXPECT_EQ(row[i].color, palette.subtle);
    }

    // Low is red-heavy, high is green-heavy: red falls and green rises along the bar
    EXPECT_EQ(row[0].color, palette.quota_low);
    for (int i = 1; i < 15; ++i) {
        EXPECT_LE(row[i].color.r, row[i - 1].color.r);
        EXPECT_GE(row[i].color.g, row[i - 1].color.g);
        EXPECT_LE(row[i].color.b, row[i - 1].color.b);
    }
}

TEST(BarRendererTest, RenderBar_FullBarEndsOnHighColor) {
    const auto row = render_bar(100.0, 12);
    EXPECT_EQ(row.back().color, default_palette().quota_high);
}

TEST(BarRendererTest, RenderBar_OutOfRangeIsClamped) {
    EXPECT_EQ(render_bar(-25.0, 15), render_bar(0.0, 15));
    EXPECT_EQ(render_bar(180.0, 15), render_bar(100.0, 15));
    EXPECT_EQ(render_bar(std::nan(""), 15), render_bar(0.0, 15));
}

TEST(BarRendererTest, RenderBar_NonPositiveWidthIsEmpty) {
    EXPECT_TRUE(render_bar(50.0, 0).empty());
    EXPECT_TRUE(render_bar(50.0, -3).empty());
}

TEST(BarRendererTest, FilledColumns_RoundsHalfAwayFromZero) {
    EXPECT_EQ(filled_columns(0.25, 10), 3);   // 2.5
    EXPECT_EQ(filled_columns(0.24, 10), 2);
    EXPECT_EQ(filled_columns(1.5, 10), 10);
    EXPECT_EQ(filled_columns(std::nan(""), 10), 0);
}

TEST(BarRendererTest, RateLimitedBar_IsAllLightShade) {
    const auto row = render_rate_limited_bar(8);
    ASSERT_EQ(row.size(), 8u);
    EXPECT_EQ(count_glyph(row, kGlyphLight), 8);
    EXPECT_EQ(row.front().color, default_palette().error);
}
