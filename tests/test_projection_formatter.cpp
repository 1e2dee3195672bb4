// =============================================================================
// Projection Formatter Unit Tests
// Status classification, badge / rate / depletion text and colors
// =============================================================================

#include <gtest/gtest.h>
#include "../src/render/projection_formatter.hpp"

#include <limits>

using namespace quotadash;

namespace {
constexpr double kInf = std::numeric_limits<double>::infinity();
}

// -----------------------------------------------------------------------------
// Classification
// -----------------------------------------------------------------------------
TEST(ProjectionFormatterTest, Classify_DefaultThresholds) {
    EXPECT_EQ(classify_projection(10.0, 0.5), ProjectionStatus::Critical);
    EXPECT_EQ(classify_projection(10.0, 3.0), ProjectionStatus::Warning);
    EXPECT_EQ(classify_projection(10.0, 6.0), ProjectionStatus::Safe);
}

TEST(ProjectionFormatterTest, Classify_NoRateOrNoHorizonIsUnknown) {
    EXPECT_EQ(classify_projection(0.0, 2.0), ProjectionStatus::Unknown);
    EXPECT_EQ(classify_projection(-1.0, 2.0), ProjectionStatus::Unknown);
    EXPECT_EQ(classify_projection(10.0, kInf), ProjectionStatus::Unknown);
}

TEST(ProjectionFormatterTest, Classify_WarningBandEndsAtReset) {
    const auto thresholds = thresholds_for_reset(7200);
    ASSERT_TRUE(thresholds.has_value());
    EXPECT_DOUBLE_EQ(thresholds->critical_hours, 1.0);
    EXPECT_DOUBLE_EQ(thresholds->warning_hours, 2.0);
    EXPECT_EQ(classify_projection(10.0, 3.0, *thresholds), ProjectionStatus::Safe);
    EXPECT_EQ(classify_projection(10.0, 1.5, *thresholds), ProjectionStatus::Warning);
    EXPECT_EQ(classify_projection(10.0, 0.5, *thresholds), ProjectionStatus::Critical);
}

TEST(ProjectionFormatterTest, Classify_ResetBeforeDepletionIsSafe) {
    // Resets in 30 minutes, runs out in 45: the refill comes first
    const auto thresholds = thresholds_for_reset(1800);
    ASSERT_TRUE(thresholds.has_value());
    EXPECT_DOUBLE_EQ(thresholds->critical_hours, 0.5);
    EXPECT_EQ(classify_projection(10.0, 0.75, *thresholds), ProjectionStatus::Safe);
    EXPECT_EQ(classify_projection(10.0, 0.25, *thresholds), ProjectionStatus::Critical);
}

TEST(ProjectionFormatterTest, Classify_NoResetLeavesStatusUnknown) {
    EXPECT_FALSE(thresholds_for_reset(0).has_value());
    EXPECT_FALSE(thresholds_for_reset(-60).has_value());
}

// -----------------------------------------------------------------------------
// Text
// -----------------------------------------------------------------------------
TEST(ProjectionFormatterTest, BadgeText) {
    EXPECT_EQ(badge_text(ProjectionStatus::Critical), "▲ CRITICAL");
    EXPECT_EQ(badge_text(ProjectionStatus::Warning), "▲ WARNING");
    EXPECT_EQ(badge_text(ProjectionStatus::Safe), "● SAFE");
    EXPECT_EQ(badge_text(ProjectionStatus::Unknown), "");
}

TEST(ProjectionFormatterTest, RateText) {
    EXPECT_EQ(rate_text(12.345), "12.3%/hr");
    EXPECT_EQ(rate_text(4.0), "4.0%/hr");
    EXPECT_EQ(rate_text(0.0), "");
}

TEST(ProjectionFormatterTest, DepletionText) {
    const ProjectionResult projection{ProjectionStatus::Warning, 10.0, 2.5};
    EXPECT_EQ(depletion_text(projection, 20), "(Depletes: 2h 30m)");
    EXPECT_EQ(depletion_text(projection, 10), "(Depletes)");

    const ProjectionResult days{ProjectionStatus::Safe, 1.0, 50.0};
    EXPECT_EQ(depletion_text(days, 20), "(Depletes: 2d 02h)");
}

TEST(ProjectionFormatterTest, DepletionText_EmptyWithoutProjection) {
    EXPECT_EQ(depletion_text(ProjectionResult{}, 20), "");
    EXPECT_EQ(depletion_text(ProjectionResult{ProjectionStatus::Safe, 0.0, 3.0}, 20), "");
}

// -----------------------------------------------------------------------------
// Rendering
// -----------------------------------------------------------------------------
TEST(ProjectionFormatterTest, Badge_RightAlignedAndBoldWhenAlarming) {
    const auto& palette = default_palette();
    const auto row = render_badge(ProjectionResult{ProjectionStatus::Critical, 30.0, 0.5}, 12);

    EXPECT_EQ(to_plain(row), "  ▲ CRITICAL");
    EXPECT_EQ(row.back().color, palette.error);
    EXPECT_TRUE(row.back().bold);

    const auto safe = render_badge(ProjectionResult{ProjectionStatus::Safe, 1.0, 50.0}, 10);
    EXPECT_EQ(to_plain(safe), "    ● SAFE");
    EXPECT_EQ(safe.back().color, palette.success);
    EXPECT_FALSE(safe.back().bold);
}

TEST(ProjectionFormatterTest, Badge_UnknownIsBlank) {
    EXPECT_EQ(to_plain(render_badge(ProjectionResult{}, 10)), std::string(10, ' '));
}

TEST(ProjectionFormatterTest, DetailColumns_MutedUnlessAlarming) {
    const auto& palette = default_palette();

    const auto warning_rate = render_rate(ProjectionResult{ProjectionStatus::Warning, 12.0, 3.0}, 10);
    EXPECT_EQ(to_plain(warning_rate), "  12.0%/hr");
    EXPECT_EQ(warning_rate.back().color, palette.warning);

    const auto safe_rate = render_rate(ProjectionResult{ProjectionStatus::Safe, 2.0, 40.0}, 10);
    EXPECT_EQ(safe_rate.back().color, palette.text_secondary);

    const auto depletion = render_depletion(ProjectionResult{ProjectionStatus::Critical, 60.0, 0.5}, 20);
    EXPECT_EQ(to_plain(depletion), "  (Depletes: 0h 30m)");
    EXPECT_EQ(depletion.back().color, palette.error);
}

TEST(ProjectionFormatterTest, StatusColors) {
    const auto& palette = default_palette();
    EXPECT_EQ(status_color(palette, ProjectionStatus::Critical), palette.error);
    EXPECT_EQ(status_color(palette, ProjectionStatus::Warning), palette.warning);
    EXPECT_EQ(status_color(palette, ProjectionStatus::Safe), palette.success);
    EXPECT_EQ(status_color(palette, ProjectionStatus::Unknown), palette.subtle);
}
