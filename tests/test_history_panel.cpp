// =============================================================================
// HistoryPanel Unit Tests
// Peak summaries, card composition and loading / empty states
// =============================================================================

#include <gtest/gtest.h>
#include "../src/panels/history_panel.hpp"
#include "../src/render/chart_renderer.hpp"

using namespace quotadash;

namespace {

class RecordingPlotter : public IPlotter {
public:
    TextBlock plot(const std::vector<PlotSeries>& series, const PlotOptions& options) const override {
        last_series = series;
        last_options = options;
        ++calls;
        return {make_row("<chart>", Rgb{})};
    }

    mutable std::vector<PlotSeries> last_series;
    mutable PlotOptions last_options;
    mutable int calls = 0;
};

UsageHistory sample_history() {
    UsageHistory history;
    history.daily_claude = {10.0, 20.0, 30.0, 40.0};
    history.daily_gemini = {5.0, 15.0};
    history.hourly = std::vector<double>(24, 1.0);
    history.hourly[14] = 12.34;
    history.weekly = {1.0, 2.0, 3.0, 27.0, 4.0, 5.0, 6.0};
    history.recent = {1.0, 2.0, 3.0};
    return history;
}

bool contains_row(const TextBlock& block, const std::string& needle) {
    for (const auto& row : block) {
        if (to_plain(row).find(needle) != std::string::npos) return true;
    }
    return false;
}

} // namespace

// -----------------------------------------------------------------------------
// Peak summaries
// -----------------------------------------------------------------------------
TEST(HistoryPanelTest, PeakHourText) {
    EXPECT_EQ(HistoryPanel::peak_hour_text(sample_history()), "Peak: 14:00-15:00 (avg 12.3% consumed)");
}

TEST(HistoryPanelTest, PeakHourText_WrapsAtMidnight) {
    UsageHistory history;
    history.hourly = std::vector<double>(24, 0.0);
    history.hourly[23] = 4.0;
    EXPECT_EQ(HistoryPanel::peak_hour_text(history), "Peak: 23:00-00:00 (avg 4.0% consumed)");
}

TEST(HistoryPanelTest, PeakDayText) {
    EXPECT_EQ(HistoryPanel::peak_day_text(sample_history()), "Peak day: Wed (avg 27.0% consumed)");

    auto named = sample_history();
    named.day_names = {"So", "Mo", "Di", "Mi", "Do", "Fr", "Sa"};
    EXPECT_EQ(HistoryPanel::peak_day_text(named), "Peak day: Mi (avg 27.0% consumed)");
}

TEST(HistoryPanelTest, PeakDayText_PartialNamesUseDefaults) {
    auto partial = sample_history();
    partial.day_names = {"So", "Mo", "Di", "Mi"};
    EXPECT_EQ(HistoryPanel::peak_day_text(partial), "Peak day: Wed (avg 27.0% consumed)");
}

TEST(HistoryPanelTest, PeakDayText_NoConsumption) {
    UsageHistory history;
    EXPECT_EQ(HistoryPanel::peak_day_text(history), "Peak day: Unknown (avg 0.0% consumed)");
    history.weekly = std::vector<double>(7, 0.0);
    EXPECT_EQ(HistoryPanel::peak_day_text(history), "Peak day: Unknown (avg 0.0% consumed)");
}

// -----------------------------------------------------------------------------
// Cards
// -----------------------------------------------------------------------------
TEST(HistoryPanelTest, Consumption_PlotsBothFamilies) {
    RecordingPlotter plotter;
    HistoryPanel panel(plotter);
    const auto rows = panel.render_consumption(sample_history(), 88);

    ASSERT_EQ(plotter.calls, 1);
    EXPECT_EQ(plotter.last_options.width, 80);
    EXPECT_EQ(plotter.last_options.height, HistoryPanel::kChartHeight);
    EXPECT_EQ(plotter.last_options.caption, "Last 4 days - Claude (red) vs Gemini (blue)");
    EXPECT_EQ(plotter.last_series[1].values, (std::vector<double>{5.0, 15.0, 0.0, 0.0}));

    EXPECT_EQ(to_plain(rows[0]), "◈ Daily Consumption");
    EXPECT_TRUE(contains_row(rows, "<chart>"));
    EXPECT_EQ(to_plain(rows.back()), "  ■ Claude  ■ Gemini");
}

TEST(HistoryPanelTest, Consumption_NarrowWidthKeepsMinimumChart) {
    RecordingPlotter plotter;
    HistoryPanel panel(plotter);
    (void)panel.render_consumption(sample_history(), 20);
    EXPECT_EQ(plotter.last_options.width, HistoryPanel::kMinChartWidth);
}

TEST(HistoryPanelTest, Consumption_NoDailyData) {
    RecordingPlotter plotter;
    HistoryPanel panel(plotter);
    UsageHistory history;
    history.hourly = {1.0};

    const auto rows = panel.render_consumption(history, 88);
    EXPECT_EQ(plotter.calls, 0);
    EXPECT_EQ(to_plain(rows.back()), "  " + std::string(kNoDataText));
}

TEST(HistoryPanelTest, HourlyAndWeeklyCards) {
    RecordingPlotter plotter;
    HistoryPanel panel(plotter);

    const auto hourly = panel.render_hourly(sample_history());
    ASSERT_EQ(hourly.size(), 4u);
    EXPECT_EQ(to_plain(hourly[0]), "◷ Hourly Pattern");
    EXPECT_EQ(to_plain(hourly[2]).substr(0, 5), "  00 ");
    EXPECT_EQ(to_plain(hourly[3]), "  Peak: 14:00-15:00 (avg 12.3% consumed)");

    const auto weekly = panel.render_weekly(sample_history());
    ASSERT_EQ(weekly.size(), 4u);
    EXPECT_EQ(to_plain(weekly[0]), "▦ Weekly Pattern");
    EXPECT_EQ(to_plain(weekly[3]), "  Peak day: Wed (avg 27.0% consumed)");
}

TEST(HistoryPanelTest, RecentCard_EmptyShowsPlaceholder) {
    RecordingPlotter plotter;
    HistoryPanel panel(plotter);
    const auto rows = panel.render_recent(UsageHistory{}, 40);

    EXPECT_EQ(to_plain(rows[0]), "∿ Recent Activity");
    EXPECT_EQ(to_plain(rows.back()), "  " + std::string(kNoDataText));
}

// -----------------------------------------------------------------------------
// Full tab
// -----------------------------------------------------------------------------
TEST(HistoryPanelTest, Render_Loading) {
    RecordingPlotter plotter;
    HistoryPanel panel(plotter);
    const auto block = panel.render(sample_history(), 100, true);

    ASSERT_EQ(block.size(), 3u);
    EXPECT_EQ(to_plain(block[2]), "Loading history data...");
    EXPECT_EQ(plotter.calls, 0);
}

TEST(HistoryPanelTest, Render_NoHistory) {
    RecordingPlotter plotter;
    HistoryPanel panel(plotter);
    const auto block = panel.render(UsageHistory{}, 100);

    EXPECT_TRUE(contains_row(block, "No historical data available yet."));
    EXPECT_TRUE(contains_row(block, "Data will appear as quota snapshots are recorded."));
}

TEST(HistoryPanelTest, Render_FourFramedCards) {
    RecordingPlotter plotter;
    HistoryPanel panel(plotter);
    const auto block = panel.render(sample_history(), 100);

    int tops = 0;
    for (size_t i = 2; i < block.size(); ++i) {
        EXPECT_EQ(block[i].size(), 94u) << "row " << i;
        if (block[i][0].glyph == "╭") ++tops;
    }
    EXPECT_EQ(tops, 4);
    EXPECT_EQ(to_plain(block[0]), "History");
}
