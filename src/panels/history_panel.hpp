#pragma once

#include "../glyph_row.hpp"
#include "../interfaces/i_plotter.hpp"
#include "../palette.hpp"
#include "../usage_history.hpp"
#include <string>

namespace quotadash {

// History tab: daily consumption chart, hourly heatmap, weekly pattern and
// recent activity, each in its own card.
class HistoryPanel {
public:
    static constexpr int kChartHeight = 8;
    static constexpr int kMinChartWidth = 30;

    explicit HistoryPanel(const IPlotter& plotter, const Palette& palette = default_palette());

    [[nodiscard]] TextBlock render(const UsageHistory& history, int width, bool loading = false) const;

    [[nodiscard]] TextBlock render_consumption(const UsageHistory& history, int inner_width) const;
    [[nodiscard]] TextBlock render_hourly(const UsageHistory& history) const;
    [[nodiscard]] TextBlock render_weekly(const UsageHistory& history) const;
    [[nodiscard]] TextBlock render_recent(const UsageHistory& history, int inner_width) const;

    // "Peak: 14:00-15:00 (avg 12.3% consumed)"
    static std::string peak_hour_text(const UsageHistory& history);
    // "Peak day: Wed (avg 27.0% consumed)"
    static std::string peak_day_text(const UsageHistory& history);

private:
    const IPlotter& plotter_;
    Palette palette_;
};

} // namespace quotadash
