#include "history_panel.hpp"
#include "../render/chart_renderer.hpp"
#include "card.hpp"
#include <algorithm>
#include <format>

namespace quotadash {

namespace {

GlyphRow indented(const GlyphRow& row) {
    GlyphRow out;
    append_spaces(out, 2);
    append_row(out, row);
    return out;
}

} // namespace

HistoryPanel::HistoryPanel(const IPlotter& plotter, const Palette& palette)
    : plotter_(plotter), palette_(palette)
{
}

std::string HistoryPanel::peak_hour_text(const UsageHistory& history) {
    const auto [hour, value] = peak_hour(history);
    return std::format("Peak: {:02}:00-{:02}:00 (avg {:.1f}% consumed)", hour, (hour + 1) % 24, value);
}

std::string HistoryPanel::peak_day_text(const UsageHistory& history) {
    const auto [day, value] = peak_day(history);
    return std::format("Peak day: {} (avg {:.1f}% consumed)", day, value);
}

TextBlock HistoryPanel::render_consumption(const UsageHistory& history, int inner_width) const {
    TextBlock rows;
    rows.push_back(card_title("◈", "Daily Consumption", palette_.primary, palette_));
    rows.emplace_back();

    const size_t days = std::max(history.daily_claude.size(), history.daily_gemini.size());
    if (days == 0) {
        rows.push_back(indented(render_no_data(palette_)));
        return rows;
    }

    // The value axis takes the remaining columns
    const int chart_width = std::max(inner_width - 8, kMinChartWidth);
    const auto caption = std::format("Last {} days - Claude (red) vs Gemini (blue)", days);
    auto chart = render_dual_line_chart(plotter_, history.daily_claude, history.daily_gemini,
                                        chart_width, kChartHeight, caption, palette_);
    rows.insert(rows.end(), chart.begin(), chart.end());

    rows.emplace_back();
    rows.push_back(indented(render_legend({{"Claude", palette_.chart_red}, {"Gemini", palette_.chart_blue}},
                                          palette_)));
    return rows;
}

TextBlock HistoryPanel::render_hourly(const UsageHistory& history) const {
    TextBlock rows;
    rows.push_back(card_title("◷", "Hourly Pattern", palette_.primary, palette_));
    rows.emplace_back();

    if (history.hourly.empty()) {
        rows.push_back(indented(render_no_data(palette_)));
        return rows;
    }

    rows.push_back(indented(render_hourly_heatmap(history.hourly, palette_)));
    rows.push_back(indented(make_row(peak_hour_text(history), palette_.text_secondary)));
    return rows;
}

TextBlock HistoryPanel::render_weekly(const UsageHistory& history) const {
    TextBlock rows;
    rows.push_back(card_title("▦", "Weekly Pattern", palette_.primary, palette_));
    rows.emplace_back();

    if (history.weekly.empty()) {
        rows.push_back(indented(render_no_data(palette_)));
        return rows;
    }

    rows.push_back(indented(render_weekly_pattern(history.weekly, history.day_names, palette_)));
    rows.push_back(indented(make_row(peak_day_text(history), palette_.text_secondary)));
    return rows;
}

TextBlock HistoryPanel::render_recent(const UsageHistory& history, int inner_width) const {
    TextBlock rows;
    rows.push_back(card_title("∿", "Recent Activity", palette_.primary, palette_));
    rows.emplace_back();
    rows.push_back(indented(render_colored_sparkline(history.recent, std::max(inner_width - 2, 1), palette_)));
    return rows;
}

TextBlock HistoryPanel::render(const UsageHistory& history, int width, bool loading) const {
    const int outer = card_width(width);
    const int inner = card_inner_width(width);

    TextBlock body;
    body.push_back(make_row("History", palette_.primary, true));
    body.emplace_back();

    if (loading) {
        body.push_back(make_row("Loading history data...", palette_.text_secondary));
        return body;
    }
    if (history.empty()) {
        body.push_back(make_row("No historical data available yet.", palette_.text_secondary));
        body.push_back(make_row("Data will appear as quota snapshots are recorded.", palette_.text_secondary));
        return body;
    }

    for (const auto& content : {render_consumption(history, inner), render_hourly(history),
                                render_weekly(history), render_recent(history, inner)}) {
        auto card = render_card(content, outer, palette_);
        body.insert(body.end(), card.begin(), card.end());
    }
    return body;
}

} // namespace quotadash
