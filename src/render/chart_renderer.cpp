#include "chart_renderer.hpp"
#include "bar_renderer.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <format>

namespace quotadash {

namespace {

constexpr std::array<std::string_view, 8> kSparkRamp = {"▁", "▂", "▃", "▄", "▅", "▆", "▇", "█"};
constexpr std::array<std::string_view, 4> kHeatRamp = {"░", "▒", "▓", "█"};
constexpr std::string_view kLegendMarker = "■";

constexpr int kMinChartWidth = 20;
constexpr int kMinChartHeight = 3;
constexpr int kMinBarColumns = 10;

double series_max(const std::vector<double>& values) {
    double max_value = 0.0;
    for (double v : values) {
        if (v > max_value) max_value = v;
    }
    return max_value > 0.0 ? max_value : 1.0;
}

const std::vector<std::string>& default_day_names() {
    static const std::vector<std::string> names = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
    return names;
}

Rgb heat_color(const Palette& palette, int intensity) {
    switch (intensity) {
        case 1:
            return palette.success;
        case 2:
            return palette.warning;
        case 3:
            return palette.error;
        default:
            return palette.subtle;
    }
}

} // namespace

GlyphRow render_no_data(const Palette& palette) {
    return make_row(kNoDataText, palette.text_secondary);
}

int ramp_index(double value, double max_value, int levels) {
    if (levels < 1) return 0;
    if (!(max_value > 0.0)) max_value = 1.0;
    if (std::isnan(value)) return 0;
    const long index = std::lround(value / max_value * static_cast<double>(levels - 1));
    return static_cast<int>(std::clamp<long>(index, 0, levels - 1));
}

std::vector<double> normalize_buckets(const std::vector<double>& values, int buckets) {
    std::vector<double> out(std::max(0, buckets), 0.0);
    std::copy_n(values.begin(), std::min(values.size(), out.size()), out.begin());
    return out;
}

std::vector<size_t> sample_indices(size_t length, int width) {
    std::vector<size_t> indices;
    if (length == 0 || width < 1) return indices;

    const double step = std::max(1.0, static_cast<double>(length) / static_cast<double>(width));
    for (int i = 0; i < width; ++i) {
        const auto index = static_cast<size_t>(std::floor(i * step));
        if (index >= length) break;
        indices.push_back(index);
    }
    return indices;
}

TextBlock render_line_chart(const IPlotter& plotter, const std::vector<double>& data,
                            int width, int height, const std::string& caption, const Palette& palette) {
    if (data.empty()) return {render_no_data(palette)};

    PlotOptions options;
    options.width = std::max(width, kMinChartWidth);
    options.height = std::max(height, kMinChartHeight);
    options.caption = caption;
    return plotter.plot({PlotSeries{data, std::nullopt}}, options);
}

TextBlock render_dual_line_chart(const IPlotter& plotter,
                                 const std::vector<double>& claude, const std::vector<double>& gemini,
                                 int width, int height, const std::string& caption, const Palette& palette) {
    if (claude.empty() && gemini.empty()) return {render_no_data(palette)};

    const size_t length = std::max(claude.size(), gemini.size());
    const auto claude_data = normalize_buckets(claude, static_cast<int>(length));
    const auto gemini_data = normalize_buckets(gemini, static_cast<int>(length));

    PlotOptions options;
    options.width = std::max(width, kMinChartWidth);
    options.height = std::max(height, kMinChartHeight);
    options.caption = caption;
    return plotter.plot({PlotSeries{claude_data, palette.chart_red}, PlotSeries{gemini_data, palette.chart_blue}},
                        options);
}

TextBlock render_bar_chart(const std::vector<double>& values, const std::vector<std::string>& labels,
                           int width, const Palette& palette) {
    if (values.empty()) return {render_no_data(palette)};

    const double max_value = series_max(values);

    int label_width = 0;
    for (const auto& label : labels) {
        label_width = std::max(label_width, display_width(label));
    }
    const int bar_columns = std::max(kMinBarColumns, width - label_width - 10);

    TextBlock block;
    for (size_t i = 0; i < values.size(); ++i) {
        const std::string label = i < labels.size() ? labels[i] : std::string();

        GlyphRow row = aligned_text(label, label_width, Align::Right, palette.text_secondary);
        append_text(row, " │", palette.subtle);

        const double value = std::isnan(values[i]) ? 0.0 : values[i];
        const int length = std::clamp(static_cast<int>(value / max_value * bar_columns), 0, bar_columns);
        for (int c = 0; c < length; ++c) {
            row.push_back(Cell{std::string(kGlyphFull), palette.primary, false});
        }
        append_text(row, std::format(" {:.1f}", value), palette.text_primary);
        block.push_back(std::move(row));
    }
    return block;
}

GlyphRow render_hourly_heatmap(const std::vector<double>& hourly, const Palette& palette) {
    const auto buckets = normalize_buckets(hourly, kHeatmapBuckets);
    const double max_value = series_max(buckets);

    GlyphRow row = make_row("00 ", palette.text_secondary);
    for (int hour = 0; hour < kHeatmapBuckets; ++hour) {
        const int intensity = ramp_index(buckets[hour], max_value, static_cast<int>(kHeatRamp.size()));
        row.push_back(Cell{std::string(kHeatRamp[intensity]), heat_color(palette, intensity), false});
        if (hour == 11) {
            append_spaces(row, 1);
        }
    }
    append_text(row, " 23", palette.text_secondary);
    return row;
}

GlyphRow render_weekly_pattern(const std::vector<double>& weekly, const std::vector<std::string>& day_names,
                               const Palette& palette) {
    const auto buckets = normalize_buckets(weekly, kWeekBuckets);
    const auto& names = day_names.size() == kWeekBuckets ? day_names : default_day_names();
    const double max_value = series_max(buckets);

    GlyphRow row;
    for (int day = 0; day < kWeekBuckets; ++day) {
        if (day > 0) append_spaces(row, 1);
        append_text(row, names[day], palette.text_secondary);
        append_spaces(row, 1);
        const int level = ramp_index(buckets[day], max_value, static_cast<int>(kSparkRamp.size()));
        row.push_back(Cell{std::string(kSparkRamp[level]), palette.primary, false});
    }
    return row;
}

GlyphRow render_sparkline(const std::vector<double>& values, int width, const Palette& palette) {
    if (values.empty()) return render_no_data(palette);

    const double max_value = series_max(values);
    GlyphRow row;
    for (size_t index : sample_indices(values.size(), width)) {
        const int level = ramp_index(values[index], max_value, static_cast<int>(kSparkRamp.size()));
        row.push_back(Cell{std::string(kSparkRamp[level]), palette.primary, false});
    }
    return row;
}

GlyphRow render_colored_sparkline(const std::vector<double>& values, int width, const Palette& palette) {
    if (values.empty()) return render_no_data(palette);

    const double max_value = series_max(values);
    GlyphRow row;
    for (size_t index : sample_indices(values.size(), width)) {
        const double value = values[index];
        const int level = ramp_index(value, max_value, static_cast<int>(kSparkRamp.size()));
        // Consumption is inverted onto the remaining-quota scale
        const double consumed_percent = value / max_value * 100.0;
        row.push_back(Cell{std::string(kSparkRamp[level]), quota_color(palette, 100.0 - consumed_percent), false});
    }
    return row;
}

GlyphRow render_legend(const std::vector<LegendItem>& items, const Palette& palette) {
    GlyphRow row;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) append_spaces(row, 2);
        row.push_back(Cell{std::string(kLegendMarker), items[i].color, false});
        append_spaces(row, 1);
        append_row(row, make_row(items[i].label, palette.text_primary));
    }
    return row;
}

} // namespace quotadash
