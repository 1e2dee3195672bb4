#pragma once

#include "../glyph_row.hpp"
#include "../interfaces/i_plotter.hpp"
#include "../palette.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace quotadash {

inline constexpr std::string_view kNoDataText = "No data available";
inline constexpr int kHeatmapBuckets = 24;
inline constexpr int kWeekBuckets = 7;

struct LegendItem {
    std::string label;
    Rgb color;
};

// Explicit placeholder for empty series
GlyphRow render_no_data(const Palette& palette = default_palette());

// round(value / max * (levels - 1)) clamped to [0, levels-1]; max <= 0 counts as 1
int ramp_index(double value, double max_value, int levels);

// Pads with zeros or truncates to `buckets` entries
std::vector<double> normalize_buckets(const std::vector<double>& values, int buckets);

// Index of each sampled point: floor(i * step), step = max(1, len/width)
std::vector<size_t> sample_indices(size_t length, int width);

// Single series through the plotter; width >= 20, height >= 3
TextBlock render_line_chart(const IPlotter& plotter, const std::vector<double>& data,
                            int width, int height, const std::string& caption,
                            const Palette& palette = default_palette());

// Two series, the shorter zero-padded to the longer; Claude red, Gemini blue
TextBlock render_dual_line_chart(const IPlotter& plotter,
                                 const std::vector<double>& claude, const std::vector<double>& gemini,
                                 int width, int height, const std::string& caption,
                                 const Palette& palette = default_palette());

// Horizontal bars scaled to the series maximum; missing labels are empty
TextBlock render_bar_chart(const std::vector<double>& values, const std::vector<std::string>& labels,
                           int width, const Palette& palette = default_palette());

// "00 " + 24 intensity cells with a gap after 11:00 + " 23"
GlyphRow render_hourly_heatmap(const std::vector<double>& hourly, const Palette& palette = default_palette());

// "Sun ▁ Mon ▃ ..."; day names fall back to Sun..Sat unless exactly seven are given
GlyphRow render_weekly_pattern(const std::vector<double>& weekly, const std::vector<std::string>& day_names,
                               const Palette& palette = default_palette());

GlyphRow render_sparkline(const std::vector<double>& values, int width, const Palette& palette = default_palette());

// Sparkline whose points are colored by relative consumption (high = error)
GlyphRow render_colored_sparkline(const std::vector<double>& values, int width,
                                  const Palette& palette = default_palette());

// "■ label" entries joined by two spaces
GlyphRow render_legend(const std::vector<LegendItem>& items, const Palette& palette = default_palette());

} // namespace quotadash
