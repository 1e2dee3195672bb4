#include "ascii_plotter.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <limits>

namespace quotadash {

namespace {

struct GridCell {
    std::string_view glyph = " ";
    Rgb color;
};

} // namespace

AsciiPlotter::AsciiPlotter(const Palette& palette)
    : palette_(palette)
{
}

std::vector<double> AsciiPlotter::resample(const std::vector<double>& values, int width) {
    if (values.empty() || width < 1) return {};
    if (static_cast<int>(values.size()) == width) return values;
    if (values.size() == 1) return std::vector<double>(width, values.front());

    std::vector<double> out(width);
    const double last = static_cast<double>(values.size() - 1);
    for (int i = 0; i < width; ++i) {
        const double pos = width == 1 ? 0.0 : last * i / static_cast<double>(width - 1);
        const auto lo = static_cast<size_t>(std::floor(pos));
        const size_t hi = std::min(lo + 1, values.size() - 1);
        const double frac = pos - static_cast<double>(lo);
        out[i] = values[lo] + (values[hi] - values[lo]) * frac;
    }
    return out;
}

TextBlock AsciiPlotter::plot(const std::vector<PlotSeries>& series, const PlotOptions& options) const {
    TextBlock block;

    std::vector<std::vector<double>> data;
    for (const auto& s : series) {
        data.push_back(options.width > 0 ? resample(s.values, options.width) : s.values);
        for (double& v : data.back()) {
            if (std::isnan(v)) v = 0.0;
        }
    }

    double min_value = std::numeric_limits<double>::infinity();
    double max_value = -std::numeric_limits<double>::infinity();
    size_t columns = 0;
    for (const auto& values : data) {
        for (double v : values) {
            min_value = std::min(min_value, v);
            max_value = std::max(max_value, v);
        }
        columns = std::max(columns, values.size());
    }
    if (columns == 0 || std::isinf(min_value)) return block;

    const double interval = max_value - min_value;
    const int height = options.height > 0 ? options.height : std::max(1, static_cast<int>(std::ceil(interval)));
    const double ratio = interval > 0.0 ? static_cast<double>(height) / interval : 1.0;

    const auto to_row = [&](double v) {
        return static_cast<int>(std::lround(v * ratio)) - static_cast<int>(std::lround(min_value * ratio));
    };
    const int rows = to_row(max_value);

    // Axis labels, top row first
    std::vector<std::string> labels(rows + 1);
    size_t label_width = 0;
    for (int y = 0; y <= rows; ++y) {
        const double magnitude = rows > 0 ? max_value - y * interval / rows : max_value;
        labels[y] = std::format("{:.2f}", magnitude);
        label_width = std::max(label_width, labels[y].size());
    }

    const int offset = static_cast<int>(label_width) + 2;
    std::vector<std::vector<GridCell>> grid(rows + 1, std::vector<GridCell>(columns + offset));
    for (int y = 0; y <= rows; ++y) {
        grid[y][offset - 1] = GridCell{"┤", palette_.text_secondary};
    }

    for (size_t s = 0; s < data.size(); ++s) {
        const auto& values = data[s];
        const Rgb color = series[s].color.value_or(palette_.text_primary);
        if (values.empty()) continue;

        const int first = to_row(values.front());
        grid[rows - first][offset - 1] = GridCell{"┼", palette_.text_secondary};

        for (size_t x = 0; x + 1 < values.size(); ++x) {
            const int y0 = to_row(values[x]);
            const int y1 = to_row(values[x + 1]);
            const size_t col = x + offset;

            if (y0 == y1) {
                grid[rows - y0][col] = GridCell{"─", color};
                continue;
            }
            if (y0 > y1) {
                grid[rows - y1][col] = GridCell{"╰", color};
                grid[rows - y0][col] = GridCell{"╮", color};
            } else {
                grid[rows - y1][col] = GridCell{"╭", color};
                grid[rows - y0][col] = GridCell{"╯", color};
            }
            for (int y = std::min(y0, y1) + 1; y < std::max(y0, y1); ++y) {
                grid[rows - y][col] = GridCell{"│", color};
            }
        }
    }

    for (int y = 0; y <= rows; ++y) {
        GlyphRow row = aligned_text(labels[y], static_cast<int>(label_width) + 1, Align::Right,
                                    palette_.text_secondary);
        for (size_t x = offset - 1; x < grid[y].size(); ++x) {
            row.push_back(Cell{std::string(grid[y][x].glyph), grid[y][x].color, false});
        }
        // Drop trailing blanks so rows stay as narrow as their content
        while (!row.empty() && row.back().glyph == " ") row.pop_back();
        block.push_back(std::move(row));
    }

    if (!options.caption.empty()) {
        const int plot_width = static_cast<int>(columns) + offset;
        block.push_back(aligned_text(options.caption, plot_width, Align::Center, palette_.text_secondary));
        while (!block.back().empty() && block.back().back().glyph == " ") block.back().pop_back();
    }
    return block;
}

} // namespace quotadash
