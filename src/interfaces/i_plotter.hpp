#pragma once

#include "../glyph_row.hpp"
#include <optional>
#include <string>
#include <vector>

namespace quotadash {

struct PlotSeries {
    std::vector<double> values;
    std::optional<Rgb> color;
};

struct PlotOptions {
    int width = 0;
    int height = 0;
    std::string caption;
};

// Plots one or more series onto a height x width character grid with a value axis
class IPlotter {
public:
    virtual ~IPlotter() = default;

    [[nodiscard]] virtual TextBlock plot(const std::vector<PlotSeries>& series,
                                         const PlotOptions& options) const = 0;
};

} // namespace quotadash
