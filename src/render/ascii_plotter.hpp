#pragma once

#include "../interfaces/i_plotter.hpp"
#include "../palette.hpp"

namespace quotadash {

// Box-drawing line plot with a left value axis and an optional centered caption
class AsciiPlotter : public IPlotter {
public:
    explicit AsciiPlotter(const Palette& palette = default_palette());

    [[nodiscard]] TextBlock plot(const std::vector<PlotSeries>& series,
                                 const PlotOptions& options) const override;

    // Linear resampling of `values` to exactly `width` points
    static std::vector<double> resample(const std::vector<double>& values, int width);

private:
    Palette palette_;
};

} // namespace quotadash
