#include "shimmer.hpp"
#include <array>
#include <cstdlib>
#include <string>

namespace quotadash {

namespace {

constexpr std::array<std::string_view, 10> kSpinnerFrames = {
    "⠋", "⠙", "⠹", "⠸", "⠼", "⠴", "⠦", "⠧", "⠇", "⠏"};

constexpr int kSolidRadius = 3;
constexpr int kDimRadius = 5;

} // namespace

double shimmer_phase(uint64_t frame, int cycle_period) {
    const uint64_t cycle = cycle_period > 0 ? static_cast<uint64_t>(cycle_period) : 1;
    const double t = static_cast<double>(frame % cycle) / static_cast<double>(cycle);
    const double p = t < 0.5 ? t * 2.0 : (1.0 - t) * 2.0;
    return p * p * (3.0 - 2.0 * p);
}

int shimmer_center(int width, uint64_t frame, int cycle_period, bool reverse) {
    const double eased = shimmer_phase(frame, cycle_period);
    const double position = reverse ? 1.0 - eased : eased;
    return static_cast<int>(position * static_cast<double>(width));
}

GlyphRow render_shimmer(int width, uint64_t frame, int cycle_period, Rgb accent, bool reverse,
                        const Palette& palette) {
    GlyphRow row;
    if (width < 1) return row;
    row.reserve(width);

    const int center = shimmer_center(width, frame, cycle_period, reverse);
    for (int i = 0; i < width; ++i) {
        const int dist = std::abs(center - i);
        if (dist < kSolidRadius) {
            row.push_back(Cell{std::string(kShimmerSolid), accent, false});
        } else if (dist < kDimRadius) {
            row.push_back(Cell{std::string(kShimmerDim), palette.text_secondary, false});
        } else {
            row.push_back(Cell{std::string(kShimmerBackground), palette.bg_light, false});
        }
    }
    return row;
}

std::string_view spinner_glyph(uint64_t frame) {
    return kSpinnerFrames[(frame / 2) % kSpinnerFrames.size()];
}

} // namespace quotadash
