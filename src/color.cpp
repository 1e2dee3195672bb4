#include "color.hpp"
#include <algorithm>
#include <charconv>
#include <cmath>
#include <format>

namespace quotadash {

namespace {

uint8_t lerp_channel(uint8_t from, uint8_t to, double t) {
    const double value = static_cast<double>(from) + t * (static_cast<double>(to) - static_cast<double>(from));
    if (std::isnan(value)) return from;
    const auto truncated = static_cast<long long>(std::clamp(value, -1.0, 256.0));
    return static_cast<uint8_t>(std::clamp(truncated, 0LL, 255LL));
}

// Levels used by the 6x6x6 xterm color cube
constexpr int kCubeLevels[6] = {0x00, 0x5f, 0x87, 0xaf, 0xd7, 0xff};

int nearest_cube_index(int channel) {
    int best = 0;
    for (int i = 1; i < 6; ++i) {
        if (std::abs(kCubeLevels[i] - channel) < std::abs(kCubeLevels[best] - channel)) {
            best = i;
        }
    }
    return best;
}

int distance_sq(int r1, int g1, int b1, int r2, int g2, int b2) {
    return (r1 - r2) * (r1 - r2) + (g1 - g2) * (g1 - g2) + (b1 - b2) * (b1 - b2);
}

} // namespace

Rgb interpolate(Rgb from, Rgb to, double t) {
    return Rgb{
        lerp_channel(from.r, to.r, t),
        lerp_channel(from.g, to.g, t),
        lerp_channel(from.b, to.b, t),
    };
}

std::optional<Rgb> parse_hex(std::string_view hex) {
    if (!hex.empty() && hex.front() == '#') {
        hex.remove_prefix(1);
    }
    if (hex.size() != 6) return std::nullopt;

    uint8_t channels[3] = {};
    for (int i = 0; i < 3; ++i) {
        const char* first = hex.data() + i * 2;
        auto [ptr, ec] = std::from_chars(first, first + 2, channels[i], 16);
        if (ec != std::errc{} || ptr != first + 2) return std::nullopt;
    }
    return Rgb{channels[0], channels[1], channels[2]};
}

std::string to_hex(Rgb color) {
    return std::format("#{:02x}{:02x}{:02x}", color.r, color.g, color.b);
}

int to_xterm256(Rgb color) {
    const int ri = nearest_cube_index(color.r);
    const int gi = nearest_cube_index(color.g);
    const int bi = nearest_cube_index(color.b);
    const int cube_index = 16 + 36 * ri + 6 * gi + bi;
    const int cube_dist = distance_sq(color.r, color.g, color.b,
                                      kCubeLevels[ri], kCubeLevels[gi], kCubeLevels[bi]);

    // Gray ramp 232..255 covers 8..238 in steps of 10
    const int avg = (color.r + color.g + color.b) / 3;
    const int gray_step = std::clamp((avg - 8 + 5) / 10, 0, 23);
    const int gray_level = 8 + gray_step * 10;
    const int gray_dist = distance_sq(color.r, color.g, color.b, gray_level, gray_level, gray_level);

    return gray_dist < cube_dist ? 232 + gray_step : cube_index;
}

} // namespace quotadash
