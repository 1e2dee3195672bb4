#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace quotadash {

struct Rgb {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    bool operator==(const Rgb&) const = default;
};

// Per-channel linear interpolation, truncated toward zero.
// t outside [0,1] extrapolates; results saturate at the byte range.
Rgb interpolate(Rgb from, Rgb to, double t);

// "#rrggbb" or "rrggbb"
std::optional<Rgb> parse_hex(std::string_view hex);
std::string to_hex(Rgb color);

// Nearest entry of the xterm 256-color palette (cube or gray ramp)
int to_xterm256(Rgb color);

} // namespace quotadash
