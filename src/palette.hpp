#pragma once

#include "color.hpp"
#include <string_view>

namespace quotadash {

// Default theme values. The theme registry itself lives outside the renderers;
// every renderer takes a Palette so hosts can substitute their own.
struct Palette {
    // Gradients
    Rgb quota_low{0xff, 0x6b, 0x6b};
    Rgb quota_high{0x51, 0xcf, 0x66};
    Rgb time_start{0xff, 0xd9, 0x3d};
    Rgb time_end{0x6c, 0x5c, 0xe7};

    // Brand accents
    Rgb claude{0xcc, 0x78, 0x5c};
    Rgb gemini{0x42, 0x85, 0xf4};
    Rgb primary{0xff, 0x5f, 0xaf};
    Rgb secondary{0x5f, 0x5f, 0xff};

    // Status
    Rgb success{0x00, 0xd7, 0x87};
    Rgb warning{0xff, 0xd7, 0x00};
    Rgb error{0xff, 0x00, 0x00};

    // Text and background
    Rgb subtle{0x58, 0x58, 0x58};
    Rgb text_primary{0xd0, 0xd0, 0xd0};
    Rgb text_secondary{0x8a, 0x8a, 0x8a};
    Rgb bg_light{0x3a, 0x3a, 0x3a};

    // Chart series
    Rgb chart_red{0xff, 0x00, 0x00};
    Rgb chart_blue{0x00, 0x00, 0xff};
};

const Palette& default_palette();

// >50 success, >20 warning, otherwise error
Rgb quota_color(const Palette& palette, double percent, bool rate_limited = false);
Rgb tier_color(const Palette& palette, std::string_view tier);

} // namespace quotadash
