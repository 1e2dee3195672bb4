#pragma once

#include "../color.hpp"
#include <ncurses.h>

namespace quotadash {

// Fixed color pair indices; glyph colors are allocated after these
enum ColorPair {
    COLOR_PAIR_DEFAULT = 1,
    COLOR_PAIR_STATUS,
    COLOR_PAIR_TAB_ACTIVE,
    COLOR_PAIR_TAB_INACTIVE,
    COLOR_PAIR_ERROR,
    COLOR_PAIR_HELP_KEY,
    COLOR_PAIR_DIALOG,
    COLOR_PAIR_FIRST_DYNAMIC,
};

// Initialize ncurses color pairs
void init_colors();

// Pair drawing `color` on the default background, allocated on first use.
// Falls back to COLOR_PAIR_DEFAULT when the terminal runs out of pairs.
int color_pair_for(Rgb color);

} // namespace quotadash
