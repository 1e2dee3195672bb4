#include "tui_colors.hpp"
#include <map>

namespace quotadash {

namespace {

// Terminal color index -> allocated pair
std::map<int, int> g_pairs;
int g_next_pair = COLOR_PAIR_FIRST_DYNAMIC;

// Nearest of the eight ANSI colors, for terminals without 256-color support
int to_basic_color(Rgb color) {
    return (color.r > 127 ? COLOR_RED : 0) | (color.g > 127 ? COLOR_GREEN : 0) | (color.b > 127 ? COLOR_BLUE : 0);
}

} // namespace

void init_colors() {
    g_pairs.clear();
    g_next_pair = COLOR_PAIR_FIRST_DYNAMIC;

    if (!has_colors()) {
        return;
    }

    start_color();
    use_default_colors();

    init_pair(COLOR_PAIR_DEFAULT, -1, -1);  // Default terminal colors
    init_pair(COLOR_PAIR_STATUS, COLOR_WHITE, COLOR_BLUE);
    init_pair(COLOR_PAIR_TAB_ACTIVE, COLOR_BLACK, COLOR_MAGENTA);
    init_pair(COLOR_PAIR_TAB_INACTIVE, COLOR_WHITE, -1);
    init_pair(COLOR_PAIR_ERROR, COLOR_RED, COLOR_BLUE);
    init_pair(COLOR_PAIR_HELP_KEY, COLOR_CYAN, COLOR_BLUE);
    init_pair(COLOR_PAIR_DIALOG, COLOR_WHITE, COLOR_BLUE);
}

int color_pair_for(Rgb color) {
    if (!has_colors()) return COLOR_PAIR_DEFAULT;

    const int index = COLORS >= 256 ? to_xterm256(color) : to_basic_color(color);
    if (const auto it = g_pairs.find(index); it != g_pairs.end()) {
        return it->second;
    }

    if (g_next_pair >= COLOR_PAIRS) return COLOR_PAIR_DEFAULT;

    const int pair = g_next_pair++;
    init_pair(static_cast<short>(pair), static_cast<short>(index), -1);
    g_pairs.emplace(index, pair);
    return pair;
}

} // namespace quotadash
