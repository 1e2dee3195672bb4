#pragma once

#include "../glyph_row.hpp"
#include "../palette.hpp"
#include <string_view>

namespace quotadash {

// Rounded border plus two columns of horizontal padding on each side
inline constexpr int kCardChrome = 6;
inline constexpr int kMinCardWidth = 40;

// Outer card width for a terminal width
int card_width(int terminal_width);

// Columns available to card content
int card_inner_width(int terminal_width);

// "◈ Title" heading row
GlyphRow card_title(std::string_view icon, std::string_view title, Rgb icon_color,
                    const Palette& palette = default_palette());

// Frames the content in a rounded border; rows are padded or clipped to the inner width
TextBlock render_card(const TextBlock& content, int outer_width, const Palette& palette = default_palette());

} // namespace quotadash
