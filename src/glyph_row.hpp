#pragma once

#include "color.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace quotadash {

// One terminal column: a single UTF-8 code point and its foreground color
struct Cell {
    std::string glyph;
    Rgb color;
    bool bold = false;

    bool operator==(const Cell&) const = default;
};

using GlyphRow = std::vector<Cell>;
using TextBlock = std::vector<GlyphRow>;

enum class Align {
    Left,
    Right,
    Center
};

// Splits UTF-8 text into cells (one per code point) and appends them
void append_text(GlyphRow& row, std::string_view text, Rgb color, bool bold = false);
void append_row(GlyphRow& row, const GlyphRow& tail);
void append_spaces(GlyphRow& row, int count);

// Text placed inside a fixed-width column; never truncates
GlyphRow aligned_text(std::string_view text, int width, Align align, Rgb color, bool bold = false);

GlyphRow make_row(std::string_view text, Rgb color, bool bold = false);

// Prefixes every row of the block with plain spaces
void indent_block(TextBlock& block, int spaces);

// Number of code points (terminal columns for the glyphs this project emits)
int display_width(std::string_view text);

std::string to_plain(const GlyphRow& row);
std::string to_plain(const TextBlock& block);

// 24-bit SGR escapes, reset at the end of every row
std::string to_ansi(const GlyphRow& row);
std::string to_ansi(const TextBlock& block);

} // namespace quotadash
