#include "glyph_row.hpp"
#include <algorithm>
#include <format>

namespace quotadash {

namespace {

size_t code_point_length(unsigned char lead) {
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 1;  // Stray continuation byte, keep it as its own cell
}

} // namespace

void append_text(GlyphRow& row, std::string_view text, Rgb color, bool bold) {
    size_t pos = 0;
    while (pos < text.size()) {
        size_t len = code_point_length(static_cast<unsigned char>(text[pos]));
        len = std::min(len, text.size() - pos);
        row.push_back(Cell{std::string(text.substr(pos, len)), color, bold});
        pos += len;
    }
}

void append_row(GlyphRow& row, const GlyphRow& tail) {
    row.insert(row.end(), tail.begin(), tail.end());
}

void append_spaces(GlyphRow& row, int count) {
    for (int i = 0; i < count; ++i) {
        row.push_back(Cell{" ", Rgb{}, false});
    }
}

GlyphRow aligned_text(std::string_view text, int width, Align align, Rgb color, bool bold) {
    GlyphRow cells;
    append_text(cells, text, color, bold);

    const int padding = std::max(0, width - static_cast<int>(cells.size()));
    int left = 0;
    switch (align) {
        case Align::Left:
            left = 0;
            break;
        case Align::Right:
            left = padding;
            break;
        case Align::Center:
            left = padding / 2;
            break;
    }

    GlyphRow row;
    row.reserve(cells.size() + padding);
    append_spaces(row, left);
    append_row(row, cells);
    append_spaces(row, padding - left);
    return row;
}

GlyphRow make_row(std::string_view text, Rgb color, bool bold) {
    GlyphRow row;
    append_text(row, text, color, bold);
    return row;
}

void indent_block(TextBlock& block, int spaces) {
    for (auto& row : block) {
        GlyphRow indented;
        append_spaces(indented, spaces);
        append_row(indented, row);
        row = std::move(indented);
    }
}

int display_width(std::string_view text) {
    int width = 0;
    size_t pos = 0;
    while (pos < text.size()) {
        pos += code_point_length(static_cast<unsigned char>(text[pos]));
        ++width;
    }
    return width;
}

std::string to_plain(const GlyphRow& row) {
    std::string out;
    for (const auto& cell : row) {
        out += cell.glyph;
    }
    return out;
}

std::string to_plain(const TextBlock& block) {
    std::string out;
    for (size_t i = 0; i < block.size(); ++i) {
        if (i > 0) out += '\n';
        out += to_plain(block[i]);
    }
    return out;
}

std::string to_ansi(const GlyphRow& row) {
    std::string out;
    bool have_style = false;
    Rgb current{};
    bool current_bold = false;

    for (const auto& cell : row) {
        if (cell.glyph == " ") {
            out += ' ';
            continue;
        }
        if (!have_style || cell.color != current || cell.bold != current_bold) {
            out += cell.bold ? "\x1b[0;1m" : "\x1b[0m";
            out += std::format("\x1b[38;2;{};{};{}m", cell.color.r, cell.color.g, cell.color.b);
            current = cell.color;
            current_bold = cell.bold;
            have_style = true;
        }
        out += cell.glyph;
    }
    if (have_style) out += "\x1b[0m";
    return out;
}

std::string to_ansi(const TextBlock& block) {
    std::string out;
    for (size_t i = 0; i < block.size(); ++i) {
        if (i > 0) out += '\n';
        out += to_ansi(block[i]);
    }
    return out;
}

} // namespace quotadash
