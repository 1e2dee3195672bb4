#include "card.hpp"
#include <algorithm>

namespace quotadash {

namespace {

GlyphRow border_row(std::string_view left, std::string_view right, int outer_width, Rgb color) {
    GlyphRow row;
    append_text(row, left, color);
    for (int i = 0; i < outer_width - 2; ++i) {
        append_text(row, "─", color);
    }
    append_text(row, right, color);
    return row;
}

} // namespace

int card_width(int terminal_width) {
    return std::max(terminal_width - 6, kMinCardWidth);
}

int card_inner_width(int terminal_width) {
    return card_width(terminal_width) - kCardChrome;
}

GlyphRow card_title(std::string_view icon, std::string_view title, Rgb icon_color, const Palette& palette) {
    GlyphRow row = make_row(icon, icon_color);
    append_spaces(row, 1);
    append_text(row, title, palette.text_primary, true);
    return row;
}

TextBlock render_card(const TextBlock& content, int outer_width, const Palette& palette) {
    outer_width = std::max(outer_width, kCardChrome + 1);
    const int inner = outer_width - kCardChrome;

    TextBlock card;
    card.push_back(border_row("╭", "╮", outer_width, palette.subtle));
    for (const auto& line : content) {
        GlyphRow row;
        append_text(row, "│", palette.subtle);
        append_spaces(row, 2);

        GlyphRow body = line;
        if (static_cast<int>(body.size()) > inner) {
            body.resize(inner);
        }
        append_row(row, body);
        append_spaces(row, inner - static_cast<int>(body.size()) + 2);
        append_text(row, "│", palette.subtle);
        card.push_back(std::move(row));
    }
    card.push_back(border_row("╰", "╯", outer_width, palette.subtle));
    return card;
}

} // namespace quotadash
