#pragma once

#include "../glyph_row.hpp"
#include "../palette.hpp"
#include <cstdint>
#include <string_view>

namespace quotadash {

// Loading-state animation: a highlight band that sweeps back and forth.
//
// The cycle position t = (frame mod cycle) / cycle is folded into a triangle
// wave and eased with smoothstep, so the band slows down at both ends. Columns
// within 3 of the band center use the accent color, within 5 a dimmer glyph,
// the rest the background glyph.

inline constexpr std::string_view kShimmerSolid = "▓";
inline constexpr std::string_view kShimmerDim = "▒";
inline constexpr std::string_view kShimmerBackground = "░";

// Eased position in [0,1] for the given frame; cycle_period <= 0 counts as 1
double shimmer_phase(uint64_t frame, int cycle_period);

// Band center column: eased*width, or (1-eased)*width when reversed
int shimmer_center(int width, uint64_t frame, int cycle_period, bool reverse);

GlyphRow render_shimmer(int width, uint64_t frame, int cycle_period, Rgb accent, bool reverse,
                        const Palette& palette = default_palette());

// Braille spinner, one step every two frames
std::string_view spinner_glyph(uint64_t frame);

} // namespace quotadash
