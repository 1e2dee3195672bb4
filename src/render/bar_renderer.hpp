#pragma once

#include "../glyph_row.hpp"
#include "../palette.hpp"
#include <cstdint>
#include <string>
#include <string_view>

namespace quotadash {

inline constexpr std::string_view kGlyphFull = "█";
inline constexpr std::string_view kGlyphLight = "░";

// round(width * fraction) clamped to [0, width]; NaN counts as empty
int filled_columns(double fraction, int width);

// Shared gradient primitive: the first `filled` columns are full blocks colored
// from `from` to `to` across the whole bar width, the rest light shade in `empty`.
GlyphRow render_gradient_bar(int filled, int width, Rgb from, Rgb to, Rgb empty);

// Quota bar: percent clamped to [0,100], low-to-high gradient
GlyphRow render_bar(double percent, int width, const Palette& palette = default_palette());

// Error-colored light-shade bar shown while a metric is rate limited
GlyphRow render_rate_limited_bar(int width, const Palette& palette = default_palette());

// Countdown period for the time bar: PRO 5h, otherwise 1h when the reset is at
// most an hour away, else one day.
int64_t select_reset_period(int64_t seconds_remaining, std::string_view tier);

// clamp(1 - remaining/period, 0, 1): fills as time is consumed
double time_fill_fraction(int64_t seconds_remaining, std::string_view tier);

GlyphRow render_time_bar(int64_t seconds_remaining, std::string_view tier, int width,
                         const Palette& palette = default_palette());

// "1d 01h", "2h 30m"; "---" for non-positive, infinite or NaN input
std::string format_duration(double hours);

} // namespace quotadash
