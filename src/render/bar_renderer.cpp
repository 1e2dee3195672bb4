#include "bar_renderer.hpp"
#include <algorithm>
#include <cmath>
#include <format>

namespace quotadash {

namespace {

constexpr int64_t kHourSeconds = 3600;
constexpr int64_t kDaySeconds = 86400;
constexpr int64_t kProPeriodSeconds = 5 * kHourSeconds;
constexpr double kMaxDurationHours = 1e9;

} // namespace

int filled_columns(double fraction, int width) {
    if (width < 1 || std::isnan(fraction)) return 0;
    const double clamped = std::clamp(fraction, 0.0, 1.0);
    const auto filled = static_cast<int>(std::lround(static_cast<double>(width) * clamped));
    return std::clamp(filled, 0, width);
}

GlyphRow render_gradient_bar(int filled, int width, Rgb from, Rgb to, Rgb empty) {
    GlyphRow row;
    if (width < 1) return row;

    filled = std::clamp(filled, 0, width);
    row.reserve(width);

    const double span = static_cast<double>(std::max(1, width - 1));
    for (int i = 0; i < width; ++i) {
        if (i < filled) {
            row.push_back(Cell{std::string(kGlyphFull), interpolate(from, to, i / span), false});
        } else {
            row.push_back(Cell{std::string(kGlyphLight), empty, false});
        }
    }
    return row;
}

GlyphRow render_bar(double percent, int width, const Palette& palette) {
    if (std::isnan(percent)) percent = 0.0;
    const double clamped = std::clamp(percent, 0.0, 100.0);
    return render_gradient_bar(filled_columns(clamped / 100.0, width), width,
                               palette.quota_low, palette.quota_high, palette.subtle);
}

GlyphRow render_rate_limited_bar(int width, const Palette& palette) {
    GlyphRow row;
    for (int i = 0; i < width; ++i) {
        row.push_back(Cell{std::string(kGlyphLight), palette.error, false});
    }
    return row;
}

int64_t select_reset_period(int64_t seconds_remaining, std::string_view tier) {
    if (tier == "PRO") return kProPeriodSeconds;
    if (seconds_remaining <= kHourSeconds) return kHourSeconds;
    return kDaySeconds;
}

double time_fill_fraction(int64_t seconds_remaining, std::string_view tier) {
    seconds_remaining = std::max<int64_t>(seconds_remaining, 0);
    const int64_t period = select_reset_period(seconds_remaining, tier);
    const double fraction = 1.0 - static_cast<double>(seconds_remaining) / static_cast<double>(period);
    return std::clamp(fraction, 0.0, 1.0);
}

GlyphRow render_time_bar(int64_t seconds_remaining, std::string_view tier, int width, const Palette& palette) {
    const double fraction = time_fill_fraction(seconds_remaining, tier);
    return render_gradient_bar(filled_columns(fraction, width), width,
                               palette.time_start, palette.time_end, palette.subtle);
}

std::string format_duration(double hours) {
    if (std::isnan(hours) || std::isinf(hours) || hours <= 0.0) {
        return "---";
    }

    hours = std::min(hours, kMaxDurationHours);
    const auto whole_hours = static_cast<int64_t>(hours);
    const auto minutes = static_cast<int>((hours - static_cast<double>(whole_hours)) * 60.0);

    if (whole_hours >= 24) {
        return std::format("{}d {:02}h", whole_hours / 24, whole_hours % 24);
    }
    return std::format("{}h {:02}m", whole_hours, minutes);
}

} // namespace quotadash
