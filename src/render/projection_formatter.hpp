#pragma once

#include "../glyph_row.hpp"
#include "../palette.hpp"
#include "../quota_info.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace quotadash {

struct ProjectionThresholds {
    double critical_hours = 1.0;  // depletion sooner than this is critical
    double warning_hours = 5.0;   // depletion sooner than this is a warning
};

// Bands for a quota that resets in `seconds_until_reset`: only running out before
// the reset is alarming, so both bands end at the reset. nullopt when no reset
// is known, which leaves the projection Unknown.
std::optional<ProjectionThresholds> thresholds_for_reset(int64_t seconds_until_reset);

ProjectionStatus classify_projection(double session_rate, double session_hours_left,
                                     const ProjectionThresholds& thresholds = {});

// "▲ CRITICAL", "▲ WARNING", "● SAFE"; empty for Unknown
std::string badge_text(ProjectionStatus status);

// "12.5%/hr"; empty when no rate has been observed
std::string rate_text(double session_rate);

// "(Depletes: 2h 30m)", cut to `width` columns with the closing parenthesis kept.
// Empty when there is no rate or the horizon is infinite.
std::string depletion_text(const ProjectionResult& projection, int width);

Rgb status_color(const Palette& palette, ProjectionStatus status);

// Right-aligned, status-colored columns used by the dashboard rows
GlyphRow render_badge(const ProjectionResult& projection, int width, const Palette& palette = default_palette());
GlyphRow render_rate(const ProjectionResult& projection, int width, const Palette& palette = default_palette());
GlyphRow render_depletion(const ProjectionResult& projection, int width, const Palette& palette = default_palette());

} // namespace quotadash
