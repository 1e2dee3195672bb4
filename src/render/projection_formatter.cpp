#include "projection_formatter.hpp"
#include "bar_renderer.hpp"
#include <algorithm>
#include <cmath>
#include <format>

namespace quotadash {

std::optional<ProjectionThresholds> thresholds_for_reset(int64_t seconds_until_reset) {
    if (seconds_until_reset <= 0) return std::nullopt;

    const double hours_until_reset = static_cast<double>(seconds_until_reset) / 3600.0;
    ProjectionThresholds thresholds;
    thresholds.critical_hours = std::min(thresholds.critical_hours, hours_until_reset);
    thresholds.warning_hours = hours_until_reset;
    return thresholds;
}

ProjectionStatus classify_projection(double session_rate, double session_hours_left,
                                     const ProjectionThresholds& thresholds) {
    if (!(session_rate > 0.0)) return ProjectionStatus::Unknown;
    if (std::isnan(session_hours_left) || std::isinf(session_hours_left)) return ProjectionStatus::Unknown;

    if (session_hours_left < thresholds.critical_hours) return ProjectionStatus::Critical;
    if (session_hours_left < thresholds.warning_hours) return ProjectionStatus::Warning;
    return ProjectionStatus::Safe;
}

std::string badge_text(ProjectionStatus status) {
    switch (status) {
        case ProjectionStatus::Critical:
            return "▲ CRITICAL";
        case ProjectionStatus::Warning:
            return "▲ WARNING";
        case ProjectionStatus::Safe:
            return "● SAFE";
        case ProjectionStatus::Unknown:
            break;
    }
    return {};
}

std::string rate_text(double session_rate) {
    if (!(session_rate > 0.0)) return {};
    return std::format("{:.1f}%/hr", session_rate);
}

std::string depletion_text(const ProjectionResult& projection, int width) {
    if (!(projection.session_rate > 0.0) || std::isinf(projection.session_hours_left)) {
        return {};
    }

    std::string text = std::format("(Depletes: {})", format_duration(projection.session_hours_left));
    if (width >= 1 && static_cast<int>(text.size()) > width) {
        text = text.substr(0, width - 1) + ")";
    }
    return text;
}

Rgb status_color(const Palette& palette, ProjectionStatus status) {
    switch (status) {
        case ProjectionStatus::Critical:
            return palette.error;
        case ProjectionStatus::Warning:
            return palette.warning;
        case ProjectionStatus::Safe:
            return palette.success;
        case ProjectionStatus::Unknown:
            break;
    }
    return palette.subtle;
}

namespace {

bool is_bold(ProjectionStatus status) {
    return status == ProjectionStatus::Critical || status == ProjectionStatus::Warning;
}

// Rate and depletion text stay muted unless the projection is alarming
Rgb detail_color(const Palette& palette, ProjectionStatus status) {
    if (status == ProjectionStatus::Critical || status == ProjectionStatus::Warning) {
        return status_color(palette, status);
    }
    return palette.text_secondary;
}

} // namespace

GlyphRow render_badge(const ProjectionResult& projection, int width, const Palette& palette) {
    return aligned_text(badge_text(projection.status), width, Align::Right,
                        status_color(palette, projection.status), is_bold(projection.status));
}

GlyphRow render_rate(const ProjectionResult& projection, int width, const Palette& palette) {
    return aligned_text(rate_text(projection.session_rate), width, Align::Right,
                        detail_color(palette, projection.status));
}

GlyphRow render_depletion(const ProjectionResult& projection, int width, const Palette& palette) {
    return aligned_text(depletion_text(projection, width), width, Align::Right,
                        detail_color(palette, projection.status));
}

} // namespace quotadash
