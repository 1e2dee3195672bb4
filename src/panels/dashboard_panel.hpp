#pragma once

#include "../animation/metric_animation_scheduler.hpp"
#include "../glyph_row.hpp"
#include "../palette.hpp"
#include "../quota_info.hpp"
#include "../viewmodels/dashboard_view_model.hpp"
#include <chrono>
#include <cstdint>
#include <string_view>
#include <vector>

namespace quotadash {

struct SyncResult {
    bool animating = false;  // some metric is converging; keep ticking
    bool pending = false;    // some account has not loaded yet; keep the shimmer running
};

// Composes the account cards of the dashboard tab from the bar, shimmer and
// projection renderers. Row layout, left to right:
//
//   indent(4) bar(n) ' ' percent(6) ' ' rate(10) ' ' badge(10)
//   indent(4) bar(n) ' ' reset(6)   ' ' depletion(21)
//
// where n = max(content_width - 34, 10).
class DashboardPanel {
public:
    static constexpr int kIndentWidth = 4;
    static constexpr int kPercentWidth = 6;
    static constexpr int kRateWidth = 10;
    static constexpr int kBadgeWidth = 10;
    static constexpr int kMinBarWidth = 10;
    static constexpr int kMinContentWidth = 20;
    static constexpr int kMaxEmailWidth = 35;

    static constexpr int kQuotaShimmerCycle = 120;
    static constexpr int kClaudeTimeShimmerCycle = 80;
    static constexpr int kTimeShimmerCycle = 100;

    explicit DashboardPanel(const Palette& palette = default_palette());

    // Pushes every loaded family's display percent into the scheduler as a target
    SyncResult sync_targets(const std::vector<AccountQuota>& accounts, MetricAnimationScheduler& scheduler,
                            std::chrono::system_clock::time_point now) const;

    // Complete tab body for a terminal `width`
    [[nodiscard]] TextBlock render(const DashboardViewModel& view_model, const MetricAnimationScheduler& scheduler,
                                   uint64_t frame, int width, std::chrono::system_clock::time_point now) const;

    static int bar_width_for(int content_width);

    [[nodiscard]] GlyphRow render_quota_line(double percent, int bar_width, const ProjectionResult* projection) const;
    [[nodiscard]] GlyphRow render_time_line(int64_t reset_seconds, std::string_view tier, int bar_width,
                                            const ProjectionResult* projection) const;
    [[nodiscard]] GlyphRow render_rate_limited_line(int bar_width) const;
    [[nodiscard]] GlyphRow render_total_line(double percent, int bar_width) const;

    // Shimmer rows for an account still loading; `accent` picks the brand color
    [[nodiscard]] GlyphRow render_loading_line(Rgb accent, int cycle_period, bool reverse, uint64_t frame,
                                               int bar_width, int trailing_width) const;

    [[nodiscard]] GlyphRow render_account_header(const AccountQuota& account, bool selected) const;

    [[nodiscard]] TextBlock render_account(const AccountQuota& account, bool selected,
                                           const DashboardViewModel& view_model,
                                           const MetricAnimationScheduler& scheduler, uint64_t frame,
                                           int content_width, std::chrono::system_clock::time_point now) const;

private:
    [[nodiscard]] GlyphRow family_label(ModelFamily family) const;
    [[nodiscard]] GlyphRow total_label() const;
    [[nodiscard]] Rgb family_color(ModelFamily family) const;

    void append_family(TextBlock& lines, const AccountQuota& account, ModelFamily family,
                       const DashboardViewModel& view_model, const MetricAnimationScheduler& scheduler,
                       int bar_width, std::chrono::system_clock::time_point now) const;
    void append_loading(TextBlock& lines, uint64_t frame, int bar_width) const;
    void append_error(TextBlock& lines, int bar_width) const;

    Palette palette_;
};

} // namespace quotadash
