#include "dashboard_panel.hpp"
#include "../render/bar_renderer.hpp"
#include "../render/projection_formatter.hpp"
#include "../render/shimmer.hpp"
#include "card.hpp"
#include <algorithm>
#include <format>

namespace quotadash {

namespace {

constexpr ModelFamily kFamilies[] = {ModelFamily::Claude, ModelFamily::Gemini};

GlyphRow indent_row() {
    GlyphRow row;
    append_spaces(row, DashboardPanel::kIndentWidth);
    return row;
}

GlyphRow percent_cell(double percent, const Palette& palette) {
    return aligned_text(std::format("{:.0f}%", percent), DashboardPanel::kPercentWidth, Align::Right,
                        quota_color(palette, percent));
}

} // namespace

DashboardPanel::DashboardPanel(const Palette& palette)
    : palette_(palette)
{
}

SyncResult DashboardPanel::sync_targets(const std::vector<AccountQuota>& accounts,
                                        MetricAnimationScheduler& scheduler,
                                        std::chrono::system_clock::time_point now) const {
    SyncResult result;
    for (const auto& account : accounts) {
        if (!account.loaded) {
            result.pending = true;
            continue;
        }
        if (!account.error.empty()) continue;

        for (ModelFamily family : kFamilies) {
            const auto summary = summarize_family(account.quotas, family, now);
            if (!summary) continue;

            const std::string key = metric_key(account.email, family);
            const auto* state = scheduler.find(key);
            if (!state || state->target_percent != summary->percent) {
                scheduler.set_target(key, summary->percent);
            }
        }
    }
    result.animating = scheduler.is_animating();
    return result;
}

int DashboardPanel::bar_width_for(int content_width) {
    const int right_side = kPercentWidth + kRateWidth + kBadgeWidth;
    return std::max(content_width - kIndentWidth - right_side - 4, kMinBarWidth);
}

GlyphRow DashboardPanel::render_quota_line(double percent, int bar_width, const ProjectionResult* projection) const {
    GlyphRow row = indent_row();
    append_row(row, render_bar(percent, bar_width, palette_));
    append_spaces(row, 1);
    append_row(row, percent_cell(percent, palette_));
    append_spaces(row, 1);
    if (projection) {
        append_row(row, render_rate(*projection, kRateWidth, palette_));
    } else {
        append_spaces(row, kRateWidth);
    }
    append_spaces(row, 1);
    if (projection) {
        append_row(row, render_badge(*projection, kBadgeWidth, palette_));
    } else {
        append_spaces(row, kBadgeWidth);
    }
    return row;
}

GlyphRow DashboardPanel::render_time_line(int64_t reset_seconds, std::string_view tier, int bar_width,
                                          const ProjectionResult* projection) const {
    const int depletion_width = kRateWidth + kBadgeWidth;

    GlyphRow row = indent_row();
    append_row(row, render_time_bar(reset_seconds, tier, bar_width, palette_));
    append_spaces(row, 1);
    append_row(row, aligned_text(format_duration(static_cast<double>(reset_seconds) / 3600.0), kPercentWidth,
                                 Align::Right, palette_.text_secondary));
    append_spaces(row, 1);
    if (projection) {
        append_row(row, render_depletion(*projection, depletion_width, palette_));
    } else {
        append_spaces(row, depletion_width);
    }
    return row;
}

GlyphRow DashboardPanel::render_rate_limited_line(int bar_width) const {
    GlyphRow row = indent_row();
    append_row(row, render_rate_limited_bar(bar_width, palette_));
    append_spaces(row, 1);
    append_row(row, aligned_text("RATE LIMITED", kPercentWidth + 1 + kRateWidth, Align::Right, palette_.error, true));
    return row;
}

GlyphRow DashboardPanel::render_total_line(double percent, int bar_width) const {
    percent = std::clamp(percent, 0.0, 100.0);

    GlyphRow row = indent_row();
    append_row(row, render_bar(percent, bar_width, palette_));
    append_spaces(row, 1);
    append_row(row, percent_cell(percent, palette_));
    append_spaces(row, 1 + kRateWidth + 1 + kBadgeWidth);
    return row;
}

GlyphRow DashboardPanel::render_loading_line(Rgb accent, int cycle_period, bool reverse, uint64_t frame,
                                             int bar_width, int trailing_width) const {
    GlyphRow row = indent_row();
    append_row(row, render_shimmer(bar_width, frame, cycle_period, accent, reverse, palette_));
    append_spaces(row, 1);
    append_row(row, aligned_text(spinner_glyph(frame), kPercentWidth, Align::Right, accent));
    append_spaces(row, 1 + trailing_width);
    return row;
}

GlyphRow DashboardPanel::render_account_header(const AccountQuota& account, bool selected) const {
    GlyphRow row;
    if (selected) {
        append_text(row, "▸ ", palette_.primary, true);
    } else {
        append_spaces(row, 2);
    }

    if (account.is_active) {
        append_text(row, "● ", palette_.success);
    } else {
        append_text(row, "○ ", palette_.subtle);
    }

    GlyphRow email = make_row(account.email, palette_.text_primary, true);
    if (static_cast<int>(email.size()) > kMaxEmailWidth) {
        email.resize(kMaxEmailWidth - 3);
        append_text(email, "...", palette_.text_primary, true);
    }
    append_row(row, email);
    append_spaces(row, 1);

    const std::string tier = account.tier.empty() ? "UNKNOWN" : account.tier;
    const std::string_view icon = tier == "PRO" ? "◆" : "◇";
    append_text(row, std::format("{} {}", icon, tier), tier_color(palette_, tier));
    return row;
}

Rgb DashboardPanel::family_color(ModelFamily family) const {
    return family == ModelFamily::Claude ? palette_.claude : palette_.gemini;
}

GlyphRow DashboardPanel::family_label(ModelFamily family) const {
    const Rgb color = family_color(family);
    GlyphRow row;
    append_spaces(row, 2);
    append_text(row, family == ModelFamily::Claude ? "⬡" : "◎", color);
    append_spaces(row, 1);
    append_text(row, family == ModelFamily::Claude ? "Claude" : "Gemini", color, true);
    return row;
}

GlyphRow DashboardPanel::total_label() const {
    GlyphRow row;
    append_spaces(row, 2);
    append_text(row, "◈", palette_.primary);
    append_spaces(row, 1);
    append_text(row, "Total Quota Left", palette_.primary, true);
    return row;
}

void DashboardPanel::append_family(TextBlock& lines, const AccountQuota& account, ModelFamily family,
                                   const DashboardViewModel& view_model, const MetricAnimationScheduler& scheduler,
                                   int bar_width, std::chrono::system_clock::time_point now) const {
    const auto summary = summarize_family(account.quotas, family, now);
    if (!summary) return;

    const std::string key = metric_key(account.email, family);
    const ProjectionResult* projection = view_model.projection_for(key);

    lines.push_back(family_label(family));
    if (summary->is_rate_limited) {
        lines.push_back(render_rate_limited_line(bar_width));
    } else {
        lines.push_back(render_quota_line(scheduler.current_percent(key, summary->percent), bar_width, projection));
    }
    if (summary->reset_seconds > 0) {
        lines.push_back(render_time_line(summary->reset_seconds, account.tier, bar_width, projection));
    }
}

void DashboardPanel::append_loading(TextBlock& lines, uint64_t frame, int bar_width) const {
    const int quota_trailing = kRateWidth + 1 + kBadgeWidth;
    const int time_trailing = kRateWidth + kBadgeWidth;

    for (ModelFamily family : kFamilies) {
        const Rgb accent = family_color(family);
        const int time_cycle = family == ModelFamily::Claude ? kClaudeTimeShimmerCycle : kTimeShimmerCycle;
        lines.push_back(family_label(family));
        lines.push_back(render_loading_line(accent, kQuotaShimmerCycle, false, frame, bar_width, quota_trailing));
        lines.push_back(render_loading_line(accent, time_cycle, true, frame, bar_width, time_trailing));
        lines.emplace_back();
    }

    lines.push_back(total_label());
    lines.push_back(render_loading_line(palette_.primary, kQuotaShimmerCycle, false, frame, bar_width,
                                        quota_trailing));
}

void DashboardPanel::append_error(TextBlock& lines, int bar_width) const {
    for (ModelFamily family : kFamilies) {
        if (family != kFamilies[0]) lines.emplace_back();
        lines.push_back(family_label(family));
        lines.push_back(render_quota_line(0.0, bar_width, nullptr));
    }
}

TextBlock DashboardPanel::render_account(const AccountQuota& account, bool selected,
                                         const DashboardViewModel& view_model,
                                         const MetricAnimationScheduler& scheduler, uint64_t frame,
                                         int content_width, std::chrono::system_clock::time_point now) const {
    TextBlock lines;
    lines.push_back(render_account_header(account, selected));
    lines.emplace_back();

    const int bar_width = bar_width_for(std::max(content_width - 4, kMinContentWidth));

    if (!account.loaded) {
        append_loading(lines, frame, bar_width);
        return lines;
    }

    if (!account.error.empty()) {
        append_error(lines, bar_width);
        lines.emplace_back();
        GlyphRow message = indent_row();
        append_text(message, "✗ " + account.error, palette_.error);
        lines.push_back(std::move(message));
        return lines;
    }

    bool first = true;
    for (ModelFamily family : kFamilies) {
        if (!summarize_family(account.quotas, family, now)) continue;
        if (!first) lines.emplace_back();
        append_family(lines, account, family, view_model, scheduler, bar_width, now);
        first = false;
    }

    if (account.total_limit > 0) {
        const double percent = static_cast<double>(account.total_remaining) /
                               static_cast<double>(account.total_limit) * 100.0;
        lines.emplace_back();
        lines.push_back(total_label());
        lines.push_back(render_total_line(percent, bar_width));
    }
    return lines;
}

TextBlock DashboardPanel::render(const DashboardViewModel& view_model, const MetricAnimationScheduler& scheduler,
                                 uint64_t frame, int width, std::chrono::system_clock::time_point now) const {
    const int outer = card_width(width);
    const int inner = card_inner_width(width);

    TextBlock body;
    body.push_back(make_row("Quota Dashboard", palette_.primary, true));
    body.push_back(make_row("Multi-account model quota monitor", palette_.text_secondary));
    body.emplace_back();

    TextBlock content;
    content.push_back(card_title("◈", "Account Quotas", palette_.primary, palette_));

    if (view_model.initial_loading) {
        content.emplace_back();
        GlyphRow row;
        append_spaces(row, 2);
        append_text(row, spinner_glyph(frame), palette_.primary);
        append_text(row, " Loading accounts...", palette_.text_secondary);
        content.push_back(std::move(row));
        content.emplace_back();
    } else if (view_model.accounts.empty()) {
        content.emplace_back();
        GlyphRow row;
        append_spaces(row, 2);
        append_text(row, "○ ", palette_.subtle);
        append_text(row, "No accounts configured", palette_.text_secondary);
        content.push_back(std::move(row));
        content.emplace_back();
        GlyphRow hint;
        append_spaces(hint, 2);
        append_text(hint, "╰─▶ Add accounts to the quota provider", palette_.secondary);
        content.push_back(std::move(hint));
        content.emplace_back();
    } else {
        GlyphRow divider;
        append_spaces(divider, 2);
        append_text(divider, "├", palette_.subtle);
        for (int i = 0; i < std::max(inner - 4, 20); ++i) append_text(divider, "─", palette_.subtle);
        append_text(divider, "┤", palette_.subtle);

        content.emplace_back();
        for (size_t i = 0; i < view_model.accounts.size(); ++i) {
            const bool selected = static_cast<int>(i) == view_model.selected_index;
            auto account = render_account(view_model.accounts[i], selected, view_model, scheduler, frame, inner, now);
            content.insert(content.end(), account.begin(), account.end());
            if (i + 1 < view_model.accounts.size()) {
                content.emplace_back();
                content.push_back(divider);
                content.emplace_back();
            }
        }
        content.emplace_back();
    }

    auto card = render_card(content, outer, palette_);
    body.insert(body.end(), card.begin(), card.end());
    return body;
}

} // namespace quotadash
