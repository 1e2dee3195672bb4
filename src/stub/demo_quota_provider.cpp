#include "demo_quota_provider.hpp"
#include "../render/projection_formatter.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <string_view>
#include <spdlog/spdlog.h>

namespace quotadash {

namespace {

constexpr const char* kNames[] = {"alice", "bob", "carol", "dave", "erin", "frank",
                                  "grace", "heidi", "ivan", "judy", "mallory", "oscar"};

// The fourth account demonstrates the error card
constexpr int kErrorAccountIndex = 3;

double cycle_seconds(std::string_view tier) {
    return tier == "PRO" ? 5.0 * 3600.0 : 24.0 * 3600.0;
}

} // namespace

DemoQuotaProvider::DemoQuotaProvider(DemoOptions options)
    : options_(std::move(options)), rng_(options_.seed) {
    options_.accounts = std::clamp(options_.accounts, 1, kMaxAccounts);
    if (!(options_.time_scale > 0.0)) options_.time_scale = 1.0;
    origin_ = now();

    std::uniform_real_distribution<double> rate_dist(4.0, 30.0);
    std::uniform_real_distribution<double> phase_dist(0.0, 1.0);

    for (int i = 0; i < options_.accounts; ++i) {
        DemoAccount account;
        account.email = std::string(kNames[i]) + "@example.com";
        account.tier = i % 2 == 0 ? "PRO" : "FREE";
        if (i == kErrorAccountIndex) {
            account.error = "token refresh failed: 401 Unauthorized";
        }

        const double period = cycle_seconds(account.tier);
        for (ModelFamily family : {ModelFamily::Claude, ModelFamily::Gemini, ModelFamily::Gemini}) {
            DemoQuota quota;
            quota.family = family;
            quota.drain_rate = rate_dist(rng_);
            quota.phase_seconds = phase_dist(rng_) * period;
            account.quotas.push_back(quota);
        }
        accounts_.push_back(std::move(account));
    }

    generate_history();
    spdlog::info("demo provider: {} accounts, seed {}", accounts_.size(), options_.seed);
}

std::chrono::system_clock::time_point DemoQuotaProvider::now() const {
    return options_.clock ? options_.clock() : std::chrono::system_clock::now();
}

double DemoQuotaProvider::simulated_seconds(std::chrono::system_clock::time_point now) const {
    const std::chrono::duration<double> elapsed = now - origin_;
    return std::max(elapsed.count(), 0.0) * options_.time_scale;
}

ProviderSnapshot DemoQuotaProvider::fetch() {
    ProviderSnapshot snapshot;
    const auto current = now();
    const bool loading = fetch_count_ < options_.loading_fetches;
    ++fetch_count_;

    for (const auto& account : accounts_) {
        if (loading) {
            AccountQuota pending;
            pending.email = account.email;
            pending.tier = account.tier;
            pending.is_active = snapshot.accounts.empty();
            snapshot.accounts.push_back(std::move(pending));
            continue;
        }

        AccountQuota quota = build_account(account, simulated_seconds(current), current);
        quota.is_active = snapshot.accounts.empty();
        add_projections(account, quota, current, snapshot.projections);
        snapshot.accounts.push_back(std::move(quota));
    }

    if (!loading) {
        // Feed the sparkline with the mean drain across all quotas
        double total = 0.0;
        int count = 0;
        for (const auto& account : accounts_) {
            if (!account.error.empty()) continue;
            for (const auto& quota : account.quotas) {
                total += quota.drain_rate;
                ++count;
            }
        }
        std::normal_distribution<double> jitter(0.0, 2.0);
        const double sample = count > 0 ? std::max(total / count + jitter(rng_), 0.0) : 0.0;
        history_.recent.push_back(sample);
        if (history_.recent.size() > kRecentSamples) {
            history_.recent.erase(history_.recent.begin());
        }
        snapshot.history = history_;
    }

    spdlog::debug("demo provider: fetch {} ({})", fetch_count_, loading ? "loading" : "loaded");
    return snapshot;
}

AccountQuota DemoQuotaProvider::build_account(const DemoAccount& account, double sim_seconds,
                                              std::chrono::system_clock::time_point now) const {
    AccountQuota result;
    result.email = account.email;
    result.tier = account.tier;
    result.loaded = true;
    result.error = account.error;
    if (!account.error.empty()) return result;

    const double period = cycle_seconds(account.tier);
    for (const auto& quota : account.quotas) {
        const double cycle_pos = std::fmod(sim_seconds + quota.phase_seconds, period);
        const double percent = std::max(100.0 - quota.drain_rate * cycle_pos / 3600.0, 0.0);
        const double seconds_to_reset = (period - cycle_pos) / options_.time_scale;

        QuotaSnapshot snapshot;
        snapshot.model_family = quota.family;
        snapshot.limit = kQuotaLimit;
        snapshot.remaining = std::llround(percent / 100.0 * static_cast<double>(kQuotaLimit));
        snapshot.is_rate_limited = snapshot.remaining == 0;
        snapshot.reset_time = now + std::chrono::duration_cast<std::chrono::system_clock::duration>(
                                        std::chrono::duration<double>(seconds_to_reset));
        result.quotas.push_back(snapshot);
    }

    // Only paid accounts expose an aggregate pool
    if (account.tier == "PRO") {
        for (const auto& snapshot : result.quotas) {
            result.total_remaining += snapshot.remaining;
            result.total_limit += snapshot.limit;
        }
    }
    return result;
}

void DemoQuotaProvider::add_projections(const DemoAccount& account, const AccountQuota& quota,
                                        std::chrono::system_clock::time_point now,
                                        std::map<std::string, ProjectionResult>& projections) const {
    if (!quota.error.empty()) return;

    for (ModelFamily family : {ModelFamily::Claude, ModelFamily::Gemini}) {
        const auto summary = summarize_family(quota.quotas, family, now);
        if (!summary) continue;

        // Rate of the quota that drains fastest within the family
        double rate = 0.0;
        for (const auto& demo : account.quotas) {
            if (demo.family == family) rate = std::max(rate, demo.drain_rate);
        }

        ProjectionResult projection;
        if (!summary->is_rate_limited) {
            projection.session_rate = rate;
            projection.session_hours_left = summary->percent / rate;
            // Without a reset countdown the status stays Unknown
            if (const auto thresholds = thresholds_for_reset(summary->reset_seconds)) {
                projection.status = classify_projection(projection.session_rate, projection.session_hours_left,
                                                        *thresholds);
            }
        }
        projections[metric_key(account.email, family)] = projection;
    }
}

void DemoQuotaProvider::generate_history() {
    std::uniform_real_distribution<double> daily(5.0, 60.0);
    for (int i = 0; i < 14; ++i) history_.daily_claude.push_back(daily(rng_));
    for (int i = 0; i < 10; ++i) history_.daily_gemini.push_back(daily(rng_) * 0.7);

    // Working hours consume most
    std::uniform_real_distribution<double> noise(0.0, 3.0);
    for (int hour = 0; hour < 24; ++hour) {
        const double distance = std::abs(hour - 14);
        history_.hourly.push_back(std::max(12.0 - distance * 1.2, 0.5) + noise(rng_));
    }

    history_.day_names = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
    for (int day = 0; day < 7; ++day) {
        const bool weekend = day == 0 || day == 6;
        history_.weekly.push_back((weekend ? 8.0 : 25.0) + noise(rng_) * 3.0);
    }
}

} // namespace quotadash
