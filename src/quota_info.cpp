#include "quota_info.hpp"
#include <algorithm>

namespace quotadash {

std::string_view to_string(ModelFamily family) {
    switch (family) {
        case ModelFamily::Claude:
            return "claude";
        case ModelFamily::Gemini:
            return "gemini";
    }
    return "unknown";
}

std::optional<ModelFamily> parse_model_family(std::string_view name) {
    if (name == "claude") return ModelFamily::Claude;
    if (name == "gemini") return ModelFamily::Gemini;
    return std::nullopt;
}

double display_percent(const QuotaSnapshot& snapshot) {
    if (snapshot.limit <= 0 || snapshot.is_rate_limited) return 0.0;
    const double percent = static_cast<double>(snapshot.remaining) / static_cast<double>(snapshot.limit) * 100.0;
    return std::clamp(percent, 0.0, 100.0);
}

std::optional<FamilySummary> summarize_family(const std::vector<QuotaSnapshot>& quotas,
                                              ModelFamily family,
                                              std::chrono::system_clock::time_point now) {
    std::optional<FamilySummary> summary;

    for (const auto& quota : quotas) {
        if (quota.model_family != family) continue;

        const double percent = display_percent(quota);
        if (summary && percent >= summary->percent) continue;

        FamilySummary candidate;
        candidate.percent = percent;
        candidate.is_rate_limited = quota.is_rate_limited;
        if (quota.reset_time) {
            const auto remaining = std::chrono::duration_cast<std::chrono::seconds>(*quota.reset_time - now);
            candidate.reset_seconds = std::max<int64_t>(remaining.count(), 0);
        }
        summary = candidate;
    }
    return summary;
}

std::string_view to_string(ProjectionStatus status) {
    switch (status) {
        case ProjectionStatus::Unknown:
            return "UNKNOWN";
        case ProjectionStatus::Safe:
            return "SAFE";
        case ProjectionStatus::Warning:
            return "WARNING";
        case ProjectionStatus::Critical:
            return "CRITICAL";
    }
    return "UNKNOWN";
}

std::string metric_key(std::string_view account, ModelFamily family) {
    std::string key(account);
    key += ':';
    key += to_string(family);
    return key;
}

} // namespace quotadash
