#pragma once

#include <chrono>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quotadash {

enum class ModelFamily {
    Claude,
    Gemini
};

std::string_view to_string(ModelFamily family);
std::optional<ModelFamily> parse_model_family(std::string_view name);

// One quota reading for a model family, as delivered by the data provider
struct QuotaSnapshot {
    ModelFamily model_family = ModelFamily::Claude;
    int64_t remaining = 0;
    int64_t limit = 0;
    bool is_rate_limited = false;
    std::optional<std::chrono::system_clock::time_point> reset_time;
};

// 0 when limit is zero or rate limited, otherwise remaining/limit*100 clamped to [0,100]
double display_percent(const QuotaSnapshot& snapshot);

// Lowest display percent across one family, with that reading's reset countdown
struct FamilySummary {
    double percent = 0.0;
    int64_t reset_seconds = 0;
    bool is_rate_limited = false;
};

std::optional<FamilySummary> summarize_family(const std::vector<QuotaSnapshot>& quotas,
                                              ModelFamily family,
                                              std::chrono::system_clock::time_point now);

struct AccountQuota {
    std::string email;
    std::string tier;          // "PRO", "FREE", ...
    bool is_active = false;
    bool loaded = false;       // false until the first quota reading arrives
    std::string error;
    std::vector<QuotaSnapshot> quotas;
    int64_t total_remaining = 0;
    int64_t total_limit = 0;
};

enum class ProjectionStatus {
    Unknown,
    Safe,
    Warning,
    Critical
};

std::string_view to_string(ProjectionStatus status);

struct ProjectionResult {
    ProjectionStatus status = ProjectionStatus::Unknown;
    double session_rate = 0.0;  // percent per hour
    double session_hours_left = std::numeric_limits<double>::infinity();
};

// "{account}:{claude|gemini}"
std::string metric_key(std::string_view account, ModelFamily family);

} // namespace quotadash
