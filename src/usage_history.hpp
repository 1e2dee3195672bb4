#pragma once

#include <string>
#include <utility>
#include <vector>

namespace quotadash {

// Consumption history series, one point per time bucket (percent consumed)
struct UsageHistory {
    std::vector<double> daily_claude;
    std::vector<double> daily_gemini;
    std::vector<double> hourly;   // 24 buckets, 00:00 first
    std::vector<double> weekly;   // 7 buckets, Sunday first
    std::vector<std::string> day_names;
    std::vector<double> recent;   // most recent samples, oldest first

    [[nodiscard]] bool empty() const {
        return daily_claude.empty() && daily_gemini.empty() && hourly.empty() && weekly.empty() && recent.empty();
    }
};

// Hour with the highest average consumption; {0, 0} when there is no data
std::pair<int, double> peak_hour(const UsageHistory& history);

// Day with the highest average consumption; {"Unknown", 0} when nothing was consumed
std::pair<std::string, double> peak_day(const UsageHistory& history);

} // namespace quotadash
