#include "usage_history.hpp"

namespace quotadash {

std::pair<int, double> peak_hour(const UsageHistory& history) {
    int hour = 0;
    double value = 0.0;
    for (size_t i = 0; i < history.hourly.size() && i < 24; ++i) {
        if (history.hourly[i] > value) {
            value = history.hourly[i];
            hour = static_cast<int>(i);
        }
    }
    return {hour, value};
}

std::pair<std::string, double> peak_day(const UsageHistory& history) {
    if (history.weekly.empty()) return {"Unknown", 0.0};

    static const char* const kDefaultNames[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
    // Partial name lists fall back to the defaults, as in the weekly pattern row
    const bool named = history.day_names.size() == 7;
    std::string day = "Unknown";
    double value = 0.0;
    for (size_t i = 0; i < history.weekly.size() && i < 7; ++i) {
        if (history.weekly[i] > value) {
            value = history.weekly[i];
            day = named ? history.day_names[i] : kDefaultNames[i];
        }
    }
    return {day, value};
}

} // namespace quotadash
