#include "metric_animation_scheduler.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

namespace quotadash {

namespace {

double clamp_percent(double percent) {
    if (std::isnan(percent)) return 0.0;
    return std::clamp(percent, 0.0, 100.0);
}

} // namespace

double MetricAnimationScheduler::step_toward(double current, double target) {
    const double distance = std::abs(target - current);
    const double step = std::max(distance / kStepDivisor, kMinStep);

    if (current < target) {
        return std::min(current + step, target);
    }
    if (current > target) {
        return std::max(current - step, target);
    }
    return current;
}

void MetricAnimationScheduler::set_target(const std::string& key, double target_percent) {
    const double target = clamp_percent(target_percent);

    auto [it, inserted] = states_.try_emplace(key);
    auto& state = it->second;
    if (inserted) {
        state.key = key;
        spdlog::debug("animation: tracking metric {}", key);
    }

    state.target_percent = target;
    if (!state.is_animating) {
        state.is_animating = true;
        state.frame = 0;
    }
}

bool MetricAnimationScheduler::advance() {
    bool any_animating = false;

    for (auto& [key, state] : states_) {
        if (!state.is_animating) continue;

        ++state.frame;
        state.current_percent = step_toward(state.current_percent, state.target_percent);
        if (state.current_percent == state.target_percent) {
            state.is_animating = false;
        } else {
            any_animating = true;
        }
    }
    return any_animating;
}

bool MetricAnimationScheduler::is_animating() const {
    return std::ranges::any_of(states_, [](const auto& entry) { return entry.second.is_animating; });
}

const MetricAnimationState* MetricAnimationScheduler::find(const std::string& key) const {
    if (auto it = states_.find(key); it != states_.end()) {
        return &it->second;
    }
    return nullptr;
}

double MetricAnimationScheduler::current_percent(const std::string& key, double fallback) const {
    if (const auto* state = find(key)) {
        return state->current_percent;
    }
    return fallback;
}

std::vector<std::string> MetricAnimationScheduler::keys() const {
    std::vector<std::string> out;
    out.reserve(states_.size());
    for (const auto& [key, state] : states_) {
        out.push_back(key);
    }
    return out;
}

} // namespace quotadash
