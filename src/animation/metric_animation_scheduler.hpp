#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace quotadash {

struct MetricAnimationState {
    std::string key;
    double current_percent = 0.0;
    double target_percent = 0.0;
    bool is_animating = false;  // Converging when true, Idle otherwise
    uint64_t frame = 0;         // Ticks applied since the metric last started converging
};

// Owns one convergence state per metric key ("alice@x:claude") and moves the
// displayed percentage toward its target one tick at a time.
//
// Each tick moves a converging metric by max(|target - current| / 10, 0.5),
// never past the target, so large jumps ease out and small ones still finish
// in a bounded number of ticks. The scheduler never registers timers: the host
// calls advance() every kTickInterval for as long as it returns true.
class MetricAnimationScheduler {
public:
    static constexpr std::chrono::milliseconds kTickInterval{50};
    static constexpr double kStepDivisor = 10.0;
    static constexpr double kMinStep = 0.5;

    // Idle metrics start converging (new keys start from 0) and the host must
    // deliver ticks again. While converging only the target moves; the current
    // value is untouched, so a moving target is re-aimed without a jump.
    void set_target(const std::string& key, double target_percent);

    // Applies one tick to every converging metric, in key order.
    // Returns true while any metric is still converging.
    bool advance();

    [[nodiscard]] bool is_animating() const;
    [[nodiscard]] const MetricAnimationState* find(const std::string& key) const;

    // Displayed value for a key, or `fallback` for a key never seen
    [[nodiscard]] double current_percent(const std::string& key, double fallback = 0.0) const;

    [[nodiscard]] size_t size() const { return states_.size(); }
    [[nodiscard]] std::vector<std::string> keys() const;

    // Single convergence step; exposed for tests and for hosts that need to
    // predict how many ticks a change will take.
    static double step_toward(double current, double target);

private:
    std::map<std::string, MetricAnimationState> states_;
};

} // namespace quotadash
