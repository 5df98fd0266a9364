#pragma once
#include <chrono>

// delay(n) = min(base * factor^n, max). Distinct upstreams tolerate
// different minimum intervals, so each queue carries its own policy.
class BackoffPolicy {
public:
    BackoffPolicy(std::chrono::milliseconds base_delay = std::chrono::milliseconds(1000),
                  double factor = 2.0,
                  std::chrono::milliseconds max_delay = std::chrono::milliseconds(15000));

    std::chrono::milliseconds delay(int consecutive_errors) const;

    // Same curve with a multiplicative jitter in [0.85, 1.15], clamped to max
    std::chrono::milliseconds jittered_delay(int consecutive_errors) const;

    std::chrono::milliseconds base_delay() const { return base_delay_; }
    std::chrono::milliseconds max_delay() const { return max_delay_; }
    double factor() const { return factor_; }

    static constexpr double kJitterFactor = 0.15;

private:
    double raw_delay_ms(int consecutive_errors) const;

    std::chrono::milliseconds base_delay_;
    double factor_;
    std::chrono::milliseconds max_delay_;
};
