#include "backoff_policy.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>

BackoffPolicy::BackoffPolicy(std::chrono::milliseconds base_delay, double factor,
                             std::chrono::milliseconds max_delay)
    : base_delay_(std::max(base_delay, std::chrono::milliseconds(0))),
      factor_(std::max(factor, 1.0)),
      max_delay_(std::max(max_delay, std::chrono::milliseconds(0))) {
}

std::chrono::milliseconds BackoffPolicy::delay(int consecutive_errors) const {
    double delay_ms = std::min(raw_delay_ms(consecutive_errors), static_cast<double>(max_delay_.count()));
    return std::chrono::milliseconds(static_cast<int64_t>(delay_ms));
}

std::chrono::milliseconds BackoffPolicy::jittered_delay(int consecutive_errors) const {
    double delay_ms = util::random_jitter(raw_delay_ms(consecutive_errors), kJitterFactor);
    delay_ms = std::min(delay_ms, static_cast<double>(max_delay_.count()));
    return std::chrono::milliseconds(static_cast<int64_t>(delay_ms));
}

double BackoffPolicy::raw_delay_ms(int consecutive_errors) const {
    int n = std::max(consecutive_errors, 0);
    double delay_ms = static_cast<double>(base_delay_.count()) * std::pow(factor_, n);
    // pow overflows to inf for large n; min() against max_delay still clamps it
    return std::isfinite(delay_ms) ? delay_ms : static_cast<double>(max_delay_.count());
}
