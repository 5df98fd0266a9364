#pragma once
#include <chrono>
#include <deque>
#include <mutex>

// Sliding-window limiter: at most `limit_per_minute` dispatches in any
// trailing 60 second window. A limit of 0 disables limiting.
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    explicit RateLimiter(int limit_per_minute = 0);

    // True if fewer than `limit` dispatches fall inside the window.
    // Prunes stale timestamps but never records one.
    bool allow();
    bool allow(Clock::time_point now);

    // Records a dispatch at the current time
    void record();
    void record(Clock::time_point now);

    // Time until the oldest timestamp leaves the window
    std::chrono::milliseconds time_until_allowed();

    void set_limit(int limit_per_minute);
    int limit() const;
    size_t window_count(Clock::time_point now);

    static constexpr std::chrono::seconds kWindow{60};

private:
    void prune(Clock::time_point now);

    mutable std::mutex mutex_;
    std::deque<Clock::time_point> timestamps_;
    int limit_per_minute_;
};
