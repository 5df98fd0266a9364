#include "rate_limiter.hpp"
#include <algorithm>

RateLimiter::RateLimiter(int limit_per_minute)
    : limit_per_minute_(std::max(0, limit_per_minute)) {
}

bool RateLimiter::allow() {
    return allow(Clock::now());
}

bool RateLimiter::allow(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (limit_per_minute_ <= 0) {
        return true;
    }

    prune(now);
    return timestamps_.size() < static_cast<size_t>(limit_per_minute_);
}

void RateLimiter::record() {
    record(Clock::now());
}

void RateLimiter::record(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    timestamps_.push_back(now);
}

std::chrono::milliseconds RateLimiter::time_until_allowed() {
    std::lock_guard<std::mutex> lock(mutex_);

    auto now = Clock::now();
    prune(now);

    if (limit_per_minute_ <= 0 || timestamps_.size() < static_cast<size_t>(limit_per_minute_)) {
        return std::chrono::milliseconds(0);
    }

    auto oldest_expiry = timestamps_.front() + kWindow;
    return std::chrono::duration_cast<std::chrono::milliseconds>(oldest_expiry - now);
}

void RateLimiter::set_limit(int limit_per_minute) {
    std::lock_guard<std::mutex> lock(mutex_);
    limit_per_minute_ = std::max(0, limit_per_minute);
}

int RateLimiter::limit() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return limit_per_minute_;
}

size_t RateLimiter::window_count(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    prune(now);
    return timestamps_.size();
}

void RateLimiter::prune(Clock::time_point now) {
    // Timestamps are appended in order; anything 60s old or more drops off the front
    while (!timestamps_.empty() && now - timestamps_.front() >= kWindow) {
        timestamps_.pop_front();
    }
}
