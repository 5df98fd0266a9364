#include <gtest/gtest.h>
#include "rate_limiter.hpp"

using namespace std::chrono_literals;

TEST(RateLimiterTest, AllowsUntilLimitReached) {
    RateLimiter limiter(3);
    auto now = RateLimiter::Clock::now();

    for (int i = 0; i < 3; ++i) {
        EXPECT_TRUE(limiter.allow(now));
        limiter.record(now);
    }
    EXPECT_FALSE(limiter.allow(now));
}

TEST(RateLimiterTest, DenialHasNoSideEffects) {
    RateLimiter limiter(1);
    auto now = RateLimiter::Clock::now();
    limiter.record(now);

    EXPECT_FALSE(limiter.allow(now));
    EXPECT_FALSE(limiter.allow(now));
    EXPECT_EQ(limiter.window_count(now), 1u);
}

TEST(RateLimiterTest, TimestampsLeaveTrailingWindow) {
    RateLimiter limiter(2);
    auto start = RateLimiter::Clock::now();
    limiter.record(start);
    limiter.record(start + 10s);

    EXPECT_FALSE(limiter.allow(start + 59s));
    EXPECT_TRUE(limiter.allow(start + 60s));
    EXPECT_EQ(limiter.window_count(start + 60s), 1u);
    EXPECT_EQ(limiter.window_count(start + 70s), 0u);
}

TEST(RateLimiterTest, ZeroLimitIsUnlimited) {
    RateLimiter limiter(0);
    auto now = RateLimiter::Clock::now();
    for (int i = 0; i < 100; ++i) {
        limiter.record(now);
    }
    EXPECT_TRUE(limiter.allow(now));
}

TEST(RateLimiterTest, SetLimitAppliesToExistingWindow) {
    RateLimiter limiter(5);
    auto now = RateLimiter::Clock::now();
    limiter.record(now);
    limiter.record(now);

    limiter.set_limit(2);
    EXPECT_EQ(limiter.limit(), 2);
    EXPECT_FALSE(limiter.allow(now));
}

TEST(RateLimiterTest, TimeUntilAllowedIsZeroWithCapacity) {
    RateLimiter limiter(2);
    limiter.record();
    EXPECT_EQ(limiter.time_until_allowed(), 0ms);

    limiter.record();
    auto wait = limiter.time_until_allowed();
    EXPECT_GT(wait, 0ms);
    EXPECT_LE(wait, 60000ms);
}
