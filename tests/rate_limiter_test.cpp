#include "server/rate_limiter.h"
#include <gtest/gtest.h>

using std::chrono::milliseconds;
using std::chrono::seconds;

TEST(RateLimiterTest, BurstThenRefill) {
    RateLimiter limiter(60, 3);  // one token per second
    auto t0 = RateLimiter::Clock::now();
    EXPECT_TRUE(limiter.allow("a", t0));
    EXPECT_TRUE(limiter.allow("a", t0));
    EXPECT_TRUE(limiter.allow("a", t0));
    EXPECT_FALSE(limiter.allow("a", t0));

    EXPECT_FALSE(limiter.allow("a", t0 + milliseconds(500)));
    EXPECT_TRUE(limiter.allow("a", t0 + milliseconds(1100)));
    EXPECT_FALSE(limiter.allow("a", t0 + milliseconds(1200)));
}

TEST(RateLimiterTest, RefillNeverExceedsBurst) {
    RateLimiter limiter(600, 2);
    auto t0 = RateLimiter::Clock::now();
    EXPECT_TRUE(limiter.allow("a", t0));
    auto later = t0 + seconds(60);
    EXPECT_TRUE(limiter.allow("a", later));
    EXPECT_TRUE(limiter.allow("a", later));
    EXPECT_FALSE(limiter.allow("a", later));
}

TEST(RateLimiterTest, ClientsAreIndependent) {
    RateLimiter limiter(60, 1);
    auto t0 = RateLimiter::Clock::now();
    EXPECT_TRUE(limiter.allow("a", t0));
    EXPECT_FALSE(limiter.allow("a", t0));
    EXPECT_TRUE(limiter.allow("b", t0));
    EXPECT_EQ(limiter.trackedClients(), 2u);
}

TEST(RateLimiterTest, PruneForgetsIdleClients) {
    RateLimiter limiter(60, 1);
    auto t0 = RateLimiter::Clock::now();
    limiter.allow("idle", t0);
    limiter.allow("busy", t0);
    limiter.allow("busy", t0 + seconds(50));

    EXPECT_EQ(limiter.prune(t0 + seconds(60), seconds(30)), 1u);
    EXPECT_EQ(limiter.trackedClients(), 1u);
    EXPECT_EQ(limiter.prune(t0 + seconds(60), seconds(30)), 0u);
}
