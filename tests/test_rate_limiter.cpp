#include <gtest/gtest.h>
#include "riftcrawl/rate_limiter.hpp"
#include <thread>

using namespace riftcrawl;
using namespace std::chrono;

TEST(QuotaHeaders, ParsesLimitsAndCounts) {
    auto windows = parse_rate_limit_headers("20:1,100:120", "3:1,100:120");
    ASSERT_EQ(windows.size(), 2u);
    EXPECT_EQ(windows[0].limit, 20);
    EXPECT_EQ(windows[0].span, seconds(1));
    EXPECT_EQ(windows[0].used, 3);
    EXPECT_EQ(windows[1].limit, 100);
    EXPECT_EQ(windows[1].span, seconds(120));
    EXPECT_EQ(windows[1].used, 100);
}

TEST(QuotaHeaders, SkipsMalformedPairs) {
    auto windows = parse_rate_limit_headers("20:1,junk,x:5,0:10,50:60");
    ASSERT_EQ(windows.size(), 2u);
    EXPECT_EQ(windows[0].limit, 20);
    EXPECT_EQ(windows[1].limit, 50);
    EXPECT_EQ(windows[1].used, 0);
}

TEST(QuotaHeaders, EmptyHeader) {
    EXPECT_TRUE(parse_rate_limit_headers("").empty());
}

TEST(RateLimiter, AllowsBurstWithinWindow) {
    RateLimiter limiter({{5, milliseconds(1000)}});
    auto start = steady_clock::now();
    for (int i = 0; i < 5; ++i) limiter.wait_for_slot();
    EXPECT_LT(steady_clock::now() - start, milliseconds(200));
}

TEST(RateLimiter, BlocksWhenWindowFull) {
    RateLimiter limiter({{2, milliseconds(150)}});
    auto start = steady_clock::now();
    for (int i = 0; i < 3; ++i) limiter.wait_for_slot();
    EXPECT_GE(steady_clock::now() - start, milliseconds(140));
}

TEST(RateLimiter, PauseHoldsBackEveryCaller) {
    RateLimiter limiter({{100, milliseconds(1000)}});
    limiter.pause_for(milliseconds(150));
    EXPECT_TRUE(limiter.paused());
    EXPECT_EQ(limiter.pause_count(), 1);

    auto start = steady_clock::now();
    std::thread other([&] { limiter.wait_for_slot(); });
    limiter.wait_for_slot();
    other.join();
    EXPECT_GE(steady_clock::now() - start, milliseconds(140));
    EXPECT_FALSE(limiter.paused());
}

TEST(RateLimiter, ShorterPauseDoesNotShortenCooldown) {
    RateLimiter limiter({{100, milliseconds(1000)}});
    limiter.pause_for(milliseconds(500));
    limiter.pause_for(milliseconds(10));
    EXPECT_EQ(limiter.pause_count(), 1);
    EXPECT_TRUE(limiter.paused());
}

TEST(RateLimiter, ObservePausesOnSaturatedWindow) {
    RateLimiter limiter({{100, milliseconds(1000)}});
    limiter.observe(parse_rate_limit_headers("20:1,100:120", "5:1,99:120"));
    EXPECT_FALSE(limiter.paused());

    limiter.observe(parse_rate_limit_headers("20:1,100:120", "20:1,40:120"));
    EXPECT_TRUE(limiter.paused());
    EXPECT_EQ(limiter.pause_count(), 1);
}
