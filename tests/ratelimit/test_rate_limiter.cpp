/**
 * @file test_rate_limiter.cpp
 * @brief Token bucket tests with a controlled clock
 */

#include "axiom/rate_limiter.hpp"

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

using namespace std::chrono_literals;
using axiom::ratelimit::RateLimitConfig;
using axiom::ratelimit::RateLimiter;

namespace {

/// Manually advanced steady clock
struct ManualClock
{
    axiom::SteadyClock::time_point now{};

    [[nodiscard]] RateLimiter::NowFn fn()
    {
        return [this] { return now; };
    }
};

constexpr RateLimitConfig kSmall{.max_tokens = 3, .refill_rate = 1, .refill_period = 1000ms};

}  // namespace

TEST(RateLimiter, CapacityThenDenied)
{
    ManualClock clock;
    RateLimiter limiter(kSmall, clock.fn());

    EXPECT_TRUE(limiter.allow("alice"));
    EXPECT_TRUE(limiter.allow("alice"));
    EXPECT_TRUE(limiter.allow("alice"));
    EXPECT_FALSE(limiter.allow("alice"));
    EXPECT_EQ(limiter.remaining("alice"), 0);
}

TEST(RateLimiter, KeysAreIndependent)
{
    ManualClock clock;
    RateLimiter limiter(kSmall, clock.fn());

    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(limiter.allow("alice"));
    }
    EXPECT_FALSE(limiter.allow("alice"));
    EXPECT_TRUE(limiter.allow("bob"));
}

TEST(RateLimiter, UnseenKeyReportsFullBucket)
{
    ManualClock clock;
    RateLimiter limiter(kSmall, clock.fn());
    EXPECT_EQ(limiter.remaining("nobody"), 3);
}

TEST(RateLimiter, RefillsWholePeriodsOnly)
{
    ManualClock clock;
    RateLimiter limiter(kSmall, clock.fn());
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(limiter.allow("alice"));
    }

    clock.now += 999ms;
    EXPECT_FALSE(limiter.allow("alice"));

    clock.now += 1000ms;
    EXPECT_TRUE(limiter.allow("alice"));
    EXPECT_FALSE(limiter.allow("alice"));
}

TEST(RateLimiter, RefillCapsAtCapacity)
{
    ManualClock clock;
    RateLimiter limiter(kSmall, clock.fn());
    ASSERT_TRUE(limiter.allow("alice"));

    clock.now += std::chrono::hours{24 * 365};
    auto decision = limiter.check("alice");
    EXPECT_TRUE(decision.allowed);
    EXPECT_EQ(decision.remaining, 2);
}

TEST(RateLimiter, CheckReportsDecision)
{
    ManualClock clock;
    RateLimiter limiter(kSmall, clock.fn());

    auto first = limiter.check("alice");
    EXPECT_TRUE(first.allowed);
    EXPECT_EQ(first.remaining, 2);
    EXPECT_EQ(first.limit, 3);
    EXPECT_EQ(first.retry_after, 0ms);

    (void)limiter.check("alice");
    (void)limiter.check("alice");
    auto denied = limiter.check("alice");
    EXPECT_FALSE(denied.allowed);
    EXPECT_EQ(denied.remaining, 0);
    EXPECT_EQ(denied.retry_after, 1000ms);

    auto headers = axiom::ratelimit::response_headers(denied);
    ASSERT_EQ(headers.size(), 2u);
    EXPECT_EQ(headers[0].first, "X-RateLimit-Limit");
    EXPECT_EQ(headers[0].second, "3");
    EXPECT_EQ(headers[1].first, "X-RateLimit-Remaining");
    EXPECT_EQ(headers[1].second, "0");
}

TEST(RateLimiter, ZeroRefillNeverRecovers)
{
    ManualClock clock;
    RateLimiter limiter(RateLimitConfig{.max_tokens = 1, .refill_rate = 0, .refill_period = 10ms}, clock.fn());
    ASSERT_TRUE(limiter.allow("k"));
    clock.now += 10s;
    EXPECT_FALSE(limiter.allow("k"));
}

TEST(RateLimiter, DefaultTiers)
{
    EXPECT_EQ(axiom::ratelimit::kDefaultTier.max_tokens, 100);
    EXPECT_EQ(axiom::ratelimit::kDefaultTier.refill_rate, 10);
    EXPECT_EQ(axiom::ratelimit::kStrictTier.max_tokens, 20);
    EXPECT_EQ(axiom::ratelimit::kStrictTier.refill_rate, 2);
    EXPECT_EQ(axiom::ratelimit::kStrictTier.refill_period, std::chrono::minutes{1});
}

TEST(RateLimiter, ValidateRejectsBadConfig)
{
    EXPECT_TRUE(axiom::ratelimit::validate(kSmall));
    EXPECT_FALSE(axiom::ratelimit::validate(RateLimitConfig{.max_tokens = 0, .refill_rate = 1, .refill_period = 1s}));
    EXPECT_FALSE(axiom::ratelimit::validate(RateLimitConfig{.max_tokens = 1, .refill_rate = -1, .refill_period = 1s}));
    EXPECT_FALSE(axiom::ratelimit::validate(RateLimitConfig{.max_tokens = 1, .refill_rate = 1, .refill_period = 0ms}));
}

TEST(RateLimiter, ConcurrentCallersShareOneBucket)
{
    constexpr int kThreads = 8;
    constexpr int kCallsPerThread = 50;
    RateLimiter limiter(RateLimitConfig{.max_tokens = 100, .refill_rate = 0, .refill_period = 1s});

    std::atomic<int> admitted{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < kCallsPerThread; ++i) {
                if (limiter.allow("shared")) {
                    admitted.fetch_add(1);
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(admitted.load(), 100);
    EXPECT_EQ(limiter.remaining("shared"), 0);
}

TEST(RateLimiter, RefilledBucketsAreEvicted)
{
    ManualClock clock;
    RateLimiter limiter(kSmall, clock.fn());
    ASSERT_TRUE(limiter.allow("idle"));
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(limiter.allow("busy"));
    }
    EXPECT_EQ(limiter.tracked_keys(), 2U);

    // One period refills "idle" to capacity; "busy" is still two tokens short
    clock.now += 1000ms;
    EXPECT_EQ(limiter.evict_idle(), 1U);
    EXPECT_EQ(limiter.tracked_keys(), 1U);
    EXPECT_EQ(limiter.remaining("idle"), 3);
    EXPECT_TRUE(limiter.allow("busy"));
    EXPECT_FALSE(limiter.allow("busy"));

    clock.now += 10s;
    EXPECT_EQ(limiter.evict_idle(), 1U);
    EXPECT_EQ(limiter.tracked_keys(), 0U);
}

TEST(RateLimiter, SweepsWhenKeysPileUp)
{
    ManualClock clock;
    RateLimiter limiter(kSmall, clock.fn());
    for (std::size_t i = 0; i < RateLimiter::kMinSweepThreshold; ++i) {
        ASSERT_TRUE(limiter.allow("client-" + std::to_string(i)));
    }
    EXPECT_EQ(limiter.tracked_keys(), RateLimiter::kMinSweepThreshold);

    clock.now += 1000ms;
    EXPECT_TRUE(limiter.allow("newcomer"));
    EXPECT_EQ(limiter.tracked_keys(), 1U);
}

TEST(RateLimiter, DrainedBucketsSurviveSweep)
{
    ManualClock clock;
    RateLimiter limiter(RateLimitConfig{.max_tokens = 1, .refill_rate = 0, .refill_period = 10ms}, clock.fn());
    ASSERT_TRUE(limiter.allow("k"));
    clock.now += 1h;
    EXPECT_EQ(limiter.evict_idle(), 0U);
    EXPECT_FALSE(limiter.allow("k"));
}
