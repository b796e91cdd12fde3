#pragma once

/**
 * @file rate_limiter.hpp
 * @brief Per-key token bucket admission gate
 *
 * Buckets live in process memory and are reset when the process restarts.
 * A bucket that has refilled to capacity behaves exactly like an unseen key,
 * so such buckets are dropped by a sweep that runs whenever the number of
 * tracked keys doubles.
 */

#include "axiom/common.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace axiom::ratelimit {

struct RateLimitConfig
{
    int max_tokens;                         ///< Bucket capacity, > 0
    int refill_rate;                        ///< Tokens added per elapsed period, >= 0
    std::chrono::milliseconds refill_period;  ///< Refill granularity, > 0
};

/// 100 requests per minute per principal, refilled 10 per minute
inline constexpr RateLimitConfig kDefaultTier{.max_tokens = 100,
                                              .refill_rate = 10,
                                              .refill_period = std::chrono::minutes{1}};

/// 20 requests per minute per principal for generation and verification
inline constexpr RateLimitConfig kStrictTier{.max_tokens = 20,
                                             .refill_rate = 2,
                                             .refill_period = std::chrono::minutes{1}};

enum class Tier { kDefault, kStrict };

[[nodiscard]] std::string_view tier_name(Tier tier) noexcept;

[[nodiscard]] axiom::VoidResult validate(const RateLimitConfig& config);

struct RateDecision
{
    bool allowed;
    int remaining;  ///< Tokens left after this check
    int limit;      ///< Bucket capacity
    std::chrono::milliseconds retry_after;  ///< Refill period when denied, zero otherwise
};

/**
 * Header name/value pairs for a decision
 * ("X-RateLimit-Limit", "X-RateLimit-Remaining")
 */
[[nodiscard]] std::vector<std::pair<std::string, std::string>> response_headers(
    const RateDecision& decision);

class RateLimiter
{
public:
    using NowFn = std::function<SteadyClock::time_point()>;

    /**
     * @param config Validated configuration (see validate())
     * @param now Clock source; defaults to std::chrono::steady_clock::now
     */
    explicit RateLimiter(RateLimitConfig config, NowFn now = {});

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    /**
     * Refill lazily, then take one token if any remain.
     * @return true if the request is admitted
     */
    [[nodiscard]] bool allow(const std::string& key);

    /**
     * Same as allow() but reports remaining tokens from the same critical section.
     */
    [[nodiscard]] RateDecision check(const std::string& key);

    /**
     * Tokens currently in the bucket; an unseen key reports a full bucket.
     */
    [[nodiscard]] int remaining(const std::string& key) const;

    /**
     * Drop every bucket that has refilled to capacity.
     * @return Number of buckets dropped
     */
    std::size_t evict_idle();

    /// Keys currently holding a bucket
    [[nodiscard]] std::size_t tracked_keys() const;

    [[nodiscard]] const RateLimitConfig& config() const noexcept { return m_config; }

    /// Tracked keys below which no automatic sweep runs
    static constexpr std::size_t kMinSweepThreshold = 1024;

private:
    struct Bucket
    {
        int tokens;
        SteadyClock::time_point last_refill;
    };

    [[nodiscard]] bool take_locked(const std::string& key, int& remaining_out);
    [[nodiscard]] bool refilled_locked(const Bucket& bucket, SteadyClock::time_point now) const;
    std::size_t evict_idle_locked(SteadyClock::time_point now);

    RateLimitConfig m_config;
    NowFn m_now;
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, Bucket> m_buckets;
    std::size_t m_sweep_at = kMinSweepThreshold;
};

}  // namespace axiom::ratelimit
