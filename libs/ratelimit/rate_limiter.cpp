/**
 * @file rate_limiter.cpp
 * @brief Token bucket rate limiter
 */

#include "axiom/rate_limiter.hpp"

#include <algorithm>
#include <format>

namespace axiom::ratelimit {

std::string_view tier_name(Tier tier) noexcept
{
    switch (tier) {
        case Tier::kDefault:
            return "default";
        case Tier::kStrict:
            return "strict";
    }
    return "unknown";
}

axiom::VoidResult validate(const RateLimitConfig& config)
{
    if (config.max_tokens <= 0) {
        return std::unexpected(Error::make(
            errc::kValidation, std::format("max_tokens must be positive, got {}", config.max_tokens)));
    }
    if (config.refill_rate < 0) {
        return std::unexpected(Error::make(
            errc::kValidation,
            std::format("refill_rate must not be negative, got {}", config.refill_rate)));
    }
    if (config.refill_period.count() <= 0) {
        return std::unexpected(Error::make(errc::kValidation, "refill_period must be positive"));
    }
    return {};
}

std::vector<std::pair<std::string, std::string>> response_headers(const RateDecision& decision)
{
    return {
        {    "X-RateLimit-Limit",     std::to_string(decision.limit)},
        {"X-RateLimit-Remaining", std::to_string(decision.remaining)},
    };
}

RateLimiter::RateLimiter(RateLimitConfig config, NowFn now)
    : m_config(config)
    , m_now(now ? std::move(now) : NowFn{[] { return SteadyClock::now(); }})
{}

bool RateLimiter::allow(const std::string& key)
{
    std::lock_guard lock(m_mutex);
    int remaining_tokens = 0;
    return take_locked(key, remaining_tokens);
}

RateDecision RateLimiter::check(const std::string& key)
{
    std::lock_guard lock(m_mutex);
    int remaining_tokens = 0;
    const bool allowed = take_locked(key, remaining_tokens);
    return RateDecision{
        .allowed = allowed,
        .remaining = remaining_tokens,
        .limit = m_config.max_tokens,
        .retry_after = allowed ? std::chrono::milliseconds{0} : m_config.refill_period,
    };
}

int RateLimiter::remaining(const std::string& key) const
{
    std::lock_guard lock(m_mutex);
    auto it = m_buckets.find(key);
    return it == m_buckets.end() ? m_config.max_tokens : it->second.tokens;
}

std::size_t RateLimiter::evict_idle()
{
    std::lock_guard lock(m_mutex);
    return evict_idle_locked(m_now());
}

std::size_t RateLimiter::tracked_keys() const
{
    std::lock_guard lock(m_mutex);
    return m_buckets.size();
}

bool RateLimiter::refilled_locked(const Bucket& bucket, SteadyClock::time_point now) const
{
    const auto periods = (now - bucket.last_refill) / m_config.refill_period;
    return static_cast<long long>(bucket.tokens) + static_cast<long long>(periods) * m_config.refill_rate
           >= m_config.max_tokens;
}

std::size_t RateLimiter::evict_idle_locked(SteadyClock::time_point now)
{
    const auto evicted =
        std::erase_if(m_buckets, [&](const auto& entry) { return refilled_locked(entry.second, now); });
    m_sweep_at = std::max(kMinSweepThreshold, m_buckets.size() * 2);
    return evicted;
}

bool RateLimiter::take_locked(const std::string& key, int& remaining_out)
{
    const auto now = m_now();
    if (m_buckets.size() >= m_sweep_at && !m_buckets.contains(key)) {
        evict_idle_locked(now);
    }
    auto [it, inserted] = m_buckets.try_emplace(key, Bucket{m_config.max_tokens, now});
    Bucket& bucket = it->second;

    if (!inserted) {
        const auto elapsed = now - bucket.last_refill;
        const auto periods = elapsed / m_config.refill_period;
        if (periods > 0) {
            // Widen before multiplying; a long-idle key may have accumulated many periods.
            const long long refill = static_cast<long long>(periods) * m_config.refill_rate;
            bucket.tokens = static_cast<int>(
                std::min<long long>(static_cast<long long>(bucket.tokens) + refill,
                                    m_config.max_tokens));
            bucket.last_refill = now;
        }
    }

    if (bucket.tokens > 0) {
        --bucket.tokens;
        remaining_out = bucket.tokens;
        return true;
    }
    remaining_out = 0;
    return false;
}

}  // namespace axiom::ratelimit
