/**
 * @file circuit_breaker.cpp
 * @brief Circuit breaker state machine and per-dependency registry
 */

#include "axiom/circuit_breaker.hpp"

#include "axiom/log.hpp"

#include <algorithm>
#include <format>

namespace axiom::breaker {

std::string_view state_name(State state) noexcept
{
    switch (state) {
        case State::kClosed:
            return "closed";
        case State::kOpen:
            return "open";
        case State::kHalfOpen:
            return "half_open";
    }
    return "unknown";
}

axiom::VoidResult validate(const BreakerConfig& config)
{
    if (config.failure_threshold <= 0 || config.success_threshold <= 0) {
        return std::unexpected(Error::make(
            errc::kValidation,
            std::format("breaker thresholds must be positive (failure={}, success={})",
                        config.failure_threshold,
                        config.success_threshold)));
    }
    if (config.timeout.count() < 0) {
        return std::unexpected(Error::make(errc::kValidation, "breaker timeout must not be negative"));
    }
    if (config.max_half_open_trials <= 0) {
        return std::unexpected(
            Error::make(errc::kValidation, "max_half_open_trials must be positive"));
    }
    return {};
}

CircuitBreaker::CircuitBreaker(std::string name, BreakerConfig config, NowFn now)
    : m_name(std::move(name))
    , m_config(config)
    , m_now(now ? std::move(now) : NowFn{[] { return SteadyClock::now(); }})
{}

void CircuitBreaker::set_observer(Observer observer)
{
    std::lock_guard lock(m_mutex);
    m_observer = std::move(observer);
}

bool CircuitBreaker::allow()
{
    Transition transition;
    bool allowed = false;
    {
        std::lock_guard lock(m_mutex);
        switch (m_state) {
            case State::kClosed:
                allowed = true;
                break;
            case State::kOpen:
                if (m_now() - m_last_failure > m_config.timeout) {
                    transition = set_state_locked(State::kHalfOpen);
                    m_trials_in_flight = 1;
                    allowed = true;
                }
                break;
            case State::kHalfOpen:
                if (m_trials_in_flight < m_config.max_half_open_trials) {
                    ++m_trials_in_flight;
                    allowed = true;
                }
                break;
        }
    }
    notify(transition);
    return allowed;
}

void CircuitBreaker::record_success()
{
    Transition transition;
    {
        std::lock_guard lock(m_mutex);
        switch (m_state) {
            case State::kHalfOpen:
                ++m_successes;
                m_trials_in_flight = std::max(0, m_trials_in_flight - 1);
                if (m_successes >= m_config.success_threshold) {
                    transition = set_state_locked(State::kClosed);
                    m_failures = 0;
                    m_successes = 0;
                    m_trials_in_flight = 0;
                }
                break;
            case State::kClosed:
                m_failures = 0;
                break;
            case State::kOpen:
                // Late result from a call admitted before the circuit opened.
                break;
        }
    }
    notify(transition);
}

void CircuitBreaker::record_failure()
{
    Transition transition;
    {
        std::lock_guard lock(m_mutex);
        ++m_failures;
        m_last_failure = m_now();
        switch (m_state) {
            case State::kClosed:
                if (m_failures >= m_config.failure_threshold) {
                    transition = set_state_locked(State::kOpen);
                }
                break;
            case State::kHalfOpen:
                transition = set_state_locked(State::kOpen);
                m_successes = 0;
                m_trials_in_flight = 0;
                break;
            case State::kOpen:
                break;
        }
    }
    notify(transition);
}

void CircuitBreaker::release_trial()
{
    std::lock_guard lock(m_mutex);
    if (m_state == State::kHalfOpen) {
        m_trials_in_flight = std::max(0, m_trials_in_flight - 1);
    }
}

State CircuitBreaker::state() const
{
    std::lock_guard lock(m_mutex);
    return m_state;
}

Snapshot CircuitBreaker::snapshot() const
{
    std::lock_guard lock(m_mutex);
    return Snapshot{.state = m_state,
                    .failures = m_failures,
                    .successes = m_successes,
                    .trials_in_flight = m_trials_in_flight};
}

std::chrono::milliseconds CircuitBreaker::retry_after() const
{
    std::lock_guard lock(m_mutex);
    if (m_state != State::kOpen) {
        return std::chrono::milliseconds{0};
    }
    const auto elapsed = m_now() - m_last_failure;
    if (elapsed >= m_config.timeout) {
        return std::chrono::milliseconds{0};
    }
    return std::chrono::ceil<std::chrono::milliseconds>(m_config.timeout - elapsed);
}

CircuitBreaker::Transition CircuitBreaker::set_state_locked(State next)
{
    Transition transition{.happened = m_state != next, .from = m_state, .to = next};
    m_state = next;
    return transition;
}

void CircuitBreaker::notify(const Transition& transition) const
{
    if (!transition.happened) {
        return;
    }
    log::info("breaker",
              "{}: {} -> {}",
              m_name,
              state_name(transition.from),
              state_name(transition.to));

    Observer observer;
    {
        std::lock_guard lock(m_mutex);
        observer = m_observer;
    }
    if (observer) {
        observer(m_name, transition.from, transition.to);
    }
}

Registry::Registry(CircuitBreaker::NowFn now)
    : m_now(std::move(now))
{}

CircuitBreaker& Registry::add(const std::string& dependency, BreakerConfig config)
{
    auto it = m_breakers.find(dependency);
    if (it == m_breakers.end()) {
        it = m_breakers
                 .emplace(dependency, std::make_unique<CircuitBreaker>(dependency, config, m_now))
                 .first;
    }
    return *it->second;
}

CircuitBreaker* Registry::find(std::string_view dependency) const
{
    auto it = m_breakers.find(dependency);
    return it == m_breakers.end() ? nullptr : it->second.get();
}

void Registry::set_observer(const CircuitBreaker::Observer& observer)
{
    for (auto& [_, breaker] : m_breakers) {
        breaker->set_observer(observer);
    }
}

}  // namespace axiom::breaker
