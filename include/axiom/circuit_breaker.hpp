#pragma once

/**
 * @file circuit_breaker.hpp
 * @brief Three-state failure isolation for a downstream dependency
 *
 * Closed:   every call is allowed; failure_threshold consecutive failures open the circuit.
 * Open:     every call is denied until timeout has elapsed since the last failure; the
 *           first call after that moves to HalfOpen and is itself allowed.
 * HalfOpen: trial calls are allowed (at most max_half_open_trials in flight);
 *           success_threshold successes close the circuit, any failure reopens it.
 */

#include "axiom/common.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace axiom::breaker {

enum class State { kClosed, kOpen, kHalfOpen };

[[nodiscard]] std::string_view state_name(State state) noexcept;

struct BreakerConfig
{
    int failure_threshold;           ///< Consecutive failures before opening, > 0
    int success_threshold;           ///< HalfOpen successes before closing, > 0
    std::chrono::milliseconds timeout;  ///< Open window before a trial is admitted
    int max_half_open_trials;        ///< Concurrent HalfOpen trials, > 0
};

inline constexpr BreakerConfig kDefaultBreaker{.failure_threshold = 5,
                                               .success_threshold = 2,
                                               .timeout = std::chrono::seconds{30},
                                               .max_half_open_trials = 1};

[[nodiscard]] axiom::VoidResult validate(const BreakerConfig& config);

/// Counters and state captured under the breaker's lock
struct Snapshot
{
    State state;
    int failures;
    int successes;
    int trials_in_flight;
};

class CircuitBreaker
{
public:
    using NowFn = std::function<SteadyClock::time_point()>;
    using Observer = std::function<void(std::string_view name, State from, State to)>;

    CircuitBreaker(std::string name, BreakerConfig config, NowFn now = {});

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    /**
     * Install the transition observer. Called after the lock is released,
     * once per transition.
     */
    void set_observer(Observer observer);

    [[nodiscard]] bool allow();
    void record_success();
    void record_failure();

    /**
     * Return a HalfOpen trial slot taken by allow() whose call never ran.
     * Counters and state are unchanged.
     */
    void release_trial();

    [[nodiscard]] State state() const;
    [[nodiscard]] Snapshot snapshot() const;

    /**
     * Time left before an Open circuit admits a trial; zero when not Open.
     */
    [[nodiscard]] std::chrono::milliseconds retry_after() const;

    [[nodiscard]] const std::string& name() const noexcept { return m_name; }
    [[nodiscard]] const BreakerConfig& config() const noexcept { return m_config; }

private:
    struct Transition
    {
        bool happened = false;
        State from = State::kClosed;
        State to = State::kClosed;
    };

    [[nodiscard]] Transition set_state_locked(State next);
    void notify(const Transition& transition) const;

    std::string m_name;
    BreakerConfig m_config;
    NowFn m_now;
    Observer m_observer;

    mutable std::mutex m_mutex;
    State m_state = State::kClosed;
    int m_failures = 0;
    int m_successes = 0;
    int m_trials_in_flight = 0;
    SteadyClock::time_point m_last_failure{};
};

/**
 * Named breakers, one per downstream dependency, created once at startup
 */
class Registry
{
public:
    explicit Registry(CircuitBreaker::NowFn now = {});

    /**
     * Create the breaker for a dependency; an existing breaker is kept.
     */
    CircuitBreaker& add(const std::string& dependency, BreakerConfig config);

    [[nodiscard]] CircuitBreaker* find(std::string_view dependency) const;

    void set_observer(const CircuitBreaker::Observer& observer);

private:
    CircuitBreaker::NowFn m_now;
    std::map<std::string, std::unique_ptr<CircuitBreaker>, std::less<>> m_breakers;
};

/// Dependency names used by the built-in operation policies
inline constexpr std::string_view kAiGeneration = "ai_generation";
inline constexpr std::string_view kFormalVerification = "formal_verification";

}  // namespace axiom::breaker
