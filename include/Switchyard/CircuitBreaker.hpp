// =================================================================
// include/Switchyard/CircuitBreaker.hpp
// =================================================================
// Per-backend circuit breaker state machine.

#pragma once

#include "Switchyard/RoutingTypes.hpp"
#include <string>
#include <chrono>
#include <cstddef>

namespace Switchyard {

/**
 * @brief Circuit breaker tuning
 */
struct CircuitBreakerConfig {
    size_t failure_threshold = 3;                    ///< Consecutive dispatch failures before opening
    std::chrono::milliseconds cooldown{15000};       ///< Initial open interval
    double backoff_multiplier = 2.0;                 ///< Cool-down growth after a failed trial
    std::chrono::milliseconds max_cooldown{120000};  ///< Cool-down cap
};

/**
 * @brief Source of a failure reported to the breaker
 */
enum class FailureSource {
    DISPATCH,  ///< A routed request timed out or was rejected
    PROBE      ///< A liveness probe failed
};

/**
 * @brief Result of a state-changing call
 */
struct BreakerTransition {
    bool changed = false;
    BreakerState from = BreakerState::CLOSED;
    BreakerState to = BreakerState::CLOSED;
};

/**
 * @brief Closed / open / half-open state machine for one backend
 *
 * closed:    calls permitted; a probe failure or N consecutive dispatch
 *            failures opens the breaker.
 * open:      calls refused until the cool-down elapses; the first caller
 *            after that moves the breaker to half-open and owns the trial.
 * half-open: exactly one trial in flight; success closes, failure reopens
 *            with the cool-down multiplied up to the configured maximum.
 *
 * Not thread-safe on its own; BackendRegistry serializes access per backend.
 */
class CircuitBreaker {
public:
    explicit CircuitBreaker(const CircuitBreakerConfig& config = CircuitBreakerConfig());

    /**
     * @brief Ask permission to issue a call
     * @param now Current monotonic time
     * @param transition Filled when the call moved the breaker to half-open
     * @return True if the caller may issue the call
     */
    bool tryAcquire(Clock::time_point now, BreakerTransition* transition = nullptr);

    /**
     * @brief Report a successful call
     * @param source Whether the call was a dispatch or a probe
     */
    BreakerTransition recordSuccess(FailureSource source);

    /**
     * @brief Report a failed call
     * @param source Dispatch failures count toward the threshold, probe failures open at once
     * @param now Current monotonic time
     */
    BreakerTransition recordFailure(FailureSource source, Clock::time_point now);

    /**
     * @brief Release a trial permit without an outcome (e.g. caller cancelled)
     */
    void releaseTrial();

    /**
     * @brief Force a state, used by operators and tests
     */
    BreakerTransition forceState(BreakerState state, Clock::time_point now);

    BreakerState state() const { return m_state; }
    size_t consecutiveFailures() const { return m_consecutive_failures; }
    Clock::time_point openUntil() const { return m_open_until; }
    std::chrono::milliseconds currentCooldown() const { return m_current_cooldown; }
    bool trialInFlight() const { return m_trial_in_flight; }

    const CircuitBreakerConfig& getConfig() const { return m_config; }

private:
    CircuitBreakerConfig m_config;
    BreakerState m_state = BreakerState::CLOSED;
    size_t m_consecutive_failures = 0;
    bool m_trial_in_flight = false;
    std::chrono::milliseconds m_current_cooldown;
    Clock::time_point m_open_until{};

    BreakerTransition transitionTo(BreakerState next);
    void open(Clock::time_point now, std::chrono::milliseconds cooldown);
    std::chrono::milliseconds nextCooldown() const;
};

} // namespace Switchyard
