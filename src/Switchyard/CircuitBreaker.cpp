// =================================================================
// src/Switchyard/CircuitBreaker.cpp
// =================================================================
// Implementation of the per-backend circuit breaker.

#include "Switchyard/CircuitBreaker.hpp"
#include <algorithm>

namespace Switchyard {

CircuitBreaker::CircuitBreaker(const CircuitBreakerConfig& config)
    : m_config(config), m_current_cooldown(config.cooldown) {
    if (m_config.failure_threshold == 0) {
        m_config.failure_threshold = 1;
    }
    if (m_config.max_cooldown < m_config.cooldown) {
        m_config.max_cooldown = m_config.cooldown;
    }
}

bool CircuitBreaker::tryAcquire(Clock::time_point now, BreakerTransition* transition) {
    switch (m_state) {
        case BreakerState::CLOSED:
            return true;

        case BreakerState::OPEN:
            if (now < m_open_until) {
                return false;
            }
            {
                auto moved = transitionTo(BreakerState::HALF_OPEN);
                if (transition) {
                    *transition = moved;
                }
            }
            m_trial_in_flight = true;
            return true;

        case BreakerState::HALF_OPEN:
            if (m_trial_in_flight) {
                return false;
            }
            m_trial_in_flight = true;
            return true;
    }
    return false;
}

BreakerTransition CircuitBreaker::recordSuccess(FailureSource source) {
    switch (m_state) {
        case BreakerState::HALF_OPEN:
            m_trial_in_flight = false;
            m_consecutive_failures = 0;
            m_current_cooldown = m_config.cooldown;
            return transitionTo(BreakerState::CLOSED);

        case BreakerState::CLOSED:
            // A passing probe says nothing about the dispatch failure streak
            if (source == FailureSource::DISPATCH) {
                m_consecutive_failures = 0;
            }
            return BreakerTransition{};

        case BreakerState::OPEN:
            // Late result of a call issued before the breaker opened
            return BreakerTransition{};
    }
    return BreakerTransition{};
}

BreakerTransition CircuitBreaker::recordFailure(FailureSource source, Clock::time_point now) {
    switch (m_state) {
        case BreakerState::CLOSED:
            if (source == FailureSource::PROBE) {
                m_consecutive_failures++;
                open(now, m_config.cooldown);
                return BreakerTransition{true, BreakerState::CLOSED, BreakerState::OPEN};
            }
            m_consecutive_failures++;
            if (m_consecutive_failures >= m_config.failure_threshold) {
                open(now, m_config.cooldown);
                return BreakerTransition{true, BreakerState::CLOSED, BreakerState::OPEN};
            }
            return BreakerTransition{};

        case BreakerState::HALF_OPEN:
            m_trial_in_flight = false;
            m_consecutive_failures++;
            open(now, nextCooldown());
            return BreakerTransition{true, BreakerState::HALF_OPEN, BreakerState::OPEN};

        case BreakerState::OPEN:
            return BreakerTransition{};
    }
    return BreakerTransition{};
}

void CircuitBreaker::releaseTrial() {
    m_trial_in_flight = false;
}

BreakerTransition CircuitBreaker::forceState(BreakerState state, Clock::time_point now) {
    BreakerState previous = m_state;

    switch (state) {
        case BreakerState::CLOSED:
            m_consecutive_failures = 0;
            m_current_cooldown = m_config.cooldown;
            m_trial_in_flight = false;
            m_state = BreakerState::CLOSED;
            break;
        case BreakerState::OPEN:
            open(now, m_current_cooldown);
            break;
        case BreakerState::HALF_OPEN:
            m_trial_in_flight = false;
            m_state = BreakerState::HALF_OPEN;
            break;
    }

    return BreakerTransition{previous != m_state, previous, m_state};
}

BreakerTransition CircuitBreaker::transitionTo(BreakerState next) {
    BreakerTransition transition{m_state != next, m_state, next};
    m_state = next;
    return transition;
}

void CircuitBreaker::open(Clock::time_point now, std::chrono::milliseconds cooldown) {
    m_current_cooldown = std::min(cooldown, m_config.max_cooldown);
    m_open_until = now + m_current_cooldown;
    m_trial_in_flight = false;
    m_state = BreakerState::OPEN;
}

std::chrono::milliseconds CircuitBreaker::nextCooldown() const {
    double grown = static_cast<double>(m_current_cooldown.count()) *
                   std::max(1.0, m_config.backoff_multiplier);
    double capped = std::min(grown, static_cast<double>(m_config.max_cooldown.count()));
    return std::chrono::milliseconds(static_cast<long long>(capped));
}

} // namespace Switchyard
