// =================================================================
// tests/CircuitBreakerTest.cpp
// =================================================================
// Unit tests for the CircuitBreaker state machine.

#include "Switchyard/CircuitBreaker.hpp"
#include "FakeBackend.hpp"
#include <iostream>
#include <cassert>

using Switchyard::BreakerState;
using Switchyard::FailureSource;
using std::chrono::milliseconds;

class CircuitBreakerTest {
private:
    Switchyard::CircuitBreakerConfig m_config;
    Switchyard::Clock::time_point m_t0 = Switchyard::Clock::now();

public:
    CircuitBreakerTest() {
        m_config.failure_threshold = 3;
        m_config.cooldown = milliseconds(1000);
        m_config.backoff_multiplier = 2.0;
        m_config.max_cooldown = milliseconds(3000);
    }

    void testOpensAfterThreshold() {
        std::cout << "Testing breaker opens after consecutive failures..." << std::endl;

        Switchyard::CircuitBreaker breaker(m_config);
        assert(breaker.state() == BreakerState::CLOSED);

        breaker.recordFailure(FailureSource::DISPATCH, m_t0);
        breaker.recordFailure(FailureSource::DISPATCH, m_t0);
        assert(breaker.state() == BreakerState::CLOSED && "Below threshold stays closed");

        auto transition = breaker.recordFailure(FailureSource::DISPATCH, m_t0);
        assert(transition.changed && transition.to == BreakerState::OPEN && "Threshold opens the breaker");
        assert(breaker.openUntil() == m_t0 + milliseconds(1000));

        std::cout << "✓ Threshold test passed" << std::endl;
    }

    void testSuccessResetsStreak() {
        std::cout << "Testing success resets the failure streak..." << std::endl;

        Switchyard::CircuitBreaker breaker(m_config);
        breaker.recordFailure(FailureSource::DISPATCH, m_t0);
        breaker.recordFailure(FailureSource::DISPATCH, m_t0);
        breaker.recordSuccess(FailureSource::DISPATCH);
        breaker.recordFailure(FailureSource::DISPATCH, m_t0);
        breaker.recordFailure(FailureSource::DISPATCH, m_t0);
        assert(breaker.state() == BreakerState::CLOSED && "Failures must be consecutive");
        assert(breaker.consecutiveFailures() == 2);

        std::cout << "✓ Streak reset test passed" << std::endl;
    }

    void testProbeFailureOpensImmediately() {
        std::cout << "Testing probe failure opens immediately..." << std::endl;

        Switchyard::CircuitBreaker breaker(m_config);
        auto transition = breaker.recordFailure(FailureSource::PROBE, m_t0);
        assert(transition.changed && breaker.state() == BreakerState::OPEN && "One failed probe opens");

        std::cout << "✓ Probe failure test passed" << std::endl;
    }

    void testSingleTrialAfterCooldown() {
        std::cout << "Testing exactly one trial after cool-down..." << std::endl;

        Switchyard::CircuitBreaker breaker(m_config);
        breaker.recordFailure(FailureSource::PROBE, m_t0);

        assert(!breaker.tryAcquire(m_t0 + milliseconds(999)) && "Refused during cool-down");
        assert(breaker.state() == BreakerState::OPEN);

        Switchyard::BreakerTransition transition;
        assert(breaker.tryAcquire(m_t0 + milliseconds(1000), &transition) && "First caller gets the trial");
        assert(transition.changed && transition.to == BreakerState::HALF_OPEN);
        assert(breaker.trialInFlight());

        assert(!breaker.tryAcquire(m_t0 + milliseconds(1001)) && "Second caller is refused");

        breaker.recordSuccess(FailureSource::DISPATCH);
        assert(breaker.state() == BreakerState::CLOSED && "Trial success closes");
        assert(breaker.tryAcquire(m_t0 + milliseconds(1002)) && "Closed breaker permits calls");

        std::cout << "✓ Single trial test passed" << std::endl;
    }

    void testFailedTrialBacksOff() {
        std::cout << "Testing failed trial reopens with backoff..." << std::endl;

        Switchyard::CircuitBreaker breaker(m_config);
        breaker.recordFailure(FailureSource::PROBE, m_t0);

        auto t1 = m_t0 + milliseconds(1000);
        assert(breaker.tryAcquire(t1));
        breaker.recordFailure(FailureSource::DISPATCH, t1);
        assert(breaker.state() == BreakerState::OPEN && "Failed trial reopens");
        assert(breaker.currentCooldown() == milliseconds(2000) && "Cool-down doubles");
        assert(breaker.openUntil() == t1 + milliseconds(2000));

        auto t2 = t1 + milliseconds(2000);
        assert(breaker.tryAcquire(t2));
        breaker.recordFailure(FailureSource::PROBE, t2);
        assert(breaker.currentCooldown() == milliseconds(3000) && "Cool-down is capped");

        auto t3 = t2 + milliseconds(3000);
        assert(breaker.tryAcquire(t3));
        breaker.recordSuccess(FailureSource::PROBE);
        assert(breaker.state() == BreakerState::CLOSED);
        assert(breaker.currentCooldown() == milliseconds(1000) && "Recovery resets the cool-down");

        std::cout << "✓ Backoff test passed" << std::endl;
    }

    void testReleaseTrial() {
        std::cout << "Testing released trial can be taken again..." << std::endl;

        Switchyard::CircuitBreaker breaker(m_config);
        breaker.recordFailure(FailureSource::PROBE, m_t0);

        auto t1 = m_t0 + milliseconds(1000);
        assert(breaker.tryAcquire(t1));
        breaker.releaseTrial();
        assert(breaker.state() == BreakerState::HALF_OPEN && "Release keeps half-open");
        assert(breaker.tryAcquire(t1) && "Trial is available again");

        std::cout << "✓ Release trial test passed" << std::endl;
    }

    void testForceState() {
        std::cout << "Testing forced states..." << std::endl;

        Switchyard::CircuitBreaker breaker(m_config);
        auto transition = breaker.forceState(BreakerState::OPEN, m_t0);
        assert(transition.changed && breaker.state() == BreakerState::OPEN);
        assert(!breaker.tryAcquire(m_t0));

        breaker.forceState(BreakerState::CLOSED, m_t0);
        assert(breaker.state() == BreakerState::CLOSED && breaker.consecutiveFailures() == 0);

        transition = breaker.forceState(BreakerState::CLOSED, m_t0);
        assert(!transition.changed && "Same state is not a transition");

        std::cout << "✓ Forced state test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running CircuitBreaker unit tests..." << std::endl;
        std::cout << "====================================" << std::endl << std::endl;

        testOpensAfterThreshold();
        std::cout << std::endl;

        testSuccessResetsStreak();
        std::cout << std::endl;

        testProbeFailureOpensImmediately();
        std::cout << std::endl;

        testSingleTrialAfterCooldown();
        std::cout << std::endl;

        testFailedTrialBacksOff();
        std::cout << std::endl;

        testReleaseTrial();
        std::cout << std::endl;

        testForceState();
        std::cout << std::endl;

        std::cout << "All CircuitBreaker tests passed!" << std::endl;
    }
};

int main() {
    try {
        SwitchyardTest::quietLogging();
        CircuitBreakerTest tests;
        tests.runAllTests();
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
