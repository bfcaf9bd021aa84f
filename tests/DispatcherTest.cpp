// =================================================================
// tests/DispatcherTest.cpp
// =================================================================
// Unit tests for Dispatcher fallback and cancellation.

#include "Switchyard/Dispatcher.hpp"
#include "Switchyard/CancellationToken.hpp"
#include "FakeBackend.hpp"
#include <iostream>
#include <cassert>
#include <future>
#include <thread>

using Switchyard::AttemptOutcome;
using Switchyard::BackendClass;
using Switchyard::BreakerState;
using Switchyard::ErrorKind;
using SwitchyardTest::FakeBackend;
using SwitchyardTest::makeBackendConfig;

namespace {

const BackendClass LIGHT = BackendClass::LIGHTWEIGHT;
const BackendClass HEAVY = BackendClass::HEAVYWEIGHT;

Switchyard::Request makeRequest(const std::string& prompt) {
    Switchyard::Request request;
    request.id = "req_dispatch";
    request.prompt = prompt;
    request.tier = Switchyard::CustomerTier::PREMIUM;
    request.arrival = Switchyard::Clock::now();
    return request;
}

/**
 * @brief Registry with one lightweight and one heavyweight fake
 */
struct Fixture {
    Switchyard::CircuitBreakerConfig breaker;
    std::unique_ptr<Switchyard::BackendRegistry> registry;
    std::shared_ptr<FakeBackend> light = std::make_shared<FakeBackend>("light-model");
    std::shared_ptr<FakeBackend> heavy = std::make_shared<FakeBackend>("heavy-model");

    explicit Fixture(size_t failure_threshold = 3) {
        breaker.failure_threshold = failure_threshold;
        registry = std::make_unique<Switchyard::BackendRegistry>(breaker);
        registry->addBackend(makeBackendConfig("light", LIGHT), light);
        registry->addBackend(makeBackendConfig("heavy", HEAVY, 0.02), heavy);
    }
};

} // anonymous namespace

class DispatcherTest {
public:
    void testFirstChoiceSucceeds() {
        std::cout << "Testing first choice success..." << std::endl;

        Fixture fixture;
        Switchyard::Dispatcher dispatcher(*fixture.registry);
        auto result = dispatcher.dispatch(makeRequest("Explain recursion"), {HEAVY, LIGHT});

        assert(result.success && "Healthy heavyweight answers");
        assert(result.decision.backend_id == "heavy");
        assert(result.decision.model_name == "heavy-model");
        assert(result.decision.attempts.size() == 1 && result.backend_calls == 1);
        assert(result.decision.rationale == "first choice");
        assert(result.text.find("heavy-model answered") == 0);
        assert(fixture.light->calls() == 0 && "Lightweight never called");

        std::cout << "✓ First choice test passed" << std::endl;
    }

    void testFallbackOnTimeout() {
        std::cout << "Testing fallback on timeout..." << std::endl;

        Fixture fixture;
        fixture.heavy->setMode(FakeBackend::Mode::TIMEOUT);
        Switchyard::Dispatcher dispatcher(*fixture.registry);
        auto result = dispatcher.dispatch(makeRequest("Explain recursion"), {HEAVY, LIGHT});

        assert(result.success && result.decision.backend_id == "light" && "Falls back to lightweight");
        assert(result.decision.attempts.size() == 2);
        assert(result.decision.attempts[0].outcome == AttemptOutcome::TIMEOUT);
        assert(result.decision.attempts[1].outcome == AttemptOutcome::SUCCESS);
        assert(result.decision.rationale.find("heavy timeout") != std::string::npos);
        assert(fixture.registry->listAll()[1].consecutive_failures == 1 && "Timeout counted against heavy");

        std::cout << "✓ Fallback on timeout test passed" << std::endl;
    }

    void testOpenBackendSkippedWithoutCall() {
        std::cout << "Testing open backend is skipped without a call..." << std::endl;

        Fixture fixture;
        fixture.registry->setHealth("heavy", BreakerState::OPEN);
        Switchyard::Dispatcher dispatcher(*fixture.registry);
        auto result = dispatcher.dispatch(makeRequest("Write a sorting algorithm"), {HEAVY, LIGHT});

        assert(result.success && result.decision.backend_id == "light");
        assert(result.decision.attempts.size() == 2 && "Skip is recorded");
        assert(result.decision.attempts[0].backend_id == "heavy");
        assert(result.decision.attempts[0].outcome == AttemptOutcome::SKIPPED_OPEN);
        assert(result.backend_calls == 1 && "Only one real call");
        assert(fixture.heavy->calls() == 0 && "Open backend never contacted");
        assert(result.decision.rationale == "fallback after heavy skipped_open");

        std::cout << "✓ Skip open backend test passed" << std::endl;
    }

    void testAllBackendsUnavailable() {
        std::cout << "Testing all backends unavailable..." << std::endl;

        Fixture fixture;
        fixture.registry->setHealth("heavy", BreakerState::OPEN);
        fixture.registry->setHealth("light", BreakerState::OPEN);
        Switchyard::Dispatcher dispatcher(*fixture.registry);
        auto result = dispatcher.dispatch(makeRequest("Hello"), {LIGHT, HEAVY});

        assert(!result.success && result.error_kind == ErrorKind::ALL_BACKENDS_UNAVAILABLE);
        assert(result.backend_calls == 0 && "No call issued");
        assert(result.decision.attempts.size() == 2);
        assert(fixture.light->calls() == 0 && fixture.heavy->calls() == 0);
        assert(result.latency < std::chrono::milliseconds(1000) && "Fails fast");

        // Every candidate failing is also exhaustion
        Fixture failing;
        failing.light->setMode(FakeBackend::Mode::REJECT);
        failing.heavy->setMode(FakeBackend::Mode::TIMEOUT);
        Switchyard::Dispatcher dispatcher2(*failing.registry);
        result = dispatcher2.dispatch(makeRequest("Hello"), {LIGHT, HEAVY});
        assert(!result.success && result.error_kind == ErrorKind::ALL_BACKENDS_UNAVAILABLE);
        assert(result.backend_calls == 2);
        assert(result.decision.rationale.find("exhausted") == 0);

        std::cout << "✓ All unavailable test passed" << std::endl;
    }

    void testNoBackendForClass() {
        std::cout << "Testing preference naming a class with no backends..." << std::endl;

        Switchyard::BackendRegistry registry;
        registry.addBackend(makeBackendConfig("light", LIGHT), std::make_shared<FakeBackend>("light-model"));
        Switchyard::Dispatcher dispatcher(registry);

        auto result = dispatcher.dispatch(makeRequest("Hello"), {HEAVY});
        assert(!result.success && result.error_kind == ErrorKind::ALL_BACKENDS_UNAVAILABLE);
        assert(result.decision.attempts.empty());

        auto duplicates = dispatcher.dispatch(makeRequest("Hello"), {LIGHT, LIGHT});
        assert(duplicates.success && duplicates.decision.attempts.size() == 1 && "Repeated class adds nothing");

        std::cout << "✓ Missing class test passed" << std::endl;
    }

    void testAttemptLimit() {
        std::cout << "Testing attempt limit..." << std::endl;

        Switchyard::BackendRegistry registry;
        std::vector<std::shared_ptr<FakeBackend>> backends;
        for (int i = 0; i < 6; ++i) {
            auto backend = std::make_shared<FakeBackend>("m" + std::to_string(i), FakeBackend::Mode::REJECT);
            backends.push_back(backend);
            registry.addBackend(makeBackendConfig("light-" + std::to_string(i), LIGHT), backend);
        }

        Switchyard::DispatchConfig config;
        config.max_attempts = 4;
        Switchyard::Dispatcher dispatcher(registry, config);
        auto result = dispatcher.dispatch(makeRequest("Hello"), {LIGHT});

        assert(!result.success && result.error_kind == ErrorKind::ALL_BACKENDS_UNAVAILABLE);
        assert(result.backend_calls == 4 && "Stops at the configured limit");
        assert(backends[4]->calls() == 0 && backends[5]->calls() == 0);

        std::cout << "✓ Attempt limit test passed" << std::endl;
    }

    void testRejectionOpensBreaker() {
        std::cout << "Testing rejection feeds the breaker..." << std::endl;

        Fixture fixture(1);
        fixture.heavy->setMode(FakeBackend::Mode::REJECT);
        Switchyard::Dispatcher dispatcher(*fixture.registry);

        auto first = dispatcher.dispatch(makeRequest("Hello"), {HEAVY, LIGHT});
        assert(first.success && first.decision.attempts[0].outcome == AttemptOutcome::REJECTED);
        assert(fixture.registry->getHealth("heavy") == BreakerState::OPEN && "Threshold 1 opens at once");

        auto second = dispatcher.dispatch(makeRequest("Hello"), {HEAVY, LIGHT});
        assert(second.decision.attempts[0].outcome == AttemptOutcome::SKIPPED_OPEN);
        assert(fixture.heavy->calls() == 1 && "Open backend not called again");

        // A throwing client counts as a rejection
        Fixture throwing(1);
        throwing.heavy->setMode(FakeBackend::Mode::THROW);
        Switchyard::Dispatcher dispatcher2(*throwing.registry);
        auto result = dispatcher2.dispatch(makeRequest("Hello"), {HEAVY, LIGHT});
        assert(result.success && result.decision.attempts[0].outcome == AttemptOutcome::REJECTED);
        assert(result.decision.attempts[0].detail.find("transport exploded") != std::string::npos);
        assert(throwing.registry->getHealth("heavy") == BreakerState::OPEN);

        std::cout << "✓ Rejection test passed" << std::endl;
    }

    void testCancelledBeforeDispatch() {
        std::cout << "Testing cancellation before any call..." << std::endl;

        Fixture fixture;
        auto cancel = std::make_shared<Switchyard::CancellationToken>();
        cancel->cancel();

        Switchyard::Dispatcher dispatcher(*fixture.registry);
        auto result = dispatcher.dispatch(makeRequest("Hello"), {LIGHT, HEAVY}, cancel);

        assert(!result.success && result.error_kind == ErrorKind::CANCELLED);
        assert(result.backend_calls == 0);
        assert(fixture.light->calls() == 0 && fixture.heavy->calls() == 0);

        std::cout << "✓ Cancel before dispatch test passed" << std::endl;
    }

    void testCancelledDuringCall() {
        std::cout << "Testing cancellation during an in-flight call..." << std::endl;

        Fixture fixture(1);
        fixture.heavy->setMode(FakeBackend::Mode::BLOCK_UNTIL_CANCELLED);
        auto cancel = std::make_shared<Switchyard::CancellationToken>();

        Switchyard::Dispatcher dispatcher(*fixture.registry);
        auto future = std::async(std::launch::async, [&dispatcher, cancel]() {
            return dispatcher.dispatch(makeRequest("Hello"), {HEAVY, LIGHT}, cancel);
        });

        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (!fixture.heavy->isBlocked() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
        assert(fixture.heavy->isBlocked() && "Call is in flight");

        cancel->cancel();
        auto result = future.get();

        assert(!result.success && result.error_kind == ErrorKind::CANCELLED);
        assert(result.decision.attempts.size() == 1);
        assert(result.decision.attempts[0].outcome == AttemptOutcome::CANCELLED);
        assert(fixture.light->calls() == 0 && "No fallback after cancellation");
        assert(fixture.registry->getHealth("heavy") == BreakerState::CLOSED && "Cancel is not a failure");

        std::cout << "✓ Cancel during call test passed" << std::endl;
    }

    void testCancellationToken() {
        std::cout << "Testing cancellation token callbacks..." << std::endl;

        Switchyard::CancellationToken token;
        int fired = 0;
        size_t kept = token.onCancel([&fired]() { fired++; });
        size_t removed = token.onCancel([&fired]() { fired += 100; });
        token.removeCallback(removed);
        (void)kept;

        assert(!token.isCancelled());
        token.cancel();
        assert(token.isCancelled() && fired == 1 && "Only registered callbacks fire");

        token.cancel();
        assert(fired == 1 && "Cancel is idempotent");

        token.onCancel([&fired]() { fired += 10; });
        assert(fired == 11 && "Late registration fires immediately");

        std::cout << "✓ Cancellation token test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running Dispatcher unit tests..." << std::endl;
        std::cout << "================================" << std::endl << std::endl;

        testFirstChoiceSucceeds();
        std::cout << std::endl;

        testFallbackOnTimeout();
        std::cout << std::endl;

        testOpenBackendSkippedWithoutCall();
        std::cout << std::endl;

        testAllBackendsUnavailable();
        std::cout << std::endl;

        testNoBackendForClass();
        std::cout << std::endl;

        testAttemptLimit();
        std::cout << std::endl;

        testRejectionOpensBreaker();
        std::cout << std::endl;

        testCancelledBeforeDispatch();
        std::cout << std::endl;

        testCancelledDuringCall();
        std::cout << std::endl;

        testCancellationToken();
        std::cout << std::endl;

        std::cout << "All Dispatcher tests passed!" << std::endl;
    }
};

int main() {
    try {
        SwitchyardTest::quietLogging();
        DispatcherTest tests;
        tests.runAllTests();
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
