// =================================================================
// src/Switchyard/Dispatcher.cpp
// =================================================================
// Implementation of the dispatcher and its fallback loop.

#include "Switchyard/Dispatcher.hpp"
#include "Switchyard/Logger.hpp"
#include <algorithm>
#include <sstream>

namespace Switchyard {

Dispatcher::Dispatcher(BackendRegistry& registry, const DispatchConfig& config)
    : m_registry(registry), m_config(config) {
}

DispatchResult Dispatcher::dispatch(const Request& request,
                                    const std::vector<BackendClass>& preferences,
                                    const std::shared_ptr<CancellationToken>& cancel) {
    auto start_time = std::chrono::steady_clock::now();
    auto finish = [&start_time](DispatchResult& result) {
        result.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
    };

    DispatchResult result;
    std::vector<BackendClass> walked;

    for (BackendClass backend_class : preferences) {
        // A class listed twice adds no new candidates
        if (std::find(walked.begin(), walked.end(), backend_class) != walked.end()) {
            continue;
        }
        walked.push_back(backend_class);

        for (const auto& backend : m_registry.get(backend_class)) {
            if (cancel && cancel->isCancelled()) {
                result.error_kind = ErrorKind::CANCELLED;
                result.error_message = "Request cancelled by caller";
                result.decision.rationale = "cancelled during fallback";
                finish(result);
                return result;
            }

            if (result.backend_calls >= m_config.max_attempts) {
                result.error_kind = ErrorKind::ALL_BACKENDS_UNAVAILABLE;
                result.error_message = "Gave up after " + std::to_string(result.backend_calls) + " backend calls";
                result.decision.rationale = "attempt limit reached; " + describeFallback(result.decision.attempts);
                finish(result);
                return result;
            }

            DispatchAttempt skipped;
            skipped.backend_id = backend.id;
            skipped.backend_class = backend.backend_class;
            skipped.outcome = AttemptOutcome::SKIPPED_OPEN;

            if (!backend.isEligible(m_registry.now())) {
                skipped.detail = "breaker open";
                result.decision.attempts.push_back(skipped);
                continue;
            }

            AcquireResult permit = m_registry.tryAcquire(backend.id);
            if (!permit.granted) {
                skipped.detail = "breaker refused call";
                result.decision.attempts.push_back(skipped);
                continue;
            }

            std::string text;
            DispatchAttempt attempt = callBackend(request, backend, permit, cancel, text);
            result.decision.attempts.push_back(attempt);
            result.backend_calls++;

            if (attempt.outcome == AttemptOutcome::SUCCESS) {
                result.success = true;
                result.text = std::move(text);
                result.decision.backend_id = backend.id;
                result.decision.backend_class = backend.backend_class;
                result.decision.model_name = backend.model_name;
                result.decision.rationale = result.decision.attempts.size() == 1
                    ? "first choice"
                    : describeFallback(result.decision.attempts);
                finish(result);
                return result;
            }

            if (attempt.outcome == AttemptOutcome::CANCELLED) {
                result.error_kind = ErrorKind::CANCELLED;
                result.error_message = "Request cancelled by caller";
                result.decision.rationale = "cancelled while calling " + backend.id;
                finish(result);
                return result;
            }
        }
    }

    result.error_kind = ErrorKind::ALL_BACKENDS_UNAVAILABLE;
    if (result.decision.attempts.empty()) {
        result.error_message = "No backend configured for " + RoutingTypeUtils::classListToString(preferences);
        result.decision.rationale = "no candidates";
    } else {
        result.error_message = "All candidate backends are open or failed";
        result.decision.rationale = "exhausted; " + describeFallback(result.decision.attempts);
    }
    finish(result);
    return result;
}

DispatchAttempt Dispatcher::callBackend(const Request& request, const BackendStatus& backend,
                                        const AcquireResult& permit,
                                        const std::shared_ptr<CancellationToken>& cancel,
                                        std::string& text) {
    DispatchAttempt attempt;
    attempt.backend_id = backend.id;
    attempt.backend_class = backend.backend_class;

    BackendReply reply;
    try {
        auto client = m_registry.getClient(backend.id);
        reply = client->generate(request.prompt, m_config.attempt_timeout, cancel);
    } catch (const std::exception& e) {
        reply = BackendReply();
        reply.error = std::string("Backend raised: ") + e.what();
    }

    attempt.latency = reply.latency;

    if (reply.cancelled) {
        // Not a verdict on the backend
        attempt.outcome = AttemptOutcome::CANCELLED;
        attempt.detail = reply.error;
        if (permit.trial) {
            m_registry.releaseTrial(backend.id);
        }
        return attempt;
    }

    if (reply.ok) {
        attempt.outcome = AttemptOutcome::SUCCESS;
        text = std::move(reply.text);
        m_registry.recordSuccess(backend.id, FailureSource::DISPATCH);
        return attempt;
    }

    attempt.outcome = reply.timed_out ? AttemptOutcome::TIMEOUT : AttemptOutcome::REJECTED;
    attempt.detail = reply.error;
    m_registry.recordFailure(backend.id, FailureSource::DISPATCH,
                             RoutingTypeUtils::attemptOutcomeToString(attempt.outcome) + ": " + reply.error);

    Logger::getInstance().warning("Dispatcher",
        "Attempt on " + backend.id + " failed for " + request.id,
        RoutingTypeUtils::errorKindToString(reply.timed_out ? ErrorKind::BACKEND_TIMEOUT
                                                            : ErrorKind::BACKEND_REJECTED) +
        (reply.error.empty() ? "" : ", " + reply.error));
    return attempt;
}

std::string Dispatcher::describeFallback(const std::vector<DispatchAttempt>& attempts) {
    std::ostringstream oss;
    oss << "fallback after ";
    bool first = true;
    for (const auto& attempt : attempts) {
        if (attempt.outcome == AttemptOutcome::SUCCESS) {
            continue;
        }
        if (!first) {
            oss << ", ";
        }
        oss << attempt.backend_id << " " << RoutingTypeUtils::attemptOutcomeToString(attempt.outcome);
        first = false;
    }
    return oss.str();
}

} // namespace Switchyard
