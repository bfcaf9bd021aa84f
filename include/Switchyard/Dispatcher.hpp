// =================================================================
// include/Switchyard/Dispatcher.hpp
// =================================================================
// Executes backend calls and owns the fallback walk.

#pragma once

#include "Switchyard/RoutingTypes.hpp"
#include "Switchyard/RouterConfig.hpp"
#include "Switchyard/BackendRegistry.hpp"
#include "Switchyard/CancellationToken.hpp"
#include <string>
#include <vector>
#include <memory>
#include <chrono>

namespace Switchyard {

/**
 * @brief Outcome of dispatching one request
 *
 * The decision is kept on failure too so metering and audit logs can see
 * every attempt that was made.
 */
struct DispatchResult {
    bool success = false;
    RoutingDecision decision;
    std::string text;                                       ///< Generated text on success
    ErrorKind error_kind = ErrorKind::ALL_BACKENDS_UNAVAILABLE;
    std::string error_message;
    std::chrono::milliseconds latency{0};                   ///< Whole walk, wall time
    size_t backend_calls = 0;                               ///< Real calls issued
};

/**
 * @brief Walks a preference list calling backends until one succeeds
 *
 * For each class in order, backends of that class are tried in configuration
 * order. Open backends are recorded as skipped without a call. Timeouts and
 * rejections are reported to the backend's breaker and the walk advances.
 * Holds no per-request state; one instance serves all request threads.
 */
class Dispatcher {
public:
    /**
     * @brief Constructor
     * @param registry Backend registry consulted for candidates and breakers
     * @param config Per-attempt timeout and attempt limit
     */
    Dispatcher(BackendRegistry& registry, const DispatchConfig& config = DispatchConfig());

    /**
     * @brief Dispatch a request
     * @param request Request to serve
     * @param preferences Ordered backend classes from the tier policy
     * @param cancel Optional caller cancellation token
     * @return Result with the attempt sequence; error_kind set when not successful
     */
    DispatchResult dispatch(const Request& request,
                            const std::vector<BackendClass>& preferences,
                            const std::shared_ptr<CancellationToken>& cancel = nullptr);

    const DispatchConfig& getConfig() const { return m_config; }

private:
    BackendRegistry& m_registry;
    DispatchConfig m_config;

    /**
     * @brief Issue one call to a backend that granted a permit
     * @return Attempt record; the breaker has already been updated
     */
    DispatchAttempt callBackend(const Request& request, const BackendStatus& backend,
                                const AcquireResult& permit,
                                const std::shared_ptr<CancellationToken>& cancel,
                                std::string& text);

    static std::string describeFallback(const std::vector<DispatchAttempt>& attempts);
};

} // namespace Switchyard
