// =================================================================
// include/Switchyard/RequestGateway.hpp
// =================================================================
// Single public entry point wiring one request through the router.

#pragma once

#include "Switchyard/RoutingTypes.hpp"
#include "Switchyard/ComplexityClassifier.hpp"
#include "Switchyard/TierPolicy.hpp"
#include "Switchyard/Dispatcher.hpp"
#include "Switchyard/UsageMeter.hpp"
#include "Switchyard/CancellationToken.hpp"
#include "nlohmann/json.hpp"
#include <string>
#include <vector>
#include <memory>
#include <unordered_map>
#include <chrono>
#include <atomic>
#include <cstdint>

namespace Switchyard {

/**
 * @brief Caller input
 */
struct GatewayRequest {
    std::string prompt;
    std::string customer_tier;                              ///< "basic", "premium" or "enterprise"
    std::unordered_map<std::string, std::string> metadata;  ///< Optional hints
};

/**
 * @brief Structured outcome returned to the caller
 */
struct GatewayResponse {
    bool success = false;
    std::string request_id;
    std::string text;                         ///< Generated text on success
    std::string model_used;                   ///< Model label on success
    std::string backend_id;
    std::chrono::milliseconds latency{0};
    double cost = 0.0;
    ErrorKind error_kind = ErrorKind::ALL_BACKENDS_UNAVAILABLE;  ///< Meaningful only on failure
    std::string message;                      ///< Error message on failure
    bool usage_recorded = false;              ///< A UsageRecord was written
    ComplexityScore score;
    RoutingDecision decision;

    /**
     * @brief Wire form: {status, text, model_used, latency_ms, cost} or
     *        {status, error_kind, message}
     */
    nlohmann::json toJson() const;
};

/**
 * @brief Orchestrates classification, policy, dispatch and metering
 *
 * Never throws from handle(); every failure becomes a structured error
 * response. Requests share no mutable per-request state and may be handled
 * concurrently.
 */
class RequestGateway {
public:
    static constexpr size_t MAX_BATCH_SIZE = 50;

    /**
     * @brief Constructor
     * @param classifier Complexity classifier
     * @param policy Tier policy table
     * @param dispatcher Dispatcher bound to the backend registry
     * @param meter Usage meter
     */
    RequestGateway(const ComplexityClassifier& classifier,
                   const TierPolicy& policy,
                   Dispatcher& dispatcher,
                   UsageMeter& meter);

    /**
     * @brief Route one request
     * @param input Prompt, tier and hints
     * @param cancel Optional token the caller may cancel
     * @return Success or structured error
     */
    GatewayResponse handle(const GatewayRequest& input,
                           const std::shared_ptr<CancellationToken>& cancel = nullptr);

    /**
     * @brief Route several requests concurrently
     * @param inputs At most MAX_BATCH_SIZE requests
     * @return One response per input, in input order
     * @throws RoutingError(INVALID_REQUEST) for oversized batches
     */
    std::vector<GatewayResponse> handleBatch(const std::vector<GatewayRequest>& inputs);

    /**
     * @brief Next request id ("req_<n>"), unique for this gateway's lifetime
     */
    std::string nextRequestId();

private:
    const ComplexityClassifier& m_classifier;
    const TierPolicy& m_policy;
    Dispatcher& m_dispatcher;
    UsageMeter& m_meter;
    std::atomic<uint64_t> m_request_counter{0};

    static GatewayResponse errorResponse(const std::string& request_id, ErrorKind kind,
                                         const std::string& message);
};

} // namespace Switchyard
