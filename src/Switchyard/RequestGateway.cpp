// =================================================================
// src/Switchyard/RequestGateway.cpp
// =================================================================
// Implementation of the request lifecycle.

#include "Switchyard/RequestGateway.hpp"
#include "Switchyard/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <future>

namespace Switchyard {

namespace {

bool isBlank(const std::string& text) {
    return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
}

} // anonymous namespace

RequestGateway::RequestGateway(const ComplexityClassifier& classifier,
                               const TierPolicy& policy,
                               Dispatcher& dispatcher,
                               UsageMeter& meter)
    : m_classifier(classifier), m_policy(policy), m_dispatcher(dispatcher), m_meter(meter) {
}

GatewayResponse RequestGateway::handle(const GatewayRequest& input,
                                       const std::shared_ptr<CancellationToken>& cancel) {
    auto start_time = std::chrono::steady_clock::now();
    std::string request_id = nextRequestId();

    try {
        // Tier errors are caller bugs: no fallback, no dispatch, no usage record
        CustomerTier tier = TierPolicy::requireTier(input.customer_tier);

        if (isBlank(input.prompt)) {
            throw RoutingError(ErrorKind::INVALID_REQUEST, "Prompt must not be empty");
        }

        Request request;
        request.id = request_id;
        request.prompt = input.prompt;
        request.tier = tier;
        request.arrival = Clock::now();
        request.metadata = input.metadata;

        ComplexityScore score = m_classifier.score(request);
        if (score.degraded) {
            Logger::getInstance().warning("RequestGateway",
                RoutingTypeUtils::errorKindToString(ErrorKind::CLASSIFICATION_DEGRADED) + " for " + request_id,
                "treated as minimum complexity");
        }

        PolicyResolution resolution = m_policy.explain(tier, score.value);
        Logger::getInstance().debug("RequestGateway", "Resolved policy for " + request_id, resolution.rationale);

        DispatchResult result = m_dispatcher.dispatch(request, resolution.preferences, cancel);
        result.decision.rationale = resolution.rationale + "; " + result.decision.rationale;

        auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);

        GatewayResponse response;
        response.request_id = request_id;
        response.success = result.success;
        response.latency = latency;
        response.score = score;
        response.decision = result.decision;

        // A cancelled request did not complete and is not billed
        if (result.success || result.error_kind != ErrorKind::CANCELLED) {
            UsageRecord usage = m_meter.record(request, result.decision, latency, result.success);
            response.usage_recorded = true;
            response.cost = usage.cost;
        }

        Logger::getInstance().logRoutingDecision(request_id, result.decision, result.success);

        if (result.success) {
            response.text = std::move(result.text);
            response.backend_id = result.decision.backend_id;
            response.model_used = result.decision.model_name;
        } else {
            response.error_kind = result.error_kind;
            response.message = result.error_message;
        }

        return response;

    } catch (const RoutingError& e) {
        Logger::getInstance().warning("RequestGateway",
            "Request " + request_id + " rejected: " + RoutingTypeUtils::errorKindToString(e.kind()), e.what());
        return errorResponse(request_id, e.kind(), e.what());
    } catch (const std::exception& e) {
        Logger::getInstance().error("RequestGateway", "Request " + request_id + " failed unexpectedly", e.what());
        return errorResponse(request_id, ErrorKind::ALL_BACKENDS_UNAVAILABLE,
                             std::string("Internal routing error: ") + e.what());
    }
}

std::vector<GatewayResponse> RequestGateway::handleBatch(const std::vector<GatewayRequest>& inputs) {
    if (inputs.size() > MAX_BATCH_SIZE) {
        throw RoutingError(ErrorKind::INVALID_REQUEST,
                           "Batch of " + std::to_string(inputs.size()) + " exceeds the limit of " +
                           std::to_string(MAX_BATCH_SIZE) + " requests");
    }

    std::vector<std::future<GatewayResponse>> futures;
    futures.reserve(inputs.size());

    // Process requests asynchronously
    for (const auto& input : inputs) {
        futures.push_back(std::async(std::launch::async,
            [this, input]() { return handle(input); }));
    }

    // Collect results
    std::vector<GatewayResponse> responses;
    responses.reserve(futures.size());
    for (auto& future : futures) {
        responses.push_back(future.get());
    }

    size_t succeeded = static_cast<size_t>(std::count_if(responses.begin(), responses.end(),
        [](const GatewayResponse& r) { return r.success; }));
    Logger::getInstance().info("RequestGateway",
        "Processed batch of " + std::to_string(inputs.size()) + " requests",
        std::to_string(succeeded) + " succeeded");

    return responses;
}

std::string RequestGateway::nextRequestId() {
    return "req_" + std::to_string(++m_request_counter);
}

GatewayResponse RequestGateway::errorResponse(const std::string& request_id, ErrorKind kind,
                                              const std::string& message) {
    GatewayResponse response;
    response.request_id = request_id;
    response.success = false;
    response.error_kind = kind;
    response.message = message;
    return response;
}

nlohmann::json GatewayResponse::toJson() const {
    nlohmann::json json;
    json["request_id"] = request_id;

    if (success) {
        json["status"] = "success";
        json["text"] = text;
        json["model_used"] = model_used;
        json["latency_ms"] = latency.count();
        json["cost"] = cost;
    } else {
        json["status"] = "error";
        json["error_kind"] = RoutingTypeUtils::errorKindToString(error_kind);
        json["message"] = message;
        json["retryable"] = RoutingTypeUtils::isRetryable(error_kind);
    }

    return json;
}

} // namespace Switchyard
