// =================================================================
// include/Switchyard/RoutingTypes.hpp
// =================================================================
// Core domain types shared by every routing component.

#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <chrono>
#include <stdexcept>
#include <optional>

namespace Switchyard {

using Clock = std::chrono::steady_clock;

/**
 * @brief Billing tier declared by the caller
 */
enum class CustomerTier {
    BASIC,       ///< Cheapest tier, lightweight first whenever possible
    PREMIUM,     ///< Escalates to heavyweight on demanding requests
    ENTERPRISE   ///< Guaranteed heavyweight first attempt
};

/**
 * @brief Coarse capability class of a model backend
 */
enum class BackendClass {
    LIGHTWEIGHT,  ///< Fast and cheap
    HEAVYWEIGHT   ///< Slower, higher quality
};

/**
 * @brief Circuit breaker state of a backend
 */
enum class BreakerState {
    CLOSED,     ///< Healthy, requests permitted
    OPEN,       ///< Unhealthy, requests not attempted until cool-down elapses
    HALF_OPEN   ///< One trial request or probe permitted
};

/**
 * @brief Error taxonomy for the routing pipeline
 */
enum class ErrorKind {
    INVALID_TIER,
    CLASSIFICATION_DEGRADED,
    BACKEND_TIMEOUT,
    BACKEND_REJECTED,
    ALL_BACKENDS_UNAVAILABLE,
    METERING_WRITE_FAILED,
    CANCELLED,
    INVALID_REQUEST,
    INVALID_CONFIGURATION
};

/**
 * @brief Error raised by routing components and converted by the gateway
 */
class RoutingError : public std::runtime_error {
public:
    RoutingError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}

    ErrorKind kind() const { return m_kind; }

private:
    ErrorKind m_kind;
};

/**
 * @brief One inbound generation request
 */
struct Request {
    std::string id;                                         ///< Unique per process lifetime
    std::string prompt;                                     ///< Prompt text
    CustomerTier tier = CustomerTier::BASIC;                ///< Validated customer tier
    Clock::time_point arrival;                              ///< Arrival timestamp
    std::unordered_map<std::string, std::string> metadata;  ///< Optional hints (e.g. "complexity")
};

/**
 * @brief Classifier output
 */
struct ComplexityScore {
    double value = 0.0;                                 ///< Score in [0, 1]
    std::unordered_map<std::string, double> features;   ///< Contributing feature breakdown
    bool degraded = false;                              ///< Input was malformed, minimum score used
};

/**
 * @brief Outcome of one entry in the dispatcher's attempt sequence
 */
enum class AttemptOutcome {
    SUCCESS,
    TIMEOUT,
    REJECTED,
    SKIPPED_OPEN,   ///< Breaker open, no call issued
    CANCELLED
};

/**
 * @brief Record of one step of the fallback walk
 */
struct DispatchAttempt {
    std::string backend_id;
    BackendClass backend_class = BackendClass::LIGHTWEIGHT;
    AttemptOutcome outcome = AttemptOutcome::SKIPPED_OPEN;
    std::chrono::milliseconds latency{0};
    std::string detail;
};

/**
 * @brief Outcome of one routing attempt
 */
struct RoutingDecision {
    std::string backend_id;                  ///< Backend that served the request (empty on failure)
    BackendClass backend_class = BackendClass::LIGHTWEIGHT;
    std::string model_name;                  ///< Model label reported to the caller
    std::vector<DispatchAttempt> attempts;   ///< Attempt sequence, never empty once dispatched
    std::string rationale;                   ///< Threshold matched / fallback reason
};

/**
 * @brief Conversion helpers for routing enums
 */
class RoutingTypeUtils {
public:
    static std::string tierToString(CustomerTier tier);

    /**
     * @brief Parse a tier name (case-insensitive)
     * @return Tier, or std::nullopt for unknown names
     */
    static std::optional<CustomerTier> parseTier(const std::string& name);

    static std::vector<CustomerTier> getAllTiers();

    static std::string classToString(BackendClass backend_class);

    /**
     * @brief Convert string to backend class
     * @return BackendClass or throws RoutingError if invalid
     */
    static BackendClass stringToClass(const std::string& str);

    static std::string breakerStateToString(BreakerState state);

    static std::string errorKindToString(ErrorKind kind);

    /**
     * @brief Whether the caller may retry a request that failed with this kind
     */
    static bool isRetryable(ErrorKind kind);

    static std::string attemptOutcomeToString(AttemptOutcome outcome);

    static std::string classListToString(const std::vector<BackendClass>& classes);
};

} // namespace Switchyard
