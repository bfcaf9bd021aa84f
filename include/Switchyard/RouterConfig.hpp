// =================================================================
// include/Switchyard/RouterConfig.hpp
// =================================================================
// Injected configuration for every routing component, with defaults.

#pragma once

#include "Switchyard/RoutingTypes.hpp"
#include "Switchyard/CircuitBreaker.hpp"
#include "Switchyard/ComplexityClassifier.hpp"
#include "Switchyard/Logger.hpp"
#include <string>
#include <vector>
#include <map>
#include <chrono>

namespace Switchyard {

/**
 * @brief Static description of one model backend
 */
struct BackendConfig {
    std::string id;                                         ///< Unique backend identifier
    BackendClass backend_class = BackendClass::LIGHTWEIGHT; ///< Capability class
    std::string type = "ollama";                            ///< Transport, selects the factory
    std::string server_url = "http://localhost:11434";      ///< Endpoint base URL
    std::string model;                                      ///< Model name on the server
    double cost_per_request = 0.0;                          ///< Declared cost in dollars
    bool local = true;                                      ///< Runs on owned hardware (cost forced to 0)
};

/**
 * @brief Routing rule set for one customer tier
 *
 * A score at or above the threshold selects the at_or_above list.
 */
struct TierRule {
    CustomerTier tier = CustomerTier::BASIC;
    double price = 0.0;                         ///< Price charged per request
    double threshold = 0.0;                     ///< Complexity escalation threshold in [0, 1]
    std::vector<BackendClass> below;            ///< Preference list below the threshold
    std::vector<BackendClass> at_or_above;      ///< Preference list at or above the threshold
};

/**
 * @brief Health probing schedule
 */
struct HealthConfig {
    std::chrono::milliseconds probe_interval{10000};  ///< Time between probe rounds
    std::chrono::milliseconds probe_timeout{2000};    ///< Bound on a single liveness call
};

/**
 * @brief Dispatcher limits
 */
struct DispatchConfig {
    std::chrono::milliseconds attempt_timeout{120000};  ///< Bound on a single backend call
    size_t max_attempts = 4;                            ///< Real backend calls per request
};

/**
 * @brief Usage metering limits
 */
struct MeteringConfig {
    size_t max_pending_records = 10000;  ///< Records buffered before the sink must drain
};

/**
 * @brief Complete router configuration
 */
struct RouterConfig {
    std::vector<BackendConfig> backends;        ///< In preference order within each class
    std::map<CustomerTier, TierRule> tiers;
    HealthConfig health;
    CircuitBreakerConfig circuit_breaker;
    DispatchConfig dispatch;
    ClassifierConfig classifier;
    MeteringConfig metering;
    LoggerConfig logging;

    /**
     * @brief Configuration used when no file is supplied
     *
     * Two local Ollama backends and the standard basic/premium/enterprise table.
     */
    static RouterConfig defaults();

    static std::vector<BackendConfig> defaultBackends();
    static std::map<CustomerTier, TierRule> defaultTiers();
};

/**
 * @brief Loads and validates router configuration files
 */
class ConfigLoader {
public:
    /**
     * @brief Load configuration from a YAML file
     * @param path Path to the configuration file
     * @return Validated configuration; sections absent from the file keep defaults
     * @throws RoutingError(INVALID_CONFIGURATION) when unreadable or invalid
     */
    static RouterConfig loadFromFile(const std::string& path);

    /**
     * @brief Load configuration from YAML text
     * @param yaml_text Document contents
     * @return Validated configuration
     * @throws RoutingError(INVALID_CONFIGURATION) when malformed or invalid
     */
    static RouterConfig loadFromString(const std::string& yaml_text);

    /**
     * @brief Check the invariants every component relies on
     * @param config Configuration to check
     * @throws RoutingError(INVALID_CONFIGURATION) describing the first violation
     */
    static void validate(const RouterConfig& config);
};

} // namespace Switchyard
