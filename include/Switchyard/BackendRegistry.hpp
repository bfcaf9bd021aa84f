// =================================================================
// include/Switchyard/BackendRegistry.hpp
// =================================================================
// Registry of model backends and their circuit breaker health.

#pragma once

#include "Switchyard/RoutingTypes.hpp"
#include "Switchyard/RouterConfig.hpp"
#include "Switchyard/BackendClient.hpp"
#include "Switchyard/CircuitBreaker.hpp"
#include <string>
#include <memory>
#include <vector>
#include <unordered_map>
#include <functional>
#include <mutex>
#include <atomic>

namespace Switchyard {

/**
 * @brief Consistent snapshot of one backend
 */
struct BackendStatus {
    std::string id;
    BackendClass backend_class = BackendClass::LIGHTWEIGHT;
    std::string model_name;
    std::string endpoint;
    double cost_per_request = 0.0;
    BreakerState state = BreakerState::CLOSED;
    size_t consecutive_failures = 0;
    Clock::time_point open_until{};
    size_t total_calls = 0;
    size_t failed_calls = 0;

    /**
     * @brief Whether a call could be permitted at the given time
     *
     * Open backends become eligible again once their cool-down elapses.
     */
    bool isEligible(Clock::time_point now) const {
        return state != BreakerState::OPEN || now >= open_until;
    }
};

/**
 * @brief Outcome of asking a breaker for permission
 */
struct AcquireResult {
    bool granted = false;  ///< Call may be issued
    bool trial = false;    ///< Call is the half-open trial
};

/**
 * @brief In-memory mapping from backend id to backend and breaker
 *
 * Backends are added at start-up, before any concurrent use; afterwards the
 * set of backends is fixed. Each backend's breaker is guarded by its own
 * mutex and its state is republished atomically, so readers never observe a
 * partially updated backend and requests to different backends never contend.
 */
class BackendRegistry {
public:
    using TimeSource = std::function<Clock::time_point()>;

    /**
     * @brief Constructor
     * @param breaker_config Tuning applied to every backend's breaker
     * @param time_source Monotonic clock, injectable for tests
     */
    explicit BackendRegistry(const CircuitBreakerConfig& breaker_config = CircuitBreakerConfig(),
                             TimeSource time_source = nullptr);

    /**
     * @brief Register a client factory for a backend type
     * @param type Value of the "type" configuration key
     * @param factory Function creating a client from a backend entry
     */
    void registerFactory(const std::string& type, BackendFactory factory);

    /**
     * @brief Create and add clients for configured backends
     * @param backends Backend entries in configuration order
     * @throws RoutingError(INVALID_CONFIGURATION) for unknown types or duplicate ids
     */
    void loadBackends(const std::vector<BackendConfig>& backends);

    /**
     * @brief Add a backend with an existing client
     * @param config Backend entry
     * @param client Client used for dispatch and probes
     */
    void addBackend(const BackendConfig& config, std::shared_ptr<BackendClient> client);

    /**
     * @brief Backends of a class in configuration order
     * @param backend_class Class to look up
     * @return Snapshots, including open backends
     */
    std::vector<BackendStatus> get(BackendClass backend_class) const;

    /**
     * @brief Snapshots of every backend in configuration order
     */
    std::vector<BackendStatus> listAll() const;

    std::vector<std::string> getBackendIds() const;

    bool hasBackend(const std::string& id) const;

    /**
     * @brief Client of a backend
     * @throws std::out_of_range for unknown ids
     */
    std::shared_ptr<BackendClient> getClient(const std::string& id) const;

    /**
     * @brief Configuration entry of a backend
     * @throws std::out_of_range for unknown ids
     */
    const BackendConfig& getConfig(const std::string& id) const;

    /**
     * @brief Current breaker state (lock-free read)
     */
    BreakerState getHealth(const std::string& id) const;

    /**
     * @brief Force a backend's breaker state
     * @param id Backend id
     * @param state New state
     */
    void setHealth(const std::string& id, BreakerState state);

    /**
     * @brief Ask a backend's breaker for permission to call it
     * @param id Backend id
     * @return Whether the call may be issued and if it is the half-open trial
     */
    AcquireResult tryAcquire(const std::string& id);

    /**
     * @brief Report a successful call or probe
     */
    void recordSuccess(const std::string& id, FailureSource source);

    /**
     * @brief Report a failed call or probe
     * @param id Backend id
     * @param source Dispatch or probe
     * @param reason Logged with any resulting transition
     */
    void recordFailure(const std::string& id, FailureSource source, const std::string& reason);

    /**
     * @brief Give back a trial permit whose call produced no verdict
     */
    void releaseTrial(const std::string& id);

    Clock::time_point now() const { return m_time_source(); }

private:
    struct BackendEntry {
        BackendConfig config;
        std::shared_ptr<BackendClient> client;
        std::string model_name;
        std::string endpoint;

        mutable std::mutex mutex;                            ///< Guards breaker
        CircuitBreaker breaker;
        std::atomic<BreakerState> state{BreakerState::CLOSED}; ///< Published breaker state
        std::atomic<size_t> total_calls{0};
        std::atomic<size_t> failed_calls{0};

        BackendEntry(const BackendConfig& cfg, std::shared_ptr<BackendClient> c,
                     const CircuitBreakerConfig& breaker_config)
            : config(cfg), client(std::move(c)), breaker(breaker_config) {}
    };

    CircuitBreakerConfig m_breaker_config;
    TimeSource m_time_source;

    std::vector<std::unique_ptr<BackendEntry>> m_entries;              ///< Configuration order
    std::unordered_map<std::string, BackendEntry*> m_by_id;
    std::unordered_map<std::string, BackendFactory> m_factories;

    BackendEntry& entry(const std::string& id) const;
    BackendStatus snapshot(const BackendEntry& entry) const;
    void publish(BackendEntry& entry, const BreakerTransition& transition, const std::string& reason);
};

} // namespace Switchyard
