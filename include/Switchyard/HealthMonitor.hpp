// =================================================================
// include/Switchyard/HealthMonitor.hpp
// =================================================================
// Periodic liveness probing that drives the per-backend breakers.

#pragma once

#include "Switchyard/BackendRegistry.hpp"
#include "Switchyard/RouterConfig.hpp"
#include <string>
#include <vector>
#include <memory>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>

namespace Switchyard {

/**
 * @brief Result of probing one backend
 */
struct ProbeOutcome {
    std::string backend_id;
    bool probed = false;                        ///< False when the breaker refused the probe
    bool healthy = false;                       ///< Probe succeeded
    BreakerState state_after = BreakerState::CLOSED;
};

/**
 * @brief Probes every backend on its own schedule
 *
 * Runs independently of request handling; requests never wait for a probe.
 * Open backends are skipped until their cool-down elapses, at which point the
 * probe becomes the half-open trial.
 */
class HealthMonitor {
public:
    /**
     * @brief Constructor
     * @param registry Registry whose breakers are updated
     * @param config Probe interval and timeout
     */
    HealthMonitor(BackendRegistry& registry, const HealthConfig& config = HealthConfig());

    /**
     * @brief Destructor, stops the probe thread
     */
    ~HealthMonitor();

    HealthMonitor(const HealthMonitor&) = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;

    /**
     * @brief Start periodic probing on a background thread
     */
    void start();

    /**
     * @brief Stop probing and join the thread; returns promptly mid-interval
     */
    void stop();

    bool isRunning() const { return m_health_thread != nullptr; }

    /**
     * @brief Probe every backend once
     * @return One outcome per backend in configuration order
     */
    std::vector<ProbeOutcome> runOnce();

    /**
     * @brief Number of completed probe rounds
     */
    size_t getRoundCount() const { return m_rounds.load(); }

private:
    BackendRegistry& m_registry;
    HealthConfig m_config;

    std::unique_ptr<std::thread> m_health_thread;
    std::atomic<bool> m_stop_requested{false};
    std::mutex m_wait_mutex;
    std::condition_variable m_wait_cv;
    std::atomic<size_t> m_rounds{0};

    void healthCheckLoop();
    ProbeOutcome probeBackend(const std::string& backend_id);
};

} // namespace Switchyard
