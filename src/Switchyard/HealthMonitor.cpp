// =================================================================
// src/Switchyard/HealthMonitor.cpp
// =================================================================
// Implementation of the health monitor.

#include "Switchyard/HealthMonitor.hpp"
#include "Switchyard/Logger.hpp"

namespace Switchyard {

HealthMonitor::HealthMonitor(BackendRegistry& registry, const HealthConfig& config)
    : m_registry(registry), m_config(config) {
}

HealthMonitor::~HealthMonitor() {
    stop();
}

void HealthMonitor::start() {
    if (m_health_thread) {
        return;
    }

    m_stop_requested.store(false);
    m_health_thread = std::make_unique<std::thread>(&HealthMonitor::healthCheckLoop, this);
    Logger::getInstance().info("HealthMonitor", "Started health check thread",
        "Interval: " + std::to_string(m_config.probe_interval.count()) + "ms");
}

void HealthMonitor::stop() {
    if (!m_health_thread) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_wait_mutex);
        m_stop_requested.store(true);
    }
    m_wait_cv.notify_all();

    m_health_thread->join();
    m_health_thread.reset();
    m_stop_requested.store(false);
    Logger::getInstance().info("HealthMonitor", "Stopped health check thread");
}

std::vector<ProbeOutcome> HealthMonitor::runOnce() {
    std::vector<ProbeOutcome> outcomes;
    for (const auto& id : m_registry.getBackendIds()) {
        if (m_stop_requested.load()) {
            break;
        }
        outcomes.push_back(probeBackend(id));
    }

    m_rounds++;
    return outcomes;
}

ProbeOutcome HealthMonitor::probeBackend(const std::string& backend_id) {
    ProbeOutcome outcome;
    outcome.backend_id = backend_id;

    AcquireResult permit = m_registry.tryAcquire(backend_id);
    if (!permit.granted) {
        outcome.state_after = m_registry.getHealth(backend_id);
        return outcome;
    }

    outcome.probed = true;
    try {
        auto client = m_registry.getClient(backend_id);
        outcome.healthy = client && client->probe(m_config.probe_timeout);
    } catch (const std::exception& e) {
        Logger::getInstance().warning("HealthMonitor", "Probe raised for " + backend_id, e.what());
        outcome.healthy = false;
    }

    if (outcome.healthy) {
        m_registry.recordSuccess(backend_id, FailureSource::PROBE);
    } else {
        m_registry.recordFailure(backend_id, FailureSource::PROBE, "liveness probe failed");
    }

    outcome.state_after = m_registry.getHealth(backend_id);
    Logger::getInstance().debug("HealthMonitor", "Probed " + backend_id,
        std::string(outcome.healthy ? "healthy" : "unhealthy") + ", state " +
        RoutingTypeUtils::breakerStateToString(outcome.state_after));
    return outcome;
}

void HealthMonitor::healthCheckLoop() {
    while (!m_stop_requested.load()) {
        try {
            runOnce();
        } catch (const std::exception& e) {
            Logger::getInstance().error("HealthMonitor",
                "Health check loop error: " + std::string(e.what()));
        }

        // Sleep for the configured interval, waking early on stop()
        std::unique_lock<std::mutex> lock(m_wait_mutex);
        m_wait_cv.wait_for(lock, m_config.probe_interval, [this]() { return m_stop_requested.load(); });
    }
}

} // namespace Switchyard
