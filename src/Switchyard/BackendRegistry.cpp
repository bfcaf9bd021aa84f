// =================================================================
// src/Switchyard/BackendRegistry.cpp
// =================================================================
// Implementation of the backend registry.

#include "Switchyard/BackendRegistry.hpp"
#include "Switchyard/OllamaBackend.hpp"
#include "Switchyard/Logger.hpp"
#include <stdexcept>

namespace Switchyard {

BackendRegistry::BackendRegistry(const CircuitBreakerConfig& breaker_config, TimeSource time_source)
    : m_breaker_config(breaker_config), m_time_source(std::move(time_source)) {
    if (!m_time_source) {
        m_time_source = []() { return Clock::now(); };
    }

    // Register built-in factories
    registerFactory("ollama", [](const BackendConfig& cfg) {
        return std::make_shared<OllamaBackend>(cfg);
    });
}

void BackendRegistry::registerFactory(const std::string& type, BackendFactory factory) {
    m_factories[type] = std::move(factory);
    Logger::getInstance().debug("BackendRegistry", "Registered factory for backend type: " + type);
}

void BackendRegistry::loadBackends(const std::vector<BackendConfig>& backends) {
    for (const auto& config : backends) {
        auto factory_it = m_factories.find(config.type);
        if (factory_it == m_factories.end()) {
            throw RoutingError(ErrorKind::INVALID_CONFIGURATION,
                               "No factory for backend type '" + config.type + "' (backend " + config.id + ")");
        }

        auto client = factory_it->second(config);
        if (!client) {
            throw RoutingError(ErrorKind::INVALID_CONFIGURATION, "Factory returned no client for " + config.id);
        }
        addBackend(config, client);
    }

    Logger::getInstance().info("BackendRegistry",
        "Loaded " + std::to_string(m_entries.size()) + " backends");
}

void BackendRegistry::addBackend(const BackendConfig& config, std::shared_ptr<BackendClient> client) {
    if (m_by_id.count(config.id) > 0) {
        throw RoutingError(ErrorKind::INVALID_CONFIGURATION, "Duplicate backend id: " + config.id);
    }

    auto new_entry = std::make_unique<BackendEntry>(config, std::move(client), m_breaker_config);
    new_entry->model_name = new_entry->client ? new_entry->client->getModelName() : config.model;
    new_entry->endpoint = new_entry->client ? new_entry->client->getEndpoint() : config.server_url;
    if (new_entry->model_name.empty()) {
        new_entry->model_name = config.id;
    }

    m_by_id[config.id] = new_entry.get();
    m_entries.push_back(std::move(new_entry));

    Logger::getInstance().debug("BackendRegistry", "Added backend " + config.id,
        RoutingTypeUtils::classToString(config.backend_class));
}

std::vector<BackendStatus> BackendRegistry::get(BackendClass backend_class) const {
    std::vector<BackendStatus> result;
    for (const auto& backend : m_entries) {
        if (backend->config.backend_class == backend_class) {
            result.push_back(snapshot(*backend));
        }
    }
    return result;
}

std::vector<BackendStatus> BackendRegistry::listAll() const {
    std::vector<BackendStatus> result;
    result.reserve(m_entries.size());
    for (const auto& backend : m_entries) {
        result.push_back(snapshot(*backend));
    }
    return result;
}

std::vector<std::string> BackendRegistry::getBackendIds() const {
    std::vector<std::string> ids;
    ids.reserve(m_entries.size());
    for (const auto& backend : m_entries) {
        ids.push_back(backend->config.id);
    }
    return ids;
}

bool BackendRegistry::hasBackend(const std::string& id) const {
    return m_by_id.count(id) > 0;
}

std::shared_ptr<BackendClient> BackendRegistry::getClient(const std::string& id) const {
    return entry(id).client;
}

const BackendConfig& BackendRegistry::getConfig(const std::string& id) const {
    return entry(id).config;
}

BreakerState BackendRegistry::getHealth(const std::string& id) const {
    return entry(id).state.load();
}

void BackendRegistry::setHealth(const std::string& id, BreakerState state) {
    BackendEntry& backend = entry(id);
    std::lock_guard<std::mutex> lock(backend.mutex);
    publish(backend, backend.breaker.forceState(state, m_time_source()), "forced");
}

AcquireResult BackendRegistry::tryAcquire(const std::string& id) {
    BackendEntry& backend = entry(id);
    std::lock_guard<std::mutex> lock(backend.mutex);

    BreakerTransition transition;
    AcquireResult result;
    result.granted = backend.breaker.tryAcquire(m_time_source(), &transition);
    result.trial = result.granted && backend.breaker.state() == BreakerState::HALF_OPEN;

    publish(backend, transition, "cool-down elapsed");
    return result;
}

void BackendRegistry::recordSuccess(const std::string& id, FailureSource source) {
    BackendEntry& backend = entry(id);
    if (source == FailureSource::DISPATCH) {
        backend.total_calls++;
    }

    std::lock_guard<std::mutex> lock(backend.mutex);
    publish(backend, backend.breaker.recordSuccess(source),
            source == FailureSource::PROBE ? "probe succeeded" : "trial request succeeded");
}

void BackendRegistry::recordFailure(const std::string& id, FailureSource source, const std::string& reason) {
    BackendEntry& backend = entry(id);
    if (source == FailureSource::DISPATCH) {
        backend.total_calls++;
        backend.failed_calls++;
    }

    std::lock_guard<std::mutex> lock(backend.mutex);
    publish(backend, backend.breaker.recordFailure(source, m_time_source()), reason);
}

void BackendRegistry::releaseTrial(const std::string& id) {
    BackendEntry& backend = entry(id);
    std::lock_guard<std::mutex> lock(backend.mutex);
    backend.breaker.releaseTrial();
}

BackendRegistry::BackendEntry& BackendRegistry::entry(const std::string& id) const {
    auto it = m_by_id.find(id);
    if (it == m_by_id.end()) {
        throw std::out_of_range("Unknown backend: " + id);
    }
    return *it->second;
}

BackendStatus BackendRegistry::snapshot(const BackendEntry& backend) const {
    BackendStatus status;
    status.id = backend.config.id;
    status.backend_class = backend.config.backend_class;
    status.model_name = backend.model_name;
    status.endpoint = backend.endpoint;
    status.cost_per_request = backend.config.cost_per_request;
    status.total_calls = backend.total_calls.load();
    status.failed_calls = backend.failed_calls.load();

    std::lock_guard<std::mutex> lock(backend.mutex);
    status.state = backend.breaker.state();
    status.consecutive_failures = backend.breaker.consecutiveFailures();
    status.open_until = backend.breaker.openUntil();
    return status;
}

void BackendRegistry::publish(BackendEntry& backend, const BreakerTransition& transition, const std::string& reason) {
    backend.state.store(backend.breaker.state());
    if (transition.changed) {
        Logger::getInstance().logBreakerTransition(backend.config.id, transition.from, transition.to, reason);
    }
}

} // namespace Switchyard
