// =================================================================
// src/Switchyard/Core.cpp
// =================================================================
// Implementation of the core application orchestrator.

#include "Switchyard/Core.hpp"
#include "Switchyard/BackendRegistry.hpp"
#include "Switchyard/HealthMonitor.hpp"
#include "Switchyard/ComplexityClassifier.hpp"
#include "Switchyard/TierPolicy.hpp"
#include "Switchyard/Dispatcher.hpp"
#include "Switchyard/UsageMeter.hpp"
#include "Switchyard/RequestGateway.hpp"
#include "Switchyard/Logger.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>

namespace Switchyard {

namespace {

const char* DEFAULT_CONFIG_PATH = "config/router.yml";

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

} // anonymous namespace

Core::Core(const Commands& commands)
    : m_commands(commands) {
}

Core::~Core() {
    if (m_monitor) {
        m_monitor->stop();
    }
}

int Core::run() {
    auto start_time = std::chrono::steady_clock::now();
    int exit_code = 1;

    try {
        initialize();
        Logger::getInstance().logSessionStart(m_commands.active_command,
            "Backends: " + std::to_string(m_config.backends.size()));

        if (m_commands.active_command == "route") {
            exit_code = handleRoute();
        } else if (m_commands.active_command == "batch") {
            exit_code = handleBatch();
        } else if (m_commands.active_command == "backends") {
            exit_code = handleBackends();
        } else {
            std::cerr << "Error: Unknown command '" << m_commands.active_command << "'." << std::endl;
            exit_code = 1;
        }
    } catch (const RoutingError& e) {
        std::cerr << "Error (" << RoutingTypeUtils::errorKindToString(e.kind()) << "): " << e.what() << std::endl;
        exit_code = 1;
    }

    if (m_monitor) {
        m_monitor->stop();
    }
    if (m_meter) {
        m_meter->flush();
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    Logger::getInstance().logSessionEnd(m_commands.active_command, exit_code, static_cast<long>(duration.count()));
    Logger::getInstance().flush();

    return exit_code;
}

void Core::initialize() {
    std::string config_path = resolveConfigPath();
    m_config = config_path.empty() ? RouterConfig::defaults() : ConfigLoader::loadFromFile(config_path);
    if (config_path.empty()) {
        ConfigLoader::validate(m_config);
    }

    LoggerConfig logging = m_config.logging;
    if (m_commands.verbose) {
        logging.console_level = LogLevel::DEBUG;
    }
    Logger::getInstance().initialize(logging);

    m_registry = std::make_unique<BackendRegistry>(m_config.circuit_breaker);
    m_registry->loadBackends(m_config.backends);

    m_monitor = std::make_unique<HealthMonitor>(*m_registry, m_config.health);
    m_classifier = std::make_unique<ComplexityClassifier>(m_config.classifier);
    m_policy = std::make_unique<TierPolicy>(m_config.tiers);
    m_dispatcher = std::make_unique<Dispatcher>(*m_registry, m_config.dispatch);
    m_meter = std::make_unique<UsageMeter>(m_config);
    m_gateway = std::make_unique<RequestGateway>(*m_classifier, *m_policy, *m_dispatcher, *m_meter);
}

std::string Core::resolveConfigPath() const {
    if (!m_commands.config_path.empty()) {
        return m_commands.config_path;
    }
    if (std::filesystem::exists(DEFAULT_CONFIG_PATH)) {
        return DEFAULT_CONFIG_PATH;
    }
    return "";
}

int Core::handleRoute() {
    if (m_commands.probe_first) {
        m_monitor->runOnce();
    }

    GatewayRequest request;
    request.prompt = m_commands.prompt;
    request.customer_tier = m_commands.tier;
    if (!m_commands.complexity_hint.empty()) {
        request.metadata["complexity"] = m_commands.complexity_hint;
    }

    GatewayResponse response = m_gateway->handle(request);
    std::cout << response.toJson().dump(2) << std::endl;

    return response.success ? 0 : 1;
}

int Core::handleBatch() {
    std::vector<GatewayRequest> requests = parseBatchFile(m_commands.batch_file);
    if (requests.empty()) {
        std::cerr << "No requests found in " << m_commands.batch_file << std::endl;
        return 1;
    }

    m_monitor->start();
    std::vector<GatewayResponse> responses = m_gateway->handleBatch(requests);
    m_monitor->stop();

    size_t failures = 0;
    for (const auto& response : responses) {
        std::cout << response.toJson().dump() << std::endl;
        if (!response.success) {
            failures++;
        }
    }

    UsageReport report = m_meter->report();
    if (m_commands.report_json) {
        std::cout << report.toJson().dump(2) << std::endl;
    } else {
        std::cout << std::endl << report.toText();
    }

    return failures == 0 ? 0 : 1;
}

int Core::handleBackends() {
    m_monitor->runOnce();

    std::cout << std::left << std::setw(20) << "BACKEND"
              << std::setw(14) << "CLASS"
              << std::setw(18) << "MODEL"
              << std::setw(28) << "ENDPOINT"
              << std::setw(10) << "COST"
              << std::setw(11) << "STATE"
              << "FAILURES" << std::endl;

    bool any_closed = false;
    for (const auto& status : m_registry->listAll()) {
        std::cout << std::left << std::setw(20) << status.id
                  << std::setw(14) << RoutingTypeUtils::classToString(status.backend_class)
                  << std::setw(18) << status.model_name
                  << std::setw(28) << status.endpoint
                  << std::setw(10) << std::fixed << std::setprecision(4) << status.cost_per_request
                  << std::setw(11) << RoutingTypeUtils::breakerStateToString(status.state)
                  << status.consecutive_failures << std::endl;
        if (status.state == BreakerState::CLOSED) {
            any_closed = true;
        }
    }

    return any_closed ? 0 : 1;
}

std::vector<GatewayRequest> Core::parseBatchFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw RoutingError(ErrorKind::INVALID_REQUEST, "Cannot open batch file: " + path);
    }

    std::vector<GatewayRequest> requests;
    std::string line;
    while (std::getline(file, line)) {
        std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#') {
            continue;
        }

        GatewayRequest request;
        size_t tab = line.find('\t');
        if (tab == std::string::npos) {
            request.customer_tier = "basic";
            request.prompt = trimmed;
        } else {
            request.customer_tier = trim(line.substr(0, tab));
            request.prompt = trim(line.substr(tab + 1));
        }
        requests.push_back(request);
    }

    return requests;
}

} // namespace Switchyard
