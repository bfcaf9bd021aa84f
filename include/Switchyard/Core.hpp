// =================================================================
// include/Switchyard/Core.hpp
// =================================================================
// Defines the core application orchestrator.

#pragma once

#include "Switchyard/CliParser.hpp"
#include "Switchyard/RouterConfig.hpp"
#include <memory>
#include <string>
#include <vector>

// Forward declarations to reduce header dependencies
namespace Switchyard {
    class BackendRegistry;
    class HealthMonitor;
    class ComplexityClassifier;
    class TierPolicy;
    class Dispatcher;
    class UsageMeter;
    class RequestGateway;
    struct GatewayRequest;
}

namespace Switchyard {

class Core {
public:
    /**
     * @brief Constructs the Core application object.
     * @param commands The parsed command-line arguments.
     */
    explicit Core(const Commands& commands);

    /**
     * @brief Destructor must be declared here and defined in the .cpp file.
     * This is required because we are using unique_ptr with forward-declared types.
     */
    ~Core();

    /**
     * @brief Runs the main application logic based on parsed commands.
     * @return An integer exit code (0 for success).
     */
    int run();

    /**
     * @brief Parse a batch file of "tier<TAB>prompt" lines
     *
     * Blank lines and lines starting with '#' are ignored. A line without a
     * tab is a prompt for the basic tier.
     */
    static std::vector<GatewayRequest> parseBatchFile(const std::string& path);

private:
    // Command Handlers
    int handleRoute();
    int handleBatch();
    int handleBackends();

    /**
     * @brief Load configuration and build every routing component
     */
    void initialize();
    std::string resolveConfigPath() const;

    const Commands& m_commands;
    RouterConfig m_config;
    std::unique_ptr<BackendRegistry> m_registry;
    std::unique_ptr<HealthMonitor> m_monitor;
    std::unique_ptr<ComplexityClassifier> m_classifier;
    std::unique_ptr<TierPolicy> m_policy;
    std::unique_ptr<Dispatcher> m_dispatcher;
    std::unique_ptr<UsageMeter> m_meter;
    std::unique_ptr<RequestGateway> m_gateway;
};

} // namespace Switchyard
