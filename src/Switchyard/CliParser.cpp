// =================================================================
// src/Switchyard/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "Switchyard/CliParser.hpp"

namespace Switchyard {

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_app = std::make_shared<CLI::App>("Switchyard: complexity-aware request router for local model backends.");
    m_app->require_subcommand(1);

    m_app->add_option("-c,--config", m_commands.config_path, "Path to the router configuration (YAML).")
        ->check(CLI::ExistingFile);
    m_app->add_flag("-v,--verbose", m_commands.verbose, "Show debug output on the console.");

    // Set command callback to store which subcommand was used
    m_app->callback([this]() {
        for (auto* subcommand : m_app->get_subcommands()) {
            if (subcommand->parsed()) {
                m_commands.active_command = subcommand->get_name();
                break;
            }
        }
    });

    // Define all commands
    setupRouteCommand(*m_app);
    setupBatchCommand(*m_app);
    setupBackendsCommand(*m_app);

    return m_app;
}

const Commands& CliParser::getCommands() const {
    return m_commands;
}

void CliParser::setupRouteCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("route", "Routes one prompt and prints the structured outcome as JSON.");
    sub->add_option("prompt", m_commands.prompt, "The prompt to send.")->required();
    sub->add_option("-t,--tier", m_commands.tier, "Customer tier: basic, premium or enterprise (default: basic).");
    sub->add_option("--complexity", m_commands.complexity_hint,
                    "Explicit complexity hint: low, medium, high or a number in [0, 1].");
    sub->add_flag("--probe", m_commands.probe_first, "Probe every backend once before routing.");
}

void CliParser::setupBatchCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("batch", "Routes up to 50 prompts concurrently and prints a performance report.");
    sub->add_option("file", m_commands.batch_file, "File with one 'tier<TAB>prompt' per line.")
        ->required()->check(CLI::ExistingFile);
    sub->add_flag("--json", m_commands.report_json, "Print the performance report as JSON.");
}

void CliParser::setupBackendsCommand(CLI::App& app) {
    app.add_subcommand("backends", "Probes every backend once and lists its status.");
}

} // namespace Switchyard
