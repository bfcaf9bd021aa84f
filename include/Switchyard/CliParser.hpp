// =================================================================
// include/Switchyard/CliParser.hpp
// =================================================================
// Defines the interface for parsing command-line arguments.
// This class encapsulates all interaction with the CLI11 library.

#pragma once

#include "CLI/CLI.hpp"
#include <memory>
#include <string>

namespace Switchyard {

// Parsed command information.
struct Commands {
    std::string active_command; // Name of the subcommand triggered

    // Global options
    std::string config_path;
    bool verbose = false;

    // Options for 'route'
    std::string prompt;
    std::string tier = "basic";
    std::string complexity_hint;
    bool probe_first = false;

    // Options for 'batch'
    std::string batch_file;
    bool report_json = false;
};

class CliParser {
public:
    CliParser() = default;

    /**
     * @brief Sets up all CLI commands, options, and flags.
     * @return A shared pointer to the configured CLI::App object.
     */
    std::shared_ptr<CLI::App> setupCli();

    /**
     * @brief Retrieves the parsed command data.
     * @return A const reference to the Commands struct.
     */
    const Commands& getCommands() const;

private:
    void setupRouteCommand(CLI::App& app);
    void setupBatchCommand(CLI::App& app);
    void setupBackendsCommand(CLI::App& app);

    std::shared_ptr<CLI::App> m_app;
    Commands m_commands;
};

} // namespace Switchyard
