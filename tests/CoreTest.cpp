// =================================================================
// tests/CoreTest.cpp
// =================================================================
// Tests for command-line parsing and the application entry points.

#include "Switchyard/Core.hpp"
#include "Switchyard/CliParser.hpp"
#include "Switchyard/RequestGateway.hpp"
#include "FakeBackend.hpp"
#include <iostream>
#include <cassert>
#include <cstdio>
#include <fstream>
#include <vector>

namespace {

const char* CONFIG_FILE = "switchyard_core_test.yml";
const char* BATCH_FILE = "switchyard_core_test.tsv";

// Backends nobody listens on, quiet logging
const char* OFFLINE_CONFIG = R"(
backends:
  - {id: lite, class: lightweight, server_url: "http://127.0.0.1:1", model: llama3.2:3b}
  - {id: heavy, class: heavyweight, server_url: "http://127.0.0.1:1", model: gpt-oss:20b}
health:
  probe_timeout_ms: 500
dispatch:
  timeout_ms: 1000
logging:
  console_level: error
  file: false
)";

void writeFile(const std::string& path, const std::string& contents) {
    std::ofstream out(path);
    out << contents;
}

Switchyard::Commands parseArgs(Switchyard::CliParser& parser, std::vector<std::string> args) {
    auto app = parser.setupCli();

    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(&arg[0]);
    }
    app->parse(static_cast<int>(argv.size()), argv.data());
    return parser.getCommands();
}

} // anonymous namespace

class CoreTest {
public:
    void testParseBatchFile() {
        std::cout << "Testing batch file parsing..." << std::endl;

        writeFile(BATCH_FILE,
                  "# tier<TAB>prompt\n"
                  "basic\tHello there\n"
                  "\n"
                  "enterprise\t  Design a distributed cache  \n"
                  "No tab means basic\n"
                  "gold\tUnknown tiers are kept for the gateway to reject\n");

        auto requests = Switchyard::Core::parseBatchFile(BATCH_FILE);
        std::remove(BATCH_FILE);

        assert(requests.size() == 4 && "Comments and blank lines skipped");
        assert(requests[0].customer_tier == "basic" && requests[0].prompt == "Hello there");
        assert(requests[1].customer_tier == "enterprise" && requests[1].prompt == "Design a distributed cache");
        assert(requests[2].customer_tier == "basic" && requests[2].prompt == "No tab means basic");
        assert(requests[3].customer_tier == "gold");

        bool rejected = false;
        try {
            Switchyard::Core::parseBatchFile("does/not/exist.tsv");
        } catch (const Switchyard::RoutingError& e) {
            rejected = e.kind() == Switchyard::ErrorKind::INVALID_REQUEST;
        }
        assert(rejected && "Missing batch file is an invalid request");

        std::cout << "✓ Batch file parsing test passed" << std::endl;
    }

    void testCliParsing() {
        std::cout << "Testing command-line parsing..." << std::endl;

        Switchyard::CliParser route_parser;
        auto route = parseArgs(route_parser,
            {"switchyard", "-c", CONFIG_FILE, "route", "Explain monads", "-t", "premium", "--complexity", "high"});
        assert(route.active_command == "route");
        assert(route.config_path == CONFIG_FILE);
        assert(route.prompt == "Explain monads" && route.tier == "premium");
        assert(route.complexity_hint == "high" && !route.probe_first);

        Switchyard::CliParser batch_parser;
        writeFile(BATCH_FILE, "basic\tHi\n");
        auto batch = parseArgs(batch_parser, {"switchyard", "batch", BATCH_FILE, "--json"});
        std::remove(BATCH_FILE);
        assert(batch.active_command == "batch" && batch.report_json);

        Switchyard::CliParser backends_parser;
        auto backends = parseArgs(backends_parser, {"switchyard", "-v", "backends"});
        assert(backends.active_command == "backends" && backends.verbose);

        std::cout << "✓ Command-line parsing test passed" << std::endl;
    }

    void testRunRejectsUnknownTier() {
        std::cout << "Testing route with an unknown tier..." << std::endl;

        Switchyard::Commands commands;
        commands.active_command = "route";
        commands.config_path = CONFIG_FILE;
        commands.prompt = "Hello";
        commands.tier = "gold";

        Switchyard::Core core(commands);
        assert(core.run() == 1 && "Unknown tier fails the command");

        std::cout << "✓ Unknown tier run test passed" << std::endl;
    }

    void testRunWithOfflineBackends() {
        std::cout << "Testing route and backends with no server..." << std::endl;

        Switchyard::Commands route;
        route.active_command = "route";
        route.config_path = CONFIG_FILE;
        route.prompt = "Hello";
        Switchyard::Core route_core(route);
        assert(route_core.run() == 1 && "Unreachable backends fail the request");

        Switchyard::Commands backends;
        backends.active_command = "backends";
        backends.config_path = CONFIG_FILE;
        Switchyard::Core backends_core(backends);
        assert(backends_core.run() == 1 && "No healthy backend reported");

        std::cout << "✓ Offline run test passed" << std::endl;
    }

    void testRunRejectsBadConfig() {
        std::cout << "Testing invalid configuration file..." << std::endl;

        const std::string bad_path = "switchyard_core_bad.yml";
        writeFile(bad_path, "tiers:\n  premium:\n    threshold: 0.95\n");

        Switchyard::Commands commands;
        commands.active_command = "backends";
        commands.config_path = bad_path;
        Switchyard::Core core(commands);
        assert(core.run() == 1 && "Invalid configuration stops start-up");
        std::remove(bad_path.c_str());

        std::cout << "✓ Invalid configuration test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running Core tests..." << std::endl;
        std::cout << "=====================" << std::endl << std::endl;

        writeFile(CONFIG_FILE, OFFLINE_CONFIG);

        testParseBatchFile();
        std::cout << std::endl;

        testCliParsing();
        std::cout << std::endl;

        testRunRejectsUnknownTier();
        std::cout << std::endl;

        testRunWithOfflineBackends();
        std::cout << std::endl;

        testRunRejectsBadConfig();
        std::cout << std::endl;

        std::remove(CONFIG_FILE);
        std::cout << "All Core tests passed!" << std::endl;
    }
};

int main() {
    try {
        SwitchyardTest::quietLogging();
        CoreTest tests;
        tests.runAllTests();
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
