// =================================================================
// tests/ConfigLoaderTest.cpp
// =================================================================
// Unit tests for router configuration loading and validation.

#include "Switchyard/RouterConfig.hpp"
#include "FakeBackend.hpp"
#include <iostream>
#include <cassert>
#include <fstream>
#include <cstdio>

using Switchyard::BackendClass;
using Switchyard::CustomerTier;

namespace {

bool rejectsWithConfigError(const std::string& yaml_text) {
    try {
        Switchyard::ConfigLoader::loadFromString(yaml_text);
    } catch (const Switchyard::RoutingError& e) {
        std::cout << "  rejected: " << e.what() << std::endl;
        return e.kind() == Switchyard::ErrorKind::INVALID_CONFIGURATION;
    }
    return false;
}

} // anonymous namespace

class ConfigLoaderTest {
public:
    void testDefaultsAreValid() {
        std::cout << "Testing default configuration..." << std::endl;

        auto config = Switchyard::RouterConfig::defaults();
        Switchyard::ConfigLoader::validate(config);

        assert(config.backends.size() == 2 && "Two default backends");
        assert(config.backends[0].backend_class == BackendClass::LIGHTWEIGHT);
        assert(config.backends[1].backend_class == BackendClass::HEAVYWEIGHT);
        assert(config.tiers.size() == 3 && "Every tier has a policy");
        assert(config.dispatch.max_attempts == 4);
        assert(config.circuit_breaker.failure_threshold == 3);

        std::cout << "✓ Defaults test passed" << std::endl;
    }

    void testFullDocument() {
        std::cout << "Testing full YAML document..." << std::endl;

        const std::string yaml_text = R"(
backends:
  - id: small
    class: lightweight
    model: phi3:mini
    server_url: http://10.0.0.5:11434
  - id: cloud-large
    class: heavyweight
    type: ollama
    model: llama3:70b
    cost_per_request: 0.02
    local: false
tiers:
  basic:
    price: 0.04
    threshold: 0.8
    below_threshold: [lightweight]
    at_or_above_threshold: [lightweight, heavyweight]
health:
  probe_interval_ms: 5000
  probe_timeout_ms: 500
circuit_breaker:
  failure_threshold: 2
  cooldown_ms: 3000
  backoff_multiplier: 1.5
  max_cooldown_ms: 9000
dispatch:
  timeout_ms: 30000
  max_attempts: 3
classifier:
  weights:
    length: 0.4
  long_prompt_words: 80
metering:
  max_pending_records: 500
logging:
  console_level: warning
  file: false
)";

        auto config = Switchyard::ConfigLoader::loadFromString(yaml_text);

        assert(config.backends.size() == 2);
        assert(config.backends[0].id == "small" && config.backends[0].server_url == "http://10.0.0.5:11434");
        assert(config.backends[1].cost_per_request == 0.02 && !config.backends[1].local);
        assert(config.tiers.at(CustomerTier::BASIC).price == 0.04);
        assert(config.tiers.at(CustomerTier::BASIC).threshold == 0.8);
        assert(config.tiers.at(CustomerTier::PREMIUM).price == 0.15 && "Unnamed tiers keep defaults");
        assert(config.health.probe_interval.count() == 5000);
        assert(config.circuit_breaker.failure_threshold == 2);
        assert(config.circuit_breaker.backoff_multiplier == 1.5);
        assert(config.dispatch.max_attempts == 3);
        assert(config.classifier.length_weight == 0.4);
        assert(config.classifier.code_weight == 0.25 && "Unnamed weights keep defaults");
        assert(config.classifier.long_prompt_words == 80);
        assert(config.metering.max_pending_records == 500);
        assert(config.logging.console_level == Switchyard::LogLevel::WARNING);
        assert(!config.logging.file_enabled);

        std::cout << "✓ Full document test passed" << std::endl;
    }

    void testEmptyDocumentUsesDefaults() {
        std::cout << "Testing empty document..." << std::endl;

        auto config = Switchyard::ConfigLoader::loadFromString("");
        assert(config.backends.size() == 2 && "Empty document keeps default backends");
        assert(config.tiers.at(CustomerTier::ENTERPRISE).price == 0.30);

        std::cout << "✓ Empty document test passed" << std::endl;
    }

    void testInvalidDocumentsRejected() {
        std::cout << "Testing invalid documents are rejected..." << std::endl;

        assert(rejectsWithConfigError("backends:\n  - id: a\n    class: medium\n") && "Unknown class");
        assert(rejectsWithConfigError("backends:\n  - class: lightweight\n") && "Missing id");
        assert(rejectsWithConfigError(
            "backends:\n  - {id: a, class: lightweight}\n  - {id: a, class: heavyweight}\n") && "Duplicate id");
        assert(rejectsWithConfigError(
            "backends:\n  - {id: a, class: lightweight, local: false, cost_per_request: -1}\n") && "Negative cost");
        assert(rejectsWithConfigError("tiers:\n  gold:\n    price: 1.0\n") && "Unknown tier");
        assert(rejectsWithConfigError("tiers:\n  basic:\n    price: -0.01\n") && "Negative price");
        assert(rejectsWithConfigError("tiers:\n  premium:\n    threshold: 0.9\n") && "Unordered thresholds");
        assert(rejectsWithConfigError("tiers:\n  premium:\n    below_threshold: []\n") && "Empty preference list");
        assert(rejectsWithConfigError("tiers:\n  enterprise:\n    below_threshold: [lightweight]\n") &&
               "Enterprise must start on heavyweight below the threshold");
        assert(rejectsWithConfigError(
            "tiers:\n  enterprise:\n    at_or_above_threshold: [lightweight, heavyweight]\n") &&
               "Enterprise must start on heavyweight at or above the threshold");
        assert(rejectsWithConfigError("circuit_breaker:\n  failure_threshold: 0\n") && "Zero failure threshold");
        assert(rejectsWithConfigError("circuit_breaker:\n  cooldown_ms: 5000\n  max_cooldown_ms: 1000\n") &&
               "Max cool-down below cool-down");
        assert(rejectsWithConfigError("dispatch:\n  max_attempts: 0\n") && "Zero attempts");
        assert(rejectsWithConfigError("backends: [unclosed\n") && "Malformed YAML");
        assert(rejectsWithConfigError("- just\n- a list\n") && "Root must be a mapping");

        std::cout << "✓ Invalid documents test passed" << std::endl;
    }

    void testLocalBackendCostForcedToZero() {
        std::cout << "Testing local backends cost nothing..." << std::endl;

        auto config = Switchyard::ConfigLoader::loadFromString(
            "backends:\n"
            "  - {id: a, class: lightweight, cost_per_request: 0.5}\n"
            "  - {id: b, class: heavyweight, cost_per_request: 0.5, local: false}\n");

        assert(config.backends[0].cost_per_request == 0.0 && "Local cost forced to zero");
        assert(config.backends[1].cost_per_request == 0.5 && "Remote cost kept");

        std::cout << "✓ Local cost test passed" << std::endl;
    }

    void testLoadFromFile() {
        std::cout << "Testing loading from a file..." << std::endl;

        const std::string path = "switchyard_config_test.yml";
        {
            std::ofstream out(path);
            out << "dispatch:\n  timeout_ms: 1500\n";
        }

        auto config = Switchyard::ConfigLoader::loadFromFile(path);
        assert(config.dispatch.attempt_timeout.count() == 1500);
        std::remove(path.c_str());

        bool rejected = false;
        try {
            Switchyard::ConfigLoader::loadFromFile("does/not/exist.yml");
        } catch (const Switchyard::RoutingError& e) {
            rejected = e.kind() == Switchyard::ErrorKind::INVALID_CONFIGURATION;
        }
        assert(rejected && "Missing file must be a configuration error");

        std::cout << "✓ File loading test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running ConfigLoader unit tests..." << std::endl;
        std::cout << "==================================" << std::endl << std::endl;

        testDefaultsAreValid();
        std::cout << std::endl;

        testFullDocument();
        std::cout << std::endl;

        testEmptyDocumentUsesDefaults();
        std::cout << std::endl;

        testInvalidDocumentsRejected();
        std::cout << std::endl;

        testLocalBackendCostForcedToZero();
        std::cout << std::endl;

        testLoadFromFile();
        std::cout << std::endl;

        std::cout << "All ConfigLoader tests passed!" << std::endl;
    }
};

int main() {
    try {
        SwitchyardTest::quietLogging();
        ConfigLoaderTest tests;
        tests.runAllTests();
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
