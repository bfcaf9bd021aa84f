// =================================================================
// src/Switchyard/RouterConfig.cpp
// =================================================================
// Default configuration, YAML loading and validation.

#include "Switchyard/RouterConfig.hpp"
#include <yaml-cpp/yaml.h>
#include <set>
#include <sstream>

namespace Switchyard {

namespace {

std::vector<BackendClass> parseClassList(const YAML::Node& node, const std::string& where) {
    std::vector<BackendClass> classes;
    if (!node.IsSequence()) {
        throw RoutingError(ErrorKind::INVALID_CONFIGURATION, where + " must be a list of backend classes");
    }
    for (const auto& item : node) {
        classes.push_back(RoutingTypeUtils::stringToClass(item.as<std::string>()));
    }
    return classes;
}

std::vector<std::string> parseStringList(const YAML::Node& node) {
    std::vector<std::string> values;
    for (const auto& item : node) {
        values.push_back(item.as<std::string>());
    }
    return values;
}

std::chrono::milliseconds parseMillis(const YAML::Node& node) {
    return std::chrono::milliseconds(node.as<long long>());
}

void parseBackends(const YAML::Node& node, RouterConfig& config) {
    if (!node.IsSequence()) {
        throw RoutingError(ErrorKind::INVALID_CONFIGURATION, "'backends' must be a list");
    }

    config.backends.clear();
    for (const auto& backend_node : node) {
        BackendConfig backend;

        if (!backend_node["id"]) {
            throw RoutingError(ErrorKind::INVALID_CONFIGURATION, "Backend entry without 'id'");
        }
        backend.id = backend_node["id"].as<std::string>();

        if (!backend_node["class"]) {
            throw RoutingError(ErrorKind::INVALID_CONFIGURATION, "Backend '" + backend.id + "' has no 'class'");
        }
        backend.backend_class = RoutingTypeUtils::stringToClass(backend_node["class"].as<std::string>());

        if (backend_node["type"]) {
            backend.type = backend_node["type"].as<std::string>();
        }
        if (backend_node["server_url"]) {
            backend.server_url = backend_node["server_url"].as<std::string>();
        }
        if (backend_node["model"]) {
            backend.model = backend_node["model"].as<std::string>();
        }
        if (backend_node["cost_per_request"]) {
            backend.cost_per_request = backend_node["cost_per_request"].as<double>();
        }
        if (backend_node["local"]) {
            backend.local = backend_node["local"].as<bool>();
        }

        if (backend.local && backend.cost_per_request != 0.0) {
            Logger::getInstance().warning("ConfigLoader",
                "Local backend '" + backend.id + "' declares a cost; local backends cost 0");
            backend.cost_per_request = 0.0;
        }

        config.backends.push_back(backend);
    }
}

void parseTiers(const YAML::Node& node, RouterConfig& config) {
    for (YAML::const_iterator it = node.begin(); it != node.end(); ++it) {
        std::string name = it->first.as<std::string>();
        auto tier = RoutingTypeUtils::parseTier(name);
        if (!tier) {
            throw RoutingError(ErrorKind::INVALID_CONFIGURATION, "Unknown tier in configuration: " + name);
        }

        // Partial tier sections override only the keys they name
        TierRule& rule = config.tiers[*tier];
        rule.tier = *tier;

        YAML::Node tier_node = it->second;
        if (tier_node["price"]) {
            rule.price = tier_node["price"].as<double>();
        }
        if (tier_node["threshold"]) {
            rule.threshold = tier_node["threshold"].as<double>();
        }
        if (tier_node["below_threshold"]) {
            rule.below = parseClassList(tier_node["below_threshold"], name + ".below_threshold");
        }
        if (tier_node["at_or_above_threshold"]) {
            rule.at_or_above = parseClassList(tier_node["at_or_above_threshold"], name + ".at_or_above_threshold");
        }
    }
}

void parseClassifier(const YAML::Node& node, ClassifierConfig& classifier) {
    if (node["weights"]) {
        YAML::Node weights = node["weights"];
        if (weights["length"]) classifier.length_weight = weights["length"].as<double>();
        if (weights["code"]) classifier.code_weight = weights["code"].as<double>();
        if (weights["structure"]) classifier.structure_weight = weights["structure"].as<double>();
        if (weights["keywords"]) classifier.keyword_weight = weights["keywords"].as<double>();
    }
    if (node["simple_keyword_penalty"]) {
        classifier.simple_keyword_penalty = node["simple_keyword_penalty"].as<double>();
    }
    if (node["long_prompt_words"]) {
        classifier.long_prompt_words = node["long_prompt_words"].as<size_t>();
    }
    if (node["complex_keywords"]) {
        classifier.complex_keywords = parseStringList(node["complex_keywords"]);
    }
    if (node["simple_keywords"]) {
        classifier.simple_keywords = parseStringList(node["simple_keywords"]);
    }
    if (node["structure_keywords"]) {
        classifier.structure_keywords = parseStringList(node["structure_keywords"]);
    }
    if (node["code_keywords"]) {
        classifier.code_keywords = parseStringList(node["code_keywords"]);
    }
}

void parseLogging(const YAML::Node& node, LoggerConfig& logging) {
    if (node["dir"]) logging.log_dir = node["dir"].as<std::string>();
    if (node["console_level"]) logging.console_level = Logger::parseLevel(node["console_level"].as<std::string>());
    if (node["file_level"]) logging.file_level = Logger::parseLevel(node["file_level"].as<std::string>());
    if (node["console"]) logging.console_enabled = node["console"].as<bool>();
    if (node["file"]) logging.file_enabled = node["file"].as<bool>();
    if (node["max_file_size"]) logging.max_log_size = node["max_file_size"].as<size_t>();
    if (node["max_files"]) logging.max_log_files = node["max_files"].as<size_t>();
}

RouterConfig parseDocument(const YAML::Node& root) {
    RouterConfig config = RouterConfig::defaults();

    if (!root || root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        throw RoutingError(ErrorKind::INVALID_CONFIGURATION, "Configuration root must be a mapping");
    }

    if (root["backends"]) {
        parseBackends(root["backends"], config);
    }
    if (root["tiers"]) {
        parseTiers(root["tiers"], config);
    }

    if (root["health"]) {
        YAML::Node health = root["health"];
        if (health["probe_interval_ms"]) config.health.probe_interval = parseMillis(health["probe_interval_ms"]);
        if (health["probe_timeout_ms"]) config.health.probe_timeout = parseMillis(health["probe_timeout_ms"]);
    }

    if (root["circuit_breaker"]) {
        YAML::Node breaker = root["circuit_breaker"];
        if (breaker["failure_threshold"]) {
            config.circuit_breaker.failure_threshold = breaker["failure_threshold"].as<size_t>();
        }
        if (breaker["cooldown_ms"]) config.circuit_breaker.cooldown = parseMillis(breaker["cooldown_ms"]);
        if (breaker["backoff_multiplier"]) {
            config.circuit_breaker.backoff_multiplier = breaker["backoff_multiplier"].as<double>();
        }
        if (breaker["max_cooldown_ms"]) config.circuit_breaker.max_cooldown = parseMillis(breaker["max_cooldown_ms"]);
    }

    if (root["dispatch"]) {
        YAML::Node dispatch = root["dispatch"];
        if (dispatch["timeout_ms"]) config.dispatch.attempt_timeout = parseMillis(dispatch["timeout_ms"]);
        if (dispatch["max_attempts"]) config.dispatch.max_attempts = dispatch["max_attempts"].as<size_t>();
    }

    if (root["classifier"]) {
        parseClassifier(root["classifier"], config.classifier);
    }

    if (root["metering"] && root["metering"]["max_pending_records"]) {
        config.metering.max_pending_records = root["metering"]["max_pending_records"].as<size_t>();
    }

    if (root["logging"]) {
        parseLogging(root["logging"], config.logging);
    }

    return config;
}

} // anonymous namespace

std::vector<BackendConfig> RouterConfig::defaultBackends() {
    BackendConfig lite;
    lite.id = "llama-lite";
    lite.backend_class = BackendClass::LIGHTWEIGHT;
    lite.model = "llama3.2:3b";

    BackendConfig heavy;
    heavy.id = "gpt-oss";
    heavy.backend_class = BackendClass::HEAVYWEIGHT;
    heavy.model = "gpt-oss:20b";

    return {lite, heavy};
}

std::map<CustomerTier, TierRule> RouterConfig::defaultTiers() {
    const auto LIGHT = BackendClass::LIGHTWEIGHT;
    const auto HEAVY = BackendClass::HEAVYWEIGHT;

    std::map<CustomerTier, TierRule> tiers;
    tiers[CustomerTier::BASIC] = TierRule{CustomerTier::BASIC, 0.05, 0.70, {LIGHT}, {LIGHT, HEAVY}};
    tiers[CustomerTier::PREMIUM] = TierRule{CustomerTier::PREMIUM, 0.15, 0.50, {LIGHT, HEAVY}, {HEAVY, LIGHT}};
    tiers[CustomerTier::ENTERPRISE] = TierRule{CustomerTier::ENTERPRISE, 0.30, 0.00, {HEAVY, LIGHT}, {HEAVY, LIGHT}};
    return tiers;
}

RouterConfig RouterConfig::defaults() {
    RouterConfig config;
    config.backends = defaultBackends();
    config.tiers = defaultTiers();
    return config;
}

RouterConfig ConfigLoader::loadFromFile(const std::string& path) {
    RouterConfig config;
    try {
        config = parseDocument(YAML::LoadFile(path));
    } catch (const YAML::Exception& e) {
        throw RoutingError(ErrorKind::INVALID_CONFIGURATION,
                           "Failed to parse configuration file " + path + ": " + e.what());
    }

    validate(config);
    Logger::getInstance().info("ConfigLoader", "Loaded configuration",
        path + ", " + std::to_string(config.backends.size()) + " backends");
    return config;
}

RouterConfig ConfigLoader::loadFromString(const std::string& yaml_text) {
    RouterConfig config;
    try {
        config = parseDocument(YAML::Load(yaml_text));
    } catch (const YAML::Exception& e) {
        throw RoutingError(ErrorKind::INVALID_CONFIGURATION,
                           std::string("Failed to parse configuration: ") + e.what());
    }

    validate(config);
    return config;
}

void ConfigLoader::validate(const RouterConfig& config) {
    auto fail = [](const std::string& message) {
        throw RoutingError(ErrorKind::INVALID_CONFIGURATION, message);
    };

    // Backends
    if (config.backends.empty()) {
        fail("At least one backend must be configured");
    }

    std::set<std::string> ids;
    std::set<BackendClass> available_classes;
    for (const auto& backend : config.backends) {
        if (backend.id.empty()) {
            fail("Backend id must not be empty");
        }
        if (!ids.insert(backend.id).second) {
            fail("Duplicate backend id: " + backend.id);
        }
        if (backend.type.empty()) {
            fail("Backend '" + backend.id + "' has no type");
        }
        if (backend.cost_per_request < 0.0) {
            fail("Backend '" + backend.id + "' has a negative cost_per_request");
        }
        available_classes.insert(backend.backend_class);
    }

    // Tiers
    for (CustomerTier tier : RoutingTypeUtils::getAllTiers()) {
        auto it = config.tiers.find(tier);
        std::string name = RoutingTypeUtils::tierToString(tier);
        if (it == config.tiers.end()) {
            fail("Missing policy for tier: " + name);
        }

        const TierRule& rule = it->second;
        if (rule.price < 0.0) {
            fail("Tier '" + name + "' has a negative price");
        }
        if (rule.threshold < 0.0 || rule.threshold > 1.0) {
            fail("Tier '" + name + "' threshold must be within [0, 1]");
        }
        if (rule.below.empty() || rule.at_or_above.empty()) {
            fail("Tier '" + name + "' needs at least one acceptable backend class");
        }

        // Enterprise traffic starts on heavyweight whatever its score
        if (tier == CustomerTier::ENTERPRISE &&
            (rule.below.front() != BackendClass::HEAVYWEIGHT ||
             rule.at_or_above.front() != BackendClass::HEAVYWEIGHT)) {
            fail("Tier 'enterprise' must list heavyweight first in both preference lists");
        }

        for (const auto* list : {&rule.below, &rule.at_or_above}) {
            for (BackendClass backend_class : *list) {
                if (available_classes.count(backend_class) == 0) {
                    Logger::getInstance().warning("ConfigLoader",
                        "Tier '" + name + "' lists class with no backend",
                        RoutingTypeUtils::classToString(backend_class));
                }
            }
        }
    }

    // Higher quality tiers escalate sooner
    double basic = config.tiers.at(CustomerTier::BASIC).threshold;
    double premium = config.tiers.at(CustomerTier::PREMIUM).threshold;
    double enterprise = config.tiers.at(CustomerTier::ENTERPRISE).threshold;
    if (!(basic > premium && premium > enterprise)) {
        std::ostringstream oss;
        oss << "Tier thresholds must strictly decrease basic > premium > enterprise (got "
            << basic << ", " << premium << ", " << enterprise << ")";
        fail(oss.str());
    }

    // Health and breaker
    if (config.health.probe_interval.count() <= 0 || config.health.probe_timeout.count() <= 0) {
        fail("Health probe interval and timeout must be positive");
    }
    if (config.circuit_breaker.failure_threshold == 0) {
        fail("circuit_breaker.failure_threshold must be at least 1");
    }
    if (config.circuit_breaker.cooldown.count() <= 0) {
        fail("circuit_breaker.cooldown_ms must be positive");
    }
    if (config.circuit_breaker.backoff_multiplier < 1.0) {
        fail("circuit_breaker.backoff_multiplier must be at least 1.0");
    }
    if (config.circuit_breaker.max_cooldown < config.circuit_breaker.cooldown) {
        fail("circuit_breaker.max_cooldown_ms must not be below cooldown_ms");
    }

    // Dispatch and metering
    if (config.dispatch.attempt_timeout.count() <= 0) {
        fail("dispatch.timeout_ms must be positive");
    }
    if (config.dispatch.max_attempts == 0) {
        fail("dispatch.max_attempts must be at least 1");
    }
    if (config.metering.max_pending_records == 0) {
        fail("metering.max_pending_records must be at least 1");
    }
}

} // namespace Switchyard
