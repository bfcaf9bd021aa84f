// =================================================================
// src/Switchyard/RoutingTypes.cpp
// =================================================================
// Implementation of routing enum conversion utilities.

#include "Switchyard/RoutingTypes.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace Switchyard {

static std::string toLower(const std::string& s) {
    std::string lowered = s;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

std::string RoutingTypeUtils::tierToString(CustomerTier tier) {
    switch (tier) {
        case CustomerTier::BASIC:
            return "basic";
        case CustomerTier::PREMIUM:
            return "premium";
        case CustomerTier::ENTERPRISE:
            return "enterprise";
        default:
            return "unknown";
    }
}

std::optional<CustomerTier> RoutingTypeUtils::parseTier(const std::string& name) {
    static const std::unordered_map<std::string, CustomerTier> tier_map = {
        {"basic", CustomerTier::BASIC},
        {"premium", CustomerTier::PREMIUM},
        {"enterprise", CustomerTier::ENTERPRISE}
    };

    auto it = tier_map.find(toLower(name));
    if (it != tier_map.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::vector<CustomerTier> RoutingTypeUtils::getAllTiers() {
    return {CustomerTier::BASIC, CustomerTier::PREMIUM, CustomerTier::ENTERPRISE};
}

std::string RoutingTypeUtils::classToString(BackendClass backend_class) {
    switch (backend_class) {
        case BackendClass::LIGHTWEIGHT:
            return "lightweight";
        case BackendClass::HEAVYWEIGHT:
            return "heavyweight";
        default:
            return "unknown";
    }
}

BackendClass RoutingTypeUtils::stringToClass(const std::string& str) {
    std::string lowered = toLower(str);
    if (lowered == "lightweight") return BackendClass::LIGHTWEIGHT;
    if (lowered == "heavyweight") return BackendClass::HEAVYWEIGHT;

    throw RoutingError(ErrorKind::INVALID_CONFIGURATION, "Unknown backend class: " + str);
}

std::string RoutingTypeUtils::breakerStateToString(BreakerState state) {
    switch (state) {
        case BreakerState::CLOSED:
            return "closed";
        case BreakerState::OPEN:
            return "open";
        case BreakerState::HALF_OPEN:
            return "half-open";
        default:
            return "unknown";
    }
}

std::string RoutingTypeUtils::errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::INVALID_TIER: return "InvalidTier";
        case ErrorKind::CLASSIFICATION_DEGRADED: return "ClassificationDegraded";
        case ErrorKind::BACKEND_TIMEOUT: return "BackendTimeout";
        case ErrorKind::BACKEND_REJECTED: return "BackendRejected";
        case ErrorKind::ALL_BACKENDS_UNAVAILABLE: return "AllBackendsUnavailable";
        case ErrorKind::METERING_WRITE_FAILED: return "MeteringWriteFailed";
        case ErrorKind::CANCELLED: return "Cancelled";
        case ErrorKind::INVALID_REQUEST: return "InvalidRequest";
        case ErrorKind::INVALID_CONFIGURATION: return "InvalidConfiguration";
        default: return "Unknown";
    }
}

bool RoutingTypeUtils::isRetryable(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::BACKEND_TIMEOUT:
        case ErrorKind::BACKEND_REJECTED:
        case ErrorKind::ALL_BACKENDS_UNAVAILABLE:
            return true;
        default:
            return false;
    }
}

std::string RoutingTypeUtils::attemptOutcomeToString(AttemptOutcome outcome) {
    switch (outcome) {
        case AttemptOutcome::SUCCESS: return "success";
        case AttemptOutcome::TIMEOUT: return "timeout";
        case AttemptOutcome::REJECTED: return "rejected";
        case AttemptOutcome::SKIPPED_OPEN: return "skipped_open";
        case AttemptOutcome::CANCELLED: return "cancelled";
        default: return "unknown";
    }
}

std::string RoutingTypeUtils::classListToString(const std::vector<BackendClass>& classes) {
    std::string result = "[";
    for (size_t i = 0; i < classes.size(); ++i) {
        if (i > 0) result += ", ";
        result += classToString(classes[i]);
    }
    result += "]";
    return result;
}

} // namespace Switchyard
