// =================================================================
// src/Switchyard/TierPolicy.cpp
// =================================================================
// Implementation of the tier policy table.

#include "Switchyard/TierPolicy.hpp"
#include <iomanip>
#include <sstream>

namespace Switchyard {

TierPolicy::TierPolicy(const std::map<CustomerTier, TierRule>& rules)
    : m_rules(rules) {
    for (CustomerTier tier : RoutingTypeUtils::getAllTiers()) {
        auto it = m_rules.find(tier);
        if (it == m_rules.end() || it->second.below.empty() || it->second.at_or_above.empty()) {
            throw RoutingError(ErrorKind::INVALID_CONFIGURATION,
                               "Incomplete policy for tier: " + RoutingTypeUtils::tierToString(tier));
        }
    }
}

std::vector<BackendClass> TierPolicy::resolve(CustomerTier tier, double score) const {
    const TierRule& rule = getRule(tier);
    return score >= rule.threshold ? rule.at_or_above : rule.below;
}

std::vector<BackendClass> TierPolicy::resolve(const std::string& tier_name, double score) const {
    return resolve(requireTier(tier_name), score);
}

PolicyResolution TierPolicy::explain(CustomerTier tier, double score) const {
    const TierRule& rule = getRule(tier);

    PolicyResolution resolution;
    resolution.threshold = rule.threshold;
    resolution.escalated = score >= rule.threshold;
    resolution.preferences = resolution.escalated ? rule.at_or_above : rule.below;

    std::ostringstream rationale;
    rationale << std::fixed << std::setprecision(2);
    rationale << RoutingTypeUtils::tierToString(tier) << ": score " << score
              << (resolution.escalated ? " >= " : " < ") << rule.threshold
              << " -> " << RoutingTypeUtils::classListToString(resolution.preferences);
    resolution.rationale = rationale.str();

    return resolution;
}

double TierPolicy::priceFor(CustomerTier tier) const {
    return getRule(tier).price;
}

const TierRule& TierPolicy::getRule(CustomerTier tier) const {
    auto it = m_rules.find(tier);
    if (it == m_rules.end()) {
        throw RoutingError(ErrorKind::INVALID_TIER,
                           "No policy for tier: " + RoutingTypeUtils::tierToString(tier));
    }
    return it->second;
}

CustomerTier TierPolicy::requireTier(const std::string& tier_name) {
    auto tier = RoutingTypeUtils::parseTier(tier_name);
    if (!tier) {
        throw RoutingError(ErrorKind::INVALID_TIER, "Unknown customer tier: '" + tier_name + "'");
    }
    return *tier;
}

} // namespace Switchyard
