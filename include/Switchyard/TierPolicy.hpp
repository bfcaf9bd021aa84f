// =================================================================
// include/Switchyard/TierPolicy.hpp
// =================================================================
// Lookup from (customer tier, complexity) to backend class preferences.

#pragma once

#include "Switchyard/RoutingTypes.hpp"
#include "Switchyard/RouterConfig.hpp"
#include <string>
#include <vector>
#include <map>

namespace Switchyard {

/**
 * @brief Resolved preference list with the rule that produced it
 */
struct PolicyResolution {
    std::vector<BackendClass> preferences;  ///< Ordered, never empty
    bool escalated = false;                 ///< Score reached the tier threshold
    double threshold = 0.0;
    std::string rationale;                  ///< e.g. "premium: score 0.62 >= 0.50"
};

/**
 * @brief Data-driven tier policy table
 *
 * Stateless after construction; safe to share across request threads.
 */
class TierPolicy {
public:
    /**
     * @brief Constructor
     * @param rules One rule per tier, validated by ConfigLoader::validate
     */
    explicit TierPolicy(const std::map<CustomerTier, TierRule>& rules = RouterConfig::defaultTiers());

    /**
     * @brief Ordered preference list for a tier and score
     * @param tier Customer tier
     * @param score Complexity score in [0, 1]
     * @return Backend classes to try in order
     */
    std::vector<BackendClass> resolve(CustomerTier tier, double score) const;

    /**
     * @brief Resolve a tier given by name
     * @throws RoutingError(INVALID_TIER) for unregistered tier names
     */
    std::vector<BackendClass> resolve(const std::string& tier_name, double score) const;

    /**
     * @brief Resolve with the rule description used for audit logs
     */
    PolicyResolution explain(CustomerTier tier, double score) const;

    /**
     * @brief Price charged per request for a tier
     */
    double priceFor(CustomerTier tier) const;

    const TierRule& getRule(CustomerTier tier) const;

    /**
     * @brief Parse a tier name strictly
     * @throws RoutingError(INVALID_TIER) for unknown names; never defaults
     */
    static CustomerTier requireTier(const std::string& tier_name);

private:
    std::map<CustomerTier, TierRule> m_rules;
};

} // namespace Switchyard
