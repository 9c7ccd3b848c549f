/*
 * ToolGate C++ - Tier classifier
 */
#include <toolgate/safety/tiers.hpp>
#include <toolgate/core/logger.hpp>

namespace toolgate {

void TierClassifier::set_tier(const std::string& name, Tier tier,
                              const ResourceKeyList& resource_keys) {
    tiers_[name] = tier;
    resource_keys_[name] = resource_keys;
}

size_t TierClassifier::apply_overrides(const Json& overrides) {
    if (!overrides.is_object()) {
        if (!overrides.is_null()) {
            LOG_WARN("safety.tier_overrides must be an object, ignoring");
        }
        return 0;
    }

    size_t applied = 0;
    for (Json::const_iterator it = overrides.begin(); it != overrides.end(); ++it) {
        const std::string& name = it.key();
        std::map<std::string, Tier>::iterator current = tiers_.find(name);
        if (current == tiers_.end()) {
            LOG_WARN("Tier override for unknown action '%s' ignored", name.c_str());
            continue;
        }

        Tier wanted;
        if (!it.value().is_string() || !tier_from_string(it.value().get<std::string>(), wanted)) {
            LOG_WARN("Invalid tier override for '%s' ignored", name.c_str());
            continue;
        }

        if (static_cast<int>(wanted) < static_cast<int>(current->second)) {
            LOG_WARN("Tier override for '%s' would relax %s to %s, ignored",
                     name.c_str(), tier_to_string(current->second), tier_to_string(wanted));
            continue;
        }

        if (wanted != current->second) {
            LOG_INFO("Tier override: %s %s -> %s", name.c_str(),
                     tier_to_string(current->second), tier_to_string(wanted));
            current->second = wanted;
            ++applied;
        }
    }
    return applied;
}

bool TierClassifier::knows(const std::string& name) const {
    return tiers_.find(name) != tiers_.end();
}

Tier TierClassifier::get_tier(const std::string& name) const {
    std::map<std::string, Tier>::const_iterator it = tiers_.find(name);
    return it == tiers_.end() ? Tier::BLOCKED : it->second;
}

SafetyDecision TierClassifier::check_safety(const std::string& name, const Json& args,
                                            bool confirmed, bool override_active,
                                            bool keyword_approved) const {
    // Override widens the command allow-list only; it never lifts a tier.
    (void)override_active;

    std::map<std::string, Tier>::const_iterator it = tiers_.find(name);
    if (it == tiers_.end()) {
        return SafetyDecision(false, Tier::BLOCKED, "Unknown action \"" + name + "\"");
    }
    Tier tier = it->second;

    // Protected resources win over every tier rule.
    std::map<std::string, ResourceKeyList>::const_iterator keys = resource_keys_.find(name);
    ResourceMatch hit = resources_.match(args, keys != resource_keys_.end() ? keys->second
                                                                             : ResourceKeyList());
    if (hit.matched) {
        return SafetyDecision(false, tier, hit.reason);
    }

    switch (tier) {
        case Tier::BLOCKED:
            return SafetyDecision(false, tier,
                                  "Action \"" + name + "\" is classified as blocked and never runs");

        case Tier::AUTO:
            return SafetyDecision(true, tier);

        case Tier::CONFIRM:
        case Tier::DOUBLE_CONFIRM:
            if (!confirmed) {
                return SafetyDecision(false, tier, "Action \"" + name + "\" is classified as " +
                                                       tier_to_string(tier) +
                                                       " and requires confirmed=true");
            }
            return SafetyDecision(true, tier);

        case Tier::KEYWORD_ELEVATED:
            if (!keyword_approved) {
                return SafetyDecision(false, tier, "Action \"" + name +
                                                       "\" requires keyword approval");
            }
            return SafetyDecision(true, tier);
    }

    return SafetyDecision(false, tier, "Action \"" + name + "\" has an unrecognized tier");
}

} // namespace toolgate
