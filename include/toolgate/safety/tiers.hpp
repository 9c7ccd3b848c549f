/*
 * ToolGate C++ - Tier classifier
 *
 * Maps action names to risk tiers and decides whether one call may
 * proceed. Rules, first match wins:
 *
 *   1. unknown action                      -> blocked
 *   2. target is a protected resource      -> blocked (reason names it)
 *   3. BLOCKED tier                        -> blocked, no flag can lift it
 *   4. AUTO                                -> allowed
 *   5. CONFIRM / DOUBLE_CONFIRM            -> allowed only if confirmed
 *   6. KEYWORD_ELEVATED                    -> allowed only if keyword approved
 */
#ifndef toolgate_SAFETY_TIERS_HPP
#define toolgate_SAFETY_TIERS_HPP

#include <toolgate/core/types.hpp>
#include <toolgate/core/json.hpp>
#include <toolgate/safety/protected.hpp>
#include <string>
#include <map>

namespace toolgate {

struct SafetyDecision {
    bool allowed;
    Tier tier;
    std::string reason;

    SafetyDecision() : allowed(false), tier(Tier::BLOCKED) {}
    SafetyDecision(bool a, Tier t, const std::string& r = "") : allowed(a), tier(t), reason(r) {}
};

class TierClassifier {
public:
    TierClassifier() {}
    explicit TierClassifier(const ResourceRegistry& resources) : resources_(resources) {}

    void set_resources(const ResourceRegistry& resources) { resources_ = resources; }
    const ResourceRegistry& resources() const { return resources_; }

    // Registers or replaces the tier of an action together with the extra
    // argument keys that name its target.
    void set_tier(const std::string& name, Tier tier,
                  const ResourceKeyList& resource_keys = ResourceKeyList());

    // {"action": "tier", ...}; entries may only raise restriction. Returns
    // the number of overrides applied.
    size_t apply_overrides(const Json& overrides);

    bool knows(const std::string& name) const;

    // Unknown names resolve to BLOCKED.
    Tier get_tier(const std::string& name) const;

    SafetyDecision check_safety(const std::string& name, const Json& args, bool confirmed,
                                bool override_active, bool keyword_approved) const;

private:
    std::map<std::string, Tier> tiers_;
    std::map<std::string, ResourceKeyList> resource_keys_;
    ResourceRegistry resources_;
};

} // namespace toolgate

#endif // toolgate_SAFETY_TIERS_HPP
