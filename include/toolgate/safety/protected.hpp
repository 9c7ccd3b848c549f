/*
 * ToolGate C++ - Protected resources
 *
 * Static list of resources no automated action may target: the nodes, VMs
 * and daemons the gateway itself runs on, plus their dependents (aliases,
 * IPs, hosted services). Loaded once at startup, read-only afterwards.
 */
#ifndef toolgate_SAFETY_PROTECTED_HPP
#define toolgate_SAFETY_PROTECTED_HPP

#include <toolgate/core/types.hpp>
#include <toolgate/core/json.hpp>
#include <string>
#include <vector>
#include <utility>

namespace toolgate {

class Config;

struct ProtectedResource {
    std::string identifier;
    ResourceKind kind;
    std::vector<std::string> dependents;
    std::string description;

    ProtectedResource() : kind(ResourceKind::NODE) {}
    ProtectedResource(const std::string& id, ResourceKind k) : identifier(id), kind(k) {}

    // "node:agent1"
    std::string label() const;
};

struct ResourceMatch {
    bool matched;
    std::string resource;   // label of the protected resource
    std::string reason;

    ResourceMatch() : matched(false) {}
};

typedef std::vector<std::pair<std::string, ResourceKind>> ResourceKeyList;

class ResourceRegistry {
public:
    ResourceRegistry() {}

    // agent1 node, VMID 103, docker daemons
    static ResourceRegistry defaults();

    // Reads the protected_resources array; defaults when the key is absent.
    // Throws ConfigError on malformed entries.
    static ResourceRegistry from_config(const Config& config);

    void add(const ProtectedResource& resource);

    const std::vector<ProtectedResource>& resources() const { return resources_; }

    // Inspect the default argument keys (node/target, vmid/id,
    // service/serviceName, host/ip, path, command/cmd) plus `extra_keys`.
    ResourceMatch match(const Json& args,
                        const ResourceKeyList& extra_keys = ResourceKeyList()) const;

private:
    std::vector<ProtectedResource> resources_;

    bool match_value(ResourceKind kind, const std::string& key, const std::string& value,
                     ResourceMatch& out) const;
    bool match_command(const std::string& command, ResourceMatch& out) const;
};

} // namespace toolgate

#endif // toolgate_SAFETY_PROTECTED_HPP
