/*
 * ToolGate C++ - Protected resources
 */
#include <toolgate/safety/protected.hpp>
#include <toolgate/core/config.hpp>
#include <toolgate/core/utils.hpp>
#include <toolgate/core/logger.hpp>

#include <cstdlib>
#include <cctype>

namespace toolgate {

std::string ProtectedResource::label() const {
    return std::string(resource_kind_to_string(kind)) + ":" + identifier;
}

// ============================================================================
// Construction
// ============================================================================

ResourceRegistry ResourceRegistry::defaults() {
    ResourceRegistry reg;

    ProtectedResource node("agent1", ResourceKind::NODE);
    node.dependents.push_back("192.168.1.61");
    node.description = "hosts the gateway and its management services";
    reg.add(node);

    ProtectedResource vm("103", ResourceKind::VMID);
    vm.dependents.push_back("192.168.1.65");
    vm.description = "management VM";
    reg.add(vm);

    ProtectedResource docker("docker", ResourceKind::DAEMON);
    docker.description = "container runtime for the gateway";
    reg.add(docker);

    ProtectedResource docker_unit("docker.service", ResourceKind::DAEMON);
    docker_unit.description = docker.description;
    reg.add(docker_unit);

    return reg;
}

ResourceRegistry ResourceRegistry::from_config(const Config& config) {
    if (!config.has("protected_resources")) {
        return defaults();
    }

    Json list = config.section("protected_resources");
    if (!list.is_array()) {
        throw ConfigError("protected_resources must be an array");
    }

    ResourceRegistry reg;
    try {
        for (size_t i = 0; i < list.size(); ++i) {
            const Json& entry = list[i];
            std::string where = "protected_resources[" + std::to_string(i) + "]";

            if (!entry.is_object()) {
                throw ConfigError(where + " must be an object");
            }

            ProtectedResource res;
            Json id = entry.value("id", Json());
            if (id.is_string()) {
                res.identifier = trim(id.get<std::string>());
            } else if (id.is_number_integer()) {
                res.identifier = std::to_string(id.get<int64_t>());
            }
            if (res.identifier.empty()) {
                throw ConfigError(where + ": missing id");
            }

            std::string kind = entry.value("kind", std::string());
            if (!resource_kind_from_string(kind, res.kind)) {
                throw ConfigError(where + ": unknown kind '" + kind + "'");
            }

            Json deps = entry.value("dependents", Json::array());
            if (!deps.is_array()) {
                throw ConfigError(where + ": dependents must be an array");
            }
            for (size_t d = 0; d < deps.size(); ++d) {
                if (deps[d].is_string()) {
                    res.dependents.push_back(deps[d].get<std::string>());
                } else if (deps[d].is_number_integer()) {
                    res.dependents.push_back(std::to_string(deps[d].get<int64_t>()));
                }
            }
            res.description = entry.value("description", std::string());

            reg.add(res);
        }
    } catch (const Json::type_error& e) {
        throw ConfigError(std::string("protected_resources: ") + e.what());
    }

    LOG_DEBUG("Loaded %zu protected resources", reg.resources().size());
    return reg;
}

void ResourceRegistry::add(const ProtectedResource& resource) {
    resources_.push_back(resource);
}

// ============================================================================
// Matching
// ============================================================================

// parseInt-like: leading digits only; false when there are none.
static bool leading_int(const std::string& s, long long& out) {
    std::string t = trim(s);
    if (t.empty() || !isdigit(static_cast<unsigned char>(t[0]))) return false;
    out = strtoll(t.c_str(), nullptr, 10);
    return true;
}

static bool value_equals(ResourceKind kind, const std::string& value, const std::string& ident) {
    switch (kind) {
        case ResourceKind::VMID: {
            long long a = 0, b = 0;
            return leading_int(value, a) && leading_int(ident, b) && a == b;
        }
        case ResourceKind::PATH: {
            if (value.empty() || ident.empty()) return false;
            std::string v = normalize_path(value[0] == '/' ? value : "/" + value);
            return is_within_dir(v, normalize_path(ident));
        }
        default:
            return to_lower(trim(value)) == to_lower(trim(ident));
    }
}

static std::string describe(const ProtectedResource& res) {
    std::string text = std::string(resource_kind_to_string(res.kind)) + " \"" + res.identifier + "\"";
    if (!res.description.empty()) text += " (" + res.description + ")";
    return text;
}

bool ResourceRegistry::match_value(ResourceKind kind, const std::string& key,
                                   const std::string& value, ResourceMatch& out) const {
    for (size_t i = 0; i < resources_.size(); ++i) {
        const ProtectedResource& res = resources_[i];
        if (res.kind == kind && value_equals(kind, value, res.identifier)) {
            out.matched = true;
            out.resource = res.label();
            out.reason = "Protected " + describe(res) +
                         " cannot be targeted by automated actions";
            return true;
        }
    }

    // Dependents are matched by value regardless of the argument's kind.
    std::string lower = to_lower(trim(value));
    if (lower.empty()) return false;
    for (size_t i = 0; i < resources_.size(); ++i) {
        const ProtectedResource& res = resources_[i];
        for (size_t d = 0; d < res.dependents.size(); ++d) {
            if (to_lower(trim(res.dependents[d])) == lower) {
                out.matched = true;
                out.resource = res.label();
                out.reason = "'" + key + "' " + value + " supports protected " + describe(res) +
                             " and cannot be targeted by automated actions";
                return true;
            }
        }
    }
    return false;
}

bool ResourceRegistry::match_command(const std::string& command, ResourceMatch& out) const {
    std::string lower = to_lower(command);
    for (size_t i = 0; i < resources_.size(); ++i) {
        const ProtectedResource& res = resources_[i];
        if (res.kind != ResourceKind::DAEMON) continue;
        if (lower.find(to_lower(res.identifier)) != std::string::npos) {
            out.matched = true;
            out.resource = res.label();
            out.reason = "Command references protected " + describe(res);
            return true;
        }
    }
    return false;
}

// String and integer arguments only; other JSON types never name a target.
static bool arg_as_string(const Json& args, const std::string& key, std::string& out) {
    Json::const_iterator it = args.find(key);
    if (it == args.end()) return false;
    if (it->is_string()) {
        out = it->get<std::string>();
        return true;
    }
    if (it->is_number_integer()) {
        out = std::to_string(it->get<int64_t>());
        return true;
    }
    if (it->is_number_float()) {
        double d = it->get<double>();
        // Out-of-range or NaN cannot name a VMID
        if (!(d >= -9.2e18 && d <= 9.2e18)) return false;
        out = std::to_string(static_cast<long long>(d));
        return true;
    }
    return false;
}

ResourceMatch ResourceRegistry::match(const Json& args, const ResourceKeyList& extra_keys) const {
    ResourceMatch out;
    if (!args.is_object() || resources_.empty()) return out;

    ResourceKeyList keys;
    keys.push_back(std::make_pair(std::string("node"), ResourceKind::NODE));
    keys.push_back(std::make_pair(std::string("target"), ResourceKind::NODE));
    keys.push_back(std::make_pair(std::string("vmid"), ResourceKind::VMID));
    keys.push_back(std::make_pair(std::string("id"), ResourceKind::VMID));
    keys.push_back(std::make_pair(std::string("service"), ResourceKind::DAEMON));
    keys.push_back(std::make_pair(std::string("serviceName"), ResourceKind::DAEMON));
    keys.push_back(std::make_pair(std::string("host"), ResourceKind::HOST));
    keys.push_back(std::make_pair(std::string("ip"), ResourceKind::HOST));
    keys.push_back(std::make_pair(std::string("path"), ResourceKind::PATH));
    keys.insert(keys.end(), extra_keys.begin(), extra_keys.end());

    for (size_t i = 0; i < keys.size(); ++i) {
        std::string value;
        if (!arg_as_string(args, keys[i].first, value)) continue;
        if (match_value(keys[i].second, keys[i].first, value, out)) {
            LOG_WARN("Protected resource match: %s via '%s'", out.resource.c_str(),
                     keys[i].first.c_str());
            return out;
        }
    }

    const char* command_keys[] = {"command", "cmd"};
    for (size_t i = 0; i < 2; ++i) {
        std::string command;
        if (arg_as_string(args, command_keys[i], command) && match_command(command, out)) {
            LOG_WARN("Protected resource referenced in command: %s", out.resource.c_str());
            return out;
        }
    }

    return out;
}

} // namespace toolgate
