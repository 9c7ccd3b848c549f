/*
 * ToolGate C++ - Tool registry and dispatcher
 *
 * Actions are registered once at startup with a declarative argument
 * schema and a handler. execute() is the only way to run a handler:
 *
 *   lookup -> schema check -> sanitize -> classify/authorize
 *          -> handler (fault boundary) -> audit -> result
 *
 * After freeze() the registry is read-only and execute() may be called
 * from any number of threads.
 */
#ifndef toolgate_CORE_REGISTRY_HPP
#define toolgate_CORE_REGISTRY_HPP

#include <toolgate/core/types.hpp>
#include <toolgate/core/json.hpp>
#include <toolgate/core/call_context.hpp>
#include <toolgate/safety/tiers.hpp>
#include <toolgate/safety/paths.hpp>
#include <toolgate/safety/urls.hpp>
#include <string>
#include <vector>
#include <map>
#include <functional>
#include <stdexcept>
#include <cstdint>

namespace toolgate {

class Config;
class AuditSink;
struct AuditRecord;

class RegistrationError : public std::runtime_error {
public:
    explicit RegistrationError(const std::string& what) : std::runtime_error(what) {}
};

typedef std::function<ToolResult(const Json& args, const CallContext& ctx)> ActionHandler;

class ToolRegistry {
public:
    ToolRegistry();

    // Protected resources, path/URL policies, dispatcher limits and tier
    // overrides (applied at freeze). Throws ConfigError on malformed
    // protected_resources.
    void configure(const Config& config);

    void set_resources(const ResourceRegistry& resources);
    void set_path_policy(const PathPolicy& policy) { path_policy_ = policy; }
    void set_url_policy(const UrlPolicy& policy) { url_policy_ = policy; }
    void set_resolver(const HostResolver& resolver) { resolver_ = resolver; }
    void set_slow_call_ms(int64_t ms) { slow_call_ms_ = ms; }
    void set_max_text_length(size_t len) { max_text_length_ = len; }

    // Not owned; must outlive the registry. nullptr disables auditing.
    void set_audit_sink(AuditSink* sink) { audit_ = sink; }

    // Throws RegistrationError on a duplicate name, an empty name or
    // after freeze().
    void register_action(const ActionSpec& spec, ActionHandler handler);

    // Applies pending tier overrides and rejects further registration.
    void freeze();
    bool frozen() const { return frozen_; }

    bool has_action(const std::string& name) const;
    const ActionSpec* find_action(const std::string& name) const;
    Tier get_tier(const std::string& name) const { return classifier_.get_tier(name); }
    size_t size() const { return actions_.size(); }

    // Sorted by name
    std::vector<ActionInfo> get_action_list() const;

    // Markdown description of every action for a system prompt
    std::string build_capability_prompt() const;

    // Never throws. Every call produces exactly one audit record.
    ToolResult execute(const std::string& name, const Json& args,
                       Source source = Source::API,
                       bool override_active = false,
                       bool keyword_approved = false) const;

    const TierClassifier& classifier() const { return classifier_; }

private:
    struct Entry {
        ActionSpec spec;
        ActionHandler handler;
    };

    std::map<std::string, Entry> actions_;
    TierClassifier classifier_;
    PathPolicy path_policy_;
    UrlPolicy url_policy_;
    HostResolver resolver_;
    AuditSink* audit_;
    int64_t slow_call_ms_;
    size_t max_text_length_;
    Json tier_overrides_;
    bool frozen_;

    bool validate_args(const ActionSpec& spec, const Json& args, std::string& error) const;
    void sanitize_strings(Json& value) const;
    bool sanitize_formats(const ActionSpec& spec, Json& args, bool override_active,
                          std::string& reason) const;
    void write_audit(const AuditRecord& rec) const;
};

} // namespace toolgate

#endif // toolgate_CORE_REGISTRY_HPP
