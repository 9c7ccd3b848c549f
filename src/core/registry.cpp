/*
 * ToolGate C++ - Tool registry and dispatcher
 */
#include <toolgate/core/registry.hpp>
#include <toolgate/core/config.hpp>
#include <toolgate/core/utils.hpp>
#include <toolgate/core/logger.hpp>
#include <toolgate/audit/sink.hpp>
#include <toolgate/safety/sanitize.hpp>

#include <sstream>

namespace toolgate {

ToolRegistry::ToolRegistry()
    : classifier_(ResourceRegistry::defaults())
    , path_policy_(PathPolicy::defaults())
    , url_policy_(UrlPolicy::defaults())
    , audit_(nullptr)
    , slow_call_ms_(10000)
    , max_text_length_(10000)
    , frozen_(false) {}

void ToolRegistry::configure(const Config& config) {
    set_resources(ResourceRegistry::from_config(config));
    path_policy_ = PathPolicy::from_config(config);
    url_policy_ = UrlPolicy::from_config(config);
    slow_call_ms_ = config.get_int("dispatcher.slow_call_ms", 10000);

    int64_t max_len = config.get_int("dispatcher.max_text_length", 10000);
    max_text_length_ = max_len > 0 ? static_cast<size_t>(max_len) : 10000;

    tier_overrides_ = config.section("safety.tier_overrides");
}

void ToolRegistry::set_resources(const ResourceRegistry& resources) {
    classifier_.set_resources(resources);
}

// ============================================================================
// Registration
// ============================================================================

void ToolRegistry::register_action(const ActionSpec& spec, ActionHandler handler) {
    if (frozen_) {
        throw RegistrationError("Cannot register '" + spec.name + "': registry is frozen");
    }
    if (spec.name.empty()) {
        throw RegistrationError("Action name must not be empty");
    }
    if (!handler) {
        throw RegistrationError("Action '" + spec.name + "' has no handler");
    }
    if (actions_.find(spec.name) != actions_.end()) {
        throw RegistrationError("Duplicate action name: " + spec.name);
    }

    Entry entry;
    entry.spec = spec;
    entry.handler = handler;
    actions_[spec.name] = entry;
    classifier_.set_tier(spec.name, spec.tier, spec.resource_keys);

    LOG_DEBUG("[Registry] Registered action '%s' (%s, %zu params)",
              spec.name.c_str(), tier_to_string(spec.tier), spec.params.size());
}

void ToolRegistry::freeze() {
    if (frozen_) return;
    size_t applied = classifier_.apply_overrides(tier_overrides_);

    // Keep ActionSpec::tier in sync for listings and prompts.
    for (std::map<std::string, Entry>::iterator it = actions_.begin(); it != actions_.end(); ++it) {
        it->second.spec.tier = classifier_.get_tier(it->first);
    }

    frozen_ = true;
    LOG_INFO("[Registry] %zu actions registered, %zu tier overrides applied",
             actions_.size(), applied);
}

bool ToolRegistry::has_action(const std::string& name) const {
    return actions_.find(name) != actions_.end();
}

const ActionSpec* ToolRegistry::find_action(const std::string& name) const {
    std::map<std::string, Entry>::const_iterator it = actions_.find(name);
    return it == actions_.end() ? nullptr : &it->second.spec;
}

std::vector<ActionInfo> ToolRegistry::get_action_list() const {
    std::vector<ActionInfo> list;
    for (std::map<std::string, Entry>::const_iterator it = actions_.begin();
         it != actions_.end(); ++it) {
        list.push_back(ActionInfo(it->first, classifier_.get_tier(it->first)));
    }
    return list;
}

std::string ToolRegistry::build_capability_prompt() const {
    if (actions_.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << "## Available Actions\n\n";
    oss << "Every action runs through a safety gateway. Tiers:\n";
    oss << "- `auto`: runs immediately\n";
    oss << "- `confirm`: requires `\"confirmed\": true` after the operator agrees\n";
    oss << "- `double_confirm`: requires the operator to confirm twice\n";
    oss << "- `keyword_elevated`: requires the operator's approval keyword\n";
    oss << "- `blocked`: never runs\n\n";
    oss << "Protected infrastructure cannot be targeted by any action.\n\n";
    oss << "### Actions:\n\n";

    for (std::map<std::string, Entry>::const_iterator it = actions_.begin();
         it != actions_.end(); ++it) {
        const ActionSpec& spec = it->second.spec;
        oss << "**" << spec.name << "** [" << tier_to_string(classifier_.get_tier(spec.name))
            << "]: " << spec.description << "\n";
        if (!spec.params.empty()) {
            oss << "  Parameters:\n";
            for (size_t i = 0; i < spec.params.size(); ++i) {
                const ParamSchema& param = spec.params[i];
                oss << "  - `" << param.name << "` (" << param.type;
                if (param.required) oss << ", required";
                oss << "): " << param.description << "\n";
            }
        }
        oss << "\n";
    }
    return oss.str();
}

// ============================================================================
// Argument checks
// ============================================================================

static bool type_matches(const std::string& type, const Json& value) {
    if (type == "string") return value.is_string();
    if (type == "number") return value.is_number();
    if (type == "integer") return value.is_number_integer();
    if (type == "boolean") return value.is_boolean();
    if (type == "array") return value.is_array();
    if (type == "object") return value.is_object();
    return true;
}

bool ToolRegistry::validate_args(const ActionSpec& spec, const Json& args,
                                 std::string& error) const {
    if (!args.is_object()) {
        error = "Arguments must be a JSON object";
        return false;
    }

    for (size_t i = 0; i < spec.params.size(); ++i) {
        const ParamSchema& param = spec.params[i];
        Json::const_iterator it = args.find(param.name);
        if (it == args.end() || it->is_null()) {
            if (param.required) {
                error = "Missing required parameter '" + param.name + "'";
                return false;
            }
            continue;
        }
        if (!type_matches(param.type, *it)) {
            error = "Parameter '" + param.name + "' must be of type " + param.type;
            return false;
        }
    }
    return true;
}

void ToolRegistry::sanitize_strings(Json& value) const {
    if (value.is_string()) {
        value = sanitize_text(value.get<std::string>(), max_text_length_);
    } else if (value.is_array() || value.is_object()) {
        for (Json::iterator it = value.begin(); it != value.end(); ++it) {
            sanitize_strings(*it);
        }
    }
}

bool ToolRegistry::sanitize_formats(const ActionSpec& spec, Json& args, bool override_active,
                                    std::string& reason) const {
    for (size_t i = 0; i < spec.params.size(); ++i) {
        const ParamSchema& param = spec.params[i];
        if (param.format == ParamFormat::NONE) continue;

        Json::iterator it = args.find(param.name);
        if (it == args.end() || !it->is_string()) continue;
        std::string value = it->get<std::string>();

        switch (param.format) {
            case ParamFormat::COMMAND: {
                CommandCheck check = sanitize_command(value, override_active);
                if (!check.safe) {
                    reason = check.reason;
                    return false;
                }
                break;
            }
            case ParamFormat::PATH:
            case ParamFormat::SECRET_PATH: {
                PathCheck check = sanitize_path(value, param.root, path_policy_);
                if (!check.safe) {
                    reason = check.reason;
                    return false;
                }
                if (param.format == ParamFormat::SECRET_PATH) {
                    SecretCheck secret = check_secret_file(check.resolved_path);
                    if (secret.blocked) {
                        reason = secret.reason;
                        return false;
                    }
                }
                *it = check.resolved_path;
                break;
            }
            case ParamFormat::URL: {
                UrlCheck check = validate_url(value, resolver_, url_policy_);
                if (!check.safe) {
                    reason = check.reason;
                    return false;
                }
                break;
            }
            case ParamFormat::NODE_NAME: {
                NodeNameCheck check = sanitize_node_name(value);
                if (!check.safe) {
                    reason = check.reason;
                    return false;
                }
                *it = check.value;
                break;
            }
            case ParamFormat::NONE:
                break;
        }
    }
    return true;
}

void ToolRegistry::write_audit(const AuditRecord& rec) const {
    if (!audit_) return;
    try {
        audit_->record(rec);
    } catch (const std::exception& e) {
        LOG_ERROR("[Registry] Audit write failed for '%s' (%s): %s",
                  rec.action.c_str(), outcome_to_string(rec.outcome), e.what());
    } catch (...) {
        LOG_ERROR("[Registry] Audit write failed for '%s' (%s): unknown exception",
                  rec.action.c_str(), outcome_to_string(rec.outcome));
    }
}

// ============================================================================
// execute
// ============================================================================

static Outcome outcome_for(const ToolResult& result) {
    switch (result.status) {
        case ResultStatus::OK: return Outcome::OK;
        case ResultStatus::BLOCKED: return Outcome::BLOCKED;
        case ResultStatus::ERROR: return Outcome::ERROR;
    }
    return Outcome::ERROR;
}

ToolResult ToolRegistry::execute(const std::string& name, const Json& args, Source source,
                                 bool override_active, bool keyword_approved) const {
    int64_t started = monotonic_ms();

    AuditRecord rec;
    rec.id = generate_uuid();
    rec.timestamp_ms = current_timestamp_ms();
    rec.source = source;
    rec.action = name;
    rec.args = args.is_null() ? Json::object() : args;

    ToolResult result;
    std::map<std::string, Entry>::const_iterator it = actions_.find(name);

    if (it == actions_.end()) {
        LOG_WARN("[Registry] Unknown action '%s' from %s", name.c_str(), source_to_string(source));
        result = ToolResult::fail("Unknown action: " + name, ErrorKind::UNKNOWN_ACTION);
        result.tier = Tier::BLOCKED;
    } else {
        const Entry& entry = it->second;
        Tier tier = classifier_.get_tier(name);
        Json call_args = rec.args;
        std::string error;

        if (!validate_args(entry.spec, call_args, error)) {
            result = ToolResult::fail(error, ErrorKind::INVALID_ARGUMENTS);
        } else {
            sanitize_strings(call_args);
            rec.args = call_args;

            if (!sanitize_formats(entry.spec, call_args, override_active, error)) {
                LOG_WARN("[Registry] %s rejected by sanitizer: %s", name.c_str(), error.c_str());
                result = ToolResult::blocked(ErrorKind::SANITIZATION_REJECTED, tier, error);
            } else {
                rec.args = call_args;
                Json::const_iterator confirmed_it = call_args.find("confirmed");
                bool confirmed = confirmed_it != call_args.end() && confirmed_it->is_boolean() &&
                                 confirmed_it->get<bool>();

                SafetyDecision decision = classifier_.check_safety(
                    name, call_args, confirmed, override_active, keyword_approved);

                if (!decision.allowed) {
                    LOG_WARN("[Registry] %s blocked: %s", name.c_str(), decision.reason.c_str());
                    result = ToolResult::blocked(ErrorKind::POLICY_BLOCKED, decision.tier,
                                                 decision.reason);
                } else {
                    CallContext ctx;
                    ctx.call_id = rec.id;
                    ctx.action = name;
                    ctx.source = source;
                    ctx.tier = decision.tier;
                    ScopedOverride guard(ctx, override_active);

                    LOG_INFO("[Registry] Executing %s [%s] from %s%s", name.c_str(),
                             tier_to_string(decision.tier), source_to_string(source),
                             override_active ? " (override)" : "");
                    try {
                        result = entry.handler(call_args, ctx);
                    } catch (const std::exception& e) {
                        LOG_ERROR("[Registry] Action %s threw exception: %s", name.c_str(), e.what());
                        result = ToolResult::fail(std::string("Action failed: ") + e.what(),
                                                  ErrorKind::HANDLER_FAULT);
                    } catch (...) {
                        LOG_ERROR("[Registry] Action %s threw a non-standard exception", name.c_str());
                        result = ToolResult::fail("Action failed: unknown exception",
                                                  ErrorKind::HANDLER_FAULT);
                    }
                }
            }
        }
        result.tier = tier;
    }

    rec.tier = result.tier;
    rec.outcome = outcome_for(result);
    rec.reason = result.is_ok() ? std::string() : result.reason;
    rec.duration_ms = monotonic_ms() - started;

    if (slow_call_ms_ > 0 && rec.duration_ms >= slow_call_ms_) {
        rec.slow = true;
        LOG_WARN("[Registry] Slow call: %s took %s", name.c_str(),
                 format_duration(rec.duration_ms).c_str());
    }

    write_audit(rec);

    LOG_DEBUG("[Registry] %s -> %s in %lldms", name.c_str(), result_status_to_string(result.status),
              static_cast<long long>(rec.duration_ms));
    return result;
}

} // namespace toolgate
