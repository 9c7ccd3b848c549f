/*
 * ToolGate C++ - Core Types
 *
 * Action metadata, argument schemas and the tagged dispatch result shared
 * by the registry, the safety layer and action providers.
 */
#ifndef toolgate_CORE_TYPES_HPP
#define toolgate_CORE_TYPES_HPP

#include "json.hpp"
#include <string>
#include <vector>
#include <utility>

namespace toolgate {

// ============================================================================
// Tiers
// ============================================================================

// Ordered by increasing restriction.
enum class Tier {
    AUTO = 0,
    CONFIRM = 1,
    DOUBLE_CONFIRM = 2,
    KEYWORD_ELEVATED = 3,
    BLOCKED = 4
};

const char* tier_to_string(Tier tier);

// Parses "auto", "confirm", "double_confirm", "keyword_elevated", "blocked".
// Returns false for anything else.
bool tier_from_string(const std::string& name, Tier& out);

// Number of explicit confirmations a caller must collect before setting
// the confirmed flag: 0, 1 or 2.
int tier_requires_confirmations(Tier tier);

// ============================================================================
// Call source
// ============================================================================

enum class Source {
    LLM,
    MONITOR,
    USER,
    API
};

const char* source_to_string(Source source);
bool source_from_string(const std::string& name, Source& out);

// ============================================================================
// Protected resource kinds
// ============================================================================

enum class ResourceKind {
    NODE,
    VMID,
    DAEMON,
    PATH,
    HOST
};

const char* resource_kind_to_string(ResourceKind kind);
bool resource_kind_from_string(const std::string& name, ResourceKind& out);

// ============================================================================
// Argument schema
// ============================================================================

// Which sanitizer the dispatcher runs on a string parameter.
enum class ParamFormat {
    NONE,
    COMMAND,      // sanitize_command
    PATH,         // sanitize_path, value replaced by the resolved path
    SECRET_PATH,  // sanitize_path + secret file check (read access)
    URL,          // validate_url
    NODE_NAME     // sanitize_node_name
};

struct ParamSchema {
    std::string name;
    std::string type;       // "string", "number", "integer", "boolean", "array", "object"
    std::string description;
    bool required;
    ParamFormat format;
    std::string root;       // PATH / SECRET_PATH: optional allowed root

    ParamSchema() : required(false), format(ParamFormat::NONE) {}
    ParamSchema(const std::string& n, const std::string& t, const std::string& d, bool r = false,
                ParamFormat f = ParamFormat::NONE)
        : name(n), type(t), description(d), required(r), format(f) {}
};

// Static description of an action, fixed at registration.
struct ActionSpec {
    std::string name;
    std::string description;
    Tier tier;
    std::vector<ParamSchema> params;
    // Extra argument keys naming this action's target, checked against the
    // protected resource list in addition to the default keys.
    std::vector<std::pair<std::string, ResourceKind>> resource_keys;

    ActionSpec() : tier(Tier::BLOCKED) {}
    ActionSpec(const std::string& n, const std::string& d, Tier t)
        : name(n), description(d), tier(t) {}

    ActionSpec& param(const ParamSchema& p) {
        params.push_back(p);
        return *this;
    }

    ActionSpec& targets(const std::string& key, ResourceKind kind) {
        resource_keys.push_back(std::make_pair(key, kind));
        return *this;
    }
};

struct ActionInfo {
    std::string name;
    Tier tier;

    ActionInfo() : tier(Tier::BLOCKED) {}
    ActionInfo(const std::string& n, Tier t) : name(n), tier(t) {}
};

// ============================================================================
// Dispatch result
// ============================================================================

enum class ResultStatus {
    OK,
    ERROR,
    BLOCKED
};

enum class ErrorKind {
    NONE,
    UNKNOWN_ACTION,
    INVALID_ARGUMENTS,
    SANITIZATION_REJECTED,
    POLICY_BLOCKED,
    HANDLER_FAULT
};

const char* result_status_to_string(ResultStatus status);
const char* error_kind_to_string(ErrorKind kind);

struct ToolResult {
    ResultStatus status;
    ErrorKind error_kind;
    std::string output;     // Text for the caller / model
    Json data;              // Structured payload (optional)
    std::string reason;     // Why it was blocked or failed
    Tier tier;

    ToolResult()
        : status(ResultStatus::ERROR)
        , error_kind(ErrorKind::NONE)
        , tier(Tier::BLOCKED) {}

    bool is_ok() const { return status == ResultStatus::OK; }
    bool is_error() const { return status == ResultStatus::ERROR; }
    bool is_blocked() const { return status == ResultStatus::BLOCKED; }

    static ToolResult ok(const std::string& output, const Json& data = Json()) {
        ToolResult r;
        r.status = ResultStatus::OK;
        r.output = output;
        r.data = data;
        return r;
    }

    static ToolResult fail(const std::string& reason, ErrorKind kind = ErrorKind::HANDLER_FAULT) {
        ToolResult r;
        r.status = ResultStatus::ERROR;
        r.error_kind = kind;
        r.reason = reason;
        r.output = reason;
        return r;
    }

    static ToolResult blocked(ErrorKind kind, Tier tier, const std::string& reason) {
        ToolResult r;
        r.status = ResultStatus::BLOCKED;
        r.error_kind = kind;
        r.tier = tier;
        r.reason = reason;
        r.output = reason;
        return r;
    }

    Json to_json() const;
};

} // namespace toolgate

#endif // toolgate_CORE_TYPES_HPP
