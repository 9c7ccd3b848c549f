#include <toolgate/core/types.hpp>
#include <toolgate/core/utils.hpp>

namespace toolgate {

const char* tier_to_string(Tier tier) {
    switch (tier) {
        case Tier::AUTO: return "auto";
        case Tier::CONFIRM: return "confirm";
        case Tier::DOUBLE_CONFIRM: return "double_confirm";
        case Tier::KEYWORD_ELEVATED: return "keyword_elevated";
        case Tier::BLOCKED: return "blocked";
    }
    return "blocked";
}

bool tier_from_string(const std::string& name, Tier& out) {
    std::string lower = to_lower(trim(name));
    if (lower == "auto") { out = Tier::AUTO; return true; }
    if (lower == "confirm") { out = Tier::CONFIRM; return true; }
    if (lower == "double_confirm") { out = Tier::DOUBLE_CONFIRM; return true; }
    if (lower == "keyword_elevated") { out = Tier::KEYWORD_ELEVATED; return true; }
    if (lower == "blocked") { out = Tier::BLOCKED; return true; }
    return false;
}

int tier_requires_confirmations(Tier tier) {
    switch (tier) {
        case Tier::CONFIRM: return 1;
        case Tier::DOUBLE_CONFIRM: return 2;
        default: return 0;
    }
}

const char* source_to_string(Source source) {
    switch (source) {
        case Source::LLM: return "llm";
        case Source::MONITOR: return "monitor";
        case Source::USER: return "user";
        case Source::API: return "api";
    }
    return "api";
}

bool source_from_string(const std::string& name, Source& out) {
    std::string lower = to_lower(trim(name));
    if (lower == "llm") { out = Source::LLM; return true; }
    if (lower == "monitor") { out = Source::MONITOR; return true; }
    if (lower == "user") { out = Source::USER; return true; }
    if (lower == "api") { out = Source::API; return true; }
    return false;
}

const char* resource_kind_to_string(ResourceKind kind) {
    switch (kind) {
        case ResourceKind::NODE: return "node";
        case ResourceKind::VMID: return "vmid";
        case ResourceKind::DAEMON: return "daemon";
        case ResourceKind::PATH: return "path";
        case ResourceKind::HOST: return "host";
    }
    return "node";
}

bool resource_kind_from_string(const std::string& name, ResourceKind& out) {
    std::string lower = to_lower(trim(name));
    if (lower == "node") { out = ResourceKind::NODE; return true; }
    if (lower == "vmid") { out = ResourceKind::VMID; return true; }
    if (lower == "daemon" || lower == "service") { out = ResourceKind::DAEMON; return true; }
    if (lower == "path") { out = ResourceKind::PATH; return true; }
    if (lower == "host" || lower == "ip") { out = ResourceKind::HOST; return true; }
    return false;
}

const char* result_status_to_string(ResultStatus status) {
    switch (status) {
        case ResultStatus::OK: return "ok";
        case ResultStatus::ERROR: return "error";
        case ResultStatus::BLOCKED: return "blocked";
    }
    return "error";
}

const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "none";
        case ErrorKind::UNKNOWN_ACTION: return "unknown_action";
        case ErrorKind::INVALID_ARGUMENTS: return "invalid_arguments";
        case ErrorKind::SANITIZATION_REJECTED: return "sanitization_rejected";
        case ErrorKind::POLICY_BLOCKED: return "policy_blocked";
        case ErrorKind::HANDLER_FAULT: return "handler_fault";
    }
    return "none";
}

Json ToolResult::to_json() const {
    Json j;
    j["status"] = result_status_to_string(status);
    j["tier"] = tier_to_string(tier);
    j["output"] = output;
    if (error_kind != ErrorKind::NONE) {
        j["error_kind"] = error_kind_to_string(error_kind);
    }
    if (!reason.empty()) {
        j["reason"] = reason;
    }
    if (!data.is_null()) {
        j["data"] = data;
    }
    return j;
}

} // namespace toolgate
