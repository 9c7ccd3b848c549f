/*
 * ToolGate C++ - Audit sink
 */
#include <toolgate/audit/sink.hpp>
#include <toolgate/core/utils.hpp>

namespace toolgate {

const char* outcome_to_string(Outcome outcome) {
    switch (outcome) {
        case Outcome::OK: return "ok";
        case Outcome::ERROR: return "error";
        case Outcome::BLOCKED: return "blocked";
    }
    return "error";
}

bool outcome_from_string(const std::string& name, Outcome& out) {
    if (name == "ok") { out = Outcome::OK; return true; }
    if (name == "error") { out = Outcome::ERROR; return true; }
    if (name == "blocked") { out = Outcome::BLOCKED; return true; }
    return false;
}

Json AuditRecord::to_json() const {
    Json j;
    j["id"] = id;
    j["timestamp"] = timestamp_ms;
    j["time"] = format_timestamp_ms(timestamp_ms);
    j["source"] = source_to_string(source);
    j["action"] = action;
    j["tier"] = tier_to_string(tier);
    j["args"] = args;
    j["outcome"] = outcome_to_string(outcome);
    j["duration_ms"] = duration_ms;
    if (!reason.empty()) j["reason"] = reason;
    if (slow) j["slow"] = true;
    return j;
}

// ============================================================================
// MemoryAuditSink
// ============================================================================

void MemoryAuditSink::record(const AuditRecord& rec) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.push_back(rec);
}

std::vector<AuditRecord> MemoryAuditSink::records() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
}

size_t MemoryAuditSink::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

void MemoryAuditSink::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.clear();
}

} // namespace toolgate
