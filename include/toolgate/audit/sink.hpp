/*
 * ToolGate C++ - Audit sink
 *
 * One AuditRecord is produced per dispatched call and handed to a sink.
 * Sinks may throw AuditWriteError; the dispatcher catches and logs it.
 */
#ifndef toolgate_AUDIT_SINK_HPP
#define toolgate_AUDIT_SINK_HPP

#include <toolgate/core/types.hpp>
#include <toolgate/core/json.hpp>
#include <string>
#include <vector>
#include <mutex>
#include <stdexcept>
#include <cstdint>

namespace toolgate {

enum class Outcome {
    OK,
    ERROR,
    BLOCKED
};

const char* outcome_to_string(Outcome outcome);
bool outcome_from_string(const std::string& name, Outcome& out);

struct AuditRecord {
    std::string id;             // UUID v4
    int64_t timestamp_ms;       // Unix ms at dispatch start
    Source source;
    std::string action;
    Tier tier;
    Json args;                  // Sanitized argument snapshot
    Outcome outcome;
    int64_t duration_ms;
    std::string reason;         // Block / failure reason, empty on success
    bool slow;

    AuditRecord()
        : timestamp_ms(0)
        , source(Source::API)
        , tier(Tier::BLOCKED)
        , outcome(Outcome::ERROR)
        , duration_ms(0)
        , slow(false) {}

    Json to_json() const;
};

class AuditWriteError : public std::runtime_error {
public:
    explicit AuditWriteError(const std::string& what) : std::runtime_error(what) {}
};

class AuditSink {
public:
    virtual ~AuditSink() {}

    // Persist one record. May throw AuditWriteError.
    virtual void record(const AuditRecord& rec) = 0;
};

// In-process sink, keeps every record. Thread-safe.
class MemoryAuditSink : public AuditSink {
public:
    void record(const AuditRecord& rec) override;

    std::vector<AuditRecord> records() const;
    size_t size() const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::vector<AuditRecord> records_;
};

} // namespace toolgate

#endif // toolgate_AUDIT_SINK_HPP
