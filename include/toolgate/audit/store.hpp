/*
 * ToolGate C++ - SQLite audit store
 *
 * Default AuditSink: append-only audit_events table in a WAL-mode SQLite
 * database. Writes are bounded by busy_timeout and never retried.
 */
#ifndef toolgate_AUDIT_STORE_HPP
#define toolgate_AUDIT_STORE_HPP

#include <toolgate/audit/sink.hpp>
#include <string>
#include <vector>
#include <mutex>
#include <sqlite3.h>

namespace toolgate {

class SqliteAuditStore : public AuditSink {
public:
    SqliteAuditStore();
    ~SqliteAuditStore();

    // Database lifecycle
    bool open(const std::string& db_path, int busy_timeout_ms = 2000);
    void close();
    bool is_open() const;

    // Throws AuditWriteError when the store is closed or the insert fails.
    void record(const AuditRecord& rec) override;

    // Records with from_ms <= timestamp < to_ms, oldest first
    std::vector<AuditRecord> query_range(int64_t from_ms, int64_t to_ms, int limit = 100);

    // Newest first
    std::vector<AuditRecord> recent(int limit = 50);

    int64_t count();

    // Delete records older than cutoff_ms. Returns rows removed, -1 on error.
    int purge_older_than(int64_t cutoff_ms);

    std::string last_error() const;

private:
    sqlite3* db_;
    mutable std::mutex mutex_;
    std::string last_error_;

    bool init_tables();
    bool exec_sql(const std::string& sql);
    void set_error_from_db();
    std::vector<AuditRecord> fetch(sqlite3_stmt* stmt);

    SqliteAuditStore(const SqliteAuditStore&);
    SqliteAuditStore& operator=(const SqliteAuditStore&);
};

} // namespace toolgate

#endif // toolgate_AUDIT_STORE_HPP
