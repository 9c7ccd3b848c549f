/*
 * ToolGate C++ - SQLite audit store
 */
#include <toolgate/audit/store.hpp>
#include <toolgate/core/utils.hpp>
#include <toolgate/core/logger.hpp>

namespace toolgate {

SqliteAuditStore::SqliteAuditStore() : db_(nullptr) {}

SqliteAuditStore::~SqliteAuditStore() {
    close();
}

bool SqliteAuditStore::open(const std::string& db_path, int busy_timeout_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }

    if (db_path != ":memory:" && !create_parent_directory(db_path)) {
        last_error_ = "cannot create parent directory for " + db_path;
        LOG_ERROR("[AuditStore] Failed to create parent directory for '%s'", db_path.c_str());
        return false;
    }

    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        last_error_ = db_ ? sqlite3_errmsg(db_) : "out of memory";
        LOG_ERROR("[AuditStore] Failed to open database '%s': %s",
                  db_path.c_str(), last_error_.c_str());
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    sqlite3_busy_timeout(db_, busy_timeout_ms);
    exec_sql("PRAGMA journal_mode=WAL");
    exec_sql("PRAGMA synchronous=NORMAL");

    if (!init_tables()) {
        LOG_ERROR("[AuditStore] Failed to initialize tables: %s", last_error_.c_str());
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    LOG_INFO("[AuditStore] Database opened: %s", db_path.c_str());
    return true;
}

void SqliteAuditStore::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool SqliteAuditStore::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_ != nullptr;
}

std::string SqliteAuditStore::last_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

void SqliteAuditStore::set_error_from_db() {
    last_error_ = db_ ? sqlite3_errmsg(db_) : "database not open";
}

bool SqliteAuditStore::exec_sql(const std::string& sql) {
    if (!db_) return false;

    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        last_error_ = err_msg ? err_msg : "unknown error";
        LOG_ERROR("[AuditStore] SQL error: %s", last_error_.c_str());
        sqlite3_free(err_msg);
        return false;
    }
    return true;
}

bool SqliteAuditStore::init_tables() {
    const char* schema =
        "CREATE TABLE IF NOT EXISTS audit_events ("
        "  id TEXT PRIMARY KEY,"
        "  timestamp INTEGER NOT NULL,"
        "  source TEXT NOT NULL,"
        "  action TEXT NOT NULL,"
        "  tier TEXT NOT NULL,"
        "  args TEXT,"
        "  outcome TEXT NOT NULL,"
        "  duration_ms INTEGER NOT NULL DEFAULT 0,"
        "  reason TEXT,"
        "  slow INTEGER NOT NULL DEFAULT 0"
        ");"
        "CREATE INDEX IF NOT EXISTS idx_audit_timestamp ON audit_events(timestamp);"
        "CREATE INDEX IF NOT EXISTS idx_audit_action ON audit_events(action);";
    return exec_sql(schema);
}

// ============================================================================
// Writes
// ============================================================================

void SqliteAuditStore::record(const AuditRecord& rec) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        last_error_ = "database not open";
        throw AuditWriteError("audit store is not open");
    }

    const char* sql =
        "INSERT INTO audit_events "
        "(id, timestamp, source, action, tier, args, outcome, duration_ms, reason, slow) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        set_error_from_db();
        throw AuditWriteError("prepare failed: " + last_error_);
    }

    std::string id = rec.id.empty() ? generate_uuid() : rec.id;
    // Invalid UTF-8 in arguments must not cost the row
    std::string args = rec.args.is_null()
        ? std::string("{}")
        : rec.args.dump(-1, ' ', false, Json::error_handler_t::replace);

    sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, rec.timestamp_ms);
    sqlite3_bind_text(stmt, 3, source_to_string(rec.source), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 4, rec.action.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 5, tier_to_string(rec.tier), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 6, args.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 7, outcome_to_string(rec.outcome), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 8, rec.duration_ms);
    if (rec.reason.empty()) {
        sqlite3_bind_null(stmt, 9);
    } else {
        sqlite3_bind_text(stmt, 9, rec.reason.c_str(), -1, SQLITE_TRANSIENT);
    }
    sqlite3_bind_int(stmt, 10, rec.slow ? 1 : 0);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        set_error_from_db();
        throw AuditWriteError("insert failed: " + last_error_);
    }
}

int SqliteAuditStore::purge_older_than(int64_t cutoff_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        last_error_ = "database not open";
        return -1;
    }

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, "DELETE FROM audit_events WHERE timestamp < ?", -1, &stmt,
                                nullptr);
    if (rc != SQLITE_OK) {
        set_error_from_db();
        LOG_ERROR("[AuditStore] purge prepare failed: %s", last_error_.c_str());
        return -1;
    }

    sqlite3_bind_int64(stmt, 1, cutoff_ms);
    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        set_error_from_db();
        LOG_ERROR("[AuditStore] purge failed: %s", last_error_.c_str());
        return -1;
    }

    int removed = sqlite3_changes(db_);
    if (removed > 0) {
        LOG_INFO("[AuditStore] Purged %d records older than %s", removed,
                 format_timestamp_ms(cutoff_ms).c_str());
    }
    return removed;
}

// ============================================================================
// Reads
// ============================================================================

std::vector<AuditRecord> SqliteAuditStore::fetch(sqlite3_stmt* stmt) {
    std::vector<AuditRecord> results;
    int rc;

    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        AuditRecord rec;
        const char* col_text;

        col_text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        rec.id = col_text ? col_text : "";

        rec.timestamp_ms = sqlite3_column_int64(stmt, 1);

        col_text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 2));
        source_from_string(col_text ? col_text : "", rec.source);

        col_text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 3));
        rec.action = col_text ? col_text : "";

        col_text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 4));
        tier_from_string(col_text ? col_text : "", rec.tier);

        col_text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 5));
        if (col_text) {
            rec.args = Json::parse(col_text, nullptr, false);
            if (rec.args.is_discarded()) rec.args = Json(col_text);
        }

        col_text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 6));
        outcome_from_string(col_text ? col_text : "", rec.outcome);

        rec.duration_ms = sqlite3_column_int64(stmt, 7);

        col_text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 8));
        rec.reason = col_text ? col_text : "";

        rec.slow = sqlite3_column_int(stmt, 9) != 0;

        results.push_back(rec);
    }

    if (rc != SQLITE_DONE) {
        set_error_from_db();
        LOG_ERROR("[AuditStore] query failed: %s", last_error_.c_str());
    }
    return results;
}

std::vector<AuditRecord> SqliteAuditStore::query_range(int64_t from_ms, int64_t to_ms, int limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AuditRecord> results;
    if (!db_) {
        last_error_ = "database not open";
        return results;
    }

    const char* sql =
        "SELECT id, timestamp, source, action, tier, args, outcome, duration_ms, reason, slow "
        "FROM audit_events WHERE timestamp >= ? AND timestamp < ? "
        "ORDER BY timestamp ASC, rowid ASC LIMIT ?";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        LOG_ERROR("[AuditStore] query_range prepare failed: %s", last_error_.c_str());
        return results;
    }

    sqlite3_bind_int64(stmt, 1, from_ms);
    sqlite3_bind_int64(stmt, 2, to_ms);
    sqlite3_bind_int(stmt, 3, limit);

    results = fetch(stmt);
    sqlite3_finalize(stmt);
    return results;
}

std::vector<AuditRecord> SqliteAuditStore::recent(int limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AuditRecord> results;
    if (!db_) {
        last_error_ = "database not open";
        return results;
    }

    const char* sql =
        "SELECT id, timestamp, source, action, tier, args, outcome, duration_ms, reason, slow "
        "FROM audit_events ORDER BY timestamp DESC, rowid DESC LIMIT ?";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        LOG_ERROR("[AuditStore] recent prepare failed: %s", last_error_.c_str());
        return results;
    }

    sqlite3_bind_int(stmt, 1, limit);
    results = fetch(stmt);
    sqlite3_finalize(stmt);
    return results;
}

int64_t SqliteAuditStore::count() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        last_error_ = "database not open";
        return 0;
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM audit_events", -1, &stmt, nullptr) !=
        SQLITE_OK) {
        set_error_from_db();
        return 0;
    }

    int64_t n = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        n = sqlite3_column_int64(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return n;
}

} // namespace toolgate
