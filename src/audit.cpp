#include <kavach/audit.hpp>
#include <kavach/log.hpp>

namespace kavach {

SqliteAuditLog::SqliteAuditLog(const std::string& path) : db_(path) {
    db_.exec(
        "CREATE TABLE IF NOT EXISTS audit_events ("
        "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  event_type TEXT NOT NULL,"
        "  user_id_hash TEXT NOT NULL,"
        "  timestamp INTEGER NOT NULL"
        ");");
}

void SqliteAuditLog::record(const AuditEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite::Statement stmt(db_,
        "INSERT INTO audit_events (event_type, user_id_hash, timestamp) VALUES (?, ?, ?)");
    stmt.bind(1, event.event_type).bind(2, event.user_id_hash).bind(3, event.timestamp);
    stmt.run();
    log_debug("Audit", "%s user=%s", event.event_type.c_str(), event.user_id_hash.c_str());
}

std::vector<AuditEvent> SqliteAuditLog::recent(size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite::Statement stmt(db_,
        "SELECT event_type, user_id_hash, timestamp FROM audit_events ORDER BY id DESC LIMIT ?");
    stmt.bind(1, static_cast<int64_t>(limit));
    std::vector<AuditEvent> out;
    while (stmt.step()) {
        out.push_back({stmt.column_text(0), stmt.column_text(1), stmt.column_int(2)});
    }
    return out;
}

} // namespace kavach
