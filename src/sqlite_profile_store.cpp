#include <kavach/profile_store.hpp>
#include <kavach/log.hpp>

namespace kavach {

SqliteProfileStore::SqliteProfileStore(const std::string& path, Clock clock)
    : clock_(std::move(clock)), db_(path) {
    db_.exec(
        "CREATE TABLE IF NOT EXISTS profiles ("
        "  user_id TEXT PRIMARY KEY,"
        "  blob TEXT NOT NULL,"
        "  created_at INTEGER NOT NULL,"
        "  updated_at INTEGER NOT NULL"
        ");"
        "CREATE TABLE IF NOT EXISTS consent ("
        "  user_id TEXT PRIMARY KEY,"
        "  remember_me INTEGER NOT NULL,"
        "  sync_across_devices INTEGER NOT NULL,"
        "  updated_at INTEGER NOT NULL"
        ");"
        "CREATE TABLE IF NOT EXISTS user_sessions ("
        "  user_id TEXT NOT NULL,"
        "  session_id TEXT NOT NULL,"
        "  linked_at INTEGER NOT NULL,"
        "  PRIMARY KEY (user_id, session_id)"
        ");"
        "CREATE INDEX IF NOT EXISTS user_sessions_linked_at ON user_sessions (linked_at);");
    log_debug("ProfileStore", "opened %s", path.c_str());
}

std::optional<SealedProfile> SqliteProfileStore::find(const UserId& user) {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite::Statement stmt(db_, "SELECT blob, created_at, updated_at FROM profiles WHERE user_id = ?");
    stmt.bind(1, user.str());
    if (!stmt.step()) return std::nullopt;
    return SealedProfile{stmt.column_text(0), stmt.column_int(1), stmt.column_int(2)};
}

void SqliteProfileStore::upsert(const UserId& user, const std::string& blob, const Consent& consent) {
    std::lock_guard<std::mutex> lock(mutex_);
    Timestamp t = clock_();
    sqlite::Transaction tx(db_);
    {
        // created_at survives replacement
        sqlite::Statement stmt(db_,
            "INSERT INTO profiles (user_id, blob, created_at, updated_at) VALUES (?, ?, ?, ?) "
            "ON CONFLICT(user_id) DO UPDATE SET blob = excluded.blob, updated_at = excluded.updated_at");
        stmt.bind(1, user.str()).bind(2, blob).bind(3, t).bind(4, t);
        stmt.run();
    }
    write_consent(user, consent, t);
    tx.commit();
}

bool SqliteProfileStore::erase(const UserId& user) {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite::Transaction tx(db_);
    bool existed = false;
    {
        sqlite::Statement stmt(db_, "DELETE FROM profiles WHERE user_id = ?");
        stmt.bind(1, user.str());
        stmt.run();
        existed = db_.changes() > 0;
    }
    {
        sqlite::Statement stmt(db_, "DELETE FROM consent WHERE user_id = ?");
        stmt.bind(1, user.str());
        stmt.run();
    }
    tx.commit();
    return existed;
}

std::optional<Consent> SqliteProfileStore::consent(const UserId& user) {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite::Statement stmt(db_,
        "SELECT remember_me, sync_across_devices FROM consent WHERE user_id = ?");
    stmt.bind(1, user.str());
    if (!stmt.step()) return std::nullopt;
    return Consent{stmt.column_int(0) != 0, stmt.column_int(1) != 0};
}

void SqliteProfileStore::set_consent(const UserId& user, const Consent& consent) {
    std::lock_guard<std::mutex> lock(mutex_);
    write_consent(user, consent, clock_());
}

void SqliteProfileStore::link_session(const UserId& user, const SessionId& session) {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite::Statement stmt(db_,
        "INSERT INTO user_sessions (user_id, session_id, linked_at) VALUES (?, ?, ?) "
        "ON CONFLICT(user_id, session_id) DO UPDATE SET linked_at = excluded.linked_at");
    stmt.bind(1, user.str()).bind(2, session.str()).bind(3, clock_());
    stmt.run();
}

std::vector<SessionId> SqliteProfileStore::sessions_of(const UserId& user) {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite::Statement stmt(db_,
        "SELECT session_id FROM user_sessions WHERE user_id = ? ORDER BY linked_at");
    stmt.bind(1, user.str());
    std::vector<SessionId> out;
    while (stmt.step()) {
        out.emplace_back(stmt.column_text(0));
    }
    return out;
}

void SqliteProfileStore::unlink_session(const UserId& user, const SessionId& session) {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite::Statement stmt(db_, "DELETE FROM user_sessions WHERE user_id = ? AND session_id = ?");
    stmt.bind(1, user.str()).bind(2, session.str());
    stmt.run();
}

std::vector<SessionLink> SqliteProfileStore::links_older_than(Timestamp cutoff) {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite::Statement stmt(db_,
        "SELECT user_id, session_id FROM user_sessions WHERE linked_at < ?");
    stmt.bind(1, cutoff);
    std::vector<SessionLink> out;
    while (stmt.step()) {
        out.push_back({UserId(stmt.column_text(0)), SessionId(stmt.column_text(1))});
    }
    return out;
}

bool SqliteProfileStore::unlink_if_older(const UserId& user, const SessionId& session, Timestamp cutoff) {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite::Statement stmt(db_,
        "DELETE FROM user_sessions WHERE user_id = ? AND session_id = ? AND linked_at < ?");
    stmt.bind(1, user.str()).bind(2, session.str()).bind(3, cutoff);
    stmt.run();
    return db_.changes() > 0;
}

void SqliteProfileStore::write_consent(const UserId& user, const Consent& consent, Timestamp t) {
    sqlite::Statement stmt(db_,
        "INSERT INTO consent (user_id, remember_me, sync_across_devices, updated_at) "
        "VALUES (?, ?, ?, ?) "
        "ON CONFLICT(user_id) DO UPDATE SET remember_me = excluded.remember_me, "
        "sync_across_devices = excluded.sync_across_devices, updated_at = excluded.updated_at");
    stmt.bind(1, user.str())
        .bind(2, static_cast<int64_t>(consent.remember_me))
        .bind(3, static_cast<int64_t>(consent.sync_across_devices))
        .bind(4, t);
    stmt.run();
}

} // namespace kavach
