#include <kavach/kv_store.hpp>
#include <kavach/log.hpp>

namespace kavach {

SqliteKvStore::SqliteKvStore(const std::string& path, Clock clock)
    : clock_(std::move(clock)), db_(path) {
    db_.exec(
        "CREATE TABLE IF NOT EXISTS kv ("
        "  key TEXT PRIMARY KEY,"
        "  value TEXT NOT NULL,"
        "  version INTEGER NOT NULL,"
        "  expires_at INTEGER NOT NULL"
        ");"
        "CREATE TABLE IF NOT EXISTS kv_sequence ("
        "  id INTEGER PRIMARY KEY CHECK (id = 1),"
        "  next INTEGER NOT NULL"
        ");"
        "INSERT OR IGNORE INTO kv_sequence (id, next) VALUES (1, 1);");
    log_debug("SqliteKvStore", "opened %s", path.c_str());
}

std::optional<StoredValue> SqliteKvStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return get_locked(key);
}

uint64_t SqliteKvStore::put(const std::string& key, const std::string& data,
                            std::chrono::seconds ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite::Transaction tx(db_);
    uint64_t version = write_locked(key, data, ttl);
    tx.commit();
    return version;
}

uint64_t SqliteKvStore::put_if_version(const std::string& key, const std::string& data,
                                       uint64_t expected, std::chrono::seconds ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    // IMMEDIATE takes the write lock up front, so another process cannot
    // slip a write between the read and the update
    sqlite::Transaction tx(db_);
    auto current = get_locked(key);
    uint64_t current_version = current ? current->version : 0;
    if (current_version != expected) {
        return 0;
    }
    uint64_t version = write_locked(key, data, ttl);
    tx.commit();
    return version;
}

bool SqliteKvStore::erase(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite::Statement stmt(db_, "DELETE FROM kv WHERE key = ? AND expires_at > ?");
    stmt.bind(1, key).bind(2, clock_());
    stmt.run();
    bool existed = db_.changes() > 0;

    sqlite::Statement stale(db_, "DELETE FROM kv WHERE key = ?");
    stale.bind(1, key);
    stale.run();
    return existed;
}

bool SqliteKvStore::ping() {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        sqlite::Statement stmt(db_, "SELECT 1");
        return stmt.step();
    } catch (const VaultUnavailable& e) {
        log_warn("SqliteKvStore", "ping failed: %s", e.what());
        return false;
    }
}

size_t SqliteKvStore::purge_expired() {
    std::lock_guard<std::mutex> lock(mutex_);
    return sweep_locked(clock_());
}

size_t SqliteKvStore::sweep_locked(Timestamp t) {
    sqlite::Statement stmt(db_, "DELETE FROM kv WHERE expires_at <= ?");
    stmt.bind(1, t);
    stmt.run();
    next_sweep_ = t + SWEEP_INTERVAL_MS;
    size_t dropped = static_cast<size_t>(db_.changes());
    if (dropped > 0) log_debug("SqliteKvStore", "swept %zu expired keys", dropped);
    return dropped;
}

std::optional<StoredValue> SqliteKvStore::get_locked(const std::string& key) {
    sqlite::Statement stmt(db_, "SELECT value, version FROM kv WHERE key = ? AND expires_at > ?");
    stmt.bind(1, key).bind(2, clock_());
    if (!stmt.step()) return std::nullopt;
    return StoredValue{stmt.column_text(0), static_cast<uint64_t>(stmt.column_int(1))};
}

uint64_t SqliteKvStore::write_locked(const std::string& key, const std::string& data,
                                     std::chrono::seconds ttl) {
    Timestamp t = clock_();
    if (t >= next_sweep_) sweep_locked(t);

    int64_t version = 0;
    {
        sqlite::Statement next(db_, "SELECT next FROM kv_sequence WHERE id = 1");
        if (!next.step()) {
            throw VaultUnavailable("kv_sequence row missing");
        }
        version = next.column_int(0);
    }
    {
        sqlite::Statement bump(db_, "UPDATE kv_sequence SET next = next + 1 WHERE id = 1");
        bump.run();
    }

    Timestamp expires_at = t +
        std::chrono::duration_cast<std::chrono::milliseconds>(ttl).count();
    sqlite::Statement stmt(db_,
        "INSERT INTO kv (key, value, version, expires_at) VALUES (?, ?, ?, ?) "
        "ON CONFLICT(key) DO UPDATE SET value = excluded.value, "
        "version = excluded.version, expires_at = excluded.expires_at");
    stmt.bind(1, key).bind(2, data).bind(3, version).bind(4, expires_at);
    stmt.run();
    return static_cast<uint64_t>(version);
}

} // namespace kavach
