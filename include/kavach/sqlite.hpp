#pragma once
// SQLite helpers: RAII connection, statement and transaction
//
// Every failure surfaces as VaultUnavailable carrying sqlite3_errmsg.
// One Database is one connection; callers serialize access to it.

#include "errors.hpp"
#include <sqlite3.h>
#include <cstdint>
#include <string>

namespace kavach::sqlite {

class Database {
public:
    explicit Database(const std::string& path, int busy_timeout_ms = 5000) {
        if (sqlite3_open(path.c_str(), &db_) != SQLITE_OK) {
            std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
            if (db_) sqlite3_close(db_);
            db_ = nullptr;
            throw VaultUnavailable("Cannot open database " + path + ": " + msg);
        }
        sqlite3_busy_timeout(db_, busy_timeout_ms);
        try {
            exec("PRAGMA journal_mode=WAL");
            exec("PRAGMA foreign_keys=ON");
        } catch (const VaultUnavailable&) {
            sqlite3_close(db_);
            db_ = nullptr;
            throw;
        }
    }

    ~Database() {
        if (db_) sqlite3_close(db_);
    }

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    sqlite3* handle() const { return db_; }

    void exec(const char* sql) {
        char* err = nullptr;
        if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
            std::string msg = err ? err : sqlite3_errmsg(db_);
            sqlite3_free(err);
            throw VaultUnavailable("SQL error: " + msg);
        }
    }

    int changes() const { return sqlite3_changes(db_); }

private:
    sqlite3* db_ = nullptr;
};

class Statement {
public:
    Statement(Database& db, const char* sql) : db_(db) {
        if (sqlite3_prepare_v2(db_.handle(), sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            throw VaultUnavailable(std::string("Prepare failed: ") + sqlite3_errmsg(db_.handle()));
        }
    }

    ~Statement() {
        if (stmt_) sqlite3_finalize(stmt_);
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement& bind(int index, const std::string& value) {
        check(sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()),
                                SQLITE_TRANSIENT));
        return *this;
    }

    Statement& bind(int index, int64_t value) {
        check(sqlite3_bind_int64(stmt_, index, value));
        return *this;
    }

    // True while a row is available
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw VaultUnavailable(std::string("Step failed: ") + sqlite3_errmsg(db_.handle()));
    }

    void run() {
        while (step()) {}
    }

    std::string column_text(int col) const {
        const unsigned char* text = sqlite3_column_text(stmt_, col);
        if (!text) return "";
        return std::string(reinterpret_cast<const char*>(text),
                           static_cast<size_t>(sqlite3_column_bytes(stmt_, col)));
    }

    int64_t column_int(int col) const { return sqlite3_column_int64(stmt_, col); }

private:
    Database& db_;
    sqlite3_stmt* stmt_ = nullptr;

    void check(int rc) {
        if (rc != SQLITE_OK) {
            throw VaultUnavailable(std::string("Bind failed: ") + sqlite3_errmsg(db_.handle()));
        }
    }
};

// BEGIN IMMEDIATE; rolls back unless committed
class Transaction {
public:
    explicit Transaction(Database& db) : db_(db) {
        db_.exec("BEGIN IMMEDIATE");
    }

    ~Transaction() {
        if (!done_) {
            sqlite3_exec(db_.handle(), "ROLLBACK", nullptr, nullptr, nullptr);
        }
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit() {
        db_.exec("COMMIT");
        done_ = true;
    }

private:
    Database& db_;
    bool done_ = false;
};

} // namespace kavach::sqlite
