#pragma once
// Key-value stores backing the Session Vault
//
// Values carry a store-assigned version. Versions come from one counter per
// store and never repeat, so a compare-and-set cannot succeed against a key
// that expired and was recreated in between.
// Expiry is checked on every access. Writes also sweep every expired key,
// at most once per SWEEP_INTERVAL_MS; there is no sweeper thread.

#include "types.hpp"
#include "sqlite.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace kavach {

struct StoredValue {
    std::string data;
    uint64_t version = 0;
};

class KeyValueStore {
public:
    static constexpr Timestamp SWEEP_INTERVAL_MS = 60000;

    virtual ~KeyValueStore() = default;

    virtual std::optional<StoredValue> get(const std::string& key) = 0;

    // Unconditional write; returns the new version
    virtual uint64_t put(const std::string& key, const std::string& data,
                         std::chrono::seconds ttl) = 0;

    // Write only if the live version equals `expected` (0 = key absent).
    // Returns the new version, or 0 when the comparison failed.
    virtual uint64_t put_if_version(const std::string& key, const std::string& data,
                                    uint64_t expected, std::chrono::seconds ttl) = 0;

    // True if a live key was removed
    virtual bool erase(const std::string& key) = 0;

    virtual bool ping() = 0;
};

// In-process store: mutex-guarded map with per-key expiry
class MemoryKvStore : public KeyValueStore {
public:
    explicit MemoryKvStore(Clock clock = now) : clock_(std::move(clock)) {}

    std::optional<StoredValue> get(const std::string& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto* item = live(key);
        if (!item) return std::nullopt;
        return StoredValue{item->data, item->version};
    }

    uint64_t put(const std::string& key, const std::string& data,
                 std::chrono::seconds ttl) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return write(key, data, ttl);
    }

    uint64_t put_if_version(const std::string& key, const std::string& data,
                            uint64_t expected, std::chrono::seconds ttl) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto* item = live(key);
        uint64_t current = item ? item->version : 0;
        if (current != expected) return 0;
        return write(key, data, ttl);
    }

    bool erase(const std::string& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        bool existed = live(key) != nullptr;
        items_.erase(key);
        return existed;
    }

    bool ping() override { return true; }

    // Drop every expired key; returns how many went
    size_t purge_expired() {
        std::lock_guard<std::mutex> lock(mutex_);
        return sweep(clock_());
    }

    // Keys held, live or not
    size_t stored() {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    size_t size() {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t count = 0;
        for (const auto& [key, item] : items_) {
            if (item.expires_at > clock_()) ++count;
        }
        return count;
    }

private:
    struct Item {
        std::string data;
        uint64_t version;
        Timestamp expires_at;
    };

    Clock clock_;
    std::mutex mutex_;
    std::unordered_map<std::string, Item> items_;
    uint64_t next_version_ = 1;
    Timestamp next_sweep_ = 0;

    // Drops the key if expired
    Item* live(const std::string& key) {
        auto it = items_.find(key);
        if (it == items_.end()) return nullptr;
        if (it->second.expires_at <= clock_()) {
            items_.erase(it);
            return nullptr;
        }
        return &it->second;
    }

    size_t sweep(Timestamp t) {
        size_t dropped = 0;
        for (auto it = items_.begin(); it != items_.end();) {
            if (it->second.expires_at <= t) {
                it = items_.erase(it);
                ++dropped;
            } else {
                ++it;
            }
        }
        next_sweep_ = t + SWEEP_INTERVAL_MS;
        return dropped;
    }

    uint64_t write(const std::string& key, const std::string& data, std::chrono::seconds ttl) {
        Timestamp t = clock_();
        if (t >= next_sweep_) sweep(t);
        uint64_t version = next_version_++;
        Timestamp expires_at = t +
            std::chrono::duration_cast<std::chrono::milliseconds>(ttl).count();
        items_[key] = Item{data, version, expires_at};
        return version;
    }
};

// Durable store: one row per key in a single SQLite file
class SqliteKvStore : public KeyValueStore {
public:
    explicit SqliteKvStore(const std::string& path, Clock clock = now);

    std::optional<StoredValue> get(const std::string& key) override;
    uint64_t put(const std::string& key, const std::string& data,
                 std::chrono::seconds ttl) override;
    uint64_t put_if_version(const std::string& key, const std::string& data,
                            uint64_t expected, std::chrono::seconds ttl) override;
    bool erase(const std::string& key) override;
    bool ping() override;

    // Delete expired rows; returns how many went
    size_t purge_expired();

private:
    Clock clock_;
    std::mutex mutex_;
    sqlite::Database db_;

    Timestamp next_sweep_ = 0;

    std::optional<StoredValue> get_locked(const std::string& key);
    size_t sweep_locked(Timestamp t);
    uint64_t write_locked(const std::string& key, const std::string& data, std::chrono::seconds ttl);
};

} // namespace kavach
