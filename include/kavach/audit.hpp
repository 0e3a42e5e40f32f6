#pragma once
// Audit log: append-only record of profile-level actions
//
// Events hold an action name, a truncated hash of the user id and a time.
// Never a real value, never decrypted data, never the raw user id.

#include "crypto.hpp"
#include "log.hpp"
#include "sqlite.hpp"
#include "types.hpp"
#include <mutex>
#include <string>
#include <vector>

namespace kavach {

enum class AuditAction : uint8_t {
    ProfileSave,
    ProfileDelete,
    ConsentUpdate,
    SessionSeeded,
    DecryptionFailed
};

inline const char* audit_action_name(AuditAction action) {
    switch (action) {
        case AuditAction::ProfileSave:      return "PROFILE_SAVE";
        case AuditAction::ProfileDelete:    return "PROFILE_DELETE";
        case AuditAction::ConsentUpdate:    return "CONSENT_UPDATE";
        case AuditAction::SessionSeeded:    return "SESSION_SEEDED";
        case AuditAction::DecryptionFailed: return "DECRYPTION_FAILURE";
    }
    return "UNKNOWN";
}

struct AuditEvent {
    std::string event_type;
    std::string user_id_hash;
    Timestamp timestamp = 0;

    static AuditEvent make(AuditAction action, const UserId& user) {
        return {audit_action_name(action), hash_user_id(user.str()), now()};
    }
};

class AuditLog {
public:
    virtual ~AuditLog() = default;
    virtual void record(const AuditEvent& event) = 0;
};

// Record without failing the caller; a lost audit line is logged instead
inline void audit_event(AuditLog* log, AuditAction action, const UserId& user) {
    if (!log) return;
    try {
        log->record(AuditEvent::make(action, user));
    } catch (const std::exception& e) {
        log_warn("Audit", "failed to record %s: %s", audit_action_name(action), e.what());
    }
}

class MemoryAuditLog : public AuditLog {
public:
    void record(const AuditEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
    }

    std::vector<AuditEvent> events() {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    size_t count(AuditAction action) {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& e : events_) {
            if (e.event_type == audit_action_name(action)) ++n;
        }
        return n;
    }

private:
    std::mutex mutex_;
    std::vector<AuditEvent> events_;
};

class SqliteAuditLog : public AuditLog {
public:
    explicit SqliteAuditLog(const std::string& path);

    void record(const AuditEvent& event) override;

    // Most recent first
    std::vector<AuditEvent> recent(size_t limit);

private:
    std::mutex mutex_;
    sqlite::Database db_;
};

} // namespace kavach
