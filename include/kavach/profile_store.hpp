#pragma once
// Profile Store: document store behind the Profile Vault
//
// Holds only ciphertext plus metadata. Nothing here can decrypt.
// Also keeps the user -> sessions index that "forget me" walks.

#include "profile.hpp"
#include "sqlite.hpp"
#include "types.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace kavach {

struct SealedProfile {
    std::string blob;
    Timestamp created_at = 0;
    Timestamp updated_at = 0;
};

struct SessionLink {
    UserId user;
    SessionId session;
};

class ProfileStore {
public:
    virtual ~ProfileStore() = default;

    virtual std::optional<SealedProfile> find(const UserId& user) = 0;

    // Atomically replace the profile and its consent flags
    virtual void upsert(const UserId& user, const std::string& blob, const Consent& consent) = 0;

    // Remove profile and consent; true if a profile existed
    virtual bool erase(const UserId& user) = 0;

    virtual std::optional<Consent> consent(const UserId& user) = 0;
    virtual void set_consent(const UserId& user, const Consent& consent) = 0;

    // Adds the link or refreshes its linked_at
    virtual void link_session(const UserId& user, const SessionId& session) = 0;
    virtual std::vector<SessionId> sessions_of(const UserId& user) = 0;
    virtual void unlink_session(const UserId& user, const SessionId& session) = 0;
    // Links not refreshed since `cutoff`
    virtual std::vector<SessionLink> links_older_than(Timestamp cutoff) = 0;
    // Unlink only if still not refreshed since `cutoff`
    virtual bool unlink_if_older(const UserId& user, const SessionId& session, Timestamp cutoff) = 0;
};

class MemoryProfileStore : public ProfileStore {
public:
    explicit MemoryProfileStore(Clock clock = now) : clock_(std::move(clock)) {}

    std::optional<SealedProfile> find(const UserId& user) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = profiles_.find(user.str());
        if (it == profiles_.end()) return std::nullopt;
        return it->second;
    }

    void upsert(const UserId& user, const std::string& blob, const Consent& consent) override {
        std::lock_guard<std::mutex> lock(mutex_);
        Timestamp t = clock_();
        auto it = profiles_.find(user.str());
        Timestamp created = it == profiles_.end() ? t : it->second.created_at;
        profiles_[user.str()] = SealedProfile{blob, created, t};
        consent_[user.str()] = consent;
    }

    bool erase(const UserId& user) override {
        std::lock_guard<std::mutex> lock(mutex_);
        consent_.erase(user.str());
        return profiles_.erase(user.str()) > 0;
    }

    std::optional<Consent> consent(const UserId& user) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = consent_.find(user.str());
        if (it == consent_.end()) return std::nullopt;
        return it->second;
    }

    void set_consent(const UserId& user, const Consent& consent) override {
        std::lock_guard<std::mutex> lock(mutex_);
        consent_[user.str()] = consent;
    }

    void link_session(const UserId& user, const SessionId& session) override {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions_[user.str()][session.str()] = clock_();
    }

    std::vector<SessionId> sessions_of(const UserId& user) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<SessionId> out;
        auto it = sessions_.find(user.str());
        if (it == sessions_.end()) return out;
        for (const auto& [s, linked_at] : it->second) out.emplace_back(s);
        return out;
    }

    void unlink_session(const UserId& user, const SessionId& session) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(user.str());
        if (it == sessions_.end()) return;
        it->second.erase(session.str());
        if (it->second.empty()) sessions_.erase(it);
    }

    std::vector<SessionLink> links_older_than(Timestamp cutoff) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<SessionLink> out;
        for (const auto& [u, linked] : sessions_) {
            for (const auto& [s, linked_at] : linked) {
                if (linked_at < cutoff) out.push_back({UserId(u), SessionId(s)});
            }
        }
        return out;
    }

    bool unlink_if_older(const UserId& user, const SessionId& session, Timestamp cutoff) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(user.str());
        if (it == sessions_.end()) return false;
        auto link = it->second.find(session.str());
        if (link == it->second.end() || link->second >= cutoff) return false;
        it->second.erase(link);
        if (it->second.empty()) sessions_.erase(it);
        return true;
    }

private:
    Clock clock_;
    std::mutex mutex_;
    std::unordered_map<std::string, SealedProfile> profiles_;
    std::unordered_map<std::string, Consent> consent_;
    std::unordered_map<std::string, std::map<std::string, Timestamp>> sessions_;
};

// Tables: profiles, consent, user_sessions
class SqliteProfileStore : public ProfileStore {
public:
    explicit SqliteProfileStore(const std::string& path, Clock clock = now);

    std::optional<SealedProfile> find(const UserId& user) override;
    void upsert(const UserId& user, const std::string& blob, const Consent& consent) override;
    bool erase(const UserId& user) override;
    std::optional<Consent> consent(const UserId& user) override;
    void set_consent(const UserId& user, const Consent& consent) override;
    void link_session(const UserId& user, const SessionId& session) override;
    std::vector<SessionId> sessions_of(const UserId& user) override;
    void unlink_session(const UserId& user, const SessionId& session) override;
    std::vector<SessionLink> links_older_than(Timestamp cutoff) override;
    bool unlink_if_older(const UserId& user, const SessionId& session, Timestamp cutoff) override;

private:
    Clock clock_;
    std::mutex mutex_;
    sqlite::Database db_;

    void write_consent(const UserId& user, const Consent& consent, Timestamp t);
};

} // namespace kavach
