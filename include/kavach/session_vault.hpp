#pragma once
// Session Vault (Locker 1): ephemeral, encrypted, TTL-bound registries
//
// One registry per session under kavach:registry:<session>. Every write
// refreshes the TTL. There is deliberately no call that lists, scans or
// merges sessions: every operation names exactly one SessionId.

#include "crypto.hpp"
#include "kv_store.hpp"
#include "registry.hpp"
#include "types.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace kavach {

class SessionVault {
public:
    static constexpr std::chrono::seconds DEFAULT_TTL{1800};

    SessionVault(std::shared_ptr<KeyValueStore> store,
                 std::shared_ptr<const Cipher> cipher,
                 std::chrono::seconds ttl = DEFAULT_TTL);

    // Registry with revision set to the stored version, or nullopt if absent/expired
    std::optional<TokenRegistry> get(const SessionId& session);

    // Unconditional overwrite
    void put(const SessionId& session, TokenRegistry& registry);

    // Compare-and-set on registry.revision(). On success the revision is
    // advanced to the new stored version.
    bool put_if_unchanged(const SessionId& session, TokenRegistry& registry);

    // Write only when the session has no entries yet
    bool seed_if_empty(const SessionId& session, TokenRegistry& registry);

    // True if a live registry was removed
    bool clear(const SessionId& session);

    // Live registry present; nothing is decrypted
    bool exists(const SessionId& session);

    bool ping();

    std::chrono::seconds ttl() const { return ttl_; }

    static std::string key_for(const SessionId& session) {
        return "kavach:registry:" + session.str();
    }

private:
    std::shared_ptr<KeyValueStore> store_;
    std::shared_ptr<const Cipher> cipher_;
    std::chrono::seconds ttl_;

    std::string seal(const SessionId& session, const TokenRegistry& registry) const;
    TokenRegistry open(const SessionId& session, const StoredValue& value) const;
};

} // namespace kavach
