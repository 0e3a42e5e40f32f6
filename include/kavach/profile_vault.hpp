#pragma once
// Profile Vault (Locker 2): consent-gated, encrypted, one profile per user
//
// - Writes need a ConsentGate, which only exists for granted consent
// - Profiles are encrypted before they reach the store (aad = user id)
// - load_profile hands back ciphertext; only the recreator decrypts
// - delete_profile also clears every session the user owns; a link is
//   dropped only once its session is confirmed clear
// - Links whose session registry has expired are pruned on later links

#include "audit.hpp"
#include "crypto.hpp"
#include "profile.hpp"
#include "profile_store.hpp"
#include "session_vault.hpp"
#include "types.hpp"
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kavach {

// Proof that a user has granted persistence consent
class ConsentGate {
public:
    // Throws ConsentRequired unless consent.granted()
    static ConsentGate require(const UserId& user, const Consent& consent);

    const UserId& user() const { return user_; }
    const Consent& consent() const { return consent_; }

private:
    ConsentGate(UserId user, Consent consent)
        : user_(std::move(user)), consent_(consent) {}

    UserId user_;
    Consent consent_;
};

struct DeleteResult {
    bool profile_deleted = false;
    size_t sessions_cleared = 0;
};

struct ProfileMeta {
    bool has_profile = false;
    Consent consent;
    Timestamp updated_at = 0;
};

class ProfileVault {
public:
    ProfileVault(std::shared_ptr<ProfileStore> store,
                 std::shared_ptr<SessionVault> sessions,
                 std::shared_ptr<const Cipher> cipher,
                 std::shared_ptr<AuditLog> audit,
                 Clock clock = now);

    // Throws EmptyProfile if no field survives normalization
    void save_profile(const ConsentGate& gate, const Profile& fields);

    // Throws ConsentRequired before touching the store
    void save_profile(const UserId& user, const Profile& fields, const Consent& consent);

    // Profile taken from the session's registry, explicit fields override.
    // Returns the names of the fields stored.
    std::vector<std::string> save_profile_from_session(const UserId& user, const SessionId& session,
                                      const Profile& overrides, const Consent& consent);

    std::optional<SealedProfile> load_profile(const UserId& user);

    // Idempotent "forget me"
    DeleteResult delete_profile(const UserId& user);

    Consent consent(const UserId& user);

    // Unset flags keep their stored value
    Consent update_consent(const UserId& user, std::optional<bool> remember_me,
                           std::optional<bool> sync_across_devices);

    ProfileMeta meta(const UserId& user);

    void link_session(const UserId& user, const SessionId& session);

    // Drop links older than `cutoff` whose session holds no registry.
    // Returns how many went.
    size_t prune_links(Timestamp cutoff);

    // Throws DecryptionFailure; caller wipes the result
    Profile unseal(const UserId& user, const SealedProfile& sealed) const;

    AuditLog* audit() const { return audit_.get(); }

private:
    std::shared_ptr<ProfileStore> store_;
    std::shared_ptr<SessionVault> sessions_;
    std::shared_ptr<const Cipher> cipher_;
    std::shared_ptr<AuditLog> audit_;
    Clock clock_;
    std::atomic<Timestamp> next_prune_{0};
};

} // namespace kavach
