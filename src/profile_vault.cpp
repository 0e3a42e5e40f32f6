#include <kavach/profile_vault.hpp>
#include <kavach/errors.hpp>
#include <kavach/log.hpp>

namespace kavach {

ConsentGate ConsentGate::require(const UserId& user, const Consent& consent) {
    if (!consent.granted()) {
        throw ConsentRequired();
    }
    return ConsentGate(user, consent);
}

ProfileVault::ProfileVault(std::shared_ptr<ProfileStore> store,
                           std::shared_ptr<SessionVault> sessions,
                           std::shared_ptr<const Cipher> cipher,
                           std::shared_ptr<AuditLog> audit,
                           Clock clock)
    : store_(std::move(store)),
      sessions_(std::move(sessions)),
      cipher_(std::move(cipher)),
      audit_(std::move(audit)),
      clock_(std::move(clock)) {
    if (!store_ || !sessions_ || !cipher_) {
        throw std::invalid_argument("ProfileVault requires a store, session vault and cipher");
    }
}

void ProfileVault::save_profile(const ConsentGate& gate, const Profile& fields) {
    Profile profile = Profile::normalize(fields);
    if (profile.empty()) {
        throw EmptyProfile();
    }

    std::string plain = profile.serialize();
    std::string blob = cipher_->encrypt(plain, gate.user().str());
    secure_wipe(plain);
    profile.wipe();

    store_->upsert(gate.user(), blob, gate.consent());
    audit_event(audit_.get(), AuditAction::ProfileSave, gate.user());
    log_info("ProfileVault", "stored profile for user %s",
             hash_user_id(gate.user().str()).c_str());
}

void ProfileVault::save_profile(const UserId& user, const Profile& fields, const Consent& consent) {
    save_profile(ConsentGate::require(user, consent), fields);
}

std::vector<std::string> ProfileVault::save_profile_from_session(const UserId& user, const SessionId& session,
                                                const Profile& overrides, const Consent& consent) {
    ConsentGate gate = ConsentGate::require(user, consent);

    auto registry = sessions_->get(session);
    Profile extracted = registry ? profile_from_registry(*registry) : Profile{};
    Profile profile = extracted.merged_with(Profile::normalize(overrides));
    extracted.wipe();

    save_profile(gate, profile);
    link_session(user, session);

    std::vector<std::string> stored;
    if (profile.name) stored.push_back("name");
    if (profile.college) stored.push_back("college");
    if (profile.email) stored.push_back("email");
    profile.wipe();
    return stored;
}

std::optional<SealedProfile> ProfileVault::load_profile(const UserId& user) {
    return store_->find(user);
}

DeleteResult ProfileVault::delete_profile(const UserId& user) {
    DeleteResult result;
    result.profile_deleted = store_->erase(user);

    for (const auto& session : store_->sessions_of(user)) {
        if (sessions_->clear(session)) {
            ++result.sessions_cleared;
        }
        store_->unlink_session(user, session);
    }

    audit_event(audit_.get(), AuditAction::ProfileDelete, user);
    log_info("ProfileVault", "forget-me for user %s: profile=%s sessions=%zu",
             hash_user_id(user.str()).c_str(),
             result.profile_deleted ? "deleted" : "absent", result.sessions_cleared);
    return result;
}

Consent ProfileVault::consent(const UserId& user) {
    return store_->consent(user).value_or(Consent{});
}

Consent ProfileVault::update_consent(const UserId& user, std::optional<bool> remember_me,
                                     std::optional<bool> sync_across_devices) {
    Consent current = consent(user);
    if (!remember_me && !sync_across_devices) {
        return current;
    }
    if (remember_me) current.remember_me = *remember_me;
    if (sync_across_devices) current.sync_across_devices = *sync_across_devices;

    store_->set_consent(user, current);
    audit_event(audit_.get(), AuditAction::ConsentUpdate, user);
    return current;
}

ProfileMeta ProfileVault::meta(const UserId& user) {
    ProfileMeta meta;
    auto sealed = store_->find(user);
    meta.has_profile = sealed.has_value() && !sealed->blob.empty();
    if (sealed) meta.updated_at = sealed->updated_at;
    meta.consent = consent(user);
    return meta;
}

void ProfileVault::link_session(const UserId& user, const SessionId& session) {
    store_->link_session(user, session);

    Timestamp t = clock_();
    Timestamp due = next_prune_.load();
    if (t < due) return;
    const Timestamp ttl_ms = std::chrono::duration_cast<std::chrono::milliseconds>(sessions_->ttl()).count();
    // One caller per interval does the sweep
    if (next_prune_.compare_exchange_strong(due, t + ttl_ms)) {
        prune_links(t - ttl_ms);
    }
}

size_t ProfileVault::prune_links(Timestamp cutoff) {
    size_t dropped = 0;
    for (const auto& link : store_->links_older_than(cutoff)) {
        if (sessions_->exists(link.session)) continue;
        // A link refreshed since the listing belongs to a live turn
        if (store_->unlink_if_older(link.user, link.session, cutoff)) ++dropped;
    }
    if (dropped > 0) log_debug("ProfileVault", "pruned %zu stale session links", dropped);
    return dropped;
}

Profile ProfileVault::unseal(const UserId& user, const SealedProfile& sealed) const {
    std::string plain = cipher_->decrypt(sealed.blob, user.str());
    try {
        Profile profile = Profile::deserialize(plain);
        secure_wipe(plain);
        return profile;
    } catch (const std::exception& e) {
        secure_wipe(plain);
        throw DecryptionFailure(std::string("Decrypted profile is malformed: ") + e.what());
    }
}

} // namespace kavach
