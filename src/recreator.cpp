#include <kavach/recreator.hpp>
#include <kavach/errors.hpp>
#include <kavach/log.hpp>

namespace kavach {

SeedResult SessionRecreator::ensure_seeded(const SessionId& session, const UserId& user) {
    profiles_->link_session(user, session);

    auto existing = sessions_->get(session);
    if (existing && !existing->empty()) {
        return {SeedOutcome::AlreadyPresent, existing->size()};
    }

    if (!profiles_->consent(user).granted()) {
        return {SeedOutcome::NoConsent, 0};
    }

    auto sealed = profiles_->load_profile(user);
    if (!sealed) {
        return {SeedOutcome::NoProfile, 0};
    }

    Profile profile;
    try {
        profile = profiles_->unseal(user, *sealed);
    } catch (const DecryptionFailure& e) {
        log_warn("Recreator", "profile for user %s unreadable: %s",
                 hash_user_id(user.str()).c_str(), e.what());
        audit_event(profiles_->audit(), AuditAction::DecryptionFailed, user);
        return {SeedOutcome::DecryptionFailed, 0};
    }

    TokenRegistry registry = registry_from_profile(profile);
    profile.wipe();
    if (registry.empty()) {
        return {SeedOutcome::NoProfile, 0};
    }

    if (!sessions_->seed_if_empty(session, registry)) {
        auto current = sessions_->get(session);
        log_debug("Recreator", "session %s seeded concurrently", session.str().c_str());
        return {SeedOutcome::LostRace, current ? current->size() : 0};
    }

    // A forget-me or re-save that landed after load_profile has already
    // cleared the linked sessions; undo this seed too
    auto latest = profiles_->load_profile(user);
    if (!latest || latest->blob != sealed->blob) {
        sessions_->clear(session);
        log_info("Recreator", "profile for user %s changed while seeding; session %s cleared",
                 hash_user_id(user.str()).c_str(), session.str().c_str());
        return {SeedOutcome::NoProfile, 0};
    }

    audit_event(profiles_->audit(), AuditAction::SessionSeeded, user);
    log_debug("Recreator", "seeded session %s with %zu tokens",
              session.str().c_str(), registry.size());
    return {SeedOutcome::Seeded, registry.size()};
}

} // namespace kavach
