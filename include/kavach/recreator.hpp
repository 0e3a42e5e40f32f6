#pragma once
// Session Recreator: seed an empty session from the user's profile
//
// Runs at the start of a turn. Reads the single current profile, decrypts
// it in memory, and writes a fresh registry only if the session is still
// empty. Of several concurrent callers at most one seeds; the rest see
// LostRace and read what the winner wrote. A seed whose profile was deleted
// or replaced before the write landed is cleared again.

#include "profile_vault.hpp"
#include "session_vault.hpp"
#include "types.hpp"
#include <memory>

namespace kavach {

enum class SeedOutcome : uint8_t {
    AlreadyPresent,
    Seeded,
    LostRace,
    NoConsent,
    NoProfile,
    DecryptionFailed
};

inline const char* seed_outcome_name(SeedOutcome outcome) {
    switch (outcome) {
        case SeedOutcome::AlreadyPresent:   return "already_present";
        case SeedOutcome::Seeded:           return "seeded";
        case SeedOutcome::LostRace:         return "lost_race";
        case SeedOutcome::NoConsent:        return "no_consent";
        case SeedOutcome::NoProfile:        return "no_profile";
        case SeedOutcome::DecryptionFailed: return "decryption_failed";
    }
    return "unknown";
}

struct SeedResult {
    SeedOutcome outcome;
    size_t token_count = 0;
};

class SessionRecreator {
public:
    SessionRecreator(std::shared_ptr<SessionVault> sessions,
                     std::shared_ptr<ProfileVault> profiles)
        : sessions_(std::move(sessions)), profiles_(std::move(profiles)) {}

    // Also records the session as owned by the user
    SeedResult ensure_seeded(const SessionId& session, const UserId& user);

private:
    std::shared_ptr<SessionVault> sessions_;
    std::shared_ptr<ProfileVault> profiles_;
};

} // namespace kavach
