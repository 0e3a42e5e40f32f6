#pragma once
// Kavach: the privacy core behind one object
//
// Wires detector, vaults, recreator, sanitizer and shield together and
// exposes the operations a chat backend calls per turn. Holds no registry
// state of its own; the vaults are the only source of truth.

#include "audit.hpp"
#include "config.hpp"
#include "crypto.hpp"
#include "detector.hpp"
#include "kv_store.hpp"
#include "masking.hpp"
#include "profile_store.hpp"
#include "profile_vault.hpp"
#include "prompt_shield.hpp"
#include "recreator.hpp"
#include "sanitizer.hpp"
#include "session_vault.hpp"
#include "unmasker.hpp"
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kavach {

// Black-box text model. Only ever sees masked text.
class LanguageModel {
public:
    virtual ~LanguageModel() = default;
    virtual std::string complete(const std::string& system_prompt,
                                 const std::string& masked_text) = 0;
};

// Collaborators; any left null are built from the config
struct KavachParts {
    std::shared_ptr<KeyValueStore> kv;
    std::shared_ptr<ProfileStore> profiles;
    std::shared_ptr<AuditLog> audit;
    std::shared_ptr<Recognizer> recognizer;
    std::shared_ptr<const Cipher> cipher;
};

struct DisplayResult {
    std::string sanitized;    // Still tokenized; safe to persist
    std::string display;      // Real values; show, never store
    std::vector<Leak> leaks;
    std::vector<std::string> unknown_tokens;
    size_t replaced = 0;
};

struct ChatTurn {
    std::string masked_prompt;
    std::string masked_response;
    std::string display_text;
    bool blocked = false;
    SeedOutcome seed = SeedOutcome::NoProfile;
    MaskResult mask;
    size_t leaks = 0;
};

class Kavach {
public:
    Kavach(const KavachConfig& config, KavachParts parts = {});

    MaskResult mask(const SessionId& session, const std::string& text,
                    const std::atomic<bool>* cancel = nullptr);

    SanitizeResult sanitize(const SessionId& session, const std::string& response);
    UnmaskResult unmask(const SessionId& session, const std::string& text);

    // Sanitize then unmask against one registry snapshot
    DisplayResult sanitize_and_unmask(const SessionId& session, const std::string& response);

    SeedResult ensure_seeded(const SessionId& session, const UserId& user);

    void save_profile(const UserId& user, const Profile& fields, const Consent& consent);
    std::vector<std::string> save_profile_from_session(const UserId& user, const SessionId& session,
                                                       const Profile& overrides, const Consent& consent);
    std::optional<SealedProfile> load_profile(const UserId& user);
    DeleteResult delete_profile(const UserId& user);
    Consent update_consent(const UserId& user, std::optional<bool> remember_me,
                           std::optional<bool> sync_across_devices);
    ProfileMeta profile_meta(const UserId& user);

    // Tokens with their values blotted out; empty for an unknown session
    json masked_summary(const SessionId& session);

    ShieldVerdict shield_check(const std::string& text) const { return shield_.inspect(text); }

    // seed -> shield -> mask -> model -> sanitize -> unmask
    ChatTurn chat_turn(const SessionId& session, const UserId& user,
                       const std::string& text, LanguageModel& model);

    bool healthy();

    SessionVault& session_vault() { return *sessions_; }
    ProfileVault& profile_vault() { return *profiles_; }
    const EntityDetector& detector() const { return *detector_; }
    const PromptShield& shield() const { return shield_; }
    const KavachConfig& config() const { return config_; }

private:
    KavachConfig config_;
    std::shared_ptr<SessionVault> sessions_;
    std::shared_ptr<ProfileVault> profiles_;
    std::shared_ptr<EntityDetector> detector_;
    std::unique_ptr<MaskingPipeline> masking_;
    std::unique_ptr<SessionRecreator> recreator_;
    ResponseSanitizer sanitizer_;
    PromptShield shield_;

    TokenRegistry snapshot(const SessionId& session);
};

} // namespace kavach
