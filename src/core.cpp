#include <kavach/core.hpp>
#include <kavach/errors.hpp>
#include <kavach/log.hpp>

#include <filesystem>
#include <system_error>

namespace kavach {

namespace {

std::string join_path(const std::string& dir, const char* file) {
    if (dir.empty() || dir.back() == '/') return dir + file;
    return dir + "/" + file;
}

} // namespace

Kavach::Kavach(const KavachConfig& config, KavachParts parts)
    : config_(config), sanitizer_(config.leak_policy, config.max_text_bytes) {
    config_.validate();

    if (!parts.cipher) {
        KavachConfig resolved = config_;
        resolved.resolve_secret();
        parts.cipher = std::make_shared<Cipher>(resolved.secret, config_.kdf_iterations);
        secure_wipe(resolved.secret);
    }
    secure_wipe(config_.secret);

    const bool durable = !config_.data_path.empty();
    if (durable) {
        std::error_code ec;
        std::filesystem::create_directories(config_.data_path, ec);
        if (ec) {
            throw ConfigError("Cannot create data directory " + config_.data_path + ": " + ec.message());
        }
    }
    if (!parts.kv) {
        if (durable) parts.kv = std::make_shared<SqliteKvStore>(join_path(config_.data_path, "sessions.db"));
        else parts.kv = std::make_shared<MemoryKvStore>();
    }
    if (!parts.profiles) {
        if (durable) parts.profiles = std::make_shared<SqliteProfileStore>(join_path(config_.data_path, "profiles.db"));
        else parts.profiles = std::make_shared<MemoryProfileStore>();
    }
    if (!parts.audit) {
        if (durable) parts.audit = std::make_shared<SqliteAuditLog>(join_path(config_.data_path, "audit.db"));
        else parts.audit = std::make_shared<MemoryAuditLog>();
    }
    if (!parts.recognizer && config_.recognizer == "gazetteer") {
        parts.recognizer = std::make_shared<GazetteerRecognizer>();
    }

    sessions_ = std::make_shared<SessionVault>(parts.kv, parts.cipher,
                                               std::chrono::seconds(config_.ttl_seconds));
    profiles_ = std::make_shared<ProfileVault>(parts.profiles, sessions_, parts.cipher, parts.audit);
    detector_ = std::make_shared<EntityDetector>(parts.recognizer, config_.detector);
    masking_ = std::make_unique<MaskingPipeline>(detector_, sessions_, config_.max_retries,
                                                config_.max_text_bytes);
    recreator_ = std::make_unique<SessionRecreator>(sessions_, profiles_);

    log_debug("Kavach", "ready (store=%s, recognizer=%s, ttl=%llds)",
              durable ? config_.data_path.c_str() : "memory",
              parts.recognizer ? parts.recognizer->name() : "none",
              static_cast<long long>(config_.ttl_seconds));
}

MaskResult Kavach::mask(const SessionId& session, const std::string& text,
                        const std::atomic<bool>* cancel) {
    return masking_->mask(session, text, cancel);
}

TokenRegistry Kavach::snapshot(const SessionId& session) {
    auto registry = sessions_->get(session);
    return registry ? std::move(*registry) : TokenRegistry{};
}

SanitizeResult Kavach::sanitize(const SessionId& session, const std::string& response) {
    return sanitizer_.sanitize(snapshot(session), response);
}

UnmaskResult Kavach::unmask(const SessionId& session, const std::string& text) {
    return kavach::unmask(snapshot(session), text);
}

DisplayResult Kavach::sanitize_and_unmask(const SessionId& session, const std::string& response) {
    TokenRegistry registry = snapshot(session);
    SanitizeResult clean = sanitizer_.sanitize(registry, response);
    UnmaskResult shown = kavach::unmask(registry, clean.text);

    DisplayResult out;
    out.sanitized = std::move(clean.text);
    out.display = std::move(shown.text);
    out.leaks = std::move(clean.leaks);
    out.unknown_tokens = std::move(clean.unknown_tokens);
    out.replaced = shown.replaced;
    return out;
}

SeedResult Kavach::ensure_seeded(const SessionId& session, const UserId& user) {
    return recreator_->ensure_seeded(session, user);
}

void Kavach::save_profile(const UserId& user, const Profile& fields, const Consent& consent) {
    profiles_->save_profile(user, fields, consent);
}

std::vector<std::string> Kavach::save_profile_from_session(const UserId& user, const SessionId& session,
                                                           const Profile& overrides, const Consent& consent) {
    return profiles_->save_profile_from_session(user, session, overrides, consent);
}

std::optional<SealedProfile> Kavach::load_profile(const UserId& user) {
    return profiles_->load_profile(user);
}

DeleteResult Kavach::delete_profile(const UserId& user) {
    return profiles_->delete_profile(user);
}

Consent Kavach::update_consent(const UserId& user, std::optional<bool> remember_me,
                               std::optional<bool> sync_across_devices) {
    return profiles_->update_consent(user, remember_me, sync_across_devices);
}

ProfileMeta Kavach::profile_meta(const UserId& user) {
    return profiles_->meta(user);
}

json Kavach::masked_summary(const SessionId& session) {
    return snapshot(session).masked_summary();
}

ChatTurn Kavach::chat_turn(const SessionId& session, const UserId& user,
                           const std::string& text, LanguageModel& model) {
    ChatTurn turn;
    turn.seed = ensure_seeded(session, user).outcome;

    turn.mask = mask(session, text);
    turn.masked_prompt = turn.mask.masked_text;

    ShieldVerdict verdict = shield_.inspect(text);

    if (verdict.blocked) {
        turn.blocked = true;
        turn.masked_response = shield_.blocked_response();
        turn.display_text = turn.masked_response;
        return turn;
    }

    std::string raw = model.complete(shield_.system_prompt(), turn.masked_prompt);

    DisplayResult shown = sanitize_and_unmask(session, raw);
    turn.masked_response = std::move(shown.sanitized);
    turn.display_text = std::move(shown.display);
    turn.leaks = shown.leaks.size();
    return turn;
}

bool Kavach::healthy() {
    try {
        return sessions_->ping();
    } catch (const VaultUnavailable& e) {
        log_warn("Kavach", "health check failed: %s", e.what());
        return false;
    }
}

} // namespace kavach
