#include <kavach/session_vault.hpp>
#include <kavach/errors.hpp>
#include <kavach/log.hpp>

namespace kavach {

namespace {

// Store errors that are not already VaultUnavailable get wrapped
template<typename F>
auto guarded(const char* op, F&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const VaultUnavailable&) {
        throw;
    } catch (const std::exception& e) {
        log_warn("SessionVault", "%s failed: %s", op, e.what());
        throw VaultUnavailable(std::string("Session store ") + op + " failed: " + e.what());
    }
}

} // namespace

SessionVault::SessionVault(std::shared_ptr<KeyValueStore> store,
                           std::shared_ptr<const Cipher> cipher,
                           std::chrono::seconds ttl)
    : store_(std::move(store)), cipher_(std::move(cipher)), ttl_(ttl) {
    if (!store_) throw std::invalid_argument("SessionVault requires a store");
    if (!cipher_) throw std::invalid_argument("SessionVault requires a cipher");
    if (ttl_.count() <= 0) throw std::invalid_argument("SessionVault TTL must be positive");
}

std::optional<TokenRegistry> SessionVault::get(const SessionId& session) {
    auto value = guarded("get", [&] { return store_->get(key_for(session)); });
    if (!value) return std::nullopt;
    return open(session, *value);
}

void SessionVault::put(const SessionId& session, TokenRegistry& registry) {
    std::string sealed = seal(session, registry);
    uint64_t version = guarded("put", [&] {
        return store_->put(key_for(session), sealed, ttl_);
    });
    registry.set_revision(version);
    log_debug("SessionVault", "put %zu entries (rev %llu)", registry.size(),
              static_cast<unsigned long long>(version));
}

bool SessionVault::put_if_unchanged(const SessionId& session, TokenRegistry& registry) {
    std::string sealed = seal(session, registry);
    uint64_t version = guarded("put_if_version", [&] {
        return store_->put_if_version(key_for(session), sealed, registry.revision(), ttl_);
    });
    if (version == 0) {
        log_debug("SessionVault", "revision %llu is stale",
                  static_cast<unsigned long long>(registry.revision()));
        return false;
    }
    registry.set_revision(version);
    return true;
}

bool SessionVault::seed_if_empty(const SessionId& session, TokenRegistry& registry) {
    auto current = get(session);
    if (current && !current->empty()) {
        return false;
    }
    registry.set_revision(current ? current->revision() : 0);
    return put_if_unchanged(session, registry);
}

bool SessionVault::clear(const SessionId& session) {
    return guarded("erase", [&] { return store_->erase(key_for(session)); });
}

bool SessionVault::exists(const SessionId& session) {
    return guarded("get", [&] { return store_->get(key_for(session)).has_value(); });
}

bool SessionVault::ping() {
    return guarded("ping", [&] { return store_->ping(); });
}

std::string SessionVault::seal(const SessionId& session, const TokenRegistry& registry) const {
    std::string plain = registry.serialize();
    std::string sealed = cipher_->encrypt(plain, key_for(session));
    secure_wipe(plain);
    return sealed;
}

TokenRegistry SessionVault::open(const SessionId& session, const StoredValue& value) const {
    std::string plain;
    try {
        plain = cipher_->decrypt(value.data, key_for(session));
    } catch (const DecryptionFailure& e) {
        log_warn("SessionVault", "stored registry unreadable: %s", e.what());
        throw VaultUnavailable("Stored registry cannot be decrypted");
    }

    try {
        TokenRegistry registry = TokenRegistry::deserialize(plain);
        secure_wipe(plain);
        registry.set_revision(value.version);
        return registry;
    } catch (const std::exception& e) {
        secure_wipe(plain);
        log_warn("SessionVault", "stored registry malformed: %s", e.what());
        throw VaultUnavailable("Stored registry is malformed");
    }
}

} // namespace kavach
