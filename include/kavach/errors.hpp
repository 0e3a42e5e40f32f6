#pragma once
// Errors: the failure taxonomy shared by every vault and pipeline stage
//
// Vault and crypto failures propagate to the caller. Detector failures are
// absorbed by the detector itself and only surface as a `degraded` flag.
// Each error carries a stable code string so transports can map it without
// parsing messages.

#include <stdexcept>
#include <string>

namespace kavach {

class Error : public std::runtime_error {
public:
    Error(const char* code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    const char* code() const noexcept { return code_; }

private:
    const char* code_;
};

// Backing store unreachable, corrupt, or too contended to commit
class VaultUnavailable : public Error {
public:
    explicit VaultUnavailable(const std::string& message)
        : Error("VAULT_UNAVAILABLE", message) {}
};

class ConsentRequired : public Error {
public:
    ConsentRequired()
        : Error("CONSENT_REQUIRED", "Consent required to remember profile") {}
};

class EmptyProfile : public Error {
public:
    EmptyProfile()
        : Error("EMPTY_PROFILE", "Profile has no non-empty field") {}
};

// Ciphertext failed authentication or could not be decoded
class DecryptionFailure : public Error {
public:
    explicit DecryptionFailure(const std::string& message)
        : Error("DECRYPTION_FAILURE", message) {}
};

class DetectorUnavailable : public Error {
public:
    explicit DetectorUnavailable(const std::string& message)
        : Error("DETECTOR_UNAVAILABLE", message) {}
};

class Cancelled : public Error {
public:
    Cancelled() : Error("CANCELLED", "Request cancelled before commit") {}
};

class TextTooLong : public Error {
public:
    TextTooLong(size_t size, size_t limit)
        : Error("TEXT_TOO_LONG", "Text of " + std::to_string(size) +
                " bytes exceeds the " + std::to_string(limit) + " byte limit") {}
};

class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& message)
        : Error("CONFIG_ERROR", message) {}
};

} // namespace kavach
