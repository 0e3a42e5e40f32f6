#pragma once
// Cipher: authenticated encryption for everything a vault writes
//
// AES-256-GCM with a key derived from the process secret by PBKDF2-SHA256.
// Stored form is base64(nonce[12] || ciphertext || tag[16]).
// Associated data binds a blob to its scope, so a registry copied under
// another session key or a profile copied to another user fails to open.

#include <openssl/crypto.h>
#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace kavach {

// Zero a buffer holding key material or decrypted plaintext
inline void secure_wipe(std::string& data) {
    if (!data.empty()) {
        OPENSSL_cleanse(&data[0], data.size());
    }
    data.clear();
}

std::string sha256_hex(const std::string& data);
std::string base64_encode(const std::string& data);
std::optional<std::string> base64_decode(const std::string& encoded);

// First 16 hex chars of SHA-256(user id), the only user reference audit keeps
inline std::string hash_user_id(const std::string& user_id) {
    return sha256_hex(user_id).substr(0, 16);
}

class Cipher {
public:
    static constexpr int DEFAULT_KDF_ITERATIONS = 100000;
    static constexpr size_t KEY_SIZE = 32;
    static constexpr size_t NONCE_SIZE = 12;
    static constexpr size_t TAG_SIZE = 16;

    // Throws ConfigError on an empty secret or a failed derivation
    explicit Cipher(const std::string& secret, int kdf_iterations = DEFAULT_KDF_ITERATIONS);
    ~Cipher();

    Cipher(const Cipher&) = delete;
    Cipher& operator=(const Cipher&) = delete;

    std::string encrypt(const std::string& plaintext, const std::string& aad) const;

    // Throws DecryptionFailure on bad encoding, wrong key, wrong aad or tampering
    std::string decrypt(const std::string& encoded, const std::string& aad) const;

private:
    std::array<unsigned char, KEY_SIZE> key_{};
};

} // namespace kavach
