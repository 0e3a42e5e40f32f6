#include <kavach/crypto.hpp>
#include <kavach/errors.hpp>

#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include <algorithm>
#include <stdexcept>
#include <vector>

namespace kavach {

namespace {

// RAII owner for EVP_CIPHER_CTX
class CipherContext {
public:
    CipherContext() : ctx_(EVP_CIPHER_CTX_new()) {}
    ~CipherContext() {
        if (ctx_) EVP_CIPHER_CTX_free(ctx_);
    }

    CipherContext(const CipherContext&) = delete;
    CipherContext& operator=(const CipherContext&) = delete;

    EVP_CIPHER_CTX* get() const { return ctx_; }
    bool valid() const { return ctx_ != nullptr; }

private:
    EVP_CIPHER_CTX* ctx_;
};

const unsigned char* bytes(const std::string& s) {
    return reinterpret_cast<const unsigned char*>(s.data());
}

} // namespace

std::string sha256_hex(const std::string& data) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(bytes(data), data.size(), digest);

    static const char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(SHA256_DIGEST_LENGTH * 2);
    for (unsigned char b : digest) {
        out += hex[b >> 4];
        out += hex[b & 0x0f];
    }
    return out;
}

std::string base64_encode(const std::string& data) {
    if (data.empty()) return "";
    std::vector<unsigned char> out(4 * ((data.size() + 2) / 3) + 1);
    int len = EVP_EncodeBlock(out.data(), bytes(data), static_cast<int>(data.size()));
    return std::string(reinterpret_cast<const char*>(out.data()), static_cast<size_t>(len));
}

std::optional<std::string> base64_decode(const std::string& encoded) {
    if (encoded.empty()) return std::string();
    if (encoded.size() % 4 != 0) return std::nullopt;

    std::vector<unsigned char> out(encoded.size() / 4 * 3 + 1);
    int len = EVP_DecodeBlock(out.data(), bytes(encoded), static_cast<int>(encoded.size()));
    if (len < 0) return std::nullopt;

    // EVP_DecodeBlock counts padding as zero bytes
    size_t padding = 0;
    if (encoded[encoded.size() - 1] == '=') ++padding;
    if (encoded[encoded.size() - 2] == '=') ++padding;
    return std::string(reinterpret_cast<const char*>(out.data()), static_cast<size_t>(len) - padding);
}

Cipher::Cipher(const std::string& secret, int kdf_iterations) {
    if (secret.empty()) {
        throw ConfigError("Encryption secret is empty");
    }
    if (kdf_iterations < 1) {
        throw ConfigError("KDF iterations must be positive");
    }

    // Deterministic salt: first 16 bytes of SHA-256(secret)
    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(bytes(secret), secret.size(), digest);

    int rc = PKCS5_PBKDF2_HMAC(
        secret.data(), static_cast<int>(secret.size()),
        digest, 16,
        kdf_iterations,
        EVP_sha256(),
        static_cast<int>(key_.size()), key_.data());
    OPENSSL_cleanse(digest, sizeof(digest));

    if (rc != 1) {
        throw ConfigError("Key derivation failed");
    }
}

Cipher::~Cipher() {
    OPENSSL_cleanse(key_.data(), key_.size());
}

std::string Cipher::encrypt(const std::string& plaintext, const std::string& aad) const {
    std::array<unsigned char, NONCE_SIZE> nonce{};
    if (RAND_bytes(nonce.data(), static_cast<int>(nonce.size())) != 1) {
        throw std::runtime_error("Failed to generate nonce");
    }

    CipherContext ctx;
    if (!ctx.valid()) {
        throw std::runtime_error("Failed to create cipher context");
    }
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(NONCE_SIZE), nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), nonce.data()) != 1) {
        throw std::runtime_error("Failed to initialize encryption");
    }

    int len = 0;
    if (!aad.empty() &&
        EVP_EncryptUpdate(ctx.get(), nullptr, &len, bytes(aad), static_cast<int>(aad.size())) != 1) {
        throw std::runtime_error("Failed to bind associated data");
    }

    std::vector<unsigned char> ciphertext(plaintext.size() + EVP_MAX_BLOCK_LENGTH);
    int out_len = 0;
    if (EVP_EncryptUpdate(ctx.get(), ciphertext.data(), &len, bytes(plaintext),
                          static_cast<int>(plaintext.size())) != 1) {
        throw std::runtime_error("Encryption failed");
    }
    out_len = len;
    if (EVP_EncryptFinal_ex(ctx.get(), ciphertext.data() + out_len, &len) != 1) {
        throw std::runtime_error("Encryption finalization failed");
    }
    out_len += len;

    std::array<unsigned char, TAG_SIZE> tag{};
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(TAG_SIZE), tag.data()) != 1) {
        throw std::runtime_error("Failed to read authentication tag");
    }

    std::string sealed;
    sealed.reserve(NONCE_SIZE + static_cast<size_t>(out_len) + TAG_SIZE);
    sealed.append(reinterpret_cast<const char*>(nonce.data()), nonce.size());
    sealed.append(reinterpret_cast<const char*>(ciphertext.data()), static_cast<size_t>(out_len));
    sealed.append(reinterpret_cast<const char*>(tag.data()), tag.size());
    return base64_encode(sealed);
}

std::string Cipher::decrypt(const std::string& encoded, const std::string& aad) const {
    auto sealed = base64_decode(encoded);
    if (!sealed) {
        throw DecryptionFailure("Ciphertext is not valid base64");
    }
    if (sealed->size() < NONCE_SIZE + TAG_SIZE) {
        throw DecryptionFailure("Ciphertext too short");
    }

    const unsigned char* raw = bytes(*sealed);
    const unsigned char* nonce = raw;
    const unsigned char* body = raw + NONCE_SIZE;
    size_t body_len = sealed->size() - NONCE_SIZE - TAG_SIZE;
    std::array<unsigned char, TAG_SIZE> tag{};
    std::copy(raw + NONCE_SIZE + body_len, raw + sealed->size(), tag.begin());

    CipherContext ctx;
    if (!ctx.valid()) {
        throw DecryptionFailure("Failed to create cipher context");
    }
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(NONCE_SIZE), nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), nonce) != 1) {
        throw DecryptionFailure("Failed to initialize decryption");
    }

    int len = 0;
    if (!aad.empty() &&
        EVP_DecryptUpdate(ctx.get(), nullptr, &len, bytes(aad), static_cast<int>(aad.size())) != 1) {
        throw DecryptionFailure("Failed to bind associated data");
    }

    std::string plaintext(body_len + EVP_MAX_BLOCK_LENGTH, '\0');
    unsigned char* out = reinterpret_cast<unsigned char*>(&plaintext[0]);
    int out_len = 0;
    if (EVP_DecryptUpdate(ctx.get(), out, &len, body, static_cast<int>(body_len)) != 1) {
        secure_wipe(plaintext);
        throw DecryptionFailure("Decryption failed");
    }
    out_len = len;

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(TAG_SIZE), tag.data()) != 1) {
        secure_wipe(plaintext);
        throw DecryptionFailure("Failed to set authentication tag");
    }
    if (EVP_DecryptFinal_ex(ctx.get(), out + out_len, &len) != 1) {
        secure_wipe(plaintext);
        throw DecryptionFailure("Authentication failed");
    }
    out_len += len;

    plaintext.resize(static_cast<size_t>(out_len));
    return plaintext;
}

} // namespace kavach
