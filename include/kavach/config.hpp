#pragma once
// Configuration: one struct, layered sources
//
// Priority, lowest first: built-in defaults, JSON file (--config),
// environment (KAVACH_*), command-line flags. The encryption secret comes
// only from KAVACH_SECRET or a secret file, never from the JSON file.

#include "detector.hpp"
#include "sanitizer.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace kavach {

using json = nlohmann::json;

struct KavachConfig {
    std::string data_path;               // Directory for SQLite files; empty = in-memory stores
    int64_t ttl_seconds = 1800;          // Session registry lifetime, refreshed on write
    int kdf_iterations = 100000;         // PBKDF2 rounds for the vault key
    int max_retries = 8;                 // Mask commit attempts under contention
    size_t max_text_bytes = DEFAULT_MAX_TEXT_BYTES;  // Per mask or sanitize call
    std::string recognizer = "gazetteer";  // "gazetteer" or "none"
    LeakPolicy leak_policy;
    DetectorOptions detector;
    bool verbose = false;

    std::string secret_file;             // Read when KAVACH_SECRET is unset
    std::string secret;                  // Never serialized, never logged

    // Throws ConfigError on unknown values or a "secret" key
    void apply_json(const json& doc);
    void load_file(const std::string& path);
    void apply_env();

    // Fill `secret` from secret_file if needed; throws ConfigError if none
    void resolve_secret();

    void validate() const;

    // Effective settings without the secret
    json describe() const;
};

} // namespace kavach
