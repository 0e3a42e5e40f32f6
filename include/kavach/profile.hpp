#pragma once
// Profile: the one long-term record a user may keep
//
// Exactly three fields. Values are trimmed and empty strings become absent.
// Consent is stored beside the profile and is granted when either flag is set.

#include "crypto.hpp"
#include "registry.hpp"
#include "text.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace kavach {

using json = nlohmann::json;

struct Consent {
    bool remember_me = false;
    bool sync_across_devices = false;

    bool granted() const { return remember_me || sync_across_devices; }

    json to_json() const {
        return {{"remember_me", remember_me}, {"sync_across_devices", sync_across_devices}};
    }
};

struct Profile {
    std::optional<std::string> name;
    std::optional<std::string> college;
    std::optional<std::string> email;

    bool empty() const { return !name && !college && !email; }

    std::string serialize() const {
        json doc = json::object();
        doc["name"] = name ? json(*name) : json();
        doc["college"] = college ? json(*college) : json();
        doc["email"] = email ? json(*email) : json();
        return doc.dump();
    }

    // Unknown keys are ignored; non-string values count as absent
    static Profile deserialize(const std::string& data) {
        json doc = json::parse(data);
        if (!doc.is_object()) {
            throw std::runtime_error("Profile deserialize: not an object");
        }
        auto field = [&](const char* key) -> std::optional<std::string> {
            if (!doc.contains(key) || !doc[key].is_string()) return std::nullopt;
            return doc[key].get<std::string>();
        };
        return normalize(Profile{field("name"), field("college"), field("email")});
    }

    static Profile normalize(const Profile& in) {
        auto clean = [](const std::optional<std::string>& v) -> std::optional<std::string> {
            if (!v) return std::nullopt;
            std::string t = text::trim(*v);
            if (t.empty()) return std::nullopt;
            return t;
        };
        return Profile{clean(in.name), clean(in.college), clean(in.email)};
    }

    // Fields present in `overrides` win
    Profile merged_with(const Profile& overrides) const {
        Profile out = *this;
        if (overrides.name) out.name = overrides.name;
        if (overrides.college) out.college = overrides.college;
        if (overrides.email) out.email = overrides.email;
        return out;
    }

    // Scrub decrypted values once they have been used
    void wipe() {
        for (auto* field : {&name, &college, &email}) {
            if (*field) secure_wipe(**field);
            field->reset();
        }
    }
};

// Build a profile from a session: first PERSON -> name, first ORG -> college,
// first EMAIL -> email, "first" meaning lowest token number
inline Profile profile_from_registry(const TokenRegistry& registry) {
    Profile profile;
    uint32_t best[3] = {UINT32_MAX, UINT32_MAX, UINT32_MAX};
    for (const auto& [token, entry] : registry.entries()) {
        std::optional<std::string>* slot = nullptr;
        int idx = 0;
        switch (entry.type) {
            case EntityType::Person: slot = &profile.name; idx = 0; break;
            case EntityType::Org:    slot = &profile.college; idx = 1; break;
            case EntityType::Email:  slot = &profile.email; idx = 2; break;
            default: continue;
        }
        uint32_t number = parse_token(token)->number;
        if (number < best[idx]) {
            best[idx] = number;
            *slot = entry.original;
        }
    }
    return Profile::normalize(profile);
}

// Registry recreated from a profile: name -> [PERSON_1], college -> [ORG_1],
// email -> [EMAIL_1]
inline TokenRegistry registry_from_profile(const Profile& profile) {
    TokenRegistry registry;
    if (profile.name) registry.assign(*profile.name, EntityType::Person);
    if (profile.college) registry.assign(*profile.college, EntityType::Org);
    if (profile.email) registry.assign(*profile.email, EntityType::Email);
    return registry;
}

} // namespace kavach
