#pragma once
// Token Registry: per-session bijection between tokens and real values
//
// - Tokens look like [PERSON_1]; numbering is per type and never reused
// - Reverse index keyed by normalized value, so repeats map to one token
// - Revision mirrors the backing store version and drives compare-and-set
// - Serialized as JSON; counters are rebuilt from token suffixes on load

#include "types.hpp"
#include "text.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace kavach {

using json = nlohmann::json;

inline std::string make_token(EntityType type, uint32_t number) {
    return std::string("[") + entity_type_prefix(type) + "_" + std::to_string(number) + "]";
}

struct ParsedToken {
    std::string prefix;
    uint32_t number = 0;
};

// Parse anything shaped like [ABC_12]. The prefix is not checked against
// the entity set, so foreign tokens a model invents still parse.
inline std::optional<ParsedToken> parse_token(const std::string& s) {
    if (s.size() < 5 || s.front() != '[' || s.back() != ']') return std::nullopt;

    size_t underscore = s.rfind('_');
    if (underscore == std::string::npos || underscore < 2 || underscore + 2 > s.size() - 1) {
        return std::nullopt;
    }
    for (size_t i = 1; i < underscore; ++i) {
        if (s[i] < 'A' || s[i] > 'Z') return std::nullopt;
    }
    uint64_t number = 0;
    for (size_t i = underscore + 1; i + 1 < s.size(); ++i) {
        if (!text::is_digit(s[i])) return std::nullopt;
        number = number * 10 + static_cast<uint64_t>(s[i] - '0');
        if (number > UINT32_MAX) return std::nullopt;
    }
    return ParsedToken{s.substr(1, underscore - 1), static_cast<uint32_t>(number)};
}

struct TokenEntry {
    std::string original;
    EntityType type;
    Timestamp created_at = 0;
};

class TokenRegistry {
public:
    struct Assignment {
        std::string token;
        bool created = false;
    };

    // Token for value, allocating the next number for its type if unseen.
    // The value is kept as written; only the reverse-index key is normalized.
    Assignment assign(const std::string& value, EntityType type, Timestamp at = now()) {
        std::string key = text::normalize_value(value, type);
        auto it = reverse_.find(key);
        if (it != reverse_.end()) {
            return {it->second, false};
        }

        uint32_t& counter = counters_[index_of(type)];
        std::string token = make_token(type, ++counter);
        entries_[token] = TokenEntry{text::trim(value), type, at};
        reverse_[key] = token;
        return {token, true};
    }

    const TokenEntry* find(const std::string& token) const {
        auto it = entries_.find(token);
        return it == entries_.end() ? nullptr : &it->second;
    }

    std::optional<std::string> token_for(const std::string& value, EntityType type) const {
        auto it = reverse_.find(text::normalize_value(value, type));
        if (it == reverse_.end()) return std::nullopt;
        return it->second;
    }

    const std::map<std::string, TokenEntry>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    uint32_t counter(EntityType type) const { return counters_[index_of(type)]; }

    // Store version this registry was read at; 0 when never persisted
    uint64_t revision() const { return revision_; }
    void set_revision(uint64_t revision) { revision_ = revision; }

    std::string serialize() const {
        json items = json::array();
        for (const auto& [token, entry] : entries_) {
            items.push_back({
                {"token", token},
                {"original", entry.original},
                {"type", entity_type_prefix(entry.type)},
                {"created_at", entry.created_at}
            });
        }
        return json{{"format", 1}, {"entries", items}}.dump();
    }

    static TokenRegistry deserialize(const std::string& data) {
        json doc = json::parse(data, nullptr, false);
        if (doc.is_discarded() || !doc.is_object() || !doc.contains("entries") ||
            !doc["entries"].is_array()) {
            throw std::runtime_error("Registry deserialize: malformed document");
        }
        if (doc.value("format", 0) != 1) {
            throw std::runtime_error("Registry deserialize: unsupported format");
        }

        TokenRegistry reg;
        for (const auto& item : doc["entries"]) {
            if (!item.is_object() || !item.contains("token") || !item.contains("original") ||
                !item.contains("type")) {
                throw std::runtime_error("Registry deserialize: malformed entry");
            }
            std::string token = item["token"].get<std::string>();
            auto type = entity_type_from_prefix(item["type"].get<std::string>());
            auto parsed = parse_token(token);
            if (!type || !parsed || parsed->prefix != entity_type_prefix(*type)) {
                throw std::runtime_error("Registry deserialize: token does not match type");
            }

            std::string original = item["original"].get<std::string>();
            std::string key = text::normalize_value(original, *type);
            if (reg.entries_.count(token) || reg.reverse_.count(key)) {
                throw std::runtime_error("Registry deserialize: duplicate token or value");
            }

            reg.entries_[token] = TokenEntry{original, *type, item.value("created_at", Timestamp{0})};
            reg.reverse_[key] = token;
            uint32_t& counter = reg.counters_[index_of(*type)];
            counter = std::max(counter, parsed->number);
        }
        return reg;
    }

    // Token list for display: real values replaced by a dot per character, capped at 10
    json masked_summary() const {
        std::vector<std::pair<std::string, const TokenEntry*>> ordered;
        for (const auto& [token, entry] : entries_) ordered.emplace_back(token, &entry);
        std::sort(ordered.begin(), ordered.end(), [](const auto& a, const auto& b) {
            if (a.second->type != b.second->type) return a.second->type < b.second->type;
            return parse_token(a.first)->number < parse_token(b.first)->number;
        });

        json out = json::array();
        for (const auto& [token, entry] : ordered) {
            size_t chars = 0;
            for (unsigned char c : entry->original) {
                if ((c & 0xC0) != 0x80) ++chars;
            }
            std::string masked;
            for (size_t i = 0; i < std::min<size_t>(chars, 10); ++i) masked += "\xE2\x97\x8F";
            out.push_back({
                {"token", token},
                {"type", entity_type_prefix(entry->type)},
                {"masked", masked}
            });
        }
        return out;
    }

private:
    std::map<std::string, TokenEntry> entries_;
    std::unordered_map<std::string, std::string> reverse_;
    std::array<uint32_t, 6> counters_{};
    uint64_t revision_ = 0;

    static size_t index_of(EntityType type) { return static_cast<size_t>(type); }
};

} // namespace kavach
