#pragma once
// Response Sanitizer: put tokens back where the model leaked real values
//
// Runs on every model response before anything else sees it. Matching is
// exact (case-insensitive, word-bounded), by digits for phones and ids, and
// optionally fuzzy for names. A space in a stored value matches any
// whitespace run. Tokens already in the response are never
// rewritten; tokens the registry does not know are reported.

#include "registry.hpp"
#include "types.hpp"
#include <map>
#include <string>
#include <vector>

namespace kavach {

enum class LeakMatchMode : uint8_t {
    Exact,
    Fuzzy
};

struct LeakPolicy {
    LeakMatchMode mode = LeakMatchMode::Fuzzy;
    size_t max_edit_distance = 2;
    float min_similarity = 0.8f;
    size_t min_fuzzy_length = 5;
};

enum class LeakKind : uint8_t {
    Exact,
    Digits,
    Fuzzy
};

struct Leak {
    std::string token;
    EntityType type;
    LeakKind kind;
    size_t start = 0;
    size_t end = 0;
};

struct SanitizeResult {
    std::string text;
    std::vector<Leak> leaks;
    std::vector<std::string> unknown_tokens;

    std::map<std::string, size_t> leaks_by_type() const {
        std::map<std::string, size_t> out;
        for (const auto& leak : leaks) out[entity_type_prefix(leak.type)]++;
        return out;
    }
};

class ResponseSanitizer {
public:
    explicit ResponseSanitizer(LeakPolicy policy = {},
                               size_t max_text_bytes = DEFAULT_MAX_TEXT_BYTES)
        : policy_(policy), max_text_bytes_(max_text_bytes) {}

    // Throws TextTooLong past max_text_bytes
    SanitizeResult sanitize(const TokenRegistry& registry, const std::string& response) const;

    const LeakPolicy& policy() const { return policy_; }

private:
    LeakPolicy policy_;
    size_t max_text_bytes_;
};

} // namespace kavach
