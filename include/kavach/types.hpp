#pragma once
// Core types: entities, tokens, and the scopes they live in
//
// A session scopes every token. A user owns at most one profile.
// The two ids are distinct types so one can never stand in for the other.

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace kavach {

// Timestamp as Unix millis
using Timestamp = int64_t;

// Current time as Timestamp
inline Timestamp now() {
    auto duration = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

// Injectable time source for stores that expire or stamp records
using Clock = std::function<Timestamp()>;

// Entity types that can be tokenized
enum class EntityType : uint8_t {
    Person,
    Org,
    Location,
    Email,
    Phone,
    IdNumber
};

constexpr EntityType ALL_ENTITY_TYPES[] = {
    EntityType::Person, EntityType::Org, EntityType::Location,
    EntityType::Email, EntityType::Phone, EntityType::IdNumber
};

// Token prefix, also used as the wire name of the type
inline const char* entity_type_prefix(EntityType type) {
    switch (type) {
        case EntityType::Person:   return "PERSON";
        case EntityType::Org:      return "ORG";
        case EntityType::Location: return "LOCATION";
        case EntityType::Email:    return "EMAIL";
        case EntityType::Phone:    return "PHONE";
        case EntityType::IdNumber: return "ID";
    }
    return "UNKNOWN";
}

inline std::optional<EntityType> entity_type_from_prefix(const std::string& prefix) {
    for (EntityType type : ALL_ENTITY_TYPES) {
        if (prefix == entity_type_prefix(type)) return type;
    }
    return std::nullopt;
}

// Map a recognizer label onto the closed entity set.
// Labels outside the table (DATE, MONEY, CARDINAL, ...) are rejected.
inline std::optional<EntityType> entity_type_from_label(const std::string& label) {
    std::string upper = label;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "PERSON" || upper == "PER") return EntityType::Person;
    if (upper == "ORG" || upper == "ORGANIZATION") return EntityType::Org;
    if (upper == "GPE" || upper == "LOC" || upper == "LOCATION") return EntityType::Location;
    if (upper == "EMAIL") return EntityType::Email;
    if (upper == "PHONE") return EntityType::Phone;
    if (upper == "ID" || upper == "ID_NUMBER") return EntityType::IdNumber;
    return std::nullopt;
}

// Proper-noun types go through the false-positive filter
inline bool is_name_like(EntityType type) {
    return type == EntityType::Person || type == EntityType::Org ||
           type == EntityType::Location;
}

// Largest input masked or response sanitized in one call
constexpr size_t DEFAULT_MAX_TEXT_BYTES = 256 * 1024;

enum class SpanSource : uint8_t {
    Recognizer,
    Pattern
};

// Candidate entity found in one input; offsets are byte offsets, end exclusive
struct EntitySpan {
    std::string text;
    EntityType type;
    size_t start = 0;
    size_t end = 0;
    SpanSource source = SpanSource::Pattern;

    size_t length() const { return end - start; }

    bool overlaps(const EntitySpan& other) const {
        return start < other.end && other.start < end;
    }
};

namespace detail {

inline void validate_scope_id(const std::string& value, const char* what) {
    if (value.empty()) {
        throw std::invalid_argument(std::string(what) + " must not be empty");
    }
    if (value.size() > 256) {
        throw std::invalid_argument(std::string(what) + " is too long");
    }
    for (unsigned char c : value) {
        if (c <= 0x20 || c == 0x7f) {
            throw std::invalid_argument(std::string(what) + " contains whitespace or control characters");
        }
    }
}

} // namespace detail

// Conversation scope for tokens. Every vault call is keyed by one.
class SessionId {
public:
    explicit SessionId(std::string value) : value_(std::move(value)) {
        detail::validate_scope_id(value_, "session id");
    }

    const std::string& str() const { return value_; }

    bool operator==(const SessionId& other) const { return value_ == other.value_; }
    bool operator!=(const SessionId& other) const { return value_ != other.value_; }
    bool operator<(const SessionId& other) const { return value_ < other.value_; }

private:
    std::string value_;
};

// Owner of at most one persistent profile
class UserId {
public:
    explicit UserId(std::string value) : value_(std::move(value)) {
        detail::validate_scope_id(value_, "user id");
    }

    const std::string& str() const { return value_; }

    bool operator==(const UserId& other) const { return value_ == other.value_; }
    bool operator!=(const UserId& other) const { return value_ != other.value_; }

private:
    std::string value_;
};

struct SessionIdHash {
    size_t operator()(const SessionId& s) const {
        return std::hash<std::string>{}(s.str());
    }
};

} // namespace kavach
