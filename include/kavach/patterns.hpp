#pragma once
// Pattern matchers: deterministic detection of structured identifiers
//
// EMAIL, PHONE (Indian, US, international) and ID numbers (12-digit
// Aadhaar-style, SSN, card numbers). Digit-bounded rules refuse a match
// that sits inside a longer run of digits.

#include "types.hpp"
#include <regex>
#include <string>
#include <vector>

namespace kavach {

struct PatternRule {
    const char* name;
    EntityType type;
    std::regex re;
    bool digit_bounded;
};

class PatternMatcher {
public:
    PatternMatcher();

    // All rule matches, possibly overlapping; source is Pattern
    std::vector<EntitySpan> match(const std::string& text) const;

    // Tie-break between equally long pattern matches
    static int priority(EntityType type);

    size_t rule_count() const { return rules_.size(); }

private:
    std::vector<PatternRule> rules_;
};

} // namespace kavach
