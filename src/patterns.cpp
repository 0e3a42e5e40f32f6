#include <kavach/patterns.hpp>
#include <kavach/text.hpp>

namespace kavach {

namespace {

constexpr auto FLAGS = std::regex::ECMAScript | std::regex::optimize;

} // namespace

// Every quantifier is bounded: std::regex recurses once per repeated
// character and overflows the stack on long runs.
PatternMatcher::PatternMatcher() {
    // RFC 5321 limits: 64-byte local part, 253-byte domain
    rules_.push_back({"email", EntityType::Email,
        std::regex(R"([A-Za-z0-9._%+-]{1,64}@[A-Za-z0-9.-]{1,253}\.[A-Za-z]{2,24})", FLAGS), false});

    // Indian mobile: optional +91, ten digits starting 6-9
    rules_.push_back({"phone_in", EntityType::Phone,
        std::regex(R"((?:\+91[-.\s]?)?[6-9]\d{9})", FLAGS), true});
    // US: (555) 123-4567, 555-123-4567, +1 555 123 4567
    rules_.push_back({"phone_us", EntityType::Phone,
        std::regex(R"((?:\+1[-.\s]?)?(?:\(\d{3}\)|\d{3})[-.\s]?\d{3}[-.\s]?\d{4})", FLAGS), true});
    // International: +44 20 7123 4567
    rules_.push_back({"phone_intl", EntityType::Phone,
        std::regex(R"(\+\d{1,3}[-.\s]?\d{1,4}[-.\s]?\d{1,4}[-.\s]?\d{1,9})", FLAGS), true});

    // Aadhaar-style 12 digits in groups of four
    rules_.push_back({"id_aadhaar", EntityType::IdNumber,
        std::regex(R"(\d{4}[-\s]?\d{4}[-\s]?\d{4})", FLAGS), true});
    // SSN needs separators; nine bare digits are too ambiguous
    rules_.push_back({"id_ssn", EntityType::IdNumber,
        std::regex(R"(\d{3}[-\s]\d{2}[-\s]\d{4})", FLAGS), true});
    // Visa / MasterCard (16) and Amex (15)
    rules_.push_back({"id_card", EntityType::IdNumber,
        std::regex(R"((?:4\d{3}|5[1-5]\d{2})[-\s]?\d{4}[-\s]?\d{4}[-\s]?\d{4}|3[47]\d{2}[-\s]?\d{6}[-\s]?\d{5})", FLAGS), true});
}

int PatternMatcher::priority(EntityType type) {
    switch (type) {
        case EntityType::Email:    return 3;
        case EntityType::IdNumber: return 2;
        case EntityType::Phone:    return 1;
        default:                   return 0;
    }
}

std::vector<EntitySpan> PatternMatcher::match(const std::string& text) const {
    std::vector<EntitySpan> spans;

    for (const auto& rule : rules_) {
        auto begin = std::sregex_iterator(text.begin(), text.end(), rule.re);
        for (auto it = begin; it != std::sregex_iterator(); ++it) {
            size_t start = static_cast<size_t>(it->position(0));
            size_t end = start + static_cast<size_t>(it->length(0));
            if (end == start) continue;

            if (rule.digit_bounded) {
                bool digit_before = start > 0 &&
                    (text::is_digit(text[start - 1]) || text[start - 1] == '+');
                bool digit_after = end < text.size() && text::is_digit(text[end]);
                if (digit_before || digit_after) continue;
            } else if (start > 0 && text::is_word_char(text[start - 1])) {
                // Glued to non-ASCII letters
                continue;
            }

            spans.push_back({text.substr(start, end - start), rule.type, start, end,
                             SpanSource::Pattern});
        }
    }
    return spans;
}

} // namespace kavach
