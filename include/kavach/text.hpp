#pragma once
// Text helpers: case folding, value normalization, edit distance
//
// Normalization decides when two mentions are "the same value" for the
// registry's reverse index. Edit distance drives both the fuzzy gazetteer
// lookup and fuzzy leak matching.

#include "types.hpp"
#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

namespace kavach::text {

inline std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

inline bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

inline bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

inline bool is_word_char(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    return std::isalnum(u) || c == '_' || u >= 0x80;
}

inline std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && is_space(s[b])) ++b;
    while (e > b && is_space(s[e - 1])) --e;
    return s.substr(b, e - b);
}

// Trim and collapse inner whitespace runs to one space
inline std::string collapse_spaces(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool pending = false;
    for (char c : s) {
        if (is_space(c)) {
            pending = !out.empty();
            continue;
        }
        if (pending) out += ' ';
        pending = false;
        out += c;
    }
    return out;
}

inline std::string digits_only(const std::string& s) {
    std::string out;
    for (char c : s) {
        if (is_digit(c)) out += c;
    }
    return out;
}

// Registry key for a value: trimmed, collapsed, ASCII case-folded.
// Phones also drop separators so "+1 555-010-9999" and "+15550109999" agree.
inline std::string normalize_value(const std::string& value, EntityType type) {
    std::string norm = to_lower(collapse_spaces(value));
    if (type == EntityType::Phone) {
        std::string compact;
        for (char c : norm) {
            if (is_digit(c) || c == '+') compact += c;
        }
        return compact;
    }
    return norm;
}

// Two-row Levenshtein distance
inline size_t levenshtein(const std::string& s1, const std::string& s2) {
    const size_t m = s1.length();
    const size_t n = s2.length();

    if (m == 0) return n;
    if (n == 0) return m;

    std::vector<size_t> prev_row(n + 1);
    std::vector<size_t> curr_row(n + 1);

    for (size_t j = 0; j <= n; j++) {
        prev_row[j] = j;
    }

    for (size_t i = 1; i <= m; i++) {
        curr_row[0] = i;

        for (size_t j = 1; j <= n; j++) {
            size_t cost = (s1[i - 1] == s2[j - 1]) ? 0 : 1;

            curr_row[j] = std::min({
                prev_row[j] + 1,        // deletion
                curr_row[j - 1] + 1,    // insertion
                prev_row[j - 1] + cost  // substitution
            });
        }

        std::swap(prev_row, curr_row);
    }

    return prev_row[n];
}

// 1 - distance / longer length, case-insensitive
inline float similarity(const std::string& a, const std::string& b) {
    std::string s1 = to_lower(a);
    std::string s2 = to_lower(b);

    if (s1.empty() && s2.empty()) return 1.0f;
    if (s1.empty() || s2.empty()) return 0.0f;

    size_t distance = levenshtein(s1, s2);
    size_t max_len = std::max(s1.length(), s2.length());
    return 1.0f - static_cast<float>(distance) / static_cast<float>(max_len);
}

// Split into words, keeping byte offsets
struct Word {
    std::string text;
    size_t start;
    size_t end;
};

inline std::vector<Word> split_words(const std::string& s) {
    std::vector<Word> words;
    size_t i = 0;
    while (i < s.size()) {
        while (i < s.size() && !is_word_char(s[i])) ++i;
        size_t b = i;
        while (i < s.size() && (is_word_char(s[i]) || ((s[i] == '\'' || s[i] == '-' || s[i] == '.') &&
                                 i + 1 < s.size() && is_word_char(s[i + 1]) && i > b))) {
            ++i;
        }
        if (i > b) words.push_back({s.substr(b, i - b), b, i});
    }
    return words;
}

} // namespace kavach::text
