#include <kavach/sanitizer.hpp>
#include <kavach/errors.hpp>
#include <kavach/log.hpp>
#include <kavach/text.hpp>

#include <algorithm>
#include <regex>

namespace kavach {

namespace {

struct Interval {
    size_t start;
    size_t end;
};

// Intervals already claimed by tokens or earlier replacements
class Claims {
public:
    bool free(size_t start, size_t end) const {
        for (const auto& c : claimed_) {
            if (start < c.end && c.start < end) return false;
        }
        return true;
    }

    void add(size_t start, size_t end) { claimed_.push_back({start, end}); }

private:
    std::vector<Interval> claimed_;
};

bool word_bounded(const std::string& text, size_t start, size_t end) {
    bool left = start == 0 || !text::is_word_char(text[start - 1]) ||
                !text::is_word_char(text[start]);
    bool right = end >= text.size() || !text::is_word_char(text[end]) ||
                 !text::is_word_char(text[end - 1]);
    return left && right;
}

const std::regex& token_pattern() {
    static const std::regex re(R"(\[[A-Z]{1,16}_\d{1,9}\])");
    return re;
}

// 7 to 20 digits; at most two of " ().-" between neighbouring digits
const std::regex& digit_run_pattern() {
    static const std::regex re(R"(\+?\(?\d(?:[ ().-]{0,2}\d){6,19})");
    return re;
}

// End of `needle` matched at `pos` in `hay`, or npos. Each space in the
// needle matches one or more whitespace characters.
size_t match_spaced(const std::string& hay, size_t pos, const std::string& needle) {
    size_t i = pos;
    for (char c : needle) {
        if (c == ' ') {
            if (i >= hay.size() || !text::is_space(hay[i])) return std::string::npos;
            while (i < hay.size() && text::is_space(hay[i])) ++i;
        } else {
            if (i >= hay.size() || hay[i] != c) return std::string::npos;
            ++i;
        }
    }
    return i;
}

bool same_number(const std::string& a, const std::string& b) {
    if (a.size() < 7 || b.size() < 7) return false;
    if (a == b) return true;
    // Country code present on one side only
    const std::string& shorter = a.size() < b.size() ? a : b;
    const std::string& longer = a.size() < b.size() ? b : a;
    return shorter.size() >= 10 && longer.size() - shorter.size() <= 3 &&
           longer.compare(longer.size() - shorter.size(), shorter.size(), shorter) == 0;
}

} // namespace

SanitizeResult ResponseSanitizer::sanitize(const TokenRegistry& registry,
                                           const std::string& response) const {
    if (response.size() > max_text_bytes_) {
        throw TextTooLong(response.size(), max_text_bytes_);
    }

    SanitizeResult result;
    Claims claims;

    auto begin = std::sregex_iterator(response.begin(), response.end(), token_pattern());
    for (auto it = begin; it != std::sregex_iterator(); ++it) {
        size_t start = static_cast<size_t>(it->position(0));
        size_t end = start + static_cast<size_t>(it->length(0));
        claims.add(start, end);
        std::string token = it->str(0);
        if (!registry.find(token) &&
            std::find(result.unknown_tokens.begin(), result.unknown_tokens.end(), token) ==
                result.unknown_tokens.end()) {
            result.unknown_tokens.push_back(token);
        }
    }

    // Longest originals first so "Alice Smith" wins over "Alice"
    std::vector<std::pair<std::string, const TokenEntry*>> entries;
    for (const auto& [token, entry] : registry.entries()) entries.emplace_back(token, &entry);
    std::stable_sort(entries.begin(), entries.end(), [](const auto& a, const auto& b) {
        return a.second->original.size() > b.second->original.size();
    });

    const std::string lowered = text::to_lower(response);
    const auto words = text::split_words(response);

    std::vector<Leak> found;

    for (const auto& [token, entry] : entries) {
        const std::string needle = text::to_lower(text::collapse_spaces(entry->original));
        if (needle.empty()) continue;

        // Exact, case-insensitive, word-bounded
        size_t pos = lowered.find(needle[0]);
        while (pos != std::string::npos) {
            size_t end = match_spaced(lowered, pos, needle);
            if (end != std::string::npos && word_bounded(response, pos, end) &&
                claims.free(pos, end)) {
                claims.add(pos, end);
                found.push_back({token, entry->type, LeakKind::Exact, pos, end});
            }
            pos = lowered.find(needle[0], pos + 1);
        }

        // Same digits, any formatting
        if (entry->type == EntityType::Phone || entry->type == EntityType::IdNumber) {
            std::string digits = text::digits_only(entry->original);
            auto dbegin = std::sregex_iterator(response.begin(), response.end(), digit_run_pattern());
            for (auto it = dbegin; it != std::sregex_iterator(); ++it) {
                size_t start = static_cast<size_t>(it->position(0));
                size_t end = start + static_cast<size_t>(it->length(0));
                if (start > 0 && text::is_digit(response[start - 1])) continue;
                if (end < response.size() && text::is_digit(response[end])) continue;
                if (!same_number(text::digits_only(it->str(0)), digits)) continue;
                if (!claims.free(start, end)) continue;
                claims.add(start, end);
                found.push_back({token, entry->type, LeakKind::Digits, start, end});
            }
        }

        // Near misses over windows with the same word count
        if (policy_.mode == LeakMatchMode::Fuzzy && is_name_like(entry->type) &&
            entry->original.size() >= policy_.min_fuzzy_length) {
            size_t n = text::split_words(entry->original).size();
            if (n == 0 || n > words.size()) continue;
            std::string target = text::to_lower(text::collapse_spaces(entry->original));

            for (size_t w = 0; w + n <= words.size(); ++w) {
                size_t start = words[w].start;
                size_t end = words[w + n - 1].end;
                if (!claims.free(start, end)) continue;
                if (response[start] < 'A' || response[start] > 'Z') continue;

                std::string window = text::to_lower(
                    text::collapse_spaces(response.substr(start, end - start)));
                if (window == target) {
                    claims.add(start, end);
                    found.push_back({token, entry->type, LeakKind::Exact, start, end});
                    continue;
                }
                if (text::levenshtein(window, target) > policy_.max_edit_distance) continue;
                if (text::similarity(window, target) + 1e-6f < policy_.min_similarity) continue;

                claims.add(start, end);
                found.push_back({token, entry->type, LeakKind::Fuzzy, start, end});
            }
        }
    }

    std::sort(found.begin(), found.end(),
              [](const Leak& a, const Leak& b) { return a.start < b.start; });

    std::string out = response;
    for (size_t k = found.size(); k-- > 0;) {
        out.replace(found[k].start, found[k].end - found[k].start, found[k].token);
    }
    result.text = std::move(out);
    result.leaks = std::move(found);

    if (!result.leaks.empty()) {
        std::string summary;
        for (const auto& [type, count] : result.leaks_by_type()) {
            if (!summary.empty()) summary += ", ";
            summary += type + "=" + std::to_string(count);
        }
        log_warn("Sanitizer", "rewrote %zu leaked values (%s)", result.leaks.size(), summary.c_str());
    }
    if (!result.unknown_tokens.empty()) {
        log_debug("Sanitizer", "%zu unknown tokens in response", result.unknown_tokens.size());
    }
    return result;
}

} // namespace kavach
