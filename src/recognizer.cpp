#include <kavach/recognizer.hpp>
#include <kavach/errors.hpp>
#include <kavach/text.hpp>

namespace kavach {

std::vector<RecognizedSpan> NullRecognizer::recognize(const std::string&) {
    throw DetectorUnavailable("No recognizer configured");
}

const std::unordered_set<std::string>& default_excluded_terms() {
    static const std::unordered_set<std::string> terms = {
        // Abbreviations and field names
        "ip", "ssn", "dob", "pan", "id", "aadhaar", "aadhar",
        "email", "phone", "mobile", "address", "name", "age",
        // Tech terms
        "ai", "ml", "api", "url", "http", "https", "www",
        "python", "java", "javascript", "code", "programming",
        // Greetings and courtesy
        "hello", "hi", "hey", "thanks", "thank", "please", "help",
        // Days and months
        "monday", "tuesday", "wednesday", "thursday", "friday", "saturday", "sunday",
        "january", "february", "march", "april", "may", "june",
        "july", "august", "september", "october", "november", "december",
        // Seasons and time words
        "summer", "winter", "spring", "fall", "autumn", "season", "seasons",
        "morning", "afternoon", "evening", "night", "today", "tomorrow", "yesterday",
        // Generic places and organisations
        "college", "school", "university", "company", "office", "home",
        "city", "state", "country", "place", "location",
        // Verbs and adjectives that look like entities in titles
        "related", "associated", "connected", "based", "located",
        // Generic nouns
        "fruits", "vegetables", "food", "drink", "water",
        "book", "movie", "song", "music", "art",
        // Question words
        "what", "when", "where", "who", "why", "how",
    };
    return terms;
}

Gazetteer Gazetteer::builtin() {
    Gazetteer g;
    g.first_names = {
        "John", "Jane", "Alice", "Bob", "Charlie", "David", "Emma",
        "James", "Mary", "Robert", "Patricia", "Michael", "Jennifer",
        "William", "Linda", "Richard", "Elizabeth", "Joseph", "Barbara",
        "Sarah", "Thomas", "Daniel", "Olivia", "Sophia", "Noah", "Liam",
        "Rahul", "Priya", "Amit", "Anita", "Raj", "Pooja", "Vikram",
        "Sneha", "Arjun", "Kavya", "Rohan", "Neha", "Arun", "Sanjay",
        "Aditya", "Ananya", "Karthik", "Divya", "Suresh", "Lakshmi",
    };
    g.companies = {
        "Google", "Microsoft", "Apple", "Amazon", "Facebook", "Meta",
        "Netflix", "Twitter", "LinkedIn", "Instagram", "WhatsApp",
        "TCS", "Infosys", "Wipro", "HCL", "Tech Mahindra", "Cognizant",
        "Accenture", "Deloitte", "KPMG", "PwC",
        "IBM", "Oracle", "SAP", "Salesforce", "Adobe", "Intel", "Nvidia",
        "Tesla", "SpaceX", "Uber", "Lyft", "Airbnb", "Stripe", "Shopify",
    };
    g.colleges = {
        "MIT", "Stanford", "Harvard", "Yale", "Princeton", "Columbia",
        "IIT", "IIM", "BITS", "NIT", "IIIT", "VIT", "SRM", "Manipal",
        "CBIT", "JNTU", "Osmania", "Anna University", "Delhi University",
        "Oxford", "Cambridge", "Berkeley", "UCLA", "Caltech",
    };
    g.places = {
        "India", "USA", "America", "England", "London", "Paris", "France",
        "Germany", "Berlin", "Japan", "Tokyo", "China", "Beijing", "Canada",
        "Toronto", "Australia", "Sydney", "Singapore", "Dubai",
        "New York", "San Francisco", "Seattle", "Boston", "Chicago",
        "Mumbai", "Delhi", "New Delhi", "Bangalore", "Bengaluru", "Hyderabad",
        "Chennai", "Pune", "Kolkata", "Ahmedabad", "Jaipur", "Kochi",
    };
    return g;
}

namespace {

// Words trimmed from either end of a run before it is labelled
const std::unordered_set<std::string>& run_stopwords() {
    static const std::unordered_set<std::string> words = {
        "a", "an", "the", "my", "our", "your", "his", "her", "their", "its",
        "i", "i'm", "im", "we", "you", "he", "she", "they", "it", "me",
        "hi", "hello", "hey", "dear", "thanks", "good", "ok", "okay", "yes", "no",
        "and", "but", "so", "or", "if", "then", "also",
        "is", "are", "was", "were", "be", "am", "this", "that", "these", "those",
        "can", "could", "would", "will", "should", "do", "does", "did",
        "tell", "let", "please", "meet",
        "in", "on", "at", "for", "from", "to", "with", "about", "of", "by",
        "mr", "mrs", "ms", "dr", "prof",
    };
    return words;
}

const std::vector<std::string>& org_suffixes() {
    static const std::vector<std::string> words = {
        "university", "college", "institute", "school", "academy",
        "inc", "ltd", "llc", "corp", "corporation", "company", "technologies",
        "labs", "systems", "solutions", "bank", "group", "foundation",
    };
    return words;
}

// Left-context cues, matched against the lowered words preceding a run
const std::vector<std::string>& person_cues() {
    static const std::vector<std::string> cues = {
        "name is", "i am", "i'm", "im", "called", "named", "this is", "meet",
        "hi", "hello", "hey", "dear", "mr", "mrs", "ms", "dr", "prof",
        "friend", "brother", "sister", "mother", "father", "wife", "husband",
    };
    return cues;
}

const std::vector<std::string>& org_cues() {
    static const std::vector<std::string> cues = {
        "work at", "working at", "works at", "worked at", "work for", "works for",
        "study at", "studying at", "studied at", "student at", "intern at",
        "joined", "employed at", "graduated from",
    };
    return cues;
}

const std::vector<std::string>& place_cues() {
    static const std::vector<std::string> cues = {
        "live in", "living in", "lives in", "lived in", "based in", "moved to",
        "born in", "from", "visiting", "visit", "travel to", "city of",
    };
    return cues;
}

bool is_capitalized(const std::string& word) {
    return !word.empty() && word[0] >= 'A' && word[0] <= 'Z';
}

// Only plain spaces, or an ampersand between spaces, keep a run going
bool joinable_gap(const std::string& gap) {
    if (gap.empty()) return false;
    std::string t = text::trim(gap);
    for (char c : gap) {
        if (c != ' ' && c != '\t' && c != '&') return false;
    }
    return t.empty() || t == "&";
}

bool starts_sentence(const std::string& text, const std::vector<text::Word>& words, size_t i) {
    if (i == 0) return true;
    for (size_t p = words[i - 1].end; p < words[i].start; ++p) {
        char c = text[p];
        if (c == '.' || c == '!' || c == '?' || c == '\n' || c == ':' || c == '"') return true;
    }
    return false;
}

bool ends_with_phrase(const std::string& context, const std::string& cue) {
    if (context.size() < cue.size()) return false;
    if (context.compare(context.size() - cue.size(), cue.size(), cue) != 0) return false;
    return context.size() == cue.size() || context[context.size() - cue.size() - 1] == ' ';
}

bool any_cue(const std::string& context, const std::vector<std::string>& cues) {
    for (const auto& cue : cues) {
        if (ends_with_phrase(context, cue)) return true;
    }
    return false;
}

} // namespace

GazetteerRecognizer::GazetteerRecognizer(Gazetteer gazetteer, float fuzzy_threshold)
    : fuzzy_threshold_(fuzzy_threshold) {
    for (const auto& n : gazetteer.first_names) first_names_.insert(text::to_lower(n));
    for (const auto& c : gazetteer.companies) entries_.push_back({text::to_lower(c), "ORG"});
    for (const auto& c : gazetteer.colleges) entries_.push_back({text::to_lower(c), "ORG"});
    for (const auto& p : gazetteer.places) entries_.push_back({text::to_lower(p), "GPE"});
}

const char* GazetteerRecognizer::lookup(const std::string& lowered, bool names) const {
    if (names) {
        if (first_names_.count(lowered)) return "PERSON";
    } else {
        for (const auto& e : entries_) {
            if (e.lowered == lowered) return e.label;
        }
    }

    // Fuzzy only for words long enough that one typo is not a different word
    if (lowered.size() < 5) return nullptr;

    const char* best = nullptr;
    float best_score = fuzzy_threshold_;
    if (names) {
        for (const auto& n : first_names_) {
            float score = text::similarity(lowered, n);
            if (score + 1e-6f >= best_score) { best_score = score; best = "PERSON"; }
        }
    } else {
        for (const auto& e : entries_) {
            if (e.lowered.size() < 5) continue;
            float score = text::similarity(lowered, e.lowered);
            if (score + 1e-6f >= best_score) { best_score = score; best = e.label; }
        }
    }
    return best;
}

std::vector<RecognizedSpan> GazetteerRecognizer::recognize(const std::string& input) {
    std::vector<RecognizedSpan> out;
    auto words = text::split_words(input);
    const auto& stop = run_stopwords();
    const auto& excluded = default_excluded_terms();

    size_t i = 0;
    while (i < words.size()) {
        if (!is_capitalized(words[i].text)) { ++i; continue; }

        // Extend the run of capitalized words
        size_t j = i + 1;
        while (j < words.size()) {
            std::string gap = input.substr(words[j - 1].end, words[j].start - words[j - 1].end);
            if (is_capitalized(words[j].text) && joinable_gap(gap)) { ++j; continue; }
            if (words[j].text == "of" && joinable_gap(gap) && j + 1 < words.size() &&
                is_capitalized(words[j + 1].text) &&
                joinable_gap(input.substr(words[j].end, words[j + 1].start - words[j].end))) {
                j += 2;
                continue;
            }
            break;
        }
        size_t run_end = j;

        // Trim function words and excluded words from the front, function words from the back
        size_t b = i;
        size_t e = j;
        while (b < e) {
            std::string w = text::to_lower(words[b].text);
            if (!stop.count(w) && !excluded.count(w)) break;
            ++b;
        }
        while (e > b && stop.count(text::to_lower(words[e - 1].text))) --e;
        i = run_end;
        if (b == e) continue;

        size_t start = words[b].start;
        size_t end = words[e - 1].end;
        std::string span = input.substr(start, end - start);
        std::string lowered = text::to_lower(span);

        bool all_excluded = true;
        for (size_t k = b; k < e; ++k) {
            if (!excluded.count(text::to_lower(words[k].text))) { all_excluded = false; break; }
        }
        if (all_excluded) continue;

        std::string context;
        for (size_t k = (b >= 3 ? b - 3 : 0); k < b; ++k) {
            if (!context.empty()) context += ' ';
            context += text::to_lower(words[k].text);
        }

        std::string first = text::to_lower(words[b].text);
        std::string last = text::to_lower(words[e - 1].text);
        size_t word_count = e - b;

        const char* label = lookup(lowered, false);
        if (!label && word_count > 1) {
            const char* head = lookup(first, false);
            if (head && std::string(head) == "ORG") label = head;
        }
        if (!label) {
            for (const auto& suffix : org_suffixes()) {
                if (word_count > 1 && (last == suffix || first == suffix)) { label = "ORG"; break; }
            }
        }
        if (!label) label = lookup(first, true);
        if (!label) {
            if (any_cue(context, person_cues())) label = "PERSON";
            else if (any_cue(context, org_cues())) label = "ORG";
            else if (any_cue(context, place_cues())) label = "GPE";
        }
        if (!label && word_count > 1 && !starts_sentence(input, words, b)) {
            label = "PERSON";
        }
        if (!label) continue;

        out.push_back({span, label, start, end});
    }
    return out;
}

} // namespace kavach
