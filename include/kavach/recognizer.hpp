#pragma once
// Recognizers: pluggable named-entity recognition
//
// A recognizer labels proper-noun spans with free-form labels (PERSON, ORG,
// GPE, ...). The detector maps labels onto the closed entity set and drops
// the rest. recognize() may throw DetectorUnavailable; the detector then
// falls back to patterns only.

#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

namespace kavach {

struct RecognizedSpan {
    std::string text;
    std::string label;
    size_t start = 0;
    size_t end = 0;
};

class Recognizer {
public:
    virtual ~Recognizer() = default;
    virtual std::vector<RecognizedSpan> recognize(const std::string& text) = 0;
    virtual const char* name() const = 0;
};

// Pattern-only deployments: every call reports the recognizer as unavailable
class NullRecognizer : public Recognizer {
public:
    std::vector<RecognizedSpan> recognize(const std::string& text) override;
    const char* name() const override { return "null"; }
};

// Lowercase words that are never an entity on their own
const std::unordered_set<std::string>& default_excluded_terms();

struct Gazetteer {
    std::vector<std::string> first_names;
    std::vector<std::string> companies;
    std::vector<std::string> colleges;
    std::vector<std::string> places;

    static Gazetteer builtin();
};

// Local heuristic recognizer
//
// Finds runs of capitalized words (joined by spaces, "of" or "&") and labels
// them from, in order: gazetteer lookup (exact, then fuzzy), organisation
// suffixes, known first names, left-context cues ("my name is", "work at",
// "live in"), and finally the shape of the run. A lone unknown capitalized
// word with no cue is not reported.
class GazetteerRecognizer : public Recognizer {
public:
    explicit GazetteerRecognizer(Gazetteer gazetteer = Gazetteer::builtin(),
                                 float fuzzy_threshold = 0.8f);

    std::vector<RecognizedSpan> recognize(const std::string& text) override;
    const char* name() const override { return "gazetteer"; }

private:
    struct Entry {
        std::string lowered;
        const char* label;
    };

    std::vector<Entry> entries_;
    std::unordered_set<std::string> first_names_;
    float fuzzy_threshold_;

    // Label of the best gazetteer match for a lowered phrase, or nullptr
    const char* lookup(const std::string& lowered, bool names) const;
};

} // namespace kavach
