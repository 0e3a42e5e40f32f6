#pragma once
// Entity Detector: recognizer + patterns, merged and filtered
//
// Candidates from both sources are filtered (allow-list, excluded terms,
// capitalization, length), then merged so the output is ordered and
// non-overlapping. A pattern match always beats a recognizer span it
// overlaps. A failing recognizer degrades detection to patterns only.

#include "patterns.hpp"
#include "recognizer.hpp"
#include "types.hpp"
#include <memory>
#include <set>
#include <string>
#include <unordered_set>
#include <vector>

namespace kavach {

struct DetectorOptions {
    std::set<EntityType> allowed = {
        EntityType::Person, EntityType::Org, EntityType::Location,
        EntityType::Email, EntityType::Phone
    };
    std::vector<std::string> extra_excluded;
};

struct DetectionResult {
    std::vector<EntitySpan> spans;
    bool degraded = false;
};

class EntityDetector {
public:
    // recognizer may be null: patterns only, never degraded
    explicit EntityDetector(std::shared_ptr<Recognizer> recognizer,
                            DetectorOptions options = {});

    DetectionResult detect(const std::string& text) const;

    // True if a name-like span is too generic to be an entity
    bool is_excluded(const std::string& span_text) const;

    bool allows(EntityType type) const { return options_.allowed.count(type) > 0; }

private:
    std::shared_ptr<Recognizer> recognizer_;
    DetectorOptions options_;
    PatternMatcher patterns_;
    std::unordered_set<std::string> excluded_;

    bool accept(const EntitySpan& span) const;
};

// Order-preserving, non-overlapping selection from overlapping candidates
std::vector<EntitySpan> merge_spans(std::vector<EntitySpan> candidates);

} // namespace kavach
