#include <kavach/detector.hpp>
#include <kavach/errors.hpp>
#include <kavach/log.hpp>
#include <kavach/text.hpp>

#include <algorithm>

namespace kavach {

namespace {

// Higher ranks first: pattern over recognizer, then longer, then type priority
bool outranks(const EntitySpan& a, const EntitySpan& b) {
    if (a.source != b.source) return a.source == SpanSource::Pattern;
    if (a.length() != b.length()) return a.length() > b.length();
    int pa = PatternMatcher::priority(a.type);
    int pb = PatternMatcher::priority(b.type);
    if (pa != pb) return pa > pb;
    return a.start < b.start;
}

} // namespace

std::vector<EntitySpan> merge_spans(std::vector<EntitySpan> candidates) {
    std::sort(candidates.begin(), candidates.end(), outranks);

    std::vector<EntitySpan> kept;
    for (auto& c : candidates) {
        bool clash = std::any_of(kept.begin(), kept.end(),
                                 [&](const EntitySpan& k) { return k.overlaps(c); });
        if (!clash) kept.push_back(std::move(c));
    }

    std::sort(kept.begin(), kept.end(),
              [](const EntitySpan& a, const EntitySpan& b) { return a.start < b.start; });
    return kept;
}

EntityDetector::EntityDetector(std::shared_ptr<Recognizer> recognizer, DetectorOptions options)
    : recognizer_(std::move(recognizer)),
      options_(std::move(options)),
      excluded_(default_excluded_terms()) {
    for (const auto& term : options_.extra_excluded) {
        excluded_.insert(text::to_lower(text::trim(term)));
    }
}

bool EntityDetector::is_excluded(const std::string& span_text) const {
    std::string lowered = text::to_lower(text::collapse_spaces(span_text));
    if (excluded_.count(lowered)) return true;

    auto words = text::split_words(lowered);
    if (words.empty()) return true;
    return std::all_of(words.begin(), words.end(),
                       [&](const text::Word& w) { return excluded_.count(w.text) > 0; });
}

bool EntityDetector::accept(const EntitySpan& span) const {
    if (!allows(span.type)) return false;
    if (text::trim(span.text).size() < 2) return false;

    if (is_name_like(span.type)) {
        unsigned char first = static_cast<unsigned char>(span.text[0]);
        if (!(first >= 'A' && first <= 'Z')) return false;
        if (is_excluded(span.text)) return false;
    }
    return true;
}

DetectionResult EntityDetector::detect(const std::string& text) const {
    DetectionResult result;
    if (text::trim(text).empty()) return result;

    std::vector<EntitySpan> candidates;

    if (recognizer_) {
        try {
            for (const auto& r : recognizer_->recognize(text)) {
                if (r.start >= r.end || r.end > text.size()) continue;
                auto type = entity_type_from_label(r.label);
                if (!type) continue;

                EntitySpan span{text.substr(r.start, r.end - r.start), *type,
                                r.start, r.end, SpanSource::Recognizer};
                if (accept(span)) candidates.push_back(std::move(span));
            }
        } catch (const std::exception& e) {
            log_warn("Detector", "recognizer %s unavailable, using patterns only: %s",
                     recognizer_->name(), e.what());
            result.degraded = true;
        }
    }

    for (auto& span : patterns_.match(text)) {
        if (accept(span)) candidates.push_back(std::move(span));
    }

    result.spans = merge_spans(std::move(candidates));
    log_debug("Detector", "%zu spans%s", result.spans.size(), result.degraded ? " (degraded)" : "");
    return result;
}

} // namespace kavach
