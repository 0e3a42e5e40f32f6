#include <kavach/masking.hpp>
#include <kavach/errors.hpp>
#include <kavach/log.hpp>
#include <kavach/text.hpp>

#include <algorithm>

namespace kavach {

MaskingPipeline::MaskingPipeline(std::shared_ptr<EntityDetector> detector,
                                 std::shared_ptr<SessionVault> vault,
                                 int max_retries,
                                 size_t max_text_bytes)
    : detector_(std::move(detector)), vault_(std::move(vault)), max_retries_(max_retries),
      max_text_bytes_(max_text_bytes) {
    if (!detector_ || !vault_) {
        throw std::invalid_argument("MaskingPipeline requires a detector and a session vault");
    }
    if (max_retries_ < 1) max_retries_ = 1;
}

MaskResult MaskingPipeline::mask(const SessionId& session, const std::string& text,
                                 const std::atomic<bool>* cancel) {
    if (text.size() > max_text_bytes_) {
        throw TextTooLong(text.size(), max_text_bytes_);
    }

    MaskResult result;
    if (text::trim(text).empty()) {
        result.masked_text = text;
        return result;
    }

    DetectionResult detection = detector_->detect(text);
    result.degraded = detection.degraded;

    for (int attempt = 0; attempt < max_retries_; ++attempt) {
        auto stored = vault_->get(session);
        bool existed = stored.has_value();
        TokenRegistry registry = existed ? std::move(*stored) : TokenRegistry{};

        std::vector<std::string> tokens;
        tokens.reserve(detection.spans.size());
        result.used_tokens.clear();
        result.new_tokens.clear();
        result.breakdown.clear();

        for (const auto& span : detection.spans) {
            auto assigned = registry.assign(span.text, span.type);
            tokens.push_back(assigned.token);
            if (assigned.created) result.new_tokens.push_back(assigned.token);
            if (std::find(result.used_tokens.begin(), result.used_tokens.end(), assigned.token) ==
                result.used_tokens.end()) {
                result.used_tokens.push_back(assigned.token);
            }
            result.breakdown[entity_type_prefix(span.type)]++;
        }

        // Right to left so earlier offsets stay valid
        std::string masked = text;
        for (size_t k = detection.spans.size(); k-- > 0;) {
            const auto& span = detection.spans[k];
            masked.replace(span.start, span.length(), tokens[k]);
        }

        if (cancel && cancel->load()) {
            throw Cancelled();
        }

        if (!existed && registry.empty()) {
            result.masked_text = std::move(masked);
            return result;
        }

        if (vault_->put_if_unchanged(session, registry)) {
            result.masked_text = std::move(masked);
            log_debug("Masking", "session %s: %zu spans, %zu new tokens",
                      session.str().c_str(), detection.spans.size(), result.new_tokens.size());
            return result;
        }

        log_debug("Masking", "session %s: registry moved, retry %d",
                  session.str().c_str(), attempt + 1);
    }

    log_warn("Masking", "session %s: gave up after %d attempts", session.str().c_str(), max_retries_);
    throw VaultUnavailable("registry contention");
}

} // namespace kavach
