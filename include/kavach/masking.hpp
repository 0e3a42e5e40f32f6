#pragma once
// Masking Pipeline: detect -> tokenize -> replace -> persist
//
// Detection runs once per call. Tokenization and the write are retried
// against the latest stored registry whenever another writer commits first,
// so concurrent turns on one session never hand out the same number twice.

#include "detector.hpp"
#include "session_vault.hpp"
#include "types.hpp"
#include <atomic>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace kavach {

struct MaskResult {
    std::string masked_text;
    std::vector<std::string> used_tokens;    // distinct, in order of first use
    std::vector<std::string> new_tokens;     // allocated by this call
    std::map<std::string, size_t> breakdown; // type prefix -> occurrences
    bool degraded = false;
};

class MaskingPipeline {
public:
    static constexpr int DEFAULT_MAX_RETRIES = 8;

    MaskingPipeline(std::shared_ptr<EntityDetector> detector,
                    std::shared_ptr<SessionVault> vault,
                    int max_retries = DEFAULT_MAX_RETRIES,
                    size_t max_text_bytes = DEFAULT_MAX_TEXT_BYTES);

    // Throws VaultUnavailable (store down, or contention past max_retries),
    // Cancelled (flag set before commit; nothing written) and TextTooLong
    MaskResult mask(const SessionId& session, const std::string& text,
                    const std::atomic<bool>* cancel = nullptr);

private:
    std::shared_ptr<EntityDetector> detector_;
    std::shared_ptr<SessionVault> vault_;
    int max_retries_;
    size_t max_text_bytes_;
};

} // namespace kavach
