#pragma once
// Prompt Shield: keep the model from being talked into decoding tokens
//
// - Hardened system prompt telling the model tokens are opaque
// - Blocked phrases and decode-request patterns in user input

#include <regex>
#include <string>
#include <vector>

namespace kavach {

struct ShieldVerdict {
    bool blocked = false;
    std::string matched;
};

class PromptShield {
public:
    PromptShield();

    // Case-insensitive scan of the user's (already masked) text
    ShieldVerdict inspect(const std::string& text) const;

    const std::string& system_prompt() const;
    const std::string& blocked_response() const;

private:
    std::vector<std::string> phrases_;
    std::vector<std::regex> suspicious_;
};

} // namespace kavach
