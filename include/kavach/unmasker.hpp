#pragma once
// Unmasker: tokens back to real values, for display only
//
// One left-to-right scan. A replaced value is never rescanned, so a real
// value that happens to look like a token cannot trigger a second
// substitution. Unknown tokens are left as they are.

#include "registry.hpp"
#include <string>

namespace kavach {

struct UnmaskResult {
    std::string text;
    size_t replaced = 0;
};

inline UnmaskResult unmask(const TokenRegistry& registry, const std::string& input) {
    UnmaskResult result;
    result.text.reserve(input.size());

    size_t i = 0;
    while (i < input.size()) {
        if (input[i] == '[') {
            size_t close = input.find(']', i + 1);
            if (close != std::string::npos) {
                std::string candidate = input.substr(i, close - i + 1);
                if (const TokenEntry* entry = registry.find(candidate)) {
                    result.text += entry->original;
                    ++result.replaced;
                    i = close + 1;
                    continue;
                }
            }
        }
        result.text += input[i];
        ++i;
    }
    return result;
}

} // namespace kavach
