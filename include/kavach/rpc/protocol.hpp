#pragma once
// RPC Protocol: JSON-RPC 2.0 helpers and error codes
//
// Newline-delimited JSON-RPC 2.0 as spoken by kavachd. Each kavach::Error
// code has its own error number so a caller can tell a user-correctable
// refusal (consent, empty profile) from a fatal one (vault down).

#include "../errors.hpp"
#include <nlohmann/json.hpp>
#include <cstring>
#include <optional>
#include <string>

namespace kavach::rpc {

using json = nlohmann::json;

// Replace invalid UTF-8 sequences with U+FFFD so json::dump cannot throw
// on text a model produced
inline std::string sanitize_utf8(const std::string& input) {
    static const char replacement[] = "\xEF\xBF\xBD";
    std::string output;
    output.reserve(input.size());

    size_t i = 0;
    while (i < input.size()) {
        unsigned char lead = static_cast<unsigned char>(input[i]);
        size_t len = lead < 0x80 ? 1
                   : (lead & 0xE0) == 0xC0 ? 2
                   : (lead & 0xF0) == 0xE0 ? 3
                   : (lead & 0xF8) == 0xF0 ? 4
                   : 0;

        bool valid = len > 0 && i + len <= input.size();
        for (size_t k = 1; valid && k < len; ++k) {
            valid = (static_cast<unsigned char>(input[i + k]) & 0xC0) == 0x80;
        }

        if (valid) {
            output.append(input, i, len);
            i += len;
        } else {
            output += replacement;
            ++i;
        }
    }
    return output;
}

namespace error {
    constexpr int PARSE_ERROR = -32700;
    constexpr int INVALID_REQUEST = -32600;
    constexpr int METHOD_NOT_FOUND = -32601;
    constexpr int INVALID_PARAMS = -32602;
    constexpr int INTERNAL_ERROR = -32603;
    constexpr int TOOL_NOT_FOUND = -32001;
    constexpr int TOOL_EXECUTION_ERROR = -32002;
    // Privacy core errors
    constexpr int VAULT_UNAVAILABLE = -32010;
    constexpr int CONSENT_REQUIRED = -32011;
    constexpr int EMPTY_PROFILE = -32012;
    constexpr int DECRYPTION_FAILURE = -32013;
    constexpr int DETECTOR_UNAVAILABLE = -32014;
    constexpr int CANCELLED = -32015;
    constexpr int CONFIG_ERROR = -32016;
    constexpr int TEXT_TOO_LONG = -32017;
}

// JSON-RPC error number for a kavach::Error code string
inline int error_number(const char* code) {
    struct Entry { const char* code; int number; };
    static const Entry table[] = {
        {"VAULT_UNAVAILABLE", error::VAULT_UNAVAILABLE},
        {"CONSENT_REQUIRED", error::CONSENT_REQUIRED},
        {"EMPTY_PROFILE", error::EMPTY_PROFILE},
        {"DECRYPTION_FAILURE", error::DECRYPTION_FAILURE},
        {"DETECTOR_UNAVAILABLE", error::DETECTOR_UNAVAILABLE},
        {"CANCELLED", error::CANCELLED},
        {"CONFIG_ERROR", error::CONFIG_ERROR},
        {"TEXT_TOO_LONG", error::TEXT_TOO_LONG},
    };
    for (const auto& e : table) {
        if (std::strcmp(e.code, code) == 0) return e.number;
    }
    return error::INTERNAL_ERROR;
}

inline json envelope(const json& id) {
    return {{"jsonrpc", "2.0"}, {"id", id}};
}

inline json make_result(const json& id, const json& result) {
    json response = envelope(id);
    response["result"] = result;
    return response;
}

inline json make_error(const json& id, int code, const std::string& message) {
    json response = envelope(id);
    response["error"] = {{"code", code}, {"message", message}};
    return response;
}

// Error response carrying the stable kavach error code in `data`
inline json make_error(const json& id, const Error& err) {
    json response = make_error(id, error_number(err.code()), err.what());
    response["error"]["data"] = {{"code", err.code()}};
    return response;
}

// tools/call result: one text block, the error flag, and the structured payload
inline json make_tool_response(const std::string& text, bool is_error = false,
                               const json& structured = json()) {
    json response = {
        {"content", json::array({{{"type", "text"}, {"text", sanitize_utf8(text)}}})},
        {"isError", is_error}
    };
    if (!structured.is_null()) response["structured"] = structured;
    return response;
}

struct RequestInfo {
    std::string method;
    json params;
    json id;
};

// Checks the envelope; params must be an object when present
inline std::optional<RequestInfo> parse_request(const json& request, std::string& error_msg) {
    if (!request.is_object() || request.value("jsonrpc", json()) != "2.0") {
        error_msg = "Missing or invalid jsonrpc version";
        return std::nullopt;
    }
    if (!request.contains("method") || !request["method"].is_string()) {
        error_msg = "Missing or invalid method";
        return std::nullopt;
    }
    json params = request.value("params", json::object());
    if (!params.is_object()) {
        error_msg = "params must be an object";
        return std::nullopt;
    }
    return RequestInfo{request["method"].get<std::string>(), std::move(params),
                       request.value("id", json())};
}

} // namespace kavach::rpc
