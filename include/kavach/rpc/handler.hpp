#pragma once
// RPC Handler: JSON-RPC front for the privacy core
//
// Speaks the same shape as an MCP tool server (initialize, tools/list,
// tools/call, shutdown) and additionally accepts each tool name as a plain
// method whose params are the tool arguments.

#include "protocol.hpp"
#include "../core.hpp"
#include "../version.hpp"
#include <chrono>
#include <functional>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

namespace kavach::rpc {

using json = nlohmann::json;

struct ToolSchema {
    std::string name;
    std::string description;
    json input_schema;
};

struct ToolResult {
    bool is_error = false;
    std::string content;      // Human-readable text response
    json structured;          // Structured JSON data

    static ToolResult ok(const std::string& text, const json& data = json()) {
        return {false, text, data};
    }

    static ToolResult error(const std::string& message) {
        return {true, message, json()};
    }
};

using ToolHandler = std::function<ToolResult(const json&)>;

// Returns empty string if all required params present, otherwise error message
inline std::string validate_required(const json& params, std::initializer_list<const char*> required) {
    for (const char* key : required) {
        if (!params.contains(key)) {
            return std::string("Missing required parameter: ") + key;
        }
    }
    return "";
}

// Parameter with default; a value of the wrong type also yields the default
template<typename T>
inline T get_param(const json& params, const char* key, T default_val) {
    if (params.contains(key)) {
        try {
            return params[key].get<T>();
        } catch (const json::type_error&) {
            return default_val;
        }
    }
    return default_val;
}

inline std::optional<bool> get_flag(const json& params, const char* key) {
    if (!params.contains(key) || !params[key].is_boolean()) return std::nullopt;
    return params[key].get<bool>();
}

inline std::optional<std::string> get_text(const json& params, const char* key) {
    if (!params.contains(key) || !params[key].is_string()) return std::nullopt;
    return params[key].get<std::string>();
}

class Handler {
public:
    explicit Handler(Kavach* core)
        : core_(core), start_time_(std::chrono::steady_clock::now()) {
        register_session_tools();
        register_profile_tools();
        register_misc_tools();
    }

    // Process a JSON-RPC request string, return response string
    std::string handle(const std::string& request_str) {
        try {
            auto request = json::parse(request_str);
            auto response = handle_request(request);
            try {
                return response.dump();
            } catch (const json::type_error&) {
                return response.dump(-1, ' ', false, json::error_handler_t::replace);
            }
        } catch (const json::parse_error& e) {
            return make_error(json(), error::PARSE_ERROR,
                              std::string("JSON parse error: ") + e.what()).dump();
        } catch (const std::exception& e) {
            return make_error(json(), error::INTERNAL_ERROR,
                              std::string("Internal error: ") + e.what()).dump();
        }
    }

    json handle_request(const json& request) {
        std::string error_msg;
        auto parsed = parse_request(request, error_msg);
        if (!parsed) {
            json id = request.is_object() ? request.value("id", json()) : json();
            return make_error(id, error::INVALID_REQUEST, error_msg);
        }
        const RequestInfo& info = *parsed;

        if (info.method == "initialize") {
            return handle_initialize(info.params, info.id);
        } else if (info.method == "tools/list") {
            return handle_tools_list(info.id);
        } else if (info.method == "tools/call") {
            return handle_tools_call(info.params, info.id);
        } else if (info.method == "shutdown") {
            shutdown_requested_ = true;
            return make_result(info.id, {{"status", "ok"}});
        }

        auto it = handlers_.find(info.method);
        if (it == handlers_.end()) {
            return make_error(info.id, error::METHOD_NOT_FOUND, "Unknown method: " + info.method);
        }
        return invoke(info.id, it->second, info.params, false);
    }

    const std::vector<ToolSchema>& tools() const { return tools_; }
    bool shutdown_requested() const { return shutdown_requested_; }

private:
    Kavach* core_;
    std::chrono::steady_clock::time_point start_time_;
    std::vector<ToolSchema> tools_;
    std::unordered_map<std::string, ToolHandler> handlers_;
    bool shutdown_requested_ = false;

    // A client may announce the kavach protocol it speaks; a mismatch is refused
    json handle_initialize(const json& params, const json& id) {
        if (params.contains("kavachProtocol") && params["kavachProtocol"].is_object()) {
            const json& p = params["kavachProtocol"];
            auto part = [&p](const char* key) {
                return p.contains(key) && p[key].is_number_integer() ? p[key].get<int>() : -1;
            };
            int major = part("major");
            int minor = part("minor");
            if (!version::protocol_compatible(major, minor)) {
                return make_error(id, error::INVALID_REQUEST,
                                  "Unsupported protocol " + std::to_string(major) + "." +
                                  std::to_string(minor));
            }
        }
        return make_result(id, {
            {"protocolVersion", "2024-11-05"},
            {"serverInfo", {
                {"name", "kavach"},
                {"version", KAVACH_VERSION}
            }},
            {"capabilities", {{"tools", {{"listChanged", false}}}}}
        });
    }

    json handle_tools_list(const json& id) {
        json tools_array = json::array();
        for (const auto& tool : tools_) {
            tools_array.push_back({
                {"name", tool.name},
                {"description", tool.description},
                {"inputSchema", tool.input_schema}
            });
        }
        return make_result(id, {{"tools", tools_array}});
    }

    json handle_tools_call(const json& params, const json& id) {
        if (!params.contains("name") || !params["name"].is_string()) {
            return make_error(id, error::INVALID_PARAMS, "Missing tool name");
        }

        std::string name = params["name"];
        json arguments = params.value("arguments", json::object());

        auto it = handlers_.find(name);
        if (it == handlers_.end()) {
            return make_error(id, error::TOOL_NOT_FOUND, "Unknown tool: " + name);
        }
        return invoke(id, it->second, arguments, true);
    }

    // Run a tool and map its failure onto a JSON-RPC error
    json invoke(const json& id, const ToolHandler& handler, const json& args, bool tool_shape) {
        try {
            ToolResult result = handler(args);
            if (tool_shape) {
                return make_result(id, make_tool_response(result.content, result.is_error, result.structured));
            }
            if (result.is_error) {
                return make_error(id, error::INVALID_PARAMS, result.content);
            }
            return make_result(id, result.structured.is_null() ? json(result.content) : result.structured);
        } catch (const Error& e) {
            return make_error(id, e);
        } catch (const std::invalid_argument& e) {
            return make_error(id, error::INVALID_PARAMS, e.what());
        } catch (const json::exception& e) {
            return make_error(id, error::INVALID_PARAMS, std::string("Bad parameter: ") + e.what());
        } catch (const std::exception& e) {
            return make_error(id, error::TOOL_EXECUTION_ERROR,
                              std::string("Tool execution failed: ") + e.what());
        }
    }

    static json string_schema(const char* description) {
        return {{"type", "string"}, {"description", description}};
    }

    static json bool_schema(const char* description) {
        return {{"type", "boolean"}, {"description", description}};
    }

    static Profile profile_param(const json& p) {
        return Profile{get_text(p, "name"), get_text(p, "college"), get_text(p, "email")};
    }

    static Consent consent_param(const json& p) {
        return Consent{get_param<bool>(p, "remember_me", false),
                       get_param<bool>(p, "sync_across_devices", false)};
    }

    // ═══════════════════════════════════════════════════════════════════
    // Session tools: mask, sanitize_and_unmask, unmask, ensure_seeded, masked_summary
    // ═══════════════════════════════════════════════════════════════════

    void register_session_tools() {
        tools_.push_back({
            "mask",
            "Replace identifying values in user text with session tokens.",
            {
                {"type", "object"},
                {"properties", {
                    {"session_id", string_schema("Conversation scope")},
                    {"text", string_schema("Raw user text")}
                }},
                {"required", {"session_id", "text"}}
            }
        });
        handlers_["mask"] = [this](const json& p) { return tool_mask(p); };

        tools_.push_back({
            "sanitize_and_unmask",
            "Rewrite leaked real values in a model response to tokens, then render it for display.",
            {
                {"type", "object"},
                {"properties", {
                    {"session_id", string_schema("Conversation scope")},
                    {"response", string_schema("Raw model response")}
                }},
                {"required", {"session_id", "response"}}
            }
        });
        handlers_["sanitize_and_unmask"] = [this](const json& p) { return tool_sanitize_and_unmask(p); };

        tools_.push_back({
            "unmask",
            "Replace known tokens with real values, for display only.",
            {
                {"type", "object"},
                {"properties", {
                    {"session_id", string_schema("Conversation scope")},
                    {"text", string_schema("Tokenized text")}
                }},
                {"required", {"session_id", "text"}}
            }
        });
        handlers_["unmask"] = [this](const json& p) { return tool_unmask(p); };

        tools_.push_back({
            "ensure_seeded",
            "Recreate an empty session from the user's stored profile, if consent allows.",
            {
                {"type", "object"},
                {"properties", {
                    {"session_id", string_schema("Conversation scope")},
                    {"user_id", string_schema("Authenticated user")}
                }},
                {"required", {"session_id", "user_id"}}
            }
        });
        handlers_["ensure_seeded"] = [this](const json& p) { return tool_ensure_seeded(p); };

        tools_.push_back({
            "masked_summary",
            "List the session's tokens with their values blotted out.",
            {
                {"type", "object"},
                {"properties", {{"session_id", string_schema("Conversation scope")}}},
                {"required", {"session_id"}}
            }
        });
        handlers_["masked_summary"] = [this](const json& p) { return tool_masked_summary(p); };
    }

    ToolResult tool_mask(const json& params) {
        std::string err = validate_required(params, {"session_id", "text"});
        if (!err.empty()) return ToolResult::error(err);

        SessionId session(params["session_id"].get<std::string>());
        MaskResult r = core_->mask(session, params["text"].get<std::string>());

        json breakdown = json::object();
        for (const auto& [type, count] : r.breakdown) breakdown[type] = count;

        json result = {
            {"masked_text", r.masked_text},
            {"used_tokens", r.used_tokens},
            {"new_tokens", r.new_tokens},
            {"breakdown", breakdown},
            {"degraded", r.degraded}
        };
        return ToolResult::ok(r.masked_text, result);
    }

    ToolResult tool_sanitize_and_unmask(const json& params) {
        std::string err = validate_required(params, {"session_id", "response"});
        if (!err.empty()) return ToolResult::error(err);

        SessionId session(params["session_id"].get<std::string>());
        DisplayResult r = core_->sanitize_and_unmask(session, params["response"].get<std::string>());

        json by_type = json::object();
        for (const auto& leak : r.leaks) {
            by_type[entity_type_prefix(leak.type)] = by_type.value(entity_type_prefix(leak.type), 0) + 1;
        }

        json result = {
            {"sanitized", sanitize_utf8(r.sanitized)},
            {"display", sanitize_utf8(r.display)},
            {"leaks", r.leaks.size()},
            {"leaks_by_type", by_type},
            {"unknown_tokens", r.unknown_tokens},
            {"replaced", r.replaced}
        };
        return ToolResult::ok(r.display, result);
    }

    ToolResult tool_unmask(const json& params) {
        std::string err = validate_required(params, {"session_id", "text"});
        if (!err.empty()) return ToolResult::error(err);

        SessionId session(params["session_id"].get<std::string>());
        UnmaskResult r = core_->unmask(session, params["text"].get<std::string>());
        return ToolResult::ok(r.text, {{"text", sanitize_utf8(r.text)}, {"replaced", r.replaced}});
    }

    ToolResult tool_ensure_seeded(const json& params) {
        std::string err = validate_required(params, {"session_id", "user_id"});
        if (!err.empty()) return ToolResult::error(err);

        SessionId session(params["session_id"].get<std::string>());
        UserId user(params["user_id"].get<std::string>());
        SeedResult r = core_->ensure_seeded(session, user);

        json result = {
            {"outcome", seed_outcome_name(r.outcome)},
            {"token_count", r.token_count}
        };
        return ToolResult::ok(std::string("Session ") + seed_outcome_name(r.outcome), result);
    }

    ToolResult tool_masked_summary(const json& params) {
        std::string err = validate_required(params, {"session_id"});
        if (!err.empty()) return ToolResult::error(err);

        SessionId session(params["session_id"].get<std::string>());
        json tokens = core_->masked_summary(session);

        std::ostringstream ss;
        for (const auto& t : tokens) {
            ss << t["token"].get<std::string>() << " " << t["masked"].get<std::string>() << "\n";
        }
        return ToolResult::ok(ss.str(), {{"tokens", tokens}, {"count", tokens.size()}});
    }

    // ═══════════════════════════════════════════════════════════════════
    // Profile tools: save_profile, delete_profile, update_consent, profile_meta
    // ═══════════════════════════════════════════════════════════════════

    void register_profile_tools() {
        tools_.push_back({
            "save_profile",
            "Store the user's single encrypted profile (name, college, email). Requires consent. "
            "With from_session, fields are taken from that session and explicit fields override.",
            {
                {"type", "object"},
                {"properties", {
                    {"user_id", string_schema("Authenticated user")},
                    {"name", string_schema("Full name")},
                    {"college", string_schema("College or organisation")},
                    {"email", string_schema("Email address")},
                    {"from_session", string_schema("Session to extract fields from")},
                    {"remember_me", bool_schema("Consent: remember on this device")},
                    {"sync_across_devices", bool_schema("Consent: sync across devices")}
                }},
                {"required", {"user_id"}}
            }
        });
        handlers_["save_profile"] = [this](const json& p) { return tool_save_profile(p); };

        tools_.push_back({
            "delete_profile",
            "Forget me: delete the stored profile and clear every session the user owns.",
            {
                {"type", "object"},
                {"properties", {{"user_id", string_schema("Authenticated user")}}},
                {"required", {"user_id"}}
            }
        });
        handlers_["delete_profile"] = [this](const json& p) { return tool_delete_profile(p); };

        tools_.push_back({
            "update_consent",
            "Change consent flags without touching the stored profile.",
            {
                {"type", "object"},
                {"properties", {
                    {"user_id", string_schema("Authenticated user")},
                    {"remember_me", bool_schema("Remember on this device")},
                    {"sync_across_devices", bool_schema("Sync across devices")}
                }},
                {"required", {"user_id"}}
            }
        });
        handlers_["update_consent"] = [this](const json& p) { return tool_update_consent(p); };

        tools_.push_back({
            "profile_meta",
            "Whether a profile exists, plus consent flags. Never decrypts.",
            {
                {"type", "object"},
                {"properties", {{"user_id", string_schema("Authenticated user")}}},
                {"required", {"user_id"}}
            }
        });
        handlers_["profile_meta"] = [this](const json& p) { return tool_profile_meta(p); };
    }

    ToolResult tool_save_profile(const json& params) {
        std::string err = validate_required(params, {"user_id"});
        if (!err.empty()) return ToolResult::error(err);

        UserId user(params["user_id"].get<std::string>());
        Profile fields = profile_param(params);
        Consent consent = consent_param(params);

        json stored = json::array();
        if (auto from = get_text(params, "from_session")) {
            for (const auto& f : core_->save_profile_from_session(user, SessionId(*from), fields, consent)) {
                stored.push_back(f);
            }
        } else {
            core_->save_profile(user, fields, consent);
            Profile clean = Profile::normalize(fields);
            if (clean.name) stored.push_back("name");
            if (clean.college) stored.push_back("college");
            if (clean.email) stored.push_back("email");
            clean.wipe();
        }
        fields.wipe();
        return ToolResult::ok("Profile saved", {{"saved", true}, {"fields", stored}});
    }

    ToolResult tool_delete_profile(const json& params) {
        std::string err = validate_required(params, {"user_id"});
        if (!err.empty()) return ToolResult::error(err);

        DeleteResult r = core_->delete_profile(UserId(params["user_id"].get<std::string>()));
        json result = {
            {"profile_deleted", r.profile_deleted},
            {"sessions_cleared", r.sessions_cleared}
        };
        return ToolResult::ok(r.profile_deleted ? "Profile deleted" : "No profile stored", result);
    }

    ToolResult tool_update_consent(const json& params) {
        std::string err = validate_required(params, {"user_id"});
        if (!err.empty()) return ToolResult::error(err);

        Consent c = core_->update_consent(UserId(params["user_id"].get<std::string>()),
                                          get_flag(params, "remember_me"),
                                          get_flag(params, "sync_across_devices"));
        return ToolResult::ok(c.granted() ? "Consent granted" : "Consent not granted", c.to_json());
    }

    ToolResult tool_profile_meta(const json& params) {
        std::string err = validate_required(params, {"user_id"});
        if (!err.empty()) return ToolResult::error(err);

        ProfileMeta m = core_->profile_meta(UserId(params["user_id"].get<std::string>()));
        json result = {
            {"has_profile", m.has_profile},
            {"consent", m.consent.to_json()},
            {"updated_at", m.updated_at}
        };
        return ToolResult::ok(m.has_profile ? "Profile stored" : "No profile stored", result);
    }

    // ═══════════════════════════════════════════════════════════════════
    // Misc tools: shield_check, version, health
    // ═══════════════════════════════════════════════════════════════════

    void register_misc_tools() {
        tools_.push_back({
            "shield_check",
            "Check text for attempts to make the model decode or reveal tokens.",
            {
                {"type", "object"},
                {"properties", {{"text", string_schema("User text")}}},
                {"required", {"text"}}
            }
        });
        handlers_["shield_check"] = [this](const json& p) { return tool_shield_check(p); };

        tools_.push_back({
            "version",
            "Daemon and protocol version.",
            {{"type", "object"}, {"properties", json::object()}, {"required", json::array()}}
        });
        handlers_["version"] = [this](const json& p) { return tool_version(p); };

        tools_.push_back({
            "health",
            "Session store reachability and uptime.",
            {{"type", "object"}, {"properties", json::object()}, {"required", json::array()}}
        });
        handlers_["health"] = [this](const json& p) { return tool_health(p); };
    }

    ToolResult tool_shield_check(const json& params) {
        std::string err = validate_required(params, {"text"});
        if (!err.empty()) return ToolResult::error(err);

        ShieldVerdict v = core_->shield_check(params["text"].get<std::string>());
        return ToolResult::ok(v.blocked ? "Blocked" : "Allowed",
                              {{"blocked", v.blocked}, {"matched", v.matched}});
    }

    ToolResult tool_version(const json&) {
        json result = {
            {"version", KAVACH_VERSION},
            {"protocol", {
                {"major", KAVACH_PROTOCOL_VERSION_MAJOR},
                {"minor", KAVACH_PROTOCOL_VERSION_MINOR}
            }}
        };
        return ToolResult::ok(KAVACH_VERSION, result);
    }

    ToolResult tool_health(const json&) {
        auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - start_time_).count();
        bool ok = core_->healthy();
        return ToolResult::ok(ok ? "ok" : "degraded",
                              {{"status", ok ? "ok" : "degraded"}, {"uptime_seconds", uptime}});
    }
};

} // namespace kavach::rpc
