#include <kavach/config.hpp>
#include <kavach/errors.hpp>
#include <kavach/text.hpp>

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace kavach {

namespace {

const char* env(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

int64_t parse_int(const std::string& value, const char* what) {
    try {
        size_t used = 0;
        long long n = std::stoll(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return n;
    } catch (const std::exception&) {
        throw ConfigError(std::string("Invalid integer for ") + what + ": " + value);
    }
}

LeakMatchMode parse_mode(const std::string& mode) {
    if (mode == "exact") return LeakMatchMode::Exact;
    if (mode == "fuzzy") return LeakMatchMode::Fuzzy;
    throw ConfigError("Unknown leak_policy.mode: " + mode);
}

} // namespace

void KavachConfig::apply_json(const json& doc) {
    if (!doc.is_object()) {
        throw ConfigError("Config must be a JSON object");
    }
    if (doc.contains("secret")) {
        throw ConfigError("The encryption secret may not be set in a config file; use KAVACH_SECRET or secret_file");
    }

    try {
        if (doc.contains("data_path")) data_path = doc["data_path"].get<std::string>();
        if (doc.contains("ttl_seconds")) ttl_seconds = doc["ttl_seconds"].get<int64_t>();
        if (doc.contains("kdf_iterations")) kdf_iterations = doc["kdf_iterations"].get<int>();
        if (doc.contains("max_retries")) max_retries = doc["max_retries"].get<int>();
        if (doc.contains("max_text_bytes")) max_text_bytes = doc["max_text_bytes"].get<size_t>();
        if (doc.contains("recognizer")) recognizer = doc["recognizer"].get<std::string>();
        if (doc.contains("verbose")) verbose = doc["verbose"].get<bool>();
        if (doc.contains("secret_file")) secret_file = doc["secret_file"].get<std::string>();

        if (doc.contains("allowed_types")) {
            detector.allowed.clear();
            for (const auto& item : doc["allowed_types"]) {
                auto type = entity_type_from_prefix(item.get<std::string>());
                if (!type) throw ConfigError("Unknown entity type: " + item.get<std::string>());
                detector.allowed.insert(*type);
            }
        }
        if (doc.contains("excluded_terms")) {
            for (const auto& item : doc["excluded_terms"]) {
                detector.extra_excluded.push_back(item.get<std::string>());
            }
        }
        if (doc.contains("leak_policy")) {
            const auto& lp = doc["leak_policy"];
            if (lp.contains("mode")) leak_policy.mode = parse_mode(lp["mode"].get<std::string>());
            if (lp.contains("max_edit_distance")) leak_policy.max_edit_distance = lp["max_edit_distance"].get<size_t>();
            if (lp.contains("min_similarity")) leak_policy.min_similarity = lp["min_similarity"].get<float>();
            if (lp.contains("min_fuzzy_length")) leak_policy.min_fuzzy_length = lp["min_fuzzy_length"].get<size_t>();
        }
    } catch (const json::exception& e) {
        throw ConfigError(std::string("Invalid config value: ") + e.what());
    }
}

void KavachConfig::load_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("Cannot read config file: " + path);
    }
    json doc = json::parse(in, nullptr, false);
    if (doc.is_discarded()) {
        throw ConfigError("Config file is not valid JSON: " + path);
    }
    apply_json(doc);
}

void KavachConfig::apply_env() {
    if (const char* v = env("KAVACH_DATA")) data_path = v;
    if (const char* v = env("KAVACH_TTL_SECONDS")) ttl_seconds = parse_int(v, "KAVACH_TTL_SECONDS");
    if (const char* v = env("KAVACH_SECRET_FILE")) secret_file = v;
    if (const char* v = env("KAVACH_SECRET")) secret = v;
    if (const char* v = env("KAVACH_VERBOSE")) verbose = std::string(v) != "0";
}

void KavachConfig::resolve_secret() {
    if (secret.empty() && !secret_file.empty()) {
        std::ifstream in(secret_file);
        if (!in) {
            throw ConfigError("Cannot read secret file: " + secret_file);
        }
        std::stringstream ss;
        ss << in.rdbuf();
        secret = text::trim(ss.str());
    }
    if (secret.empty()) {
        throw ConfigError("No encryption secret: set KAVACH_SECRET or KAVACH_SECRET_FILE");
    }
}

void KavachConfig::validate() const {
    if (ttl_seconds <= 0) throw ConfigError("ttl_seconds must be positive");
    if (kdf_iterations < 1000) throw ConfigError("kdf_iterations must be at least 1000");
    if (max_retries < 1) throw ConfigError("max_retries must be at least 1");
    if (max_text_bytes == 0) throw ConfigError("max_text_bytes must be positive");
    if (recognizer != "gazetteer" && recognizer != "none") {
        throw ConfigError("Unknown recognizer: " + recognizer);
    }
    if (leak_policy.min_similarity < 0.0f || leak_policy.min_similarity > 1.0f) {
        throw ConfigError("leak_policy.min_similarity must be within [0, 1]");
    }
    if (detector.allowed.empty()) throw ConfigError("allowed_types must not be empty");
}

json KavachConfig::describe() const {
    json allowed = json::array();
    for (EntityType t : detector.allowed) allowed.push_back(entity_type_prefix(t));
    return {
        {"data_path", data_path.empty() ? json("(memory)") : json(data_path)},
        {"ttl_seconds", ttl_seconds},
        {"kdf_iterations", kdf_iterations},
        {"max_retries", max_retries},
        {"max_text_bytes", max_text_bytes},
        {"recognizer", recognizer},
        {"allowed_types", allowed},
        {"excluded_terms", detector.extra_excluded.size()},
        {"leak_policy", {
            {"mode", leak_policy.mode == LeakMatchMode::Exact ? "exact" : "fuzzy"},
            {"max_edit_distance", leak_policy.max_edit_distance},
            {"min_similarity", leak_policy.min_similarity},
            {"min_fuzzy_length", leak_policy.min_fuzzy_length}
        }},
        {"secret", secret.empty() ? "unset" : "set"}
    };
}

} // namespace kavach
