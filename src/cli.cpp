// kavachd - privacy core daemon
//
// Modes:
//   Serve mode: kavachd [options]              - JSON-RPC 2.0 over stdin/stdout
//   CLI mode:   kavachd <tool> [--key value]   - One tool call, then exit
//
// CLI Examples:
//   kavachd mask --session_id s1 --text "My name is Alice Smith"
//   kavachd masked_summary --session_id s1
//   kavachd save_profile --user_id u1 --name "Alice Smith" --remember_me true
//   kavachd delete_profile --user_id u1
//
// Options:
//   --config PATH       JSON config file
//   --data PATH         Directory for SQLite stores (default: in-memory)
//   --ttl SECONDS       Session registry TTL
//   --secret-file PATH  File holding the encryption secret
//   --recognizer NAME   gazetteer | none
//   --verbose, -v       Timestamped debug logging on stderr
//   --json              CLI mode: print raw JSON instead of text
//
// Environment: KAVACH_SECRET, KAVACH_SECRET_FILE, KAVACH_DATA,
//              KAVACH_TTL_SECONDS, KAVACH_VERBOSE

#include <kavach/kavach.hpp>
#include <kavach/rpc/handler.hpp>

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <unistd.h>

using json = nlohmann::json;

static std::atomic<bool> g_shutdown_requested{false};

void signal_handler(int sig) {
    (void)sig;
    g_shutdown_requested.store(true);
    const char msg[] = "[kavachd] Signal received, exiting\n";
    ssize_t n = write(STDERR_FILENO, msg, sizeof(msg) - 1);
    (void)n;
    std::_Exit(0);
}

static const std::set<std::string> KNOWN_TOOLS = {
    "mask", "sanitize_and_unmask", "unmask", "ensure_seeded", "masked_summary",
    "save_profile", "delete_profile", "update_consent", "profile_meta",
    "shield_check", "version", "health"
};

void print_usage(const char* prog) {
    std::cerr << "kavachd " << KAVACH_VERSION << " - privacy core for third-party LLM chat\n\n"
              << "Usage:\n"
              << "  " << prog << " [options]                  Serve JSON-RPC on stdin/stdout\n"
              << "  " << prog << " <tool> [--key value...]    Invoke one tool and exit\n"
              << "\n"
              << "Options:\n"
              << "  --config PATH       JSON config file\n"
              << "  --data PATH         Directory for SQLite stores (default: in-memory)\n"
              << "  --ttl SECONDS       Session registry TTL (default: 1800)\n"
              << "  --secret-file PATH  File holding the encryption secret\n"
              << "  --recognizer NAME   gazetteer | none\n"
              << "  --verbose, -v       Debug logging on stderr\n"
              << "  --json              CLI mode: print raw JSON\n"
              << "\n"
              << "Tools: mask, sanitize_and_unmask, unmask, ensure_seeded, masked_summary,\n"
              << "       save_profile, delete_profile, update_consent, profile_meta,\n"
              << "       shield_check, version, health\n"
              << "\n"
              << "The encryption secret is read from KAVACH_SECRET or KAVACH_SECRET_FILE.\n";
}

// Parse "--key value" pairs into tool arguments
json parse_tool_args(int argc, char* argv[], int arg_start) {
    json args = json::object();
    for (int i = arg_start; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0) continue;

        std::string key = arg.substr(2);
        if (key == "json") continue;
        if (i + 1 < argc && std::strncmp(argv[i + 1], "--", 2) != 0) {
            std::string value = argv[++i];
            if (value == "true") {
                args[key] = true;
            } else if (value == "false") {
                args[key] = false;
            } else {
                args[key] = value;
            }
        } else {
            args[key] = true;  // Flag without value
        }
    }
    return args;
}

int run_cli(kavach::Kavach& core, const std::string& tool, const json& args, bool json_output) {
    kavach::rpc::Handler handler(&core);

    json request = {
        {"jsonrpc", "2.0"},
        {"method", "tools/call"},
        {"params", {{"name", tool}, {"arguments", args}}},
        {"id", 1}
    };
    json response = handler.handle_request(request);

    if (json_output) {
        std::cout << response.dump(2) << "\n";
        return response.contains("error") ? 1 : 0;
    }

    if (response.contains("error")) {
        std::cerr << "Error: " << response["error"]["message"].get<std::string>() << "\n";
        return 1;
    }

    const auto& result = response["result"];
    if (result.contains("content") && result["content"].is_array()) {
        for (const auto& item : result["content"]) {
            if (item.contains("text")) {
                std::cout << item["text"].get<std::string>() << "\n";
            }
        }
    }
    return result.value("isError", false) ? 1 : 0;
}

int run_serve(kavach::Kavach& core) {
    kavach::rpc::Handler handler(&core);
    std::cerr << "[kavachd] Serving JSON-RPC on stdio (v" << KAVACH_VERSION << ")\n";

    std::string line;
    while (!g_shutdown_requested && std::getline(std::cin, line)) {
        if (line.empty()) continue;

        std::string response = handler.handle(line);
        std::cout << response << "\n";
        std::cout.flush();

        if (handler.shutdown_requested()) break;
    }

    std::cerr << "[kavachd] Shutting down\n";
    return 0;
}

int main(int argc, char* argv[]) {
    kavach::KavachConfig config;
    std::string config_path;
    bool json_output = false;

    std::string tool;
    int arg_start = 1;
    if (argc > 1 && KNOWN_TOOLS.count(argv[1])) {
        tool = argv[1];
        arg_start = 2;
    }

    // Global options; in CLI mode unknown --keys are tool arguments
    std::string data_flag, ttl_flag, secret_file_flag, recognizer_flag;
    bool verbose_flag = false;
    for (int i = arg_start; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--data") == 0 && i + 1 < argc) {
            data_flag = argv[++i];
        } else if (std::strcmp(argv[i], "--ttl") == 0 && i + 1 < argc) {
            ttl_flag = argv[++i];
        } else if (std::strcmp(argv[i], "--secret-file") == 0 && i + 1 < argc) {
            secret_file_flag = argv[++i];
        } else if (std::strcmp(argv[i], "--recognizer") == 0 && i + 1 < argc) {
            recognizer_flag = argv[++i];
        } else if (std::strcmp(argv[i], "--verbose") == 0 || std::strcmp(argv[i], "-v") == 0) {
            verbose_flag = true;
        } else if (std::strcmp(argv[i], "--json") == 0) {
            json_output = true;
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (std::strcmp(argv[i], "--version") == 0) {
            std::cout << "kavachd " << KAVACH_VERSION << "\n";
            return 0;
        } else if (tool.empty()) {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    std::unique_ptr<kavach::Kavach> core;
    try {
        if (!config_path.empty()) config.load_file(config_path);
        config.apply_env();
        if (!data_flag.empty()) config.data_path = data_flag;
        if (!ttl_flag.empty()) {
            try {
                config.ttl_seconds = std::stoll(ttl_flag);
            } catch (const std::exception&) {
                throw kavach::ConfigError("Invalid --ttl: " + ttl_flag);
            }
        }
        if (!secret_file_flag.empty()) config.secret_file = secret_file_flag;
        if (!recognizer_flag.empty()) config.recognizer = recognizer_flag;
        if (verbose_flag) config.verbose = true;

        kavach::set_verbose(config.verbose);
        kavach::log_debug("kavachd", "config: %s", config.describe().dump().c_str());

        core = std::make_unique<kavach::Kavach>(config);
    } catch (const kavach::Error& e) {
        std::cerr << "[kavachd] " << e.code() << ": " << e.what() << "\n";
        return 2;
    }

    if (!tool.empty()) {
        return run_cli(*core, tool, parse_tool_args(argc, argv, arg_start), json_output);
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    return run_serve(*core);
}
