#include "bookhound/Config.hpp"
#include "bookhound/Types.hpp"
#include "bookhound/config/ConfigLoader.hpp"
#include "bookhound/core/StructuredLogger.hpp"
#include "bookhound/daemon/ControlPlane.hpp"
#include "bookhound/session/SessionRegistry.hpp"

#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <span>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#ifndef _WIN32
#include <signal.h>
#endif

#ifndef BOOKHOUND_VERSION
#define BOOKHOUND_VERSION "dev"
#endif

using namespace std::chrono_literals;

namespace {

constexpr std::string_view kBookhoundVersion = BOOKHOUND_VERSION;

enum class ShutdownReason {
    None,
    Signal,
    Control
};

std::atomic<bool> g_run_loop{false};
std::atomic<ShutdownReason> g_shutdown_reason{ShutdownReason::None};

void request_shutdown(ShutdownReason reason) noexcept {
    g_shutdown_reason.store(reason, std::memory_order_release);
    g_run_loop.store(false, std::memory_order_release);
}

struct GlobalOptions {
    std::optional<std::string> config_path{};
    std::optional<std::string> profile_name{};
    std::optional<std::string> environment{};
    std::optional<std::string> control_host{};
    std::optional<std::uint16_t> control_port{};
    std::optional<std::string> control_token{};
    bool quiet{false};
};

class CliException : public std::exception {
public:
    CliException(std::string code, std::string message, std::string hint = {})
        : code_(std::move(code)), message_(std::move(message)), hint_(std::move(hint)) {
        formatted_ = code_.empty() ? message_ : ("Error [" + code_ + "]: " + message_);
    }

    const char* what() const noexcept override {
        return formatted_.c_str();
    }

    const std::string& code() const& {
        return code_;
    }

    const std::string& hint() const& {
        return hint_;
    }

private:
    std::string code_;
    std::string message_;
    std::string hint_;
    std::string formatted_;
};

[[noreturn]] void throw_cli_error(std::string code, std::string message, std::string hint = {}) {
    throw CliException(std::move(code), std::move(message), std::move(hint));
}

[[noreturn]] void throw_daemon_unreachable() {
    throw_cli_error("E_DAEMON_UNREACHABLE",
                    "Could not contact the daemon.",
                    "Start it with 'bookhound serve' in another terminal, and verify --control-host/--control-port");
}

void print_cli_error(const CliException& ex) {
    std::cerr << ex.what() << std::endl;
    if (!ex.hint().empty()) {
        std::cerr << "Hint: " << ex.hint() << std::endl;
    }
}

void print_daemon_failure(const bookhound::daemon::ControlResponse& response) {
    const auto code = response.field("CODE", "ERR_DAEMON_UNKNOWN");
    const auto message = response.field("MESSAGE", "Daemon operation failed");
    std::cerr << "Daemon error [" << (code.empty() ? "ERR_DAEMON_UNKNOWN" : code) << "]: " << message << std::endl;
    if (const auto hint = response.field("HINT"); !hint.empty()) {
        std::cerr << "Hint: " << hint << std::endl;
    }
}

bool parse_uint64(std::string_view text, std::uint64_t& value) {
    const auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    return !text.empty() && result.ec == std::errc{} && result.ptr == text.data() + text.size();
}

bool parse_uint16(std::string_view text, std::uint16_t& value) {
    std::uint64_t parsed{};
    if (!parse_uint64(text, parsed) || parsed == 0 || parsed > 65535) {
        return false;
    }
    value = static_cast<std::uint16_t>(parsed);
    return true;
}

bool is_help_flag(std::string_view value) {
    return value == "--help" || value == "-h";
}

void print_usage() {
    std::cout << "BookHound CLI" << std::endl;
    std::cout << "Usage: bookhound [options] <command> [args]\n\n";
    std::cout << "Global options:\n"
              << "  --config <file>          Load configuration from YAML/JSON file\n"
              << "  --profile <name>         Select configuration profile (default: default)\n"
              << "  --env <name>             Apply environment overrides from config\n"
              << "  --control-host <host>    Control socket host (default 127.0.0.1)\n"
              << "  --control-port <port>    Control socket port (default 47780)\n"
              << "  --control-token <secret> Pre-shared token for control-plane authentication\n"
              << "  --quiet                  Silence structured logs\n"
              << "  --version                Print the CLI version and exit\n"
              << "  --help                   Print this help message\n\n";
    std::cout << "Commands:\n"
              << "  serve [irc options]       Run the daemon in the foreground (Ctrl+C to exit)\n"
              << "  stop                      Ask the daemon to shut down\n"
              << "  status [<session>]        Daemon status, or one session's snapshot\n"
              << "  sessions                  List registered sessions\n"
              << "  create [irc options]      Open an IRC session and print its id\n"
              << "  close <session>           Disconnect and forget a session\n"
              << "  search <session> --author <a> [--title <t>] [--max <n>] [--epub-only] [--format <ext>]\n"
              << "  author <session> --author <a> [--max <n>]\n"
              << "                           One best copy per distinct title\n"
              << "  title <session> --author <a> --title <t> [--max <n>]\n"
              << "                           Best copy per server of one title\n"
              << "  download <session> (--command <text> | --candidates <file>) [--timeout <sec>] [--filename <name>]\n"
              << "  smart <session> --author <a> [--title <t>] [--filename <name>]\n"
              << "  help                      Alias for --help\n\n";
    std::cout << "IRC options:\n"
              << "  --server <host>  --port <port>  --tls | --no-tls  --channel <#chan>\n"
              << "  --nickname <nick>  --download-dir <path>\n";
}

void print_command_usage(const std::string& command) {
    if (command == "serve") {
        std::cout << "Usage: bookhound serve [--server <host>] [--port <port>] [--tls|--no-tls] [--channel <#chan>] [--download-dir <path>]\n"
                  << "Run the daemon in the foreground until interrupted." << std::endl;
    } else if (command == "create") {
        std::cout << "Usage: bookhound create [--server <host>] [--port <port>] [--tls|--no-tls] [--channel <#chan>] [--nickname <nick>] [--download-dir <path>]\n"
                  << "Connect a new IRC session through the daemon." << std::endl;
    } else if (command == "download") {
        std::cout << "Usage: bookhound download <session> (--command <text> | --candidates <file>) [--timeout <sec>] [--filename <name>]\n"
                  << "Candidates files hold the tab-separated lines printed by search --raw; they are tried in order." << std::endl;
    } else {
        print_usage();
    }
}

// Flags shared by serve and create.
struct IrcOverrides {
    std::optional<std::string> server{};
    std::optional<std::uint16_t> port{};
    std::optional<bool> tls{};
    std::optional<std::string> channel{};
    std::optional<std::string> nickname{};
    std::optional<std::string> download_dir{};
};

// Command-local flags after the positional session id.
struct CommandOptions {
    IrcOverrides irc;
    std::optional<std::string> author{};
    std::optional<std::string> title{};
    std::optional<std::string> format{};
    std::optional<std::string> filename{};
    std::optional<std::string> command_text{};
    std::optional<std::string> candidates_file{};
    std::optional<std::uint64_t> max_results{};
    std::optional<std::uint64_t> timeout_seconds{};
    bool epub_only{false};
    bool raw{false};
    std::vector<std::string> positionals;
};

CommandOptions parse_command_options(const std::string& command,
                                     const std::vector<std::string_view>& args,
                                     std::size_t index) {
    CommandOptions options{};
    auto require_value = [&](std::string_view option) -> std::string {
        if (index >= args.size()) {
            throw_cli_error("E_MISSING_VALUE",
                            std::string(option) + " requires a value",
                            "Provide an argument immediately after " + std::string(option));
        }
        return std::string(args[index++]);
    };
    auto require_count = [&](std::string_view option) -> std::uint64_t {
        const auto value = require_value(option);
        std::uint64_t parsed{};
        if (!parse_uint64(value, parsed) || parsed == 0) {
            throw_cli_error("E_INVALID_NUMBER",
                            std::string(option) + " must be a positive integer",
                            "For example: " + std::string(option) + " 10");
        }
        return parsed;
    };

    while (index < args.size()) {
        const auto arg = args[index++];
        if (!arg.starts_with("-")) {
            options.positionals.emplace_back(arg);
            continue;
        }
        if (arg == "--server") {
            options.irc.server = require_value(arg);
        } else if (arg == "--port") {
            std::uint16_t port{};
            if (!parse_uint16(require_value(arg), port)) {
                throw_cli_error("E_INVALID_PORT", "--port must be between 1 and 65535");
            }
            options.irc.port = port;
        } else if (arg == "--tls") {
            options.irc.tls = true;
        } else if (arg == "--no-tls") {
            options.irc.tls = false;
        } else if (arg == "--channel") {
            options.irc.channel = require_value(arg);
        } else if (arg == "--nickname") {
            options.irc.nickname = require_value(arg);
        } else if (arg == "--download-dir") {
            options.irc.download_dir = require_value(arg);
        } else if (arg == "--author") {
            options.author = require_value(arg);
        } else if (arg == "--title") {
            options.title = require_value(arg);
        } else if (arg == "--format") {
            options.format = require_value(arg);
        } else if (arg == "--filename") {
            options.filename = require_value(arg);
        } else if (arg == "--command") {
            options.command_text = require_value(arg);
        } else if (arg == "--candidates") {
            options.candidates_file = require_value(arg);
        } else if (arg == "--max") {
            options.max_results = require_count(arg);
        } else if (arg == "--timeout") {
            options.timeout_seconds = require_count(arg);
        } else if (arg == "--epub-only") {
            options.epub_only = true;
        } else if (arg == "--raw") {
            options.raw = true;
        } else {
            throw_cli_error("E_UNKNOWN_OPTION",
                            "Unknown option for " + command + ": " + std::string(arg),
                            "Run 'bookhound " + command + " --help' to view usage");
        }
    }
    return options;
}

void apply_irc_overrides(const IrcOverrides& overrides, bookhound::Config& config) {
    if (overrides.server) {
        config.server_host = *overrides.server;
    }
    if (overrides.port) {
        config.server_port = *overrides.port;
    }
    if (overrides.tls) {
        config.use_tls = *overrides.tls;
    }
    if (overrides.channel) {
        config.channel = *overrides.channel;
    }
    if (overrides.nickname) {
        config.nickname = *overrides.nickname;
    }
    if (overrides.download_dir) {
        config.download_directory = *overrides.download_dir;
    }
}

bookhound::daemon::ControlFields irc_fields(const IrcOverrides& overrides) {
    bookhound::daemon::ControlFields fields;
    if (overrides.server) {
        fields["SERVER"] = *overrides.server;
    }
    if (overrides.port) {
        fields["PORT"] = std::to_string(*overrides.port);
    }
    if (overrides.tls) {
        fields["TLS"] = *overrides.tls ? "1" : "0";
    }
    if (overrides.channel) {
        fields["CHANNEL"] = *overrides.channel;
    }
    if (overrides.nickname) {
        fields["NICKNAME"] = *overrides.nickname;
    }
    if (overrides.download_dir) {
        fields["DOWNLOAD_DIR"] = *overrides.download_dir;
    }
    return fields;
}

bookhound::Config build_config(const GlobalOptions& options) {
    bookhound::Config config{};
    if (options.config_path) {
        bookhound::config::LoadOptions load{};
        load.config_path = *options.config_path;
        load.profile_name = options.profile_name;
        load.environment = options.environment;
        bookhound::config::load_configuration(load, config);
    } else if (options.profile_name || options.environment) {
        throw_cli_error("E_CONFIG_REQUIRED",
                        "--profile and --env need --config",
                        "Point --config at a YAML or JSON configuration file");
    }
    if (options.control_host) {
        config.control_host = *options.control_host;
    }
    if (options.control_port) {
        config.control_port = *options.control_port;
    }
    if (options.control_token) {
        config.control_token = *options.control_token;
    }
    return config;
}

extern "C" void signal_handler(int signal_code) {
    switch (signal_code) {
    case SIGINT:
    case SIGTERM:
        request_shutdown(ShutdownReason::Signal);
        break;
    default:
        break;
    }
}

void install_termination_handlers() {
#ifdef _WIN32
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
#else
    auto install = [](int sig) {
        struct sigaction action{};
        action.sa_handler = signal_handler;
        sigemptyset(&action.sa_mask);
        action.sa_flags = 0;
        sigaction(sig, &action, nullptr);
    };
    install(SIGINT);
    install(SIGTERM);
#endif
}

void uninstall_termination_handlers() {
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
}

bool wait_for_daemon_shutdown(bookhound::daemon::ControlClient& client, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (auto response = client.send("PING"); !response || !response->success) {
            return true;
        }
        std::this_thread::sleep_for(200ms);
    }
    return false;
}

std::string require_session_id(const CommandOptions& options, const std::string& command) {
    if (options.positionals.empty()) {
        throw_cli_error("E_MISSING_SESSION",
                        command + " requires a session id",
                        "Create one with 'bookhound create' or list them with 'bookhound sessions'");
    }
    if (options.positionals.size() > 1) {
        throw_cli_error("E_UNEXPECTED_ARGUMENT",
                        "Unexpected argument for " + command + ": " + options.positionals[1]);
    }
    return options.positionals.front();
}

std::string require_author(const CommandOptions& options, const std::string& command) {
    if (!options.author || options.author->empty()) {
        throw_cli_error("E_MISSING_AUTHOR",
                        command + " requires --author",
                        "For example: bookhound " + command + " <session> --author \"Isaac Asimov\"");
    }
    return *options.author;
}

bookhound::daemon::ControlResponse send_or_throw(bookhound::daemon::ControlClient& client,
                                                 const std::string& command,
                                                 const bookhound::daemon::ControlFields& fields = {},
                                                 const std::string& payload = {}) {
    const auto response = client.send(command,
                                      fields,
                                      std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(payload.data()),
                                                                    payload.size()));
    if (!response) {
        throw_daemon_unreachable();
    }
    return *response;
}

void print_records(const bookhound::daemon::ControlResponse& response, bool raw) {
    const auto text = response.payload_text();
    if (raw) {
        std::cout << text;
        return;
    }
    const auto records = bookhound::daemon::decode_records(text);
    std::size_t index = 0;
    for (const auto& entry : records) {
        const auto& record = entry.record;
        std::cout << std::setw(3) << ++index << ". [" << record.server_tag << "] " << record.author << " - "
                  << record.title << " (" << record.extension << ", " << record.declared_size_text << ")"
                  << "  score " << std::fixed << std::setprecision(1) << entry.score << std::endl;
        std::cout << "     " << record.reply_command << std::endl;
    }
}

void print_transfer(const bookhound::daemon::ControlResponse& response) {
    if (const auto path = response.field("PATH"); !path.empty()) {
        std::cout << "Saved to:        " << path << std::endl;
    }
    std::cout << "Bytes:           " << response.field("BYTES", "0") << '/' << response.field("EXPECTED", "0") << std::endl;
    if (const auto attempt = response.field("ATTEMPT"); !attempt.empty()) {
        std::cout << "Attempt:         " << attempt << '/' << response.field("TOTAL_ATTEMPTS") << " via "
                  << response.field("USED_SERVER", "unknown") << std::endl;
    }
    if (const auto tried = response.field("CANDIDATES_TRIED"); !tried.empty()) {
        std::cout << "Servers tried:   " << tried << std::endl;
    }
    if (response.has_payload && !response.payload.empty()) {
        std::cout << "Extracted files:" << std::endl;
        std::istringstream lines(response.payload_text());
        std::string line;
        while (std::getline(lines, line)) {
            if (!line.empty()) {
                std::cout << "  - " << line << std::endl;
            }
        }
    }
}

int run_serve(const bookhound::Config& config) {
    auto& registry = bookhound::session::SessionRegistry::instance();
    g_shutdown_reason.store(ShutdownReason::None, std::memory_order_release);
    g_run_loop.store(true, std::memory_order_release);

    bookhound::daemon::ControlServer control_server(registry, config, []() {
        request_shutdown(ShutdownReason::Control);
    });
    control_server.start(config.control_host, config.control_port);
    install_termination_handlers();

    std::cout << "Daemon running. Control at " << config.control_host << ':' << control_server.port() << std::endl;
    std::cout << "IRC network: " << config.server_host << ':' << config.server_port << (config.use_tls ? " (TLS)" : "")
              << ' ' << config.channel << std::endl;
    std::cout << "Press Ctrl+C or run 'bookhound stop' to exit." << std::endl;

    while (g_run_loop.load(std::memory_order_acquire)) {
        std::this_thread::sleep_for(200ms);
    }

    if (g_shutdown_reason.exchange(ShutdownReason::None, std::memory_order_acq_rel) == ShutdownReason::Signal) {
        std::cout << "\nInterrupt received, shutting down..." << std::endl;
    }
    std::cout << "Closing IRC sessions..." << std::endl;
    registry.close_all();
    std::cout << "Stopping control server..." << std::endl;
    control_server.stop();
    uninstall_termination_handlers();
    std::cout << "Daemon stopped." << std::endl;
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    try {
        std::vector<std::string_view> args;
        args.reserve(static_cast<std::size_t>(argc));
        for (int i = 1; i < argc; ++i) {
            args.emplace_back(argv[i]);
        }

        GlobalOptions options{};
        std::size_t index = 0;
        auto require_value = [&](std::string_view option) -> std::string {
            if (index >= args.size()) {
                throw_cli_error("E_MISSING_VALUE",
                                std::string(option) + " requires a value",
                                "Provide an argument immediately after " + std::string(option));
            }
            return std::string(args[index++]);
        };

        std::optional<std::string> command;
        while (index < args.size()) {
            const auto opt = args[index];
            if (!opt.starts_with("-")) {
                command = std::string(opt);
                ++index;
                break;
            }
            ++index;
            if (is_help_flag(opt)) {
                print_usage();
                return 0;
            }
            if (opt == "--version") {
                std::cout << "BookHound " << kBookhoundVersion << std::endl;
                return 0;
            }
            if (opt == "--quiet") {
                options.quiet = true;
                continue;
            }
            if (opt == "--config") {
                if (options.config_path) {
                    throw_cli_error("E_DUPLICATE_OPTION",
                                    "Option --config specified multiple times",
                                    "Provide the configuration file only once");
                }
                options.config_path = require_value(opt);
                continue;
            }
            if (opt == "--profile") {
                options.profile_name = require_value(opt);
                continue;
            }
            if (opt == "--env") {
                options.environment = require_value(opt);
                continue;
            }
            if (opt == "--control-host") {
                options.control_host = require_value(opt);
                continue;
            }
            if (opt == "--control-port") {
                std::uint16_t port{};
                if (!parse_uint16(require_value(opt), port)) {
                    throw_cli_error("E_INVALID_CONTROL_PORT",
                                    "--control-port must be between 1 and 65535",
                                    "For example: --control-port 47780");
                }
                options.control_port = port;
                continue;
            }
            if (opt == "--control-token") {
                options.control_token = require_value(opt);
                continue;
            }
            throw_cli_error("E_UNKNOWN_OPTION",
                            "Unknown option: " + std::string(opt),
                            "Run 'bookhound --help' to see the available options");
        }

        if (!command || *command == "help") {
            print_usage();
            return command ? 0 : 1;
        }
        if (index < args.size() && is_help_flag(args[index])) {
            print_command_usage(*command);
            return 0;
        }
        if (options.quiet) {
            bookhound::StructuredLogger::instance().set_enabled(false);
        }

        auto config = build_config(options);
        const auto command_options = parse_command_options(*command, args, index);

        if (*command == "serve") {
            if (!command_options.positionals.empty()) {
                throw_cli_error("E_UNEXPECTED_ARGUMENT", "serve takes no positional arguments");
            }
            apply_irc_overrides(command_options.irc, config);
            return run_serve(config);
        }

        bookhound::daemon::ControlClient client(config.control_host, config.control_port, config.control_token);

        if (*command == "stop") {
            const auto response = send_or_throw(client, "STOP");
            if (!response.success) {
                print_daemon_failure(response);
                return 1;
            }
            std::cout << response.field("MESSAGE", "Stop requested") << std::endl;
            if (!wait_for_daemon_shutdown(client, 10s)) {
                std::cerr << "Daemon did not shut down cleanly." << std::endl;
                return 1;
            }
            std::cout << "Daemon stopped" << std::endl;
            return 0;
        }

        if (*command == "status") {
            bookhound::daemon::ControlFields fields;
            if (!command_options.positionals.empty()) {
                fields["SESSION_ID"] = command_options.positionals.front();
            }
            const auto response = send_or_throw(client, "STATUS", fields);
            if (!response.success) {
                print_daemon_failure(response);
                return 1;
            }
            if (fields.empty()) {
                std::cout << "Daemon active" << std::endl;
                std::cout << "  Sessions:        " << response.field("SESSIONS", "0") << std::endl;
                std::cout << "  Control port:    " << response.field("CONTROL_PORT") << std::endl;
                return 0;
            }
            std::cout << "Session " << response.field("SESSION_ID") << std::endl;
            std::cout << "  State:           " << response.field("STATE") << std::endl;
            std::cout << "  Connected:       " << (response.field("CONNECTED") == "1" ? "yes" : "no") << std::endl;
            std::cout << "  Channel joined:  " << (response.field("JOINED") == "1" ? "yes" : "no") << std::endl;
            std::cout << "  Nickname:        " << response.field("NICKNAME") << std::endl;
            std::cout << "  Server:          " << response.field("SERVER") << ' ' << response.field("CHANNEL") << std::endl;
            std::cout << "  Last activity:   " << response.field("LAST_ACTIVITY") << std::endl;
            std::cout << "  Searches:        " << response.field("TOTAL_SEARCHES", "0") << std::endl;
            std::cout << "  Downloads:       " << response.field("TOTAL_DOWNLOADS", "0") << std::endl;
            std::cout << "  Last query:      " << response.field("LAST_QUERY") << " (" << response.field("LAST_RESULTS", "0")
                      << " results)" << std::endl;
            std::cout << "  Parse errors:    " << response.field("PARSE_ERRORS", "0") << std::endl;
            if (!response.payload.empty()) {
                std::cout << "  Errors:" << std::endl;
                std::istringstream lines(response.payload_text());
                std::string line;
                while (std::getline(lines, line)) {
                    if (!line.empty()) {
                        std::cout << "    - " << line << std::endl;
                    }
                }
            }
            return 0;
        }

        if (*command == "sessions") {
            const auto response = send_or_throw(client, "SESSIONS");
            if (!response.success) {
                print_daemon_failure(response);
                return 1;
            }
            if (response.field("COUNT", "0") == "0") {
                std::cout << "No sessions registered" << std::endl;
                return 0;
            }
            std::istringstream lines(response.payload_text());
            std::string line;
            while (std::getline(lines, line)) {
                if (line.empty()) {
                    continue;
                }
                std::vector<std::string> columns;
                std::istringstream parts(line);
                std::string column;
                while (std::getline(parts, column, '\t')) {
                    columns.push_back(column);
                }
                columns.resize(4);
                std::cout << columns[0] << "  " << columns[1] << "  " << columns[2]
                          << (columns[3] == "1" ? "" : "  (disconnected)") << std::endl;
            }
            return 0;
        }

        if (*command == "create") {
            const auto response = send_or_throw(client, "CREATE_SESSION", irc_fields(command_options.irc));
            if (!response.success) {
                print_daemon_failure(response);
                if (const auto id = response.field("SESSION_ID"); !id.empty()) {
                    std::cerr << "Session " << id << " kept for inspection; see 'bookhound status " << id << "'" << std::endl;
                }
                return 1;
            }
            std::cout << response.field("SESSION_ID") << std::endl;
            return 0;
        }

        if (*command == "close") {
            bookhound::daemon::ControlFields fields{{"SESSION_ID", require_session_id(command_options, *command)}};
            const auto response = send_or_throw(client, "CLOSE_SESSION", fields);
            if (!response.success) {
                print_daemon_failure(response);
                return 1;
            }
            std::cout << "Session closed" << std::endl;
            return 0;
        }

        if (*command == "search" || *command == "author" || *command == "title") {
            bookhound::daemon::ControlFields fields{{"SESSION_ID", require_session_id(command_options, *command)},
                                                   {"AUTHOR", require_author(command_options, *command)}};
            if (command_options.title) {
                fields["TITLE"] = *command_options.title;
            } else if (*command == "title") {
                throw_cli_error("E_MISSING_TITLE", "title requires --title");
            }
            if (command_options.max_results) {
                fields["MAX_RESULTS"] = std::to_string(*command_options.max_results);
            }
            if (command_options.epub_only) {
                fields["EPUB_ONLY"] = "1";
            }
            if (command_options.format) {
                fields["FORMAT"] = *command_options.format;
            }
            std::string protocol_command = "SEARCH";
            if (*command == "author") {
                protocol_command = "AUTHOR";
            } else if (*command == "title") {
                protocol_command = "TITLE";
            }
            const auto response = send_or_throw(client, protocol_command, fields);
            if (!response.success) {
                print_daemon_failure(response);
                return 1;
            }
            if (!command_options.raw) {
                std::cout << response.field("MESSAGE") << " for '" << response.field("QUERY") << "'" << std::endl;
            }
            print_records(response, command_options.raw);
            return 0;
        }

        if (*command == "download") {
            bookhound::daemon::ControlFields fields{{"SESSION_ID", require_session_id(command_options, *command)}};
            std::string payload;
            if (command_options.candidates_file) {
                std::ifstream input(*command_options.candidates_file, std::ios::binary);
                if (!input) {
                    throw_cli_error("E_CANDIDATES_UNREADABLE",
                                    "Cannot read candidates file: " + *command_options.candidates_file,
                                    "Save the output of 'bookhound search --raw' to a file");
                }
                std::ostringstream buffer;
                buffer << input.rdbuf();
                payload = buffer.str();
            }
            if (command_options.command_text) {
                fields["COMMAND_TEXT"] = *command_options.command_text;
            }
            if (payload.empty() && !command_options.command_text) {
                throw_cli_error("E_MISSING_CANDIDATES",
                                "download requires --command or --candidates",
                                "For example: bookhound download <session> --command \"!Ook Author - Title.epub\"");
            }
            if (command_options.timeout_seconds) {
                fields["TIMEOUT"] = std::to_string(*command_options.timeout_seconds);
            }
            if (command_options.filename) {
                fields["FILENAME"] = *command_options.filename;
            }
            const auto response = send_or_throw(client, "DOWNLOAD", fields, payload);
            if (!response.success) {
                print_daemon_failure(response);
                if (const auto tried = response.field("CANDIDATES_TRIED"); !tried.empty()) {
                    std::cerr << "Servers tried: " << tried << std::endl;
                }
                return 1;
            }
            std::cout << response.field("MESSAGE") << std::endl;
            print_transfer(response);
            return 0;
        }

        if (*command == "smart") {
            bookhound::daemon::ControlFields fields{{"SESSION_ID", require_session_id(command_options, *command)},
                                                   {"AUTHOR", require_author(command_options, *command)}};
            if (command_options.title) {
                fields["TITLE"] = *command_options.title;
            }
            if (command_options.filename) {
                fields["FILENAME"] = *command_options.filename;
            }
            const auto response = send_or_throw(client, "SMART", fields);
            if (!response.success) {
                print_daemon_failure(response);
                return 1;
            }
            std::cout << response.field("MESSAGE") << std::endl;
            if (response.field("MODE") == "title_level") {
                print_transfer(response);
            } else {
                print_records(response, command_options.raw);
            }
            return 0;
        }

        throw_cli_error("E_UNKNOWN_COMMAND",
                        "Unknown command: " + *command,
                        "Run 'bookhound --help' to see the list of available commands");
    } catch (const CliException& ex) {
        print_cli_error(ex);
        return 1;
    } catch (const bookhound::config::ConfigError& ex) {
        std::cerr << "Error [" << ex.code << "]: " << ex.message << std::endl;
        if (!ex.hint.empty()) {
            std::cerr << "Hint: " << ex.hint << std::endl;
        }
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error [E_UNEXPECTED]: " << ex.what() << std::endl;
        return 1;
    }
}
