#include "bookhound/core/Socket.hpp"

#include <array>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#if !defined(_WIN32)
#include <sys/wait.h>
#endif

namespace {

struct CommandResult {
    int exit_code;
    std::string output;
};

CommandResult run_cli(const std::string& executable, const std::string& arguments) {
    const std::string command = "\"" + executable + "\" " + arguments + " 2>&1";
    FILE* pipe = popen(command.c_str(), "r");
    if (!pipe) {
        throw std::runtime_error("Failed to open a pipe to the CLI");
    }

    std::string output;
    std::array<char, 256> buffer{};
    while (std::fgets(buffer.data(), static_cast<int>(buffer.size()), pipe)) {
        output.append(buffer.data());
    }

    const int status = pclose(pipe);
    int exit_code = -1;
    if (WIFEXITED(status)) {
        exit_code = WEXITSTATUS(status);
    }
    return CommandResult{exit_code, output};
}

bool expect_contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

std::filesystem::path write_temp_file(const std::string& name, const std::string& contents) {
    const auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream file(path, std::ios::binary);
    file << contents;
    file.close();
    return path;
}

bool check(const CommandResult& result, bool expect_success, const std::string& needle, const std::string& label) {
    const bool exit_ok = expect_success ? result.exit_code == 0 : result.exit_code != 0;
    if (exit_ok && expect_contains(result.output, needle)) {
        return true;
    }
    std::cerr << "Failure on " << label << ". exit=" << result.exit_code << "\n" << result.output << std::endl;
    return false;
}

// A loopback port with nothing listening on it.
std::uint16_t unused_port() {
    std::uint16_t port = 0;
    auto listener = bookhound::net::listen_tcp("127.0.0.1", 0, &port);
    return port;
}

}  // namespace

int main() {
    const char* executable_env = std::getenv("BOOKHOUND_CLI_EXECUTABLE");
    if (!executable_env) {
        std::cerr << "BOOKHOUND_CLI_EXECUTABLE is not defined" << std::endl;
        return 1;
    }
    const std::string executable = std::filesystem::path(executable_env).string();

    try {
        if (!check(run_cli(executable, "--version"), true, "BookHound ", "version banner")) {
            return 1;
        }
        if (!check(run_cli(executable, "--help"), true, "serve", "usage text")) {
            return 1;
        }
        if (!check(run_cli(executable, "teleport"), false, "E_UNKNOWN_COMMAND", "unknown command")) {
            return 1;
        }
        if (!check(run_cli(executable, "--warp status"), false, "E_UNKNOWN_OPTION", "unknown global option")) {
            return 1;
        }
        if (!check(run_cli(executable, "--config"), false, "E_MISSING_VALUE", "missing option value")) {
            return 1;
        }
        if (!check(run_cli(executable, "--control-port 0 status"), false, "E_INVALID_CONTROL_PORT", "control port range")) {
            return 1;
        }
        if (!check(run_cli(executable, "--env ci status"), false, "E_CONFIG_REQUIRED", "env without config")) {
            return 1;
        }
        if (!check(run_cli(executable, "search"), false, "E_MISSING_SESSION", "search without session")) {
            return 1;
        }
        if (!check(run_cli(executable, "search irc_session_1_1"), false, "E_MISSING_AUTHOR", "search without author")) {
            return 1;
        }
        if (!check(run_cli(executable, "create --port 99999"), false, "E_INVALID_PORT", "IRC port range")) {
            return 1;
        }

        const auto json_path = write_temp_file("bookhound_cli_config_test.json",
                                               R"JSON({
  "profiles": {
    "default": {
      "irc": {
        "channel": "ebooks"
      }
    }
  }
})JSON");
        const auto json_result = run_cli(executable, "--config \"" + json_path.string() + "\" status");
        std::filesystem::remove(json_path);
        if (!check(json_result, false, "irc.channel must start with '#' or '&'", "JSON channel validation")) {
            return 1;
        }

        const auto yaml_path = write_temp_file("bookhound_cli_config_test.yaml",
                                               R"YAML(profiles:
  default:
    control:
      host: 127.0.0.1
    search:
      max_results: 10
  staging:
    extends: default
    irc:
      server: irc.example.org
environments:
  ci:
    profile: staging
    search:
      max_results: 0
)YAML");

        const auto env_result = run_cli(executable, "--config \"" + yaml_path.string() + "\" --env ci status");
        const auto missing_env = run_cli(executable, "--config \"" + yaml_path.string() + "\" --env prod status");
        const auto missing_profile = run_cli(executable, "--config \"" + yaml_path.string() + "\" --profile nope status");
        const auto unreachable = run_cli(executable,
                                         "--config \"" + yaml_path.string() + "\" --control-port " +
                                             std::to_string(unused_port()) + " status");
        std::filesystem::remove(yaml_path);

        if (!check(env_result, false, "search.max_results must be positive", "environment override validation")) {
            return 1;
        }
        if (!check(missing_env, false, "Environment not found", "missing environment detection")) {
            return 1;
        }
        if (!check(missing_profile, false, "Available profiles: default, staging", "missing profile hint")) {
            return 1;
        }
        if (!check(unreachable, false, "E_DAEMON_UNREACHABLE", "unreachable daemon")) {
            return 1;
        }

        const auto missing_file = run_cli(executable, "--config /nonexistent/bookhound.yaml status");
        if (!check(missing_file, false, "E_CONFIG_NOT_FOUND", "missing configuration file")) {
            return 1;
        }
    } catch (const std::exception& ex) {
        std::cerr << "Exception during CLI config tests: " << ex.what() << std::endl;
        return 1;
    }

    return 0;
}
