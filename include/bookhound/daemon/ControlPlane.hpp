#pragma once

#include "bookhound/Config.hpp"
#include "bookhound/Types.hpp"
#include "bookhound/session/SessionRegistry.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace bookhound::daemon {

using ControlFields = std::unordered_map<std::string, std::string>;

constexpr std::size_t kMaxControlPayloadBytes = 8 * 1024 * 1024;

struct ControlResponse {
    bool success{false};
    ControlFields fields;
    bool has_payload{false};
    std::vector<std::uint8_t> payload;

    [[nodiscard]] std::string field(const std::string& key, std::string fallback = {}) const;
    [[nodiscard]] std::string payload_text() const;
};

// One record per line: server, author, title, extension, size, reply command,
// score, separated by tabs. Tabs and line breaks inside values become spaces.
std::string encode_records(const std::vector<RankedRecord>& records);
std::vector<RankedRecord> decode_records(std::string_view payload);

// Loopback request/response endpoint in front of a SessionRegistry. Each
// connection carries exactly one command; clients are served on their own
// threads so status polls are not held behind a running search.
class ControlServer {
public:
    using StopCallback = std::function<void()>;

    // `defaults` seeds every CREATE_SESSION; request fields override it.
    ControlServer(session::SessionRegistry& registry, Config defaults, StopCallback stop_callback);
    ~ControlServer();

    ControlServer(const ControlServer&) = delete;
    ControlServer& operator=(const ControlServer&) = delete;

    // Port 0 binds an ephemeral port; see port().
    void start(const std::string& host, std::uint16_t port);
    void stop();
    [[nodiscard]] bool running() const noexcept;
    [[nodiscard]] std::uint16_t port() const noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

class ControlClient {
public:
    ControlClient(std::string host, std::uint16_t port, std::optional<std::string> token = std::nullopt);
    ~ControlClient();

    ControlClient(const ControlClient&) = delete;
    ControlClient& operator=(const ControlClient&) = delete;

    // nullopt when the daemon is unreachable or the exchange was cut short.
    std::optional<ControlResponse> send(const std::string& command,
                                        const ControlFields& fields = {},
                                        std::span<const std::uint8_t> payload = {});

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace bookhound::daemon
