#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace bookhound {

// Minimum spacing between two outbound IRC commands. IRC Highway kicks clients
// that issue searches or download requests faster than this.
constexpr std::chrono::seconds kDefaultCommandInterval{10};

struct Config {
    std::string server_host{"irc.irchighway.net"};
    std::uint16_t server_port{6697};
    bool use_tls{true};
    std::string channel{"#ebooks"};
    std::string search_bot{"search"};
    std::string user_agent{"BookHound v1.0"};
    std::optional<std::string> nickname{};
    std::optional<std::uint32_t> identity_seed{};

    std::chrono::seconds connect_timeout{std::chrono::seconds(30)};
    std::chrono::seconds response_timeout{std::chrono::seconds(60)};
    std::chrono::seconds transfer_timeout{std::chrono::seconds(30)};
    std::chrono::milliseconds command_interval{kDefaultCommandInterval};
    std::uint8_t connect_attempts{3};
    std::chrono::milliseconds connect_backoff_step{std::chrono::seconds(5)};
    std::uint8_t nick_retry_limit{3};
    std::chrono::milliseconds join_settle_delay{std::chrono::seconds(2)};
    std::chrono::milliseconds join_timeout{std::chrono::seconds(10)};

    std::chrono::milliseconds search_window{std::chrono::seconds(20)};
    std::chrono::milliseconds search_quiet_period{std::chrono::seconds(5)};
    std::size_t search_max_results{50};
    std::size_t author_result_limit{50};
    std::size_t title_result_limit{20};
    std::chrono::seconds fallback_attempt_timeout{std::chrono::minutes(3)};

    std::size_t transfer_chunk_bytes{4096};
    std::string download_directory{"downloads"};

    std::string control_host{"127.0.0.1"};
    std::uint16_t control_port{47780};
    std::optional<std::string> control_token{};
};

}  // namespace bookhound
