#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bookhound {

using SessionId = std::string;

struct TransferOffer {
    std::string filename;
    std::string peer_address;
    std::uint16_t peer_port{0};
    std::uint64_t declared_size{0};
    std::string source_text;
};

struct BookRecord {
    std::string server_tag;
    std::string author;
    std::string title;
    std::string extension;
    std::string declared_size_text;
    // Exact text to resend to the channel to request this file.
    std::string reply_command;
    std::string source_line;
    std::optional<std::string> source_file{};
    std::optional<std::size_t> line_number{};
};

struct RankedRecord {
    BookRecord record;
    double score{0.0};
};

enum class SessionState {
    Disconnected,
    Connecting,
    Registering,
    JoiningChannel,
    Ready
};

struct SessionStatus {
    SessionId session_id;
    SessionState state{SessionState::Disconnected};
    bool connected{false};
    bool joined_channel{false};
    std::string nickname;
    std::string server;
    std::string channel;
    std::chrono::system_clock::time_point last_activity{};
    std::uint64_t total_searches{0};
    std::uint64_t total_downloads{0};
    std::string last_search_query;
    std::size_t last_search_results{0};
    std::uint64_t parse_errors{0};
    std::vector<std::string> errors;
};

struct TransferResult {
    bool success{false};
    std::string message;
    std::filesystem::path file_path;
    std::uint64_t bytes_received{0};
    std::uint64_t bytes_expected{0};
    std::vector<std::filesystem::path> extracted_files;
    // Records recovered from listing files when the download was a catalog package.
    std::vector<BookRecord> listed_records;
    std::optional<TransferOffer> offer{};
};

std::string session_state_to_string(SessionState state);
std::string format_timestamp(std::chrono::system_clock::time_point time);
std::string to_lower(std::string value);
std::string trim(std::string_view value);

}  // namespace bookhound
