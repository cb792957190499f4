#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bookhound::session {

// One RFC 1459 line: `[:prefix] COMMAND params... [:trailing]`.
struct IrcMessage {
    std::string prefix;
    std::string command;
    std::vector<std::string> params;
    std::optional<std::string> trailing;

    // Nickname part of the prefix (before `!`).
    [[nodiscard]] std::string nick() const;
    // Trailing text, or the last middle parameter when there is none.
    [[nodiscard]] std::string text() const;
};

std::optional<IrcMessage> parse_irc_line(std::string_view line);

constexpr char kCtcpDelimiter = '\x01';

// CTCP VERSION sent privately to `own_nick`; channel-wide requests do not count.
bool is_ctcp_version_request(const IrcMessage& message, std::string_view own_nick);

// Removes mIRC bold, colour, reverse, italic, underline and reset codes.
std::string strip_formatting(std::string_view text);

}  // namespace bookhound::session
