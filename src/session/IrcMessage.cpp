#include "bookhound/session/IrcMessage.hpp"

#include "bookhound/Types.hpp"

#include <algorithm>
#include <cctype>

namespace bookhound::session {

std::string IrcMessage::nick() const {
    const auto bang = prefix.find('!');
    return bang == std::string::npos ? prefix : prefix.substr(0, bang);
}

std::string IrcMessage::text() const {
    if (trailing) {
        return *trailing;
    }
    return params.empty() ? std::string{} : params.back();
}

std::optional<IrcMessage> parse_irc_line(std::string_view line) {
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.remove_suffix(1);
    }
    if (line.empty()) {
        return std::nullopt;
    }

    IrcMessage message{};
    auto next_token = [&line]() {
        const auto space = line.find(' ');
        const auto token = line.substr(0, space);
        line = space == std::string_view::npos ? std::string_view{} : line.substr(space + 1);
        while (!line.empty() && line.front() == ' ') {
            line.remove_prefix(1);
        }
        return std::string(token);
    };

    if (line.front() == ':') {
        line.remove_prefix(1);
        message.prefix = next_token();
    }
    message.command = next_token();
    if (message.command.empty()) {
        return std::nullopt;
    }
    std::transform(message.command.begin(), message.command.end(), message.command.begin(), [](unsigned char ch) {
        return static_cast<char>(std::toupper(ch));
    });

    while (!line.empty()) {
        if (line.front() == ':') {
            message.trailing = std::string(line.substr(1));
            break;
        }
        message.params.push_back(next_token());
    }
    return message;
}

bool is_ctcp_version_request(const IrcMessage& message, std::string_view own_nick) {
    if (message.command != "PRIVMSG" || message.params.empty() ||
        to_lower(message.params.front()) != to_lower(std::string(own_nick))) {
        return false;
    }
    const auto body = message.text();
    return body.size() >= 8 && body.front() == kCtcpDelimiter && to_lower(body.substr(1, 7)) == "version" &&
           (body.size() == 8 || body[8] == kCtcpDelimiter || body[8] == ' ');
}

std::string strip_formatting(std::string_view text) {
    std::string plain;
    plain.reserve(text.size());
    for (std::size_t index = 0; index < text.size(); ++index) {
        const auto ch = text[index];
        if (ch == '\x02' || ch == '\x0F' || ch == '\x16' || ch == '\x1D' || ch == '\x1F') {
            continue;
        }
        if (ch == '\x03') {
            // \x03[fg[,bg]] with one or two digits each.
            auto skip_digits = [&](std::size_t from) {
                std::size_t count = 0;
                while (count < 2 && from + count < text.size() &&
                       std::isdigit(static_cast<unsigned char>(text[from + count]))) {
                    ++count;
                }
                return count;
            };
            auto next = index + 1;
            const auto foreground = skip_digits(next);
            next += foreground;
            if (foreground > 0 && next + 1 < text.size() && text[next] == ',' &&
                std::isdigit(static_cast<unsigned char>(text[next + 1]))) {
                next += 1 + skip_digits(next + 1);
            }
            index = next - 1;
            continue;
        }
        plain.push_back(ch);
    }
    return plain;
}

}  // namespace bookhound::session
