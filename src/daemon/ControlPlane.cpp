#include "bookhound/daemon/ControlPlane.hpp"
#include "bookhound/daemon/ControlWire.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <sstream>

#ifndef _WIN32
#include <sys/socket.h>
#include <sys/types.h>
#endif

namespace bookhound::daemon {

namespace wire {

bool recv_line(net::NativeSocket socket, std::string& line) {
    line.clear();
    char ch = 0;
    while (true) {
        const auto received = ::recv(socket, &ch, 1, 0);
        if (received <= 0) {
            return false;
        }
        if (ch == '\n') {
            return true;
        }
        if (ch != '\r') {
            line.push_back(ch);
            if (line.size() > kMaxLineLength) {
                return false;
            }
        }
    }
}

bool recv_exact(net::NativeSocket socket, std::uint8_t* buffer, std::size_t length) {
    std::size_t total = 0;
    while (total < length) {
#ifdef _WIN32
        const auto received = ::recv(socket, reinterpret_cast<char*>(buffer) + total, static_cast<int>(length - total), 0);
#else
        const auto received = ::recv(socket, reinterpret_cast<char*>(buffer) + total, length - total, 0);
#endif
        if (received <= 0) {
            return false;
        }
        total += static_cast<std::size_t>(received);
    }
    return true;
}

std::string to_upper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::toupper(ch));
    });
    return value;
}

std::optional<std::uint64_t> parse_uint64(std::string_view text) {
    std::uint64_t value{};
    const auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

std::string flatten(std::string_view value) {
    std::string out(value);
    std::replace_if(out.begin(), out.end(), [](char ch) { return ch == '\r' || ch == '\n' || ch == '\t'; }, ' ');
    return out;
}

}  // namespace wire

std::string ControlResponse::field(const std::string& key, std::string fallback) const {
    const auto it = fields.find(key);
    return it == fields.end() ? std::move(fallback) : it->second;
}

std::string ControlResponse::payload_text() const {
    return std::string(payload.begin(), payload.end());
}

std::string encode_records(const std::vector<RankedRecord>& records) {
    std::ostringstream out;
    for (const auto& entry : records) {
        const auto& record = entry.record;
        out << wire::flatten(record.server_tag) << '\t' << wire::flatten(record.author) << '\t'
            << wire::flatten(record.title) << '\t' << wire::flatten(record.extension) << '\t'
            << wire::flatten(record.declared_size_text) << '\t' << wire::flatten(record.reply_command) << '\t'
            << entry.score << '\n';
    }
    return out.str();
}

std::vector<RankedRecord> decode_records(std::string_view payload) {
    std::vector<RankedRecord> records;
    while (!payload.empty()) {
        const auto end = payload.find('\n');
        auto line = payload.substr(0, end);
        payload = end == std::string_view::npos ? std::string_view{} : payload.substr(end + 1);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        if (line.empty()) {
            continue;
        }

        std::vector<std::string> columns;
        std::size_t start = 0;
        while (true) {
            const auto tab = line.find('\t', start);
            columns.emplace_back(line.substr(start, tab == std::string_view::npos ? std::string_view::npos : tab - start));
            if (tab == std::string_view::npos) {
                break;
            }
            start = tab + 1;
        }
        if (columns.size() < 6) {
            continue;
        }

        RankedRecord entry{};
        entry.record.server_tag = columns[0];
        entry.record.author = columns[1];
        entry.record.title = columns[2];
        entry.record.extension = columns[3];
        entry.record.declared_size_text = columns[4];
        entry.record.reply_command = columns[5];
        entry.record.source_line = columns[5];
        if (columns.size() > 6) {
            entry.score = std::strtod(columns[6].c_str(), nullptr);
        }
        records.push_back(std::move(entry));
    }
    return records;
}

}  // namespace bookhound::daemon
