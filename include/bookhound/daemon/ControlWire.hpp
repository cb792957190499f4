#pragma once

#include "bookhound/core/Socket.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace bookhound::daemon::wire {

constexpr std::size_t kMaxLineLength = 16 * 1024;

// Reads one LF-terminated line (CR dropped). False on EOF, error or an
// over-long line.
bool recv_line(net::NativeSocket socket, std::string& line);
bool recv_exact(net::NativeSocket socket, std::uint8_t* buffer, std::size_t length);

std::string to_upper(std::string value);
std::optional<std::uint64_t> parse_uint64(std::string_view text);

// Header values are single lines.
std::string flatten(std::string_view value);

}  // namespace bookhound::daemon::wire
