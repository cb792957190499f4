#include "bookhound/Types.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace bookhound {

std::string session_state_to_string(SessionState state) {
    switch (state) {
        case SessionState::Disconnected:
            return "disconnected";
        case SessionState::Connecting:
            return "connecting";
        case SessionState::Registering:
            return "registering";
        case SessionState::JoiningChannel:
            return "joining";
        case SessionState::Ready:
            return "ready";
    }
    return "disconnected";
}

std::string format_timestamp(std::chrono::system_clock::time_point time) {
    if (time.time_since_epoch().count() == 0) {
        return {};
    }
    const std::time_t seconds = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &seconds);
#else
    gmtime_r(&seconds, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

std::string trim(std::string_view value) {
    std::size_t begin = 0;
    std::size_t end = value.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(value[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return std::string(value.substr(begin, end - begin));
}

}  // namespace bookhound
