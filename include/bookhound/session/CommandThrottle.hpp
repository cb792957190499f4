#pragma once

#include <chrono>
#include <mutex>
#include <optional>

namespace bookhound::session {

// Keeps at least `interval` between two outbound user commands. acquire()
// sleeps for whatever remains of the interval and stamps the send time.
class CommandThrottle {
public:
    using Clock = std::chrono::steady_clock;

    explicit CommandThrottle(std::chrono::milliseconds interval);

    // Returns how long the caller was held back.
    std::chrono::milliseconds acquire();

    [[nodiscard]] std::chrono::milliseconds interval() const noexcept { return interval_; }
    [[nodiscard]] std::optional<Clock::time_point> last_command() const;

private:
    std::chrono::milliseconds interval_;
    mutable std::mutex mutex_;
    std::optional<Clock::time_point> last_command_;
};

}  // namespace bookhound::session
