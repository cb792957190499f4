#include "bookhound/session/CommandThrottle.hpp"

#include "bookhound/core/StructuredLogger.hpp"

#include <string>
#include <thread>

namespace bookhound::session {

CommandThrottle::CommandThrottle(std::chrono::milliseconds interval)
    : interval_(interval < std::chrono::milliseconds::zero() ? std::chrono::milliseconds::zero() : interval) {}

std::chrono::milliseconds CommandThrottle::acquire() {
    // Held across the sleep so concurrent callers queue up one interval apart.
    std::scoped_lock lock(mutex_);
    std::chrono::milliseconds waited{0};
    if (last_command_) {
        const auto ready_at = *last_command_ + interval_;
        const auto now = Clock::now();
        if (now < ready_at) {
            waited = std::chrono::duration_cast<std::chrono::milliseconds>(ready_at - now);
            log_event(StructuredLogger::Level::Info,
                      "session.rate_limit.wait",
                      {{"wait_ms", std::to_string(waited.count())}});
            std::this_thread::sleep_until(ready_at);
        }
    }
    last_command_ = Clock::now();
    return waited;
}

std::optional<CommandThrottle::Clock::time_point> CommandThrottle::last_command() const {
    std::scoped_lock lock(mutex_);
    return last_command_;
}

}  // namespace bookhound::session
