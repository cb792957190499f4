#include "bookhound/session/CommandThrottle.hpp"

#include <cassert>
#include <chrono>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using bookhound::session::CommandThrottle;

int main() {
    CommandThrottle throttle(300ms);
    assert(!throttle.last_command().has_value());

    const auto first_wait = throttle.acquire();
    assert(first_wait == 0ms);
    const auto first = throttle.last_command();
    assert(first.has_value());

    throttle.acquire();
    const auto second = throttle.last_command();
    assert(*second - *first >= 300ms);

    std::this_thread::sleep_for(350ms);
    assert(throttle.acquire() == 0ms);

    // Concurrent callers are queued one interval apart.
    CommandThrottle shared(150ms);
    const auto started = CommandThrottle::Clock::now();
    std::vector<std::thread> callers;
    for (int i = 0; i < 3; ++i) {
        callers.emplace_back([&]() { shared.acquire(); });
    }
    for (auto& caller : callers) {
        caller.join();
    }
    assert(CommandThrottle::Clock::now() - started >= 300ms);

    CommandThrottle unpaced(-5ms);
    assert(unpaced.interval() == 0ms);
    unpaced.acquire();
    assert(unpaced.acquire() == 0ms);

    return 0;
}
