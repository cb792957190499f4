#include "bookhound/session/SessionRegistry.hpp"
#include "fake_peers.hpp"

#include <cassert>
#include <filesystem>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using namespace bookhound;

int main() {
    const auto downloads = (std::filesystem::temp_directory_path() / "bookhound_registry_test").string();
    test::FakeIrcServer first_server;
    test::FakeIrcServer second_server;

    session::SessionRegistry registry;
    assert(registry.size() == 0);
    assert(registry.get("irc_session_0_0") == nullptr);
    assert(!registry.close("irc_session_0_0"));

    const auto first = registry.create(test::loopback_config(first_server.port(), downloads));
    assert(first.connected);
    assert(first.session_id.rfind("irc_session_", 0) == 0);
    assert(first.message == "Connected to 127.0.0.1");

    const auto second = registry.create(test::loopback_config(second_server.port(), downloads));
    assert(second.connected);
    assert(second.session_id != first.session_id);
    assert(registry.size() == 2);

    // A failed connect still registers the session so its errors stay visible.
    std::uint16_t closed_port = 0;
    {
        auto listener = net::listen_tcp("127.0.0.1", 0, &closed_port);
    }
    const auto failed = registry.create(test::loopback_config(closed_port, downloads));
    assert(!failed.connected);
    assert(failed.message.find("Failed to connect after") != std::string::npos);
    const auto failed_session = registry.get(failed.session_id);
    assert(failed_session != nullptr);
    assert(!failed_session->status().errors.empty());
    assert(registry.size() == 3);

    const auto summaries = registry.list_active_sessions();
    assert(summaries.size() == 3);
    std::set<std::string> ids;
    std::size_t connected = 0;
    for (const auto& summary : summaries) {
        ids.insert(summary.session_id);
        assert(summary.status.session_id == summary.session_id);
        connected += summary.status.connected ? 1 : 0;
    }
    assert(ids.size() == 3);
    assert(connected == 2);

    // Closing is exactly-once; a closed id never comes back.
    const auto held = registry.get(first.session_id);
    assert(held != nullptr);
    assert(registry.close(first.session_id));
    assert(!registry.close(first.session_id));
    assert(registry.get(first.session_id) == nullptr);
    assert(!held->ready());
    assert(first_server.wait_for("QUIT", 2s));
    assert(registry.size() == 2);

    // Concurrent lookups and closes are safe.
    std::vector<std::thread> workers;
    std::atomic<int> closes{0};
    for (int i = 0; i < 4; ++i) {
        workers.emplace_back([&]() {
            for (int j = 0; j < 50; ++j) {
                (void)registry.get(second.session_id);
                (void)registry.list_active_sessions();
            }
            if (registry.close(second.session_id)) {
                ++closes;
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    assert(closes.load() == 1);
    assert(registry.size() == 1);

    registry.close_all();
    assert(registry.size() == 0);
    assert(registry.list_active_sessions().empty());

    std::filesystem::remove_all(downloads);
    return 0;
}
