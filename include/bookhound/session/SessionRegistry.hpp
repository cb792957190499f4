#pragma once

#include "bookhound/Config.hpp"
#include "bookhound/Types.hpp"
#include "bookhound/session/ChatSession.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace bookhound::session {

struct CreateResult {
    SessionId session_id;
    bool connected{false};
    std::string message;
};

struct SessionSummary {
    SessionId session_id;
    SessionStatus status;
};

// id -> session table. Entries stay registered until close(), including
// sessions whose connect failed, so their status remains inspectable.
class SessionRegistry {
public:
    SessionRegistry() = default;
    ~SessionRegistry();

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    // Process-wide table used by the daemon.
    static SessionRegistry& instance();

    // Registers a new session and runs its connect sequence on the caller's thread.
    CreateResult create(Config config);

    [[nodiscard]] std::shared_ptr<ChatSession> get(const SessionId& id) const;

    // Disconnects and forgets the session. False for unknown ids.
    bool close(const SessionId& id);

    [[nodiscard]] std::vector<SessionSummary> list_active_sessions() const;
    [[nodiscard]] std::size_t size() const;

    void close_all();

private:
    SessionId next_id();

    mutable std::mutex mutex_;
    std::map<SessionId, std::shared_ptr<ChatSession>> sessions_;
    std::atomic<std::uint64_t> counter_{0};
};

}  // namespace bookhound::session
