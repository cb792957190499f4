#include "bookhound/session/SessionRegistry.hpp"

#include "bookhound/core/StructuredLogger.hpp"

#include <chrono>
#include <utility>

namespace bookhound::session {

SessionRegistry::~SessionRegistry() {
    close_all();
}

SessionRegistry& SessionRegistry::instance() {
    static SessionRegistry registry;
    return registry;
}

SessionId SessionRegistry::next_id() {
    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
                             std::chrono::system_clock::now().time_since_epoch())
                             .count();
    const auto sequence = counter_.fetch_add(1, std::memory_order_relaxed) + 1;
    return "irc_session_" + std::to_string(seconds) + "_" + std::to_string(sequence);
}

CreateResult SessionRegistry::create(Config config) {
    CreateResult result{};
    result.session_id = next_id();
    auto session = std::make_shared<ChatSession>(result.session_id, std::move(config));
    {
        std::scoped_lock lock(mutex_);
        sessions_.emplace(result.session_id, session);
    }
    log_event(StructuredLogger::Level::Info, "registry.session.created", {{"session", result.session_id}});

    result.connected = session->connect();
    if (result.connected) {
        result.message = "Connected to " + session->config().server_host;
    } else {
        const auto status = session->status();
        result.message = status.errors.empty() ? "Failed to connect" : status.errors.back();
    }
    return result;
}

std::shared_ptr<ChatSession> SessionRegistry::get(const SessionId& id) const {
    std::scoped_lock lock(mutex_);
    const auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return nullptr;
    }
    return it->second;
}

bool SessionRegistry::close(const SessionId& id) {
    std::shared_ptr<ChatSession> session;
    {
        std::scoped_lock lock(mutex_);
        const auto it = sessions_.find(id);
        if (it == sessions_.end()) {
            return false;
        }
        session = std::move(it->second);
        sessions_.erase(it);
    }
    session->disconnect();
    log_event(StructuredLogger::Level::Info, "registry.session.closed", {{"session", id}});
    return true;
}

std::vector<SessionSummary> SessionRegistry::list_active_sessions() const {
    std::vector<std::shared_ptr<ChatSession>> sessions;
    {
        std::scoped_lock lock(mutex_);
        sessions.reserve(sessions_.size());
        for (const auto& [id, session] : sessions_) {
            sessions.push_back(session);
        }
    }
    std::vector<SessionSummary> summaries;
    summaries.reserve(sessions.size());
    for (const auto& session : sessions) {
        summaries.push_back(SessionSummary{session->id(), session->status()});
    }
    return summaries;
}

std::size_t SessionRegistry::size() const {
    std::scoped_lock lock(mutex_);
    return sessions_.size();
}

void SessionRegistry::close_all() {
    std::map<SessionId, std::shared_ptr<ChatSession>> sessions;
    {
        std::scoped_lock lock(mutex_);
        sessions.swap(sessions_);
    }
    for (auto& [id, session] : sessions) {
        session->disconnect();
    }
}

}  // namespace bookhound::session
