#pragma once

#include "bookhound/Export.hpp"
#include "bookhound/Config.hpp"
#include "bookhound/Types.hpp"
#include "bookhound/search/SearchOrchestrator.hpp"
#include "bookhound/session/SessionRegistry.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace bookhound::lib {

// Embedding entry point: owns a private session table and exposes the
// search/download workflows by session id.
class BOOKHOUND_API Engine {
public:
    explicit Engine(Config defaults = {});
    ~Engine();

    Engine(Engine&&) noexcept;
    Engine& operator=(Engine&&) noexcept;
    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    session::CreateResult create_session();
    session::CreateResult create_session(Config config);
    bool close_session(const SessionId& id);
    std::optional<SessionStatus> status(const SessionId& id) const;
    std::vector<session::SessionSummary> list_sessions() const;

    search::SearchOutcome search(const SessionId& id,
                                 const std::string& author,
                                 const std::optional<std::string>& title = std::nullopt,
                                 const search::SearchOptions& options = {});
    search::SearchOutcome search_author_level(const SessionId& id, const std::string& author, std::size_t max_results = 0);
    search::SearchOutcome search_title_level(const SessionId& id,
                                             const std::string& author,
                                             const std::string& title,
                                             std::size_t max_results = 0);
    search::FallbackResult download(const SessionId& id,
                                    const std::vector<BookRecord>& candidates,
                                    std::optional<std::chrono::milliseconds> per_attempt = std::nullopt,
                                    const std::optional<std::string>& filename = std::nullopt);
    search::SmartOutcome smart_search_and_download(const SessionId& id,
                                                   const std::string& author,
                                                   const std::optional<std::string>& title = std::nullopt,
                                                   const std::optional<std::string>& filename = std::nullopt);

    const Config& defaults() const noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace bookhound::lib
