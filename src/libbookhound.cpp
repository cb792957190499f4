#include "bookhound/libbookhound.hpp"

#include <utility>

namespace bookhound::lib {

namespace {

std::string unknown_session(const SessionId& id) {
    return "Session not found: " + id;
}

}  // namespace

class Engine::Impl {
public:
    explicit Impl(Config defaults)
        : defaults_(std::move(defaults)) {}

    Config defaults_;
    session::SessionRegistry registry_;
};

Engine::Engine(Config defaults)
    : impl_(std::make_unique<Impl>(std::move(defaults))) {}

Engine::~Engine() = default;
Engine::Engine(Engine&&) noexcept = default;
Engine& Engine::operator=(Engine&&) noexcept = default;

session::CreateResult Engine::create_session() {
    return impl_->registry_.create(impl_->defaults_);
}

session::CreateResult Engine::create_session(Config config) {
    return impl_->registry_.create(std::move(config));
}

bool Engine::close_session(const SessionId& id) {
    return impl_->registry_.close(id);
}

std::optional<SessionStatus> Engine::status(const SessionId& id) const {
    const auto session = impl_->registry_.get(id);
    if (!session) {
        return std::nullopt;
    }
    return session->status();
}

std::vector<session::SessionSummary> Engine::list_sessions() const {
    return impl_->registry_.list_active_sessions();
}

search::SearchOutcome Engine::search(const SessionId& id,
                                     const std::string& author,
                                     const std::optional<std::string>& title,
                                     const search::SearchOptions& options) {
    const auto session = impl_->registry_.get(id);
    if (!session) {
        search::SearchOutcome outcome{};
        outcome.message = unknown_session(id);
        return outcome;
    }
    return search::SearchOrchestrator(*session).search_books(author, title, options);
}

search::SearchOutcome Engine::search_author_level(const SessionId& id, const std::string& author, std::size_t max_results) {
    const auto session = impl_->registry_.get(id);
    if (!session) {
        search::SearchOutcome outcome{};
        outcome.message = unknown_session(id);
        return outcome;
    }
    return search::SearchOrchestrator(*session).search_author_level(author, max_results);
}

search::SearchOutcome Engine::search_title_level(const SessionId& id,
                                                 const std::string& author,
                                                 const std::string& title,
                                                 std::size_t max_results) {
    const auto session = impl_->registry_.get(id);
    if (!session) {
        search::SearchOutcome outcome{};
        outcome.message = unknown_session(id);
        return outcome;
    }
    return search::SearchOrchestrator(*session).search_title_level(author, title, max_results);
}

search::FallbackResult Engine::download(const SessionId& id,
                                        const std::vector<BookRecord>& candidates,
                                        std::optional<std::chrono::milliseconds> per_attempt,
                                        const std::optional<std::string>& filename) {
    const auto session = impl_->registry_.get(id);
    if (!session) {
        search::FallbackResult result{};
        result.message = unknown_session(id);
        return result;
    }
    const auto timeout = per_attempt.value_or(std::chrono::milliseconds(session->config().fallback_attempt_timeout));
    return search::SearchOrchestrator(*session).download_with_fallback(candidates, timeout, filename);
}

search::SmartOutcome Engine::smart_search_and_download(const SessionId& id,
                                                       const std::string& author,
                                                       const std::optional<std::string>& title,
                                                       const std::optional<std::string>& filename) {
    const auto session = impl_->registry_.get(id);
    if (!session) {
        search::SmartOutcome outcome{};
        outcome.message = unknown_session(id);
        return outcome;
    }
    return search::SearchOrchestrator(*session).smart_search_and_download(author, title, filename);
}

const Config& Engine::defaults() const noexcept {
    return impl_->defaults_;
}

}  // namespace bookhound::lib
