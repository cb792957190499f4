#pragma once

#include "bookhound/Types.hpp"
#include "bookhound/search/CandidateRanker.hpp"
#include "bookhound/session/ChatSession.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace bookhound::search {

constexpr std::size_t kSmartTitleLimit = 10;
constexpr std::size_t kSmartAuthorLimit = 20;

struct SearchOptions {
    // 0 selects Config::search_max_results.
    std::size_t max_results{0};
    bool epub_only{false};
    std::optional<std::string> format{};
};

struct SearchOutcome {
    bool success{false};
    std::string message;
    std::string query;
    std::vector<RankedRecord> candidates;
    std::size_t raw_lines{0};
    std::size_t parse_errors{0};
};

struct FallbackResult {
    bool success{false};
    std::string message;
    TransferResult transfer;
    std::size_t attempt_number{0};
    std::size_t total_attempts{0};
    std::optional<BookRecord> used_candidate{};
    std::vector<std::string> candidates_tried;
};

enum class SmartMode {
    AuthorLevel,
    TitleLevel
};

struct SmartOutcome {
    bool success{false};
    std::string message;
    SmartMode mode{SmartMode::AuthorLevel};
    std::string query;
    std::vector<RankedRecord> unique_books;
    std::optional<FallbackResult> download{};
};

std::string smart_mode_to_string(SmartMode mode);

// Search and download workflows on top of one ready ChatSession. Every public
// call holds the session's operation mutex for its whole duration.
class SearchOrchestrator {
public:
    explicit SearchOrchestrator(session::ChatSession& session);

    SearchOutcome search_books(const std::string& author,
                               const std::optional<std::string>& title = std::nullopt,
                               const SearchOptions& options = {});

    // One best record per distinct normalized title, sorted by title.
    SearchOutcome search_author_level(const std::string& author, std::size_t max_results = 0);

    // Matching copies of one title, best per server, best first.
    SearchOutcome search_title_level(const std::string& author,
                                     const std::string& title,
                                     std::size_t max_results = 0);

    // Tries candidates in order, each bounded by `per_attempt`; stops at the first success.
    FallbackResult download_with_fallback(const std::vector<BookRecord>& candidates,
                                          std::chrono::milliseconds per_attempt,
                                          const std::optional<std::string>& filename = std::nullopt);

    SmartOutcome smart_search_and_download(const std::string& author,
                                           const std::optional<std::string>& title = std::nullopt,
                                           const std::optional<std::string>& filename = std::nullopt);

private:
    SearchOutcome search_unlocked(const std::string& author,
                                  const std::optional<std::string>& title,
                                  const SearchOptions& options);
    SearchOutcome author_level_unlocked(const std::string& author, std::size_t max_results);
    SearchOutcome title_level_unlocked(const std::string& author, const std::string& title, std::size_t max_results);
    FallbackResult fallback_unlocked(const std::vector<BookRecord>& candidates,
                                     std::chrono::milliseconds per_attempt,
                                     const std::optional<std::string>& filename);

    session::ChatSession& session_;
};

}  // namespace bookhound::search
