#include "bookhound/search/SearchOrchestrator.hpp"

#include "bookhound/core/StructuredLogger.hpp"
#include "bookhound/search/ResultParser.hpp"

#include <algorithm>
#include <mutex>
#include <utility>

namespace bookhound::search {

namespace {

std::vector<RankedRecord> scored(const std::vector<BookRecord>& records, RankMode mode) {
    std::vector<RankedRecord> ranked;
    ranked.reserve(records.size());
    for (const auto& record : records) {
        ranked.push_back(RankedRecord{record, score(record, mode)});
    }
    return ranked;
}

std::vector<BookRecord> records_of(const std::vector<RankedRecord>& ranked) {
    std::vector<BookRecord> records;
    records.reserve(ranked.size());
    for (const auto& entry : ranked) {
        records.push_back(entry.record);
    }
    return records;
}

template <typename T>
void truncate(std::vector<T>& values, std::size_t limit) {
    if (values.size() > limit) {
        values.resize(limit);
    }
}

}  // namespace

std::string smart_mode_to_string(SmartMode mode) {
    switch (mode) {
        case SmartMode::AuthorLevel:
            return "author_level";
        case SmartMode::TitleLevel:
            return "title_level";
    }
    return "author_level";
}

SearchOrchestrator::SearchOrchestrator(session::ChatSession& session)
    : session_(session) {}

SearchOutcome SearchOrchestrator::search_books(const std::string& author,
                                               const std::optional<std::string>& title,
                                               const SearchOptions& options) {
    std::scoped_lock lock(session_.operation_mutex());
    return search_unlocked(author, title, options);
}

SearchOutcome SearchOrchestrator::search_author_level(const std::string& author, std::size_t max_results) {
    std::scoped_lock lock(session_.operation_mutex());
    return author_level_unlocked(author, max_results);
}

SearchOutcome SearchOrchestrator::search_title_level(const std::string& author,
                                                     const std::string& title,
                                                     std::size_t max_results) {
    std::scoped_lock lock(session_.operation_mutex());
    return title_level_unlocked(author, title, max_results);
}

FallbackResult SearchOrchestrator::download_with_fallback(const std::vector<BookRecord>& candidates,
                                                          std::chrono::milliseconds per_attempt,
                                                          const std::optional<std::string>& filename) {
    std::scoped_lock lock(session_.operation_mutex());
    return fallback_unlocked(candidates, per_attempt, filename);
}

SearchOutcome SearchOrchestrator::search_unlocked(const std::string& author,
                                                  const std::optional<std::string>& title,
                                                  const SearchOptions& options) {
    SearchOutcome outcome{};
    const auto& config = session_.config();
    const auto max_results = options.max_results > 0 ? options.max_results : config.search_max_results;

    auto collection = session_.collect_search(author, title, max_results);
    outcome.query = collection.query;
    if (!collection.success) {
        outcome.message = collection.message;
        return outcome;
    }

    auto report = session_.parser().parse_lines(collection.lines);
    outcome.raw_lines = collection.lines.size();
    outcome.parse_errors = report.rejected;

    // Search bots answer with a packaged result list sent over DCC.
    for (const auto& offer : collection.offers) {
        const auto deadline = std::chrono::steady_clock::now() + config.response_timeout;
        auto package = session_.receive_offer(offer, std::nullopt, deadline);
        if (!package.success) {
            log_event(StructuredLogger::Level::Warning,
                      "search.package.failed",
                      {{"session", session_.id()}, {"file", offer.filename}, {"reason", package.message}});
            continue;
        }
        log_event(StructuredLogger::Level::Info,
                  "search.package.parsed",
                  {{"session", session_.id()},
                   {"file", offer.filename},
                   {"records", std::to_string(package.listed_records.size())}});
        for (auto& record : package.listed_records) {
            report.records.push_back(std::move(record));
        }
    }

    FilterOptions filter{};
    filter.author = author;
    filter.epub_only = options.epub_only;
    filter.format = options.format;
    auto records = filter_records(std::move(report.records), filter);

    if (title && !title->empty()) {
        outcome.candidates = rank(records, RankMode::Title);
    } else {
        sort_by_format_priority(records);
        outcome.candidates = scored(records, RankMode::Author);
    }
    truncate(outcome.candidates, max_results);

    session_.record_search(outcome.query, outcome.candidates.size(), outcome.parse_errors);
    outcome.success = true;
    outcome.message = "Found " + std::to_string(outcome.candidates.size()) + " results";
    log_event(StructuredLogger::Level::Info,
              "search.completed",
              {{"session", session_.id()},
               {"query", outcome.query},
               {"lines", std::to_string(outcome.raw_lines)},
               {"results", std::to_string(outcome.candidates.size())},
               {"parse_errors", std::to_string(outcome.parse_errors)}});
    return outcome;
}

SearchOutcome SearchOrchestrator::author_level_unlocked(const std::string& author, std::size_t max_results) {
    if (max_results == 0) {
        max_results = session_.config().author_result_limit;
    }
    SearchOptions options{};
    options.max_results = max_results * 2;
    auto outcome = search_unlocked(author, std::nullopt, options);
    if (!outcome.success) {
        return outcome;
    }

    auto unique = best_per_title(records_of(outcome.candidates), RankMode::Author);
    std::stable_sort(unique.begin(), unique.end(), [](const RankedRecord& lhs, const RankedRecord& rhs) {
        return normalize_title(lhs.record.title) < normalize_title(rhs.record.title);
    });
    truncate(unique, max_results);

    log_event(StructuredLogger::Level::Info,
              "search.author_level",
              {{"session", session_.id()}, {"author", author}, {"unique", std::to_string(unique.size())}});
    outcome.candidates = std::move(unique);
    outcome.message = "Found " + std::to_string(outcome.candidates.size()) + " unique titles";
    return outcome;
}

SearchOutcome SearchOrchestrator::title_level_unlocked(const std::string& author,
                                                       const std::string& title,
                                                       std::size_t max_results) {
    if (max_results == 0) {
        max_results = session_.config().title_result_limit;
    }
    SearchOptions options{};
    options.max_results = max_results * 3;
    auto outcome = search_unlocked(author, title, options);
    if (!outcome.success) {
        return outcome;
    }

    std::vector<std::string> servers;
    std::vector<std::vector<BookRecord>> groups;
    for (const auto& entry : outcome.candidates) {
        if (!titles_match(title, entry.record.title)) {
            continue;
        }
        const auto it = std::find(servers.begin(), servers.end(), entry.record.server_tag);
        if (it == servers.end()) {
            servers.push_back(entry.record.server_tag);
            groups.push_back({entry.record});
        } else {
            groups[static_cast<std::size_t>(it - servers.begin())].push_back(entry.record);
        }
    }

    std::vector<BookRecord> per_server;
    per_server.reserve(groups.size());
    for (const auto& group : groups) {
        if (auto best = best_of(group, RankMode::Title)) {
            per_server.push_back(std::move(best->record));
        }
    }
    auto ranked = rank(per_server, RankMode::Title);
    truncate(ranked, max_results);

    log_event(StructuredLogger::Level::Info,
              "search.title_level",
              {{"session", session_.id()},
               {"author", author},
               {"title", title},
               {"servers", std::to_string(ranked.size())}});
    outcome.candidates = std::move(ranked);
    outcome.message = "Found " + std::to_string(outcome.candidates.size()) + " server options";
    return outcome;
}

FallbackResult SearchOrchestrator::fallback_unlocked(const std::vector<BookRecord>& candidates,
                                                     std::chrono::milliseconds per_attempt,
                                                     const std::optional<std::string>& filename) {
    FallbackResult result{};
    if (candidates.empty()) {
        result.message = "No candidates provided";
        return result;
    }

    result.total_attempts = candidates.size();
    for (std::size_t index = 0; index < candidates.size(); ++index) {
        const auto& candidate = candidates[index];
        const auto attempt = index + 1;
        log_event(StructuredLogger::Level::Info,
                  "download.attempt",
                  {{"session", session_.id()},
                   {"attempt", std::to_string(attempt) + "/" + std::to_string(result.total_attempts)},
                   {"server", candidate.server_tag},
                   {"title", candidate.title}});

        session::DownloadRequest request{};
        request.reply_command = candidate.reply_command;
        request.filename = filename;
        request.deadline = std::chrono::steady_clock::now() + per_attempt;
        if (!candidate.server_tag.empty()) {
            request.expected_sender = candidate.server_tag;
        }

        auto transfer = session_.download(request);
        if (transfer.success) {
            result.success = true;
            result.message = transfer.message;
            result.transfer = std::move(transfer);
            result.attempt_number = attempt;
            result.used_candidate = candidate;
            log_event(StructuredLogger::Level::Info,
                      "download.succeeded",
                      {{"session", session_.id()},
                       {"server", candidate.server_tag},
                       {"path", result.transfer.file_path.string()}});
            return result;
        }

        log_event(StructuredLogger::Level::Warning,
                  "download.attempt_failed",
                  {{"session", session_.id()}, {"server", candidate.server_tag}, {"reason", transfer.message}});
        result.transfer = std::move(transfer);
    }

    for (const auto& candidate : candidates) {
        result.candidates_tried.push_back(candidate.server_tag.empty() ? "unknown" : candidate.server_tag);
    }
    result.message = "All " + std::to_string(result.total_attempts) + " download candidates failed";
    log_event(StructuredLogger::Level::Error,
              "download.exhausted",
              {{"session", session_.id()}, {"attempts", std::to_string(result.total_attempts)}});
    return result;
}

SmartOutcome SearchOrchestrator::smart_search_and_download(const std::string& author,
                                                           const std::optional<std::string>& title,
                                                           const std::optional<std::string>& filename) {
    std::scoped_lock lock(session_.operation_mutex());
    SmartOutcome outcome{};

    if (title && !title->empty()) {
        outcome.mode = SmartMode::TitleLevel;
        outcome.query = author + " - " + *title;
        auto search = title_level_unlocked(author, *title, kSmartTitleLimit);
        if (!search.success) {
            outcome.message = "Smart search failed: " + search.message;
            return outcome;
        }
        if (search.candidates.empty()) {
            outcome.message = "No copies of '" + *title + "' by " + author + " found on any server";
            return outcome;
        }
        outcome.unique_books = std::move(search.candidates);
        auto download = fallback_unlocked(records_of(outcome.unique_books),
                                          session_.config().fallback_attempt_timeout,
                                          filename);
        outcome.success = download.success;
        outcome.message = download.message;
        outcome.download = std::move(download);
        return outcome;
    }

    outcome.mode = SmartMode::AuthorLevel;
    outcome.query = author;
    auto search = author_level_unlocked(author, kSmartAuthorLimit);
    if (!search.success) {
        outcome.message = "Smart search failed: " + search.message;
        return outcome;
    }
    if (search.candidates.empty()) {
        outcome.message = "No books found by author: " + author;
        return outcome;
    }
    outcome.unique_books = std::move(search.candidates);
    outcome.success = true;
    outcome.message = "Found " + std::to_string(outcome.unique_books.size()) + " unique books by " + author +
                      ". Use title-level search to download specific book.";
    return outcome;
}

}  // namespace bookhound::search
