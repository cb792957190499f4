#include "bookhound/search/SearchOrchestrator.hpp"
#include "fake_peers.hpp"
#include "zip_fixture.hpp"

#include <cassert>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using namespace bookhound;

namespace {

BookRecord candidate(const std::string& server) {
    BookRecord record{};
    record.server_tag = server;
    record.author = "Isaac Asimov";
    record.title = "Foundation";
    record.extension = "epub";
    record.declared_size_text = "1MB";
    record.reply_command = "!" + server + " Isaac Asimov - Foundation.epub";
    return record;
}

}  // namespace

int main() {
    const auto downloads = std::filesystem::temp_directory_path() / "bookhound_orchestrator_test";
    std::filesystem::remove_all(downloads);

    std::string book(1000, 'F');
    test::FakeDccServer good_peer(book);
    test::FakeDccServer short_peer(book, 800);
    test::FakeDccServer slow_peer(book);
    std::vector<std::thread> late_replies;

    const std::string listing =
        "# Packaged Writer\n"
        "!Bsk Packaged Writer - Second Book.mobi ::INFO:: 2MB\n"
        "!Ook Packaged Writer - First Book.epub ::INFO:: 1MB\n";
    test::FakeDccServer package_peer(test::build_zip({{"SearchBot_results_for_Packaged_Writer.txt", listing, true}}));

    test::FakeIrcServer server;
    server.set_channel_handler([&](const std::string& nick, const std::string& text) -> std::vector<std::string> {
        const auto to_me = [&](const std::string& from, const std::string& body) {
            return ":" + from + "!bot@test PRIVMSG " + nick + " :" + body;
        };
        const auto in_channel = [](const std::string& body) {
            return ":Bot!bot@test PRIVMSG #ebooks :" + body;
        };
        if (text == "@search Isaac Asimov Foundation") {
            return {
                in_channel("!Ook Isaac Asimov - Foundation.epub ::INFO:: 1.2MB"),
                in_channel("!Ook Isaac Asimov - Foundation v2.epub ::INFO:: 1.1MB"),
                in_channel("!Bsk Isaac Asimov - Foundation (retail).mobi ::INFO:: 900KB"),
                in_channel("!Dragon Isaac Asimov - Foundation and Empire.epub ::INFO:: 1.3MB"),
                in_channel("!Pond Isaac Asimov - The Gods Themselves.epub ::INFO:: 700KB"),
            };
        }
        if (text == "@search Isaac Asimov") {
            return {
                in_channel("!Ook Isaac Asimov - Foundation.epub ::INFO:: 1.2MB"),
                in_channel("!Bsk Isaac Asimov - Foundation v5.epub ::INFO:: 1.2MB"),
                in_channel("!Ook Isaac Asimov - I, Robot.epub ::INFO:: 500KB"),
                in_channel("!Pond Isaac Asimov - The Caves of Steel.pdf ::INFO:: 2MB"),
                in_channel("!Pond Somebody Else - Unrelated.epub ::INFO:: 1MB"),
                in_channel("!X A - B.epub"),
            };
        }
        if (text == "@search Packaged Writer") {
            return {to_me("Search", package_peer.offer_line("SearchBot_results_for_Packaged_Writer.txt.zip"))};
        }
        if (text.rfind("!Short ", 0) == 0) {
            return {to_me("Short", short_peer.offer_line("Foundation.epub"))};
        }
        if (text.rfind("!Good ", 0) == 0 || text.rfind("!Never ", 0) == 0 || text.rfind("!Ook ", 0) == 0) {
            const auto sender = text.substr(1, text.find(' ') - 1);
            return {to_me(sender, good_peer.offer_line("Foundation.epub"))};
        }
        if (text.rfind("!Slow ", 0) == 0) {
            // Answers only after the attempt that asked has given up.
            const auto late_offer = to_me("Slow", slow_peer.offer_line("SlowCopy.epub"));
            late_replies.emplace_back([&server, late_offer]() {
                std::this_thread::sleep_for(1300ms);
                server.send(late_offer);
            });
            return {};
        }
        return {};
    });

    session::ChatSession chat("irc_session_orchestrator", test::loopback_config(server.port(), downloads.string()));
    assert(chat.connect());
    search::SearchOrchestrator orchestrator(chat);

    // Author plus title: every copy, ranked for download.
    const auto books = orchestrator.search_books("Isaac Asimov", std::string("Foundation"));
    assert(books.success);
    assert(books.query == "@search Isaac Asimov Foundation");
    assert(books.raw_lines == 5);
    assert(books.parse_errors == 0);
    assert(books.candidates.size() == 5);
    assert(books.candidates.front().record.title == "Foundation v2");
    for (std::size_t i = 1; i < books.candidates.size(); ++i) {
        assert(books.candidates[i - 1].score >= books.candidates[i].score);
    }

    search::SearchOptions mobi_only{};
    mobi_only.format = "mobi";
    const auto mobi = orchestrator.search_books("Isaac Asimov", std::string("Foundation"), mobi_only);
    assert(mobi.candidates.size() == 1);
    assert(mobi.candidates.front().record.server_tag == "Bsk");

    // Title level: only matching titles, best copy per server.
    const auto title = orchestrator.search_title_level("Isaac Asimov", "Foundation");
    assert(title.success);
    assert(title.candidates.size() == 3);
    assert(title.candidates[0].record.server_tag == "Ook");
    assert(title.candidates[0].record.title == "Foundation v2");
    assert(title.candidates[1].record.server_tag == "Bsk");
    assert(title.candidates[2].record.server_tag == "Dragon");
    assert(title.message == "Found 3 server options");

    // Author level: one representative per title, ordered by title.
    const auto author = orchestrator.search_author_level("Isaac Asimov");
    assert(author.success);
    assert(author.parse_errors == 1);
    assert(author.candidates.size() == 3);
    assert(author.candidates[0].record.title == "The Caves of Steel");
    assert(author.candidates[1].record.title == "Foundation v5");
    assert(author.candidates[1].record.server_tag == "Bsk");
    assert(author.candidates[2].record.title == "I, Robot");
    assert(chat.status().parse_errors >= 1);

    const auto capped = orchestrator.search_author_level("Isaac Asimov", 2);
    assert(capped.candidates.size() == 2);

    // Result packages delivered over DCC are unpacked and parsed.
    const auto packaged = orchestrator.search_books("Packaged Writer");
    assert(packaged.success);
    assert(packaged.raw_lines == 0);
    assert(packaged.candidates.size() == 2);
    assert(packaged.candidates[0].record.title == "First Book");
    assert(packaged.candidates[0].record.source_file == std::optional<std::string>("SearchBot_results_for_Packaged_Writer.txt"));
    assert(packaged.candidates[1].record.reply_command == "!Bsk Packaged Writer - Second Book.mobi");
    assert(chat.status().total_downloads == 0);

    // Fallback: two failures, then a success; the fourth candidate is never requested.
    const std::vector<BookRecord> candidates{candidate("Short"), candidate("Silent"), candidate("Good"), candidate("Never")};
    const auto fallback = orchestrator.download_with_fallback(candidates, 1s, std::string("Asimov - Foundation.epub"));
    assert(fallback.success);
    assert(fallback.attempt_number == 3);
    assert(fallback.total_attempts == 4);
    assert(fallback.used_candidate.has_value());
    assert(fallback.used_candidate->server_tag == "Good");
    assert(fallback.transfer.file_path == downloads / "Asimov - Foundation.epub");
    assert(fallback.transfer.bytes_received == 1000u);
    assert(server.count_prefixed("PRIVMSG #ebooks :!Short ") == 1);
    assert(server.count_prefixed("PRIVMSG #ebooks :!Silent ") == 1);
    assert(server.count_prefixed("PRIVMSG #ebooks :!Good ") == 1);
    assert(server.count_prefixed("PRIVMSG #ebooks :!Never ") == 0);

    const auto exhausted = orchestrator.download_with_fallback({candidate("Short"), candidate("Silent")}, 700ms);
    assert(!exhausted.success);
    assert(exhausted.message == "All 2 download candidates failed");
    assert(exhausted.candidates_tried == (std::vector<std::string>{"Short", "Silent"}));
    assert(exhausted.attempt_number == 0);

    // A late offer from an abandoned candidate is not credited to the next one.
    const auto stale = orchestrator.download_with_fallback({candidate("Slow"), candidate("Other")}, 1s);
    assert(!stale.success);
    assert(stale.message == "All 2 download candidates failed");
    assert(stale.candidates_tried == (std::vector<std::string>{"Slow", "Other"}));
    assert(server.count_prefixed("PRIVMSG #ebooks :!Other ") == 1);
    assert(slow_peer.connections() == 0);
    assert(!std::filesystem::exists(downloads / "SlowCopy.epub"));

    const auto nothing = orchestrator.download_with_fallback({}, 1s);
    assert(!nothing.success);
    assert(nothing.message == "No candidates provided");

    // Smart mode downloads when the target is unambiguous.
    const auto smart_title = orchestrator.smart_search_and_download("Isaac Asimov", std::string("Foundation"));
    assert(smart_title.success);
    assert(smart_title.mode == search::SmartMode::TitleLevel);
    assert(smart_title.download.has_value());
    assert(smart_title.download->attempt_number == 1);
    assert(smart_title.download->used_candidate->server_tag == "Ook");

    const auto smart_author = orchestrator.smart_search_and_download("Isaac Asimov");
    assert(smart_author.success);
    assert(smart_author.mode == search::SmartMode::AuthorLevel);
    assert(!smart_author.download.has_value());
    assert(smart_author.unique_books.size() == 3);
    assert(smart_author.message ==
           "Found 3 unique books by Isaac Asimov. Use title-level search to download specific book.");

    const auto smart_missing = orchestrator.smart_search_and_download("Nobody Known");
    assert(!smart_missing.success);
    assert(smart_missing.message == "No books found by author: Nobody Known");
    assert(search::smart_mode_to_string(smart_missing.mode) == "author_level");

    assert(chat.status().total_downloads == 2);

    chat.disconnect();
    for (auto& reply : late_replies) {
        reply.join();
    }
    const auto offline = orchestrator.search_books("Isaac Asimov");
    assert(!offline.success);
    assert(offline.message == "Not connected to IRC");
    const auto smart_offline = orchestrator.smart_search_and_download("Isaac Asimov", std::string("Foundation"));
    assert(smart_offline.message == "Smart search failed: Not connected to IRC");

    std::filesystem::remove_all(downloads);
    return 0;
}
