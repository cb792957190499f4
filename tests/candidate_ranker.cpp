#include "bookhound/search/CandidateRanker.hpp"

#include <cassert>
#include <cmath>
#include <string>
#include <utility>
#include <vector>

using namespace bookhound;
using namespace bookhound::search;

namespace {

BookRecord make_record(std::string server, std::string title, std::string extension = "epub", std::string size = "1.2MB") {
    BookRecord record{};
    record.server_tag = std::move(server);
    record.author = "Some Author";
    record.title = std::move(title);
    record.extension = std::move(extension);
    record.declared_size_text = std::move(size);
    record.reply_command = "!" + record.server_tag + " Some Author - " + record.title + "." + record.extension;
    return record;
}

bool near(double lhs, double rhs) {
    return std::fabs(lhs - rhs) < 1e-6;
}

}  // namespace

int main() {
    const std::vector<BookRecord> versions{
        make_record("A", "Book v3"),
        make_record("B", "Book v5"),
        make_record("C", "Book v4"),
    };
    for (const auto mode : {RankMode::Author, RankMode::Title}) {
        const auto best = best_per_title(versions, mode);
        assert(best.size() == 1);
        assert(best.front().record.title == "Book v5");
    }

    const std::vector<BookRecord> library{
        make_record("A", "Foundation v2", "mobi", "800KB"),
        make_record("B", "Foundation (retail)", "epub", "1.1MB"),
        make_record("C", "I, Robot", "pdf", "4MB"),
        make_record("D", "The Caves of Steel", "epub", "Unknown"),
        make_record("E", "Caves of Steel [v1]", "txt", "200KB"),
    };
    const auto collapsed = best_per_title(library, RankMode::Author);
    assert(collapsed.size() == 3);
    assert(collapsed[0].record.server_tag == "A");
    assert(collapsed[1].record.server_tag == "C");
    assert(collapsed[2].record.server_tag == "D");

    std::vector<BookRecord> again;
    for (const auto& entry : collapsed) {
        again.push_back(entry.record);
    }
    const auto second_pass = best_per_title(again, RankMode::Author);
    assert(second_pass.size() == collapsed.size());
    for (std::size_t i = 0; i < collapsed.size(); ++i) {
        assert(second_pass[i].record.reply_command == collapsed[i].record.reply_command);
        assert(near(second_pass[i].score, collapsed[i].score));
    }

    // Cross-peer ordering keeps every copy and puts the most complete file first.
    const std::vector<BookRecord> copies{
        make_record("Small", "Dune", "epub", "300KB"),
        make_record("Large", "Dune", "epub", "5MB"),
        make_record("Huge", "Dune", "epub", "250MB"),
        make_record("Pdf", "Dune", "pdf", "5MB"),
    };
    const auto ranked = rank(copies, RankMode::Title);
    assert(ranked.size() == copies.size());
    assert(ranked[0].record.server_tag == "Large");
    assert(ranked.back().record.server_tag == "Small");
    for (std::size_t i = 1; i < ranked.size(); ++i) {
        assert(ranked[i - 1].score >= ranked[i].score);
    }

    const auto tied = rank({make_record("First", "Dune"), make_record("Second", "Dune")}, RankMode::Title);
    assert(tied[0].record.server_tag == "First");
    const auto tied_best = best_of({make_record("First", "Dune"), make_record("Second", "Dune")}, RankMode::Author);
    assert(tied_best && tied_best->record.server_tag == "First");
    assert(!best_of({}, RankMode::Title).has_value());

    assert(near(parse_size_mb("332.7KB"), 0.3327));
    assert(near(parse_size_mb("1.2 MB"), 1.2));
    assert(near(parse_size_mb("2G"), 2000.0));
    assert(near(parse_size_mb("512"), 0.000512));
    assert(near(parse_size_mb("Unknown"), 0.0));
    assert(near(size_score("Unknown"), 0.0));
    assert(size_score("5MB") > size_score("300KB"));
    assert(size_score("5MB") > size_score("250MB"));

    assert(version_score("Book v5") > version_score("Book v4"));
    assert(version_score("Book") == 0.0);
    assert(format_score("EPUB") > format_score("mobi"));
    assert(format_score("mobi") > format_score("azw3"));
    assert(format_score("djvu") == 0.0);
    assert(keyword_score("The Hobbit (Retail)") > 0.0);
    assert(keyword_score("The Hobbit") == 0.0);

    assert(normalize_title("The  Great Gatsby (retail) [epub] v2") == "great gatsby");
    assert(normalize_title("An Unexpected Party") == "unexpected party");

    const std::vector<std::pair<std::string, std::string>> pairs{
        {"The Great Gatsby", "Great Gatsby (retail)"},
        {"Foundation", "Foundation and Empire"},
        {"Empire Foundation Saga", "Saga of the Foundation Empire"},
        {"Dune", "Foundation"},
        {"Robots of Dawn", "The Robots of Dawn v2"},
        {"Children of Dune", "Dune Messiah"},
        {"", "Dune"},
    };
    for (const auto& [lhs, rhs] : pairs) {
        assert(titles_match(lhs, rhs) == titles_match(rhs, lhs));
    }
    assert(titles_match("The Great Gatsby", "Great Gatsby (retail)"));
    assert(titles_match("Foundation", "Foundation and Empire"));
    assert(!titles_match("Dune", "Foundation"));
    assert(!titles_match("Children of Dune", "Dune Messiah"));
    assert(!titles_match("", "Dune"));

    return 0;
}
