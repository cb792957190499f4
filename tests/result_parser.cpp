#include "bookhound/search/ResultParser.hpp"

#include <cassert>
#include <string>
#include <vector>

using namespace bookhound;
using namespace bookhound::search;

int main() {
    const ResultParser parser;

    const auto gatsby = parser.parse_line("!Ook F Scott Fitzgerald - The Great Gatsby.epub ::INFO:: 332.7KB");
    assert(gatsby.has_value());
    assert(gatsby->server_tag == "Ook");
    assert(gatsby->author == "F Scott Fitzgerald");
    assert(gatsby->title == "The Great Gatsby");
    assert(gatsby->extension == "epub");
    assert(gatsby->declared_size_text == "332.7KB");
    assert(gatsby->reply_command == "!Ook F Scott Fitzgerald - The Great Gatsby.epub");
    assert(!gatsby->source_file.has_value());

    const auto retail = parser.parse_line("!Horla F Scott Fitzgerald - The Great Gatsby (retail) (epub).epub");
    assert(retail.has_value());
    assert(retail->server_tag == "Horla");
    assert(retail->title == "The Great Gatsby (retail) (epub)");
    assert(retail->declared_size_text == "Unknown");
    assert(retail->reply_command == "!Horla F Scott Fitzgerald - The Great Gatsby (retail) (epub).epub");

    const auto trailing = parser.parse_line("!Bsk Isaac Asimov - Foundation.MOBI  1.2 MB");
    assert(trailing.has_value());
    assert(trailing->extension == "mobi");
    assert(trailing->declared_size_text == "1.2 MB");
    assert(trailing->reply_command == "!Bsk Isaac Asimov - Foundation.MOBI");

    const auto bare = parser.parse_line("!Dragon Isaac_Asimov_Foundation.epub");
    assert(bare.has_value());
    assert(bare->author == "Unknown");
    assert(bare->title == "Isaac_Asimov_Foundation");

    assert(!parser.parse_line("!Oatmeal F. Scott Fitzgerald - The Great Gatsby (V1.5 RTF).rar ::INFO:: 272.23KB"));
    assert(!parser.parse_line("!Bot A - Short.epub"));
    assert(!parser.parse_line("!Bot Some Author - Installer.exe"));
    assert(!parser.parse_line("Non-book line that should be ignored"));
    assert(!parser.parse_line("   "));

    const std::vector<std::string> lines{
        "!Ook F Scott Fitzgerald - The Great Gatsby.epub  ::INFO:: 332.7KB",
        "!MusicWench F Scott Fitzgerald - The Great Gatsby.mobi  ::INFO:: 376.6KB",
        "!InvalidLine without proper format",
        "",
        "!Horla F Scott Fitzgerald - The Great Gatsby (retail) (epub).epub",
    };
    const auto report = parser.parse_lines(lines);
    assert(report.records.size() == 3);
    assert(report.rejected == 1);
    assert(report.records[1].server_tag == "MusicWench");
    assert(report.records[1].declared_size_text == "376.6KB");

    const std::string listing =
        "# Search results for asimov\r\n"
        "!Ook Isaac Asimov - Foundation.epub ::INFO:: 1.2MB\r\n"
        "<!Bsk> Isaac Asimov - I, Robot.mobi 2MB\r\n"
        "\r\n"
        "Pondering Isaac Asimov - The Caves of Steel.pdf  3.5 MB\r\n"
        "noise line\r\n"
        "; trailing comment\r\n";
    const auto parsed = parser.parse_listing(listing, "SearchBot_results_for_asimov.txt");
    assert(parsed.records.size() == 3);
    assert(parsed.rejected == 1);
    assert(parsed.records[0].line_number == 2u);
    assert(parsed.records[0].source_file == std::optional<std::string>("SearchBot_results_for_asimov.txt"));
    assert(parsed.records[1].server_tag == "Bsk");
    assert(parsed.records[1].title == "I, Robot");
    assert(parsed.records[1].reply_command == "!Bsk Isaac Asimov - I, Robot.mobi");
    assert(parsed.records[1].declared_size_text == "2MB");
    assert(parsed.records[2].server_tag == "Pondering");
    assert(parsed.records[2].line_number == 5u);
    assert(parsed.records[2].reply_command == "!Pondering Isaac Asimov - The Caves of Steel.pdf");

    // Listings written in a legacy codepage still parse: 0xE9 is e-acute in CP1252.
    const auto legacy = parser.parse_listing("!Ook Jules Verne - Le Tour du Monde en 80 Jours \xE9" "dition.epub\n", "verne.txt");
    assert(legacy.records.size() == 1);
    assert(legacy.records[0].title == "Le Tour du Monde en 80 Jours \xC3\xA9" "dition");

    assert(extract_size("332.7KB") == "332.7KB");
    assert(extract_size("1.2M something") == "1.2M");
    assert(extract_size("1,234 bytes") == "1,234 bytes");
    assert(extract_size("1,234,567 bytes") == "1,234,567 bytes");
    assert(extract_size("size unavailable at the moment") == "size unavailable at");

    assert(is_likely_result("!Ook Author - Title.epub"));
    assert(is_likely_result("!Ook Author - Title.RAR"));
    assert(!is_likely_result("Ook Author - Title.epub"));
    assert(!is_likely_result("!Ook no file here"));

    assert(is_allowed_extension("EPUB"));
    assert(is_allowed_extension("djvu"));
    assert(!is_allowed_extension("rar"));
    assert(!is_allowed_extension("exe"));

    FilterOptions epub_only{};
    epub_only.epub_only = true;
    assert(filter_records(report.records, epub_only).size() == 2);

    FilterOptions by_author{};
    by_author.author = "  fitzgerald ";
    by_author.format = "MOBI";
    const auto mobi = filter_records(report.records, by_author);
    assert(mobi.size() == 1);
    assert(mobi.front().server_tag == "MusicWench");

    FilterOptions other_author{};
    other_author.author = "asimov";
    assert(filter_records(report.records, other_author).empty());

    auto ordered = report.records;
    ordered.push_back(parsed.records[2]);
    sort_by_format_priority(ordered);
    assert(ordered[0].extension == "epub");
    assert(ordered[1].extension == "epub");
    assert(ordered[2].extension == "mobi");
    assert(ordered[3].extension == "pdf");
    assert(format_priority("epub") == 1);
    assert(format_priority("txt") == 5);
    assert(format_priority("djvu") == 6);

    return 0;
}
