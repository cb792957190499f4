#pragma once

#include "bookhound/Types.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bookhound::search {

// Live lines come from the channel and are request-ready; listing lines come
// from catalog packages and may use the `<!server>` or bare-server layouts.
enum class LineSource {
    Live,
    Listing
};

class LinePattern {
public:
    virtual ~LinePattern() = default;

    [[nodiscard]] virtual std::string_view name() const = 0;
    [[nodiscard]] virtual std::optional<BookRecord> try_parse(std::string_view line, LineSource source) const = 0;
};

struct ParseReport {
    std::vector<BookRecord> records;
    std::size_t rejected{0};
};

class ResultParser {
public:
    // Installs the info-marker, standard and fallback patterns in that order.
    ResultParser();
    explicit ResultParser(std::vector<std::unique_ptr<LinePattern>> patterns);

    ResultParser(ResultParser&&) noexcept = default;
    ResultParser& operator=(ResultParser&&) noexcept = default;

    [[nodiscard]] std::optional<BookRecord> parse_line(std::string_view line,
                                                       LineSource source = LineSource::Live) const;

    ParseReport parse_lines(const std::vector<std::string>& lines) const;

    // Decodes raw listing bytes, skips blank and comment lines (#, //, ;) and
    // tags every record with `source_file` and its 1-based line number.
    ParseReport parse_listing(std::string_view bytes, const std::string& source_file) const;

private:
    std::vector<std::unique_ptr<LinePattern>> patterns_;
};

std::unique_ptr<LinePattern> make_info_marker_pattern();
std::unique_ptr<LinePattern> make_standard_pattern();
std::unique_ptr<LinePattern> make_fallback_pattern();

bool is_allowed_extension(std::string_view extension);

// First size-looking token of `info` ("332.7KB", "1.2M", "1,234 bytes"),
// otherwise its first 20 characters.
std::string extract_size(std::string_view info);

// Channel heuristic: message text that starts with `!` and names an ebook or archive file.
bool is_likely_result(std::string_view message_text);

struct FilterOptions {
    std::optional<std::string> author{};
    bool epub_only{false};
    std::optional<std::string> format{};
};

std::vector<BookRecord> filter_records(std::vector<BookRecord> records, const FilterOptions& options);

// epub, mobi, azw3, pdf, txt, then everything else.
int format_priority(std::string_view extension);

// Stable ordering by format priority, then author and title (case-insensitive).
void sort_by_format_priority(std::vector<BookRecord>& records);

}  // namespace bookhound::search
