#include "bookhound/search/ResultParser.hpp"

#include "bookhound/core/StructuredLogger.hpp"
#include "bookhound/text/Encoding.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <regex>
#include <tuple>

namespace bookhound::search {

namespace {

constexpr std::string_view kInfoMarker = "::INFO::";
constexpr std::size_t kMinFieldLength = 2;
constexpr std::size_t kSizeFallbackChars = 20;

constexpr std::array<std::string_view, 16> kAllowedExtensions = {
    "epub", "mobi", "azw", "azw3", "pdf", "txt", "html", "htm",
    "rtf",  "doc",  "docx", "lit", "pdb", "fb2", "djvu", "chm"};

constexpr std::array<std::string_view, 6> kLiveResultExtensions = {
    ".epub", ".pdf", ".mobi", ".txt", ".zip", ".rar"};

enum class HeadKind {
    Bang,
    Angle,
    Bare
};

struct Head {
    HeadKind kind{HeadKind::Bang};
    std::string server;
    std::size_t content_offset{0};
};

struct Entry {
    std::string author;
    std::string title;
    std::string extension_text;
    // Absolute offset just past the extension in the source line.
    std::size_t end{0};
    std::string trailing;
};

struct FileName {
    std::size_t title_end{0};
    std::size_t extension_begin{0};
    std::size_t extension_end{0};
};

const std::regex& bang_head() {
    static const std::regex pattern(R"(^!(\S+)\s+(.+)$)");
    return pattern;
}

const std::regex& angle_head() {
    static const std::regex pattern(R"(^<!([^>]+)>\s*(.+)$)");
    return pattern;
}

const std::regex& bare_head() {
    static const std::regex pattern(R"(^([^!<\s]\S*)\s+(.+)$)");
    return pattern;
}

const std::regex& author_separator() {
    static const std::regex pattern(R"(\s+-\s+)");
    return pattern;
}

std::optional<Head> match_head(const std::string& line, LineSource source) {
    std::smatch match;
    if (std::regex_match(line, match, bang_head())) {
        return Head{HeadKind::Bang, match[1].str(), static_cast<std::size_t>(match.position(2))};
    }
    if (source != LineSource::Listing) {
        return std::nullopt;
    }
    if (std::regex_match(line, match, angle_head())) {
        return Head{HeadKind::Angle, trim(match[1].str()), static_cast<std::size_t>(match.position(2))};
    }
    if (std::regex_match(line, match, bare_head())) {
        return Head{HeadKind::Bare, match[1].str(), static_cast<std::size_t>(match.position(2))};
    }
    return std::nullopt;
}

// First `.ext` token that ends the filename (followed by whitespace or the end
// of `text`) and is an allowed ebook format.
std::optional<FileName> find_extension(std::string_view text) {
    for (auto dot = text.find('.'); dot != std::string_view::npos; dot = text.find('.', dot + 1)) {
        auto end = dot + 1;
        while (end < text.size() && std::isalnum(static_cast<unsigned char>(text[end]))) {
            ++end;
        }
        if (end == dot + 1) {
            continue;
        }
        if (end < text.size() && !std::isspace(static_cast<unsigned char>(text[end]))) {
            continue;
        }
        if (!is_allowed_extension(text.substr(dot + 1, end - dot - 1))) {
            continue;
        }
        return FileName{dot, dot + 1, end};
    }
    return std::nullopt;
}

std::optional<Entry> split_entry(std::string_view content, std::size_t offset) {
    std::cmatch separator;
    if (!std::regex_search(content.data(), content.data() + content.size(), separator, author_separator())) {
        return std::nullopt;
    }
    const auto rest_offset = static_cast<std::size_t>(separator.position(0) + separator.length(0));
    const auto rest = content.substr(rest_offset);
    const auto file = find_extension(rest);
    if (!file) {
        return std::nullopt;
    }

    Entry entry{};
    entry.author = trim(content.substr(0, static_cast<std::size_t>(separator.position(0))));
    entry.title = trim(rest.substr(0, file->title_end));
    entry.extension_text = std::string(rest.substr(file->extension_begin, file->extension_end - file->extension_begin));
    entry.end = offset + rest_offset + file->extension_end;
    entry.trailing = trim(rest.substr(file->extension_end));
    return entry;
}

std::optional<std::string> find_size(std::string_view info) {
    static const std::array<std::regex, 3> patterns = {
        std::regex(R"((\d+(?:,\d+)*\s*bytes?))", std::regex::icase),
        std::regex(R"((\d+(?:\.\d+)?\s*[KMGT]?B))", std::regex::icase),
        std::regex(R"((\d+(?:\.\d+)?\s*[KMGT]))", std::regex::icase),
    };
    std::cmatch match;
    for (const auto& pattern : patterns) {
        if (std::regex_search(info.data(), info.data() + info.size(), match, pattern)) {
            return match[1].str();
        }
    }
    return std::nullopt;
}

std::optional<BookRecord> make_record(const std::string& line,
                                      const Head& head,
                                      const Entry& entry,
                                      std::string size_text) {
    if (entry.author.size() < kMinFieldLength || entry.title.size() < kMinFieldLength) {
        return std::nullopt;
    }
    BookRecord record{};
    record.server_tag = head.server;
    record.author = entry.author;
    record.title = entry.title;
    record.extension = to_lower(entry.extension_text);
    record.declared_size_text = std::move(size_text);
    if (head.kind == HeadKind::Bang) {
        record.reply_command = trim(std::string_view(line).substr(0, entry.end));
    } else {
        record.reply_command = "!" + head.server + " " + entry.author + " - " + entry.title + "." + entry.extension_text;
    }
    record.source_line = line;
    return record;
}

std::string_view rtrim_view(std::string_view value) {
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
        value.remove_suffix(1);
    }
    return value;
}

// !server author - title.ext ::INFO:: size
class InfoMarkerPattern final : public LinePattern {
public:
    std::string_view name() const override { return "info-marker"; }

    std::optional<BookRecord> try_parse(std::string_view line, LineSource source) const override {
        const std::string text(line);
        const auto marker = text.find(kInfoMarker);
        if (marker == std::string::npos) {
            return std::nullopt;
        }
        const auto head = match_head(text.substr(0, marker), source);
        if (!head || head->content_offset >= marker) {
            return std::nullopt;
        }
        const auto main = rtrim_view(std::string_view(text).substr(head->content_offset, marker - head->content_offset));
        const auto entry = split_entry(main, head->content_offset);
        if (!entry) {
            return std::nullopt;
        }
        const auto info = trim(std::string_view(text).substr(marker + kInfoMarker.size()));
        return make_record(text, *head, *entry, extract_size(info));
    }
};

// !server author - title.ext [trailing]; listings also accept <!server> and bare server prefixes.
class StandardPattern final : public LinePattern {
public:
    std::string_view name() const override { return "standard"; }

    std::optional<BookRecord> try_parse(std::string_view line, LineSource source) const override {
        const std::string text(line);
        const auto head = match_head(text, source);
        if (!head) {
            return std::nullopt;
        }
        const auto entry = split_entry(std::string_view(text).substr(head->content_offset), head->content_offset);
        if (!entry) {
            return std::nullopt;
        }
        if (head->kind == HeadKind::Bare && entry->trailing.empty()) {
            return std::nullopt;
        }
        return make_record(text, *head, *entry, find_size(entry->trailing).value_or("Unknown"));
    }
};

// Live lines only: tag plus the first allowed `.ext`; author/title split when a
// " - " separator exists, otherwise the remainder is the title.
class FallbackPattern final : public LinePattern {
public:
    std::string_view name() const override { return "fallback"; }

    std::optional<BookRecord> try_parse(std::string_view line, LineSource source) const override {
        if (source != LineSource::Live) {
            return std::nullopt;
        }
        const std::string text(line);
        const auto head = match_head(text, source);
        if (!head) {
            return std::nullopt;
        }
        auto content = std::string_view(text).substr(head->content_offset);
        std::string size_text = "Unknown";
        if (const auto marker = content.find(kInfoMarker); marker != std::string_view::npos) {
            size_text = extract_size(trim(content.substr(marker + kInfoMarker.size())));
            content = rtrim_view(content.substr(0, marker));
        }
        const auto file = find_extension(content);
        if (!file) {
            return std::nullopt;
        }

        Entry entry{};
        const auto name_part = content.substr(0, file->title_end);
        std::cmatch separator;
        if (std::regex_search(name_part.data(), name_part.data() + name_part.size(), separator, author_separator())) {
            entry.author = trim(name_part.substr(0, static_cast<std::size_t>(separator.position(0))));
            entry.title = trim(name_part.substr(static_cast<std::size_t>(separator.position(0) + separator.length(0))));
        } else {
            entry.author = "Unknown";
            entry.title = trim(name_part);
        }
        entry.extension_text = std::string(content.substr(file->extension_begin, file->extension_end - file->extension_begin));
        entry.end = head->content_offset + file->extension_end;
        return make_record(text, *head, entry, std::move(size_text));
    }
};

bool is_comment_line(std::string_view line) {
    return line.starts_with("#") || line.starts_with("//") || line.starts_with(";");
}

}  // namespace

std::unique_ptr<LinePattern> make_info_marker_pattern() {
    return std::make_unique<InfoMarkerPattern>();
}

std::unique_ptr<LinePattern> make_standard_pattern() {
    return std::make_unique<StandardPattern>();
}

std::unique_ptr<LinePattern> make_fallback_pattern() {
    return std::make_unique<FallbackPattern>();
}

ResultParser::ResultParser() {
    patterns_.push_back(make_info_marker_pattern());
    patterns_.push_back(make_standard_pattern());
    patterns_.push_back(make_fallback_pattern());
}

ResultParser::ResultParser(std::vector<std::unique_ptr<LinePattern>> patterns)
    : patterns_(std::move(patterns)) {}

std::optional<BookRecord> ResultParser::parse_line(std::string_view line, LineSource source) const {
    const auto text = trim(line);
    if (text.empty()) {
        return std::nullopt;
    }
    for (const auto& pattern : patterns_) {
        if (auto record = pattern->try_parse(text, source)) {
            return record;
        }
    }
    return std::nullopt;
}

ParseReport ResultParser::parse_lines(const std::vector<std::string>& lines) const {
    ParseReport report{};
    for (const auto& line : lines) {
        if (trim(line).empty()) {
            continue;
        }
        if (auto record = parse_line(line, LineSource::Live)) {
            report.records.push_back(std::move(*record));
        } else {
            ++report.rejected;
        }
    }
    return report;
}

ParseReport ResultParser::parse_listing(std::string_view bytes, const std::string& source_file) const {
    ParseReport report{};
    const auto decoded = text::decode_to_utf8(bytes);
    if (!decoded) {
        log_event(StructuredLogger::Level::Warning, "parser.listing.undecodable", {{"file", source_file}});
        return report;
    }

    std::string_view remaining(decoded->utf8);
    std::size_t line_number = 0;
    while (!remaining.empty()) {
        const auto newline = remaining.find('\n');
        const auto raw = remaining.substr(0, newline);
        remaining = newline == std::string_view::npos ? std::string_view{} : remaining.substr(newline + 1);
        ++line_number;

        const auto line = trim(raw);
        if (line.empty() || is_comment_line(line)) {
            continue;
        }
        auto record = parse_line(line, LineSource::Listing);
        if (!record) {
            ++report.rejected;
            continue;
        }
        record->source_file = source_file;
        record->line_number = line_number;
        report.records.push_back(std::move(*record));
    }

    log_event(StructuredLogger::Level::Info,
              "parser.listing.parsed",
              {{"file", source_file},
               {"encoding", decoded->encoding},
               {"records", std::to_string(report.records.size())},
               {"rejected", std::to_string(report.rejected)}});
    return report;
}

bool is_allowed_extension(std::string_view extension) {
    const auto lowered = to_lower(std::string(extension));
    return std::find(kAllowedExtensions.begin(), kAllowedExtensions.end(), lowered) != kAllowedExtensions.end();
}

std::string extract_size(std::string_view info) {
    if (auto size = find_size(info)) {
        return *size;
    }
    return trim(info.substr(0, std::min(info.size(), kSizeFallbackChars)));
}

bool is_likely_result(std::string_view message_text) {
    if (!message_text.starts_with("!")) {
        return false;
    }
    const auto lowered = to_lower(std::string(message_text));
    return std::any_of(kLiveResultExtensions.begin(), kLiveResultExtensions.end(), [&](std::string_view ext) {
        return lowered.find(ext) != std::string::npos;
    });
}

std::vector<BookRecord> filter_records(std::vector<BookRecord> records, const FilterOptions& options) {
    const auto author = options.author ? to_lower(trim(*options.author)) : std::string{};
    const auto format = options.format ? to_lower(trim(*options.format)) : std::string{};

    std::erase_if(records, [&](const BookRecord& record) {
        if (options.epub_only && record.extension != "epub") {
            return true;
        }
        if (!author.empty() && to_lower(record.author).find(author) == std::string::npos &&
            to_lower(record.title).find(author) == std::string::npos) {
            return true;
        }
        return !format.empty() && record.extension != format;
    });
    return records;
}

int format_priority(std::string_view extension) {
    static constexpr std::array<std::string_view, 5> kOrder = {"epub", "mobi", "azw3", "pdf", "txt"};
    const auto lowered = to_lower(std::string(extension));
    for (std::size_t index = 0; index < kOrder.size(); ++index) {
        if (kOrder[index] == lowered) {
            return static_cast<int>(index) + 1;
        }
    }
    return static_cast<int>(kOrder.size()) + 1;
}

void sort_by_format_priority(std::vector<BookRecord>& records) {
    std::stable_sort(records.begin(), records.end(), [](const BookRecord& lhs, const BookRecord& rhs) {
        return std::make_tuple(format_priority(lhs.extension), to_lower(lhs.author), to_lower(lhs.title)) <
               std::make_tuple(format_priority(rhs.extension), to_lower(rhs.author), to_lower(rhs.title));
    });
}

}  // namespace bookhound::search
