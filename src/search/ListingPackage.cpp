#include "bookhound/search/ListingPackage.hpp"

#include "bookhound/archive/ZipArchive.hpp"
#include "bookhound/core/StructuredLogger.hpp"

#include <algorithm>
#include <array>
#include <iterator>
#include <string_view>
#include <system_error>

namespace bookhound::search {

namespace {

constexpr std::array<std::string_view, 4> kListingSuffixes = {".txt", ".log", ".list", ".dat"};
constexpr std::array<std::string_view, 6> kOtherEbookSuffixes = {".mobi", ".azw3", ".pdf", ".rtf", ".lit", ".html"};

bool has_suffix(const std::string& name, std::string_view suffix) {
    const auto lowered = to_lower(name);
    return lowered.size() >= suffix.size() && lowered.ends_with(suffix);
}

template <std::size_t N>
bool has_any_suffix(const std::string& name, const std::array<std::string_view, N>& suffixes) {
    return std::any_of(suffixes.begin(), suffixes.end(), [&](std::string_view suffix) {
        return has_suffix(name, suffix);
    });
}

std::size_t extract_entries(const archive::ZipArchive& zip,
                            const std::vector<const archive::ZipEntry*>& entries,
                            const std::filesystem::path& directory,
                            PackageContents& contents) {
    std::size_t extracted = 0;
    for (const auto* entry : entries) {
        std::string error;
        if (auto path = zip.extract(*entry, directory, &error)) {
            contents.extracted_files.push_back(std::move(*path));
            ++extracted;
        } else {
            log_event(StructuredLogger::Level::Warning,
                      "package.extract.failed",
                      {{"entry", entry->name}, {"reason", error}});
        }
    }
    return extracted;
}

}  // namespace

PackageContents unpack_listing_package(const std::filesystem::path& archive_path, const ResultParser& parser) {
    PackageContents contents{};
    std::string error;
    auto zip = archive::ZipArchive::open(archive_path, &error);
    if (!zip) {
        contents.message = error;
        log_event(StructuredLogger::Level::Warning,
                  "package.open.failed",
                  {{"path", archive_path.string()}, {"reason", error}});
        return contents;
    }
    contents.opened = true;

    std::vector<const archive::ZipEntry*> listings;
    std::vector<const archive::ZipEntry*> epubs;
    std::vector<const archive::ZipEntry*> others;
    for (const auto& entry : zip->entries()) {
        if (entry.is_directory()) {
            continue;
        }
        if (has_any_suffix(entry.name, kListingSuffixes)) {
            listings.push_back(&entry);
        } else if (has_suffix(entry.name, ".epub")) {
            epubs.push_back(&entry);
        } else if (has_any_suffix(entry.name, kOtherEbookSuffixes)) {
            others.push_back(&entry);
        }
    }

    for (const auto* entry : listings) {
        std::string read_error;
        const auto bytes = zip->read(*entry, &read_error);
        if (!bytes) {
            log_event(StructuredLogger::Level::Warning,
                      "package.listing.unreadable",
                      {{"entry", entry->name}, {"reason", read_error}});
            continue;
        }
        auto report = parser.parse_listing(*bytes, entry->name);
        contents.rejected_lines += report.rejected;
        std::move(report.records.begin(), report.records.end(), std::back_inserter(contents.records));
    }
    if (!contents.records.empty()) {
        contents.message = "Parsed " + std::to_string(contents.records.size()) + " listing records";
        return contents;
    }

    auto directory = archive_path.parent_path() / (archive_path.stem().string() + "_extracted");
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        contents.message = "Cannot create " + directory.string() + ": " + ec.message();
        return contents;
    }

    if (!epubs.empty()) {
        if (epubs.size() > kMaxExtractedFiles) {
            epubs.resize(kMaxExtractedFiles);
        }
        const auto count = extract_entries(*zip, epubs, directory, contents);
        contents.message = "Extracted " + std::to_string(count) + " EPUB files";
        return contents;
    }
    if (!others.empty()) {
        if (others.size() > kMaxExtractedFiles) {
            others.resize(kMaxExtractedFiles);
        }
        const auto count = extract_entries(*zip, others, directory, contents);
        contents.message = "Extracted " + std::to_string(count) + " ebook files";
        return contents;
    }

    contents.message = "No ebook files or listings in archive";
    log_event(StructuredLogger::Level::Info, "package.empty", {{"path", archive_path.string()}});
    return contents;
}

}  // namespace bookhound::search
