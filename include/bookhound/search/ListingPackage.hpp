#pragma once

#include "bookhound/Types.hpp"
#include "bookhound/search/ResultParser.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace bookhound::search {

constexpr std::size_t kMaxExtractedFiles = 10;

struct PackageContents {
    bool opened{false};
    std::string message;
    std::vector<BookRecord> records;
    std::size_t rejected_lines{0};
    std::vector<std::filesystem::path> extracted_files;
};

// Unpacks a downloaded ZIP in priority order: listing files (.txt .log .list
// .dat) parsed into records; failing that the .epub entries; failing that
// other ebook files. At most kMaxExtractedFiles are extracted. Files land in
// `<stem>_extracted/` next to the archive. A corrupt archive yields an empty
// result with `opened == false`.
PackageContents unpack_listing_package(const std::filesystem::path& archive_path, const ResultParser& parser);

}  // namespace bookhound::search
