#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace bookhound::archive {

struct ZipEntry {
    std::string name;
    std::uint16_t method{0};
    std::uint16_t flags{0};
    std::uint32_t crc32{0};
    std::uint64_t compressed_size{0};
    std::uint64_t uncompressed_size{0};
    std::uint64_t local_header_offset{0};

    [[nodiscard]] bool is_directory() const { return !name.empty() && name.back() == '/'; }
};

// Read-only view of a PKZIP archive. Supports stored and deflated entries;
// encrypted and ZIP64 entries are listed but cannot be read.
class ZipArchive {
public:
    static std::optional<ZipArchive> open(const std::filesystem::path& path, std::string* error = nullptr);

    [[nodiscard]] const std::vector<ZipEntry>& entries() const noexcept { return entries_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    std::optional<std::string> read(const ZipEntry& entry, std::string* error = nullptr) const;

    // Writes the entry below `directory`, keeping its relative folders but
    // dropping absolute prefixes and `..` components.
    std::optional<std::filesystem::path> extract(const ZipEntry& entry,
                                                 const std::filesystem::path& directory,
                                                 std::string* error = nullptr) const;

private:
    ZipArchive() = default;

    std::filesystem::path path_;
    std::string data_;
    std::vector<ZipEntry> entries_;
};

}  // namespace bookhound::archive
