#include "bookhound/archive/ZipArchive.hpp"

#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>

#include <zlib.h>

namespace bookhound::archive {

namespace {

constexpr std::uint32_t kLocalHeaderSignature = 0x04034b50;
constexpr std::uint32_t kCentralHeaderSignature = 0x02014b50;
constexpr std::uint32_t kEndOfCentralDirectorySignature = 0x06054b50;
constexpr std::size_t kEndOfCentralDirectorySize = 22;
constexpr std::size_t kCentralHeaderSize = 46;
constexpr std::size_t kLocalHeaderSize = 30;
constexpr std::size_t kMaxCommentSize = 0xFFFF;
constexpr std::uint64_t kMaxEntryBytes = 512ull * 1024ull * 1024ull;
constexpr std::uint16_t kMethodStored = 0;
constexpr std::uint16_t kMethodDeflated = 8;
constexpr std::uint16_t kFlagEncrypted = 0x0001;

std::uint16_t read_u16(const std::string& data, std::size_t offset) {
    return static_cast<std::uint16_t>(static_cast<unsigned char>(data[offset]) |
                                      (static_cast<unsigned char>(data[offset + 1]) << 8));
}

std::uint32_t read_u32(const std::string& data, std::size_t offset) {
    return static_cast<std::uint32_t>(read_u16(data, offset)) |
           (static_cast<std::uint32_t>(read_u16(data, offset + 2)) << 16);
}

void set_error(std::string* error, std::string message) {
    if (error) {
        *error = std::move(message);
    }
}

std::optional<std::string> inflate_raw(const char* input, std::size_t length, std::uint64_t expected, std::string* error) {
    std::string output;
    output.resize(static_cast<std::size_t>(expected));

    z_stream stream{};
    if (inflateInit2(&stream, -MAX_WBITS) != Z_OK) {
        set_error(error, "inflateInit2 failed");
        return std::nullopt;
    }
    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input));
    stream.avail_in = static_cast<uInt>(length);
    stream.next_out = reinterpret_cast<Bytef*>(output.data());
    stream.avail_out = static_cast<uInt>(output.size());

    const auto status = inflate(&stream, Z_FINISH);
    const auto produced = stream.total_out;
    inflateEnd(&stream);

    if (status != Z_STREAM_END || produced != expected) {
        set_error(error, "Corrupt deflate stream");
        return std::nullopt;
    }
    return output;
}

std::filesystem::path sanitized_relative_path(const std::string& name) {
    std::filesystem::path relative;
    for (const auto& part : std::filesystem::path(name).relative_path()) {
        const auto text = part.string();
        if (text.empty() || text == "." || text == "..") {
            continue;
        }
        relative /= part;
    }
    return relative;
}

}  // namespace

std::optional<ZipArchive> ZipArchive::open(const std::filesystem::path& path, std::string* error) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        set_error(error, "Cannot open " + path.string());
        return std::nullopt;
    }
    ZipArchive archive;
    archive.path_ = path;
    archive.data_.assign(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
    const auto& data = archive.data_;

    if (data.size() < kEndOfCentralDirectorySize) {
        set_error(error, "Not a zip archive: " + path.string());
        return std::nullopt;
    }

    std::optional<std::size_t> eocd;
    const std::size_t search_floor =
        data.size() > kEndOfCentralDirectorySize + kMaxCommentSize ? data.size() - kEndOfCentralDirectorySize - kMaxCommentSize : 0;
    for (std::size_t offset = data.size() - kEndOfCentralDirectorySize + 1; offset-- > search_floor;) {
        if (read_u32(data, offset) == kEndOfCentralDirectorySignature) {
            eocd = offset;
            break;
        }
    }
    if (!eocd) {
        set_error(error, "Missing end of central directory: " + path.string());
        return std::nullopt;
    }

    const auto entry_count = read_u16(data, *eocd + 10);
    const auto directory_size = read_u32(data, *eocd + 12);
    const auto directory_offset = read_u32(data, *eocd + 16);
    if (static_cast<std::uint64_t>(directory_offset) + directory_size > data.size()) {
        set_error(error, "Central directory out of range: " + path.string());
        return std::nullopt;
    }

    std::size_t cursor = directory_offset;
    for (std::uint16_t index = 0; index < entry_count; ++index) {
        if (cursor + kCentralHeaderSize > data.size() || read_u32(data, cursor) != kCentralHeaderSignature) {
            set_error(error, "Corrupt central directory: " + path.string());
            return std::nullopt;
        }
        ZipEntry entry{};
        entry.flags = read_u16(data, cursor + 8);
        entry.method = read_u16(data, cursor + 10);
        entry.crc32 = read_u32(data, cursor + 16);
        entry.compressed_size = read_u32(data, cursor + 20);
        entry.uncompressed_size = read_u32(data, cursor + 24);
        const auto name_length = read_u16(data, cursor + 28);
        const auto extra_length = read_u16(data, cursor + 30);
        const auto comment_length = read_u16(data, cursor + 32);
        entry.local_header_offset = read_u32(data, cursor + 42);
        if (cursor + kCentralHeaderSize + name_length > data.size()) {
            set_error(error, "Corrupt central directory: " + path.string());
            return std::nullopt;
        }
        entry.name = data.substr(cursor + kCentralHeaderSize, name_length);
        archive.entries_.push_back(std::move(entry));
        cursor += kCentralHeaderSize + name_length + extra_length + comment_length;
    }
    return archive;
}

std::optional<std::string> ZipArchive::read(const ZipEntry& entry, std::string* error) const {
    if ((entry.flags & kFlagEncrypted) != 0) {
        set_error(error, "Encrypted entry: " + entry.name);
        return std::nullopt;
    }
    if (entry.compressed_size == 0xFFFFFFFFull || entry.uncompressed_size == 0xFFFFFFFFull ||
        entry.local_header_offset == 0xFFFFFFFFull) {
        set_error(error, "ZIP64 entry not supported: " + entry.name);
        return std::nullopt;
    }
    if (entry.uncompressed_size > kMaxEntryBytes) {
        set_error(error, "Entry too large: " + entry.name);
        return std::nullopt;
    }

    const auto header = static_cast<std::size_t>(entry.local_header_offset);
    if (header + kLocalHeaderSize > data_.size() || read_u32(data_, header) != kLocalHeaderSignature) {
        set_error(error, "Corrupt local header: " + entry.name);
        return std::nullopt;
    }
    const auto body = header + kLocalHeaderSize + read_u16(data_, header + 26) + read_u16(data_, header + 28);
    if (body + entry.compressed_size > data_.size()) {
        set_error(error, "Truncated entry: " + entry.name);
        return std::nullopt;
    }

    std::optional<std::string> content;
    if (entry.method == kMethodStored) {
        if (entry.compressed_size != entry.uncompressed_size) {
            set_error(error, "Corrupt stored entry: " + entry.name);
            return std::nullopt;
        }
        content = data_.substr(body, static_cast<std::size_t>(entry.compressed_size));
    } else if (entry.method == kMethodDeflated) {
        content = inflate_raw(data_.data() + body, static_cast<std::size_t>(entry.compressed_size),
                              entry.uncompressed_size, error);
    } else {
        set_error(error, "Unsupported compression method " + std::to_string(entry.method) + ": " + entry.name);
        return std::nullopt;
    }
    if (!content) {
        return std::nullopt;
    }

    const auto checksum = ::crc32(0L, reinterpret_cast<const Bytef*>(content->data()), static_cast<uInt>(content->size()));
    if (checksum != entry.crc32) {
        set_error(error, "CRC mismatch: " + entry.name);
        return std::nullopt;
    }
    return content;
}

std::optional<std::filesystem::path> ZipArchive::extract(const ZipEntry& entry,
                                                         const std::filesystem::path& directory,
                                                         std::string* error) const {
    const auto relative = sanitized_relative_path(entry.name);
    if (relative.empty() || entry.is_directory()) {
        set_error(error, "Nothing to extract for " + entry.name);
        return std::nullopt;
    }
    auto content = read(entry, error);
    if (!content) {
        return std::nullopt;
    }

    const auto destination = directory / relative;
    std::error_code ec;
    std::filesystem::create_directories(destination.parent_path(), ec);
    if (ec) {
        set_error(error, "Cannot create " + destination.parent_path().string() + ": " + ec.message());
        return std::nullopt;
    }
    std::ofstream output(destination, std::ios::binary | std::ios::trunc);
    if (!output) {
        set_error(error, "Cannot write " + destination.string());
        return std::nullopt;
    }
    output.write(content->data(), static_cast<std::streamsize>(content->size()));
    if (!output) {
        set_error(error, "Cannot write " + destination.string());
        return std::nullopt;
    }
    return destination;
}

}  // namespace bookhound::archive
