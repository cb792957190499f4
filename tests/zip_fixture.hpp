#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <zlib.h>

namespace bookhound::test {

struct ZipFixtureEntry {
    std::string name;
    std::string content;
    bool deflate{true};
    std::uint16_t flags{0};
};

inline void put_u16(std::string& out, std::uint16_t value) {
    out.push_back(static_cast<char>(value & 0xFF));
    out.push_back(static_cast<char>((value >> 8) & 0xFF));
}

inline void put_u32(std::string& out, std::uint32_t value) {
    put_u16(out, static_cast<std::uint16_t>(value & 0xFFFF));
    put_u16(out, static_cast<std::uint16_t>((value >> 16) & 0xFFFF));
}

inline std::string deflate_raw(const std::string& input) {
    z_stream stream{};
    if (deflateInit2(&stream, Z_BEST_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("deflateInit2 failed");
    }
    std::string output(deflateBound(&stream, static_cast<uLong>(input.size())), '\0');
    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
    stream.avail_in = static_cast<uInt>(input.size());
    stream.next_out = reinterpret_cast<Bytef*>(output.data());
    stream.avail_out = static_cast<uInt>(output.size());
    const auto status = deflate(&stream, Z_FINISH);
    output.resize(stream.total_out);
    deflateEnd(&stream);
    if (status != Z_STREAM_END) {
        throw std::runtime_error("deflate failed");
    }
    return output;
}

// Builds a PKZIP archive in memory with one central directory record per entry.
inline std::string build_zip(const std::vector<ZipFixtureEntry>& entries) {
    std::string archive;
    std::string directory;
    for (const auto& entry : entries) {
        const auto crc = static_cast<std::uint32_t>(
            ::crc32(0L, reinterpret_cast<const Bytef*>(entry.content.data()), static_cast<uInt>(entry.content.size())));
        const auto body = entry.deflate ? deflate_raw(entry.content) : entry.content;
        const std::uint16_t method = entry.deflate ? 8 : 0;
        const auto offset = static_cast<std::uint32_t>(archive.size());

        put_u32(archive, 0x04034b50);
        put_u16(archive, 20);
        put_u16(archive, entry.flags);
        put_u16(archive, method);
        put_u16(archive, 0);
        put_u16(archive, 0);
        put_u32(archive, crc);
        put_u32(archive, static_cast<std::uint32_t>(body.size()));
        put_u32(archive, static_cast<std::uint32_t>(entry.content.size()));
        put_u16(archive, static_cast<std::uint16_t>(entry.name.size()));
        put_u16(archive, 0);
        archive += entry.name;
        archive += body;

        put_u32(directory, 0x02014b50);
        put_u16(directory, 20);
        put_u16(directory, 20);
        put_u16(directory, entry.flags);
        put_u16(directory, method);
        put_u16(directory, 0);
        put_u16(directory, 0);
        put_u32(directory, crc);
        put_u32(directory, static_cast<std::uint32_t>(body.size()));
        put_u32(directory, static_cast<std::uint32_t>(entry.content.size()));
        put_u16(directory, static_cast<std::uint16_t>(entry.name.size()));
        put_u16(directory, 0);
        put_u16(directory, 0);
        put_u16(directory, 0);
        put_u16(directory, 0);
        put_u32(directory, 0);
        put_u32(directory, offset);
        directory += entry.name;
    }

    const auto directory_offset = static_cast<std::uint32_t>(archive.size());
    archive += directory;
    put_u32(archive, 0x06054b50);
    put_u16(archive, 0);
    put_u16(archive, 0);
    put_u16(archive, static_cast<std::uint16_t>(entries.size()));
    put_u16(archive, static_cast<std::uint16_t>(entries.size()));
    put_u32(archive, static_cast<std::uint32_t>(directory.size()));
    put_u32(archive, directory_offset);
    put_u16(archive, 0);
    return archive;
}

}  // namespace bookhound::test
