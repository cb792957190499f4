#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace bookhound::session {

enum class ReadStatus {
    Data,
    Timeout,
    Closed,
    Error
};

// Byte stream to the IRC server. Implementations serialize their own I/O so a
// reader thread and a writer may share one instance.
class Transport {
public:
    virtual ~Transport() = default;

    virtual bool write(std::string_view data, std::string* error = nullptr) = 0;

    // Waits at most `timeout` for data. `received` is set on ReadStatus::Data.
    virtual ReadStatus read(char* buffer, std::size_t capacity, std::size_t& received, std::chrono::milliseconds timeout) = 0;

    // Wakes any pending read; later calls fail.
    virtual void shutdown() = 0;

    [[nodiscard]] virtual bool secure() const noexcept = 0;
};

// Connects within `timeout`. With `use_tls` the stream is wrapped in TLS with
// certificate verification disabled: IRC networks commonly run self-signed
// certificates. Returns nullptr and fills `error` on failure.
std::unique_ptr<Transport> open_transport(const std::string& host,
                                          std::uint16_t port,
                                          bool use_tls,
                                          std::chrono::milliseconds timeout,
                                          std::string* error = nullptr);

// Splits a transport stream into CRLF/LF-terminated lines.
class LineReader {
public:
    explicit LineReader(Transport& transport) : transport_(transport) {}

    // Next complete line without its terminator. Timeout when nothing complete
    // arrived before `timeout` elapsed; Closed/Error end the stream.
    ReadStatus next_line(std::string& line, std::chrono::milliseconds timeout);

private:
    static constexpr std::size_t kMaxLineBytes = 16 * 1024;

    Transport& transport_;
    std::string buffer_;
};

}  // namespace bookhound::session
