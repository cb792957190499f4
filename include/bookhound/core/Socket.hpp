#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <winsock2.h>
#include <ws2tcpip.h>
#endif

namespace bookhound::net {

#ifdef _WIN32
using NativeSocket = SOCKET;
constexpr NativeSocket kInvalidNativeSocket = INVALID_SOCKET;
#else
using NativeSocket = int;
constexpr NativeSocket kInvalidNativeSocket = -1;
#endif

void ensure_socket_runtime();
int last_socket_error();
std::string format_socket_error(const std::string& prefix);

class ScopedSocket {
public:
    ScopedSocket() = default;
    explicit ScopedSocket(NativeSocket handle) : handle_(handle) {}
    ScopedSocket(const ScopedSocket&) = delete;
    ScopedSocket& operator=(const ScopedSocket&) = delete;
    ScopedSocket(ScopedSocket&& other) noexcept : handle_(other.handle_) {
        other.handle_ = kInvalidNativeSocket;
    }
    ScopedSocket& operator=(ScopedSocket&& other) noexcept {
        if (this != &other) {
            reset();
            handle_ = other.handle_;
            other.handle_ = kInvalidNativeSocket;
        }
        return *this;
    }
    ~ScopedSocket() { reset(); }

    NativeSocket get() const { return handle_; }
    bool valid() const { return handle_ != kInvalidNativeSocket; }
    explicit operator bool() const { return valid(); }

    void reset(NativeSocket handle = kInvalidNativeSocket);

    // Wakes any thread blocked on the socket without releasing the descriptor.
    void shutdown();

    NativeSocket release() {
        const auto handle = handle_;
        handle_ = kInvalidNativeSocket;
        return handle;
    }

private:
    NativeSocket handle_{kInvalidNativeSocket};
};

enum class WaitResult {
    Ready,
    Timeout,
    Error
};

// Resolves `host` (IPv4) and connects within `timeout`. On failure returns an
// invalid socket and, when provided, fills `error`.
ScopedSocket connect_tcp(const std::string& host,
                         std::uint16_t port,
                         std::chrono::milliseconds timeout,
                         std::string* error = nullptr);

// Binds and listens; port 0 picks an ephemeral port reported via `bound_port`.
// Throws std::runtime_error on failure.
ScopedSocket listen_tcp(const std::string& host, std::uint16_t port, std::uint16_t* bound_port = nullptr);

bool send_all(NativeSocket socket, const char* data, std::size_t length);
bool set_recv_timeout(NativeSocket socket, std::chrono::milliseconds timeout);
bool set_non_blocking(NativeSocket socket, bool enable);
WaitResult wait_readable(NativeSocket socket, std::chrono::milliseconds timeout);
WaitResult wait_writable(NativeSocket socket, std::chrono::milliseconds timeout);
std::string endpoint_string(NativeSocket socket);

}  // namespace bookhound::net
