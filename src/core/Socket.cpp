#include "bookhound/core/Socket.hpp"

#include <stdexcept>

#ifdef _WIN32
#pragma comment(lib, "Ws2_32.lib")
#else
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>
#endif

namespace bookhound::net {

namespace {

#ifdef _WIN32
class WinsockRuntime {
public:
    WinsockRuntime() {
        WSADATA data{};
        const auto result = WSAStartup(MAKEWORD(2, 2), &data);
        if (result != 0) {
            throw std::runtime_error("WSAStartup failed");
        }
    }
    ~WinsockRuntime() {
        WSACleanup();
    }
};
#endif

bool connect_in_progress(int error) {
#ifdef _WIN32
    return error == WSAEWOULDBLOCK || error == WSAEINPROGRESS;
#else
    return error == EINPROGRESS || error == EWOULDBLOCK;
#endif
}

WaitResult wait_for(NativeSocket socket, short events, std::chrono::milliseconds timeout) {
#ifdef _WIN32
    WSAPOLLFD descriptor{};
    descriptor.fd = socket;
    descriptor.events = events;
    const auto result = WSAPoll(&descriptor, 1, static_cast<INT>(timeout.count()));
#else
    pollfd descriptor{};
    descriptor.fd = socket;
    descriptor.events = events;
    int result = 0;
    do {
        result = ::poll(&descriptor, 1, static_cast<int>(timeout.count()));
    } while (result < 0 && errno == EINTR);
#endif
    if (result < 0) {
        return WaitResult::Error;
    }
    if (result == 0) {
        return WaitResult::Timeout;
    }
    if ((descriptor.revents & events) != 0) {
        return WaitResult::Ready;
    }
    // POLLHUP / POLLERR: let the next read report the condition.
    return (descriptor.revents & (POLLHUP | POLLERR)) != 0 ? WaitResult::Ready : WaitResult::Error;
}

}  // namespace

void ensure_socket_runtime() {
#ifdef _WIN32
    static WinsockRuntime runtime;
#endif
}

int last_socket_error() {
#ifdef _WIN32
    return WSAGetLastError();
#else
    return errno;
#endif
}

std::string format_socket_error(const std::string& prefix) {
    const auto code = last_socket_error();
#ifdef _WIN32
    return prefix + " (error " + std::to_string(code) + ")";
#else
    return prefix + ": " + std::strerror(code);
#endif
}

void ScopedSocket::reset(NativeSocket handle) {
    if (handle_ != kInvalidNativeSocket) {
#ifdef _WIN32
        ::shutdown(handle_, SD_BOTH);
        ::closesocket(handle_);
#else
        ::shutdown(handle_, SHUT_RDWR);
        ::close(handle_);
#endif
    }
    handle_ = handle;
}

void ScopedSocket::shutdown() {
    if (handle_ == kInvalidNativeSocket) {
        return;
    }
#ifdef _WIN32
    ::shutdown(handle_, SD_BOTH);
#else
    ::shutdown(handle_, SHUT_RDWR);
#endif
}

ScopedSocket connect_tcp(const std::string& host,
                         std::uint16_t port,
                         std::chrono::milliseconds timeout,
                         std::string* error) {
    ensure_socket_runtime();
    auto fail = [&](const std::string& message) {
        if (error) {
            *error = message;
        }
        return ScopedSocket{};
    };

    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    addrinfo* result = nullptr;
    if (const auto err = ::getaddrinfo(host.c_str(), nullptr, &hints, &result); err != 0 || result == nullptr) {
        if (result) {
            ::freeaddrinfo(result);
        }
        return fail("Could not resolve " + host);
    }

    sockaddr_in address = *reinterpret_cast<sockaddr_in*>(result->ai_addr);
    address.sin_port = htons(port);
    ::freeaddrinfo(result);

    ScopedSocket socket(::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP));
    if (!socket) {
        return fail(format_socket_error("Failed to create socket"));
    }

    if (!set_non_blocking(socket.get(), true)) {
        return fail(format_socket_error("Failed to configure socket"));
    }

    if (::connect(socket.get(), reinterpret_cast<const sockaddr*>(&address), sizeof(address)) < 0) {
        if (!connect_in_progress(last_socket_error())) {
            return fail(format_socket_error("Connection to " + host + ":" + std::to_string(port) + " failed"));
        }
        const auto waited = wait_writable(socket.get(), timeout);
        if (waited == WaitResult::Timeout) {
            return fail("Connection to " + host + ":" + std::to_string(port) + " timed out");
        }
        int socket_error = 0;
#ifdef _WIN32
        int length = sizeof(socket_error);
#else
        socklen_t length = sizeof(socket_error);
#endif
        if (waited == WaitResult::Error ||
            ::getsockopt(socket.get(), SOL_SOCKET, SO_ERROR, reinterpret_cast<char*>(&socket_error), &length) < 0 ||
            socket_error != 0) {
            return fail("Connection to " + host + ":" + std::to_string(port) + " refused");
        }
    }

    if (!set_non_blocking(socket.get(), false)) {
        return fail(format_socket_error("Failed to configure socket"));
    }
    return socket;
}

ScopedSocket listen_tcp(const std::string& host, std::uint16_t port, std::uint16_t* bound_port) {
    ensure_socket_runtime();
    ScopedSocket server(::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP));
    if (!server) {
        throw std::runtime_error("Failed to create listen socket");
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (host.empty() || host == "0.0.0.0") {
        addr.sin_addr.s_addr = htonl(INADDR_ANY);
    } else if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        throw std::runtime_error("Invalid listen host: " + host);
    }

    const int opt = 1;
    ::setsockopt(server.get(), SOL_SOCKET, SO_REUSEADDR, reinterpret_cast<const char*>(&opt), sizeof(opt));

    if (::bind(server.get(), reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
        throw std::runtime_error(format_socket_error("Failed to bind " + host + ":" + std::to_string(port)));
    }
    if (::listen(server.get(), SOMAXCONN) < 0) {
        throw std::runtime_error(format_socket_error("Failed to listen on " + host + ":" + std::to_string(port)));
    }

    if (bound_port) {
        sockaddr_in bound{};
#ifdef _WIN32
        int len = sizeof(bound);
#else
        socklen_t len = sizeof(bound);
#endif
        if (::getsockname(server.get(), reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
            *bound_port = ntohs(bound.sin_port);
        } else {
            *bound_port = port;
        }
    }
    return server;
}

bool send_all(NativeSocket socket, const char* data, std::size_t length) {
    std::size_t total_sent = 0;
    while (total_sent < length) {
#ifdef _WIN32
        const auto sent = ::send(socket, data + total_sent, static_cast<int>(length - total_sent), 0);
#else
        const auto sent = ::send(socket, data + total_sent, length - total_sent, MSG_NOSIGNAL);
#endif
        if (sent <= 0) {
            return false;
        }
        total_sent += static_cast<std::size_t>(sent);
    }
    return true;
}

bool set_recv_timeout(NativeSocket socket, std::chrono::milliseconds timeout) {
#ifdef _WIN32
    DWORD value = static_cast<DWORD>(timeout.count());
    return ::setsockopt(socket, SOL_SOCKET, SO_RCVTIMEO, reinterpret_cast<const char*>(&value), sizeof(value)) == 0;
#else
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    return ::setsockopt(socket, SOL_SOCKET, SO_RCVTIMEO, reinterpret_cast<const char*>(&tv), sizeof(tv)) == 0;
#endif
}

bool set_non_blocking(NativeSocket socket, bool enable) {
#ifdef _WIN32
    u_long mode = enable ? 1 : 0;
    return ioctlsocket(socket, FIONBIO, &mode) == 0;
#else
    int flags = fcntl(socket, F_GETFL, 0);
    if (flags < 0) {
        return false;
    }
    if (enable) {
        flags |= O_NONBLOCK;
    } else {
        flags &= ~O_NONBLOCK;
    }
    return fcntl(socket, F_SETFL, flags) == 0;
#endif
}

WaitResult wait_readable(NativeSocket socket, std::chrono::milliseconds timeout) {
    return wait_for(socket, POLLIN, timeout);
}

WaitResult wait_writable(NativeSocket socket, std::chrono::milliseconds timeout) {
    return wait_for(socket, POLLOUT, timeout);
}

std::string endpoint_string(NativeSocket socket) {
    sockaddr_in addr{};
#ifdef _WIN32
    int len = sizeof(addr);
#else
    socklen_t len = sizeof(addr);
#endif
    if (::getpeername(socket, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
        char buffer[INET_ADDRSTRLEN]{};
        if (::inet_ntop(AF_INET, &addr.sin_addr, buffer, sizeof(buffer)) != nullptr) {
            return std::string(buffer) + ':' + std::to_string(ntohs(addr.sin_port));
        }
    }
    return "unknown";
}

}  // namespace bookhound::net
