#include "bookhound/session/Transport.hpp"

#include "bookhound/core/Socket.hpp"

#include <algorithm>
#include <array>
#include <mutex>

#include <openssl/err.h>
#include <openssl/ssl.h>

#ifndef _WIN32
#include <sys/socket.h>
#endif

namespace bookhound::session {

namespace {

void set_error(std::string* error, std::string message) {
    if (error) {
        *error = std::move(message);
    }
}

std::string openssl_error(const std::string& prefix) {
    const auto code = ERR_get_error();
    if (code == 0) {
        return prefix;
    }
    std::array<char, 256> buffer{};
    ERR_error_string_n(code, buffer.data(), buffer.size());
    return prefix + ": " + buffer.data();
}

class PlainTransport final : public Transport {
public:
    explicit PlainTransport(net::ScopedSocket socket) : socket_(std::move(socket)) {}

    bool write(std::string_view data, std::string* error) override {
        std::scoped_lock lock(write_mutex_);
        if (!socket_ || !net::send_all(socket_.get(), data.data(), data.size())) {
            set_error(error, net::format_socket_error("Send failed"));
            return false;
        }
        return true;
    }

    ReadStatus read(char* buffer, std::size_t capacity, std::size_t& received, std::chrono::milliseconds timeout) override {
        const auto waited = net::wait_readable(socket_.get(), timeout);
        if (waited == net::WaitResult::Timeout) {
            return ReadStatus::Timeout;
        }
        if (waited == net::WaitResult::Error) {
            return ReadStatus::Error;
        }
#ifdef _WIN32
        const auto got = ::recv(socket_.get(), buffer, static_cast<int>(capacity), 0);
#else
        const auto got = ::recv(socket_.get(), buffer, capacity, 0);
#endif
        if (got == 0) {
            return ReadStatus::Closed;
        }
        if (got < 0) {
            return ReadStatus::Error;
        }
        received = static_cast<std::size_t>(got);
        return ReadStatus::Data;
    }

    void shutdown() override {
        socket_.shutdown();
    }

    bool secure() const noexcept override { return false; }

private:
    net::ScopedSocket socket_;
    std::mutex write_mutex_;
};

struct SslContextDeleter {
    void operator()(SSL_CTX* context) const { SSL_CTX_free(context); }
};

struct SslDeleter {
    void operator()(SSL* ssl) const { SSL_free(ssl); }
};

// The socket is non-blocking once the handshake is done; every SSL_* call
// happens under io_mutex_ because one SSL object must not be used from two
// threads at once.
class TlsTransport final : public Transport {
public:
    TlsTransport(net::ScopedSocket socket,
                 std::unique_ptr<SSL_CTX, SslContextDeleter> context,
                 std::unique_ptr<SSL, SslDeleter> ssl)
        : socket_(std::move(socket)), context_(std::move(context)), ssl_(std::move(ssl)) {}

    ~TlsTransport() override {
        std::scoped_lock lock(io_mutex_);
        if (ssl_ && !closed_) {
            SSL_shutdown(ssl_.get());
        }
    }

    bool write(std::string_view data, std::string* error) override {
        std::size_t written = 0;
        while (written < data.size()) {
            int result = 0;
            int code = SSL_ERROR_NONE;
            {
                std::scoped_lock lock(io_mutex_);
                if (closed_) {
                    set_error(error, "Connection closed");
                    return false;
                }
                ERR_clear_error();
                result = SSL_write(ssl_.get(), data.data() + written, static_cast<int>(data.size() - written));
                if (result <= 0) {
                    code = SSL_get_error(ssl_.get(), result);
                }
            }
            if (result > 0) {
                written += static_cast<std::size_t>(result);
                continue;
            }
            if (code == SSL_ERROR_WANT_WRITE) {
                if (net::wait_writable(socket_.get(), kWriteStallTimeout) != net::WaitResult::Ready) {
                    set_error(error, "TLS write stalled");
                    return false;
                }
                continue;
            }
            if (code == SSL_ERROR_WANT_READ) {
                if (net::wait_readable(socket_.get(), kWriteStallTimeout) != net::WaitResult::Ready) {
                    set_error(error, "TLS write stalled");
                    return false;
                }
                continue;
            }
            set_error(error, openssl_error("TLS write failed"));
            return false;
        }
        return true;
    }

    ReadStatus read(char* buffer, std::size_t capacity, std::size_t& received, std::chrono::milliseconds timeout) override {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (true) {
            {
                std::scoped_lock lock(io_mutex_);
                if (closed_) {
                    return ReadStatus::Closed;
                }
                ERR_clear_error();
                const auto result = SSL_read(ssl_.get(), buffer, static_cast<int>(capacity));
                if (result > 0) {
                    received = static_cast<std::size_t>(result);
                    return ReadStatus::Data;
                }
                const auto code = SSL_get_error(ssl_.get(), result);
                if (code == SSL_ERROR_ZERO_RETURN) {
                    return ReadStatus::Closed;
                }
                if (code != SSL_ERROR_WANT_READ && code != SSL_ERROR_WANT_WRITE) {
                    return code == SSL_ERROR_SYSCALL && ERR_peek_error() == 0 ? ReadStatus::Closed : ReadStatus::Error;
                }
            }
            const auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                return ReadStatus::Timeout;
            }
            const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            const auto waited = net::wait_readable(socket_.get(), std::max(left, std::chrono::milliseconds(1)));
            if (waited == net::WaitResult::Timeout) {
                return ReadStatus::Timeout;
            }
            if (waited == net::WaitResult::Error) {
                return ReadStatus::Error;
            }
        }
    }

    void shutdown() override {
        {
            std::scoped_lock lock(io_mutex_);
            if (!closed_) {
                SSL_shutdown(ssl_.get());
                closed_ = true;
            }
        }
        socket_.shutdown();
    }

    bool secure() const noexcept override { return true; }

private:
    static constexpr std::chrono::milliseconds kWriteStallTimeout{std::chrono::seconds(10)};

    net::ScopedSocket socket_;
    std::unique_ptr<SSL_CTX, SslContextDeleter> context_;
    std::unique_ptr<SSL, SslDeleter> ssl_;
    std::mutex io_mutex_;
    bool closed_{false};
};

std::unique_ptr<Transport> wrap_tls(net::ScopedSocket socket,
                                    const std::string& host,
                                    std::chrono::milliseconds timeout,
                                    std::string* error) {
    OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr);

    std::unique_ptr<SSL_CTX, SslContextDeleter> context(SSL_CTX_new(TLS_client_method()));
    if (!context) {
        set_error(error, openssl_error("SSL_CTX_new failed"));
        return nullptr;
    }
    SSL_CTX_set_verify(context.get(), SSL_VERIFY_NONE, nullptr);
    SSL_CTX_set_mode(context.get(), SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);

    std::unique_ptr<SSL, SslDeleter> ssl(SSL_new(context.get()));
    if (!ssl) {
        set_error(error, openssl_error("SSL_new failed"));
        return nullptr;
    }
    SSL_set_tlsext_host_name(ssl.get(), host.c_str());
    if (SSL_set_fd(ssl.get(), static_cast<int>(socket.get())) != 1) {
        set_error(error, openssl_error("SSL_set_fd failed"));
        return nullptr;
    }

    // Handshake on the blocking socket, bounded by a receive timeout.
    if (!net::set_recv_timeout(socket.get(), timeout)) {
        set_error(error, net::format_socket_error("Failed to configure socket"));
        return nullptr;
    }
    ERR_clear_error();
    if (const auto result = SSL_connect(ssl.get()); result != 1) {
        set_error(error, openssl_error("TLS handshake with " + host + " failed (error " +
                                       std::to_string(SSL_get_error(ssl.get(), result)) + ")"));
        return nullptr;
    }
    if (!net::set_recv_timeout(socket.get(), std::chrono::milliseconds(0)) || !net::set_non_blocking(socket.get(), true)) {
        set_error(error, net::format_socket_error("Failed to configure socket"));
        return nullptr;
    }
    return std::make_unique<TlsTransport>(std::move(socket), std::move(context), std::move(ssl));
}

}  // namespace

std::unique_ptr<Transport> open_transport(const std::string& host,
                                          std::uint16_t port,
                                          bool use_tls,
                                          std::chrono::milliseconds timeout,
                                          std::string* error) {
    std::string connect_error;
    auto socket = net::connect_tcp(host, port, timeout, &connect_error);
    if (!socket) {
        set_error(error, connect_error);
        return nullptr;
    }
    if (use_tls) {
        return wrap_tls(std::move(socket), host, timeout, error);
    }
    return std::make_unique<PlainTransport>(std::move(socket));
}

ReadStatus LineReader::next_line(std::string& line, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::array<char, 4096> chunk{};
    while (true) {
        if (const auto newline = buffer_.find('\n'); newline != std::string::npos) {
            line = buffer_.substr(0, newline);
            buffer_.erase(0, newline + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return ReadStatus::Data;
        }
        if (buffer_.size() > kMaxLineBytes) {
            return ReadStatus::Error;
        }

        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return ReadStatus::Timeout;
        }
        std::size_t received = 0;
        const auto status = transport_.read(chunk.data(),
                                            chunk.size(),
                                            received,
                                            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now));
        if (status != ReadStatus::Data) {
            return status;
        }
        buffer_.append(chunk.data(), received);
    }
}

}  // namespace bookhound::session
