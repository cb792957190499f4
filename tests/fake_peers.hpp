#pragma once

#include "bookhound/Config.hpp"
#include "bookhound/core/Socket.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#ifndef _WIN32
#include <sys/socket.h>
#endif

namespace bookhound::test {

using namespace std::chrono_literals;

// 127.0.0.1 as announced in DCC offers.
constexpr std::uint32_t kLoopbackAddress = 2130706433u;

inline net::ScopedSocket accept_client(net::NativeSocket listener,
                                       const std::atomic<bool>& running,
                                       std::chrono::milliseconds poll = 100ms) {
    while (running.load()) {
        const auto ready = net::wait_readable(listener, poll);
        if (ready == net::WaitResult::Timeout) {
            continue;
        }
        if (ready == net::WaitResult::Error) {
            return {};
        }
        return net::ScopedSocket(::accept(listener, nullptr, nullptr));
    }
    return {};
}

// Serves `payload` to every connection, stopping after `send_limit` bytes.
class FakeDccServer {
public:
    explicit FakeDccServer(std::string payload, std::size_t send_limit = std::string::npos)
        : payload_(std::move(payload)),
          send_limit_(std::min(send_limit, payload_.size())) {
        listener_ = net::listen_tcp("127.0.0.1", 0, &port_);
        running_.store(true);
        worker_ = std::thread([this]() { serve(); });
    }

    ~FakeDccServer() {
        running_.store(false);
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    FakeDccServer(const FakeDccServer&) = delete;
    FakeDccServer& operator=(const FakeDccServer&) = delete;

    std::uint16_t port() const { return port_; }
    std::size_t connections() const { return connections_.load(); }

    std::string offer_line(const std::string& filename) const {
        return "\x01" "DCC SEND " + filename + " " + std::to_string(kLoopbackAddress) + " " +
               std::to_string(port_) + " " + std::to_string(payload_.size()) + "\x01";
    }

private:
    void serve() {
        while (running_.load()) {
            auto client = accept_client(listener_.get(), running_);
            if (!client) {
                continue;
            }
            ++connections_;
            net::send_all(client.get(), payload_.data(), send_limit_);
            client.shutdown();
        }
    }

    std::string payload_;
    std::size_t send_limit_;
    std::uint16_t port_{0};
    net::ScopedSocket listener_;
    std::atomic<bool> running_{false};
    std::atomic<std::size_t> connections_{0};
    std::thread worker_;
};

// Scripted IRC network: registers clients (answering NICK collisions while
// `nick_collisions` lasts), confirms JOIN and hands channel PRIVMSG text to
// `on_channel_message`, whose return lines are sent back.
class FakeIrcServer {
public:
    using ChannelHandler = std::function<std::vector<std::string>(const std::string& nick, const std::string& text)>;

    FakeIrcServer() {
        listener_ = net::listen_tcp("127.0.0.1", 0, &port_);
        running_.store(true);
        worker_ = std::thread([this]() { serve(); });
    }

    ~FakeIrcServer() { stop(); }

    FakeIrcServer(const FakeIrcServer&) = delete;
    FakeIrcServer& operator=(const FakeIrcServer&) = delete;

    void stop() {
        running_.store(false);
        drop_client();
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    std::uint16_t port() const { return port_; }

    void set_channel_handler(ChannelHandler handler) {
        std::scoped_lock lock(mutex_);
        handler_ = std::move(handler);
    }

    void set_nick_collisions(int count) { nick_collisions_.store(count); }
    void set_welcome(bool enabled) { welcome_.store(enabled); }

    // Sends a raw line to the connected client.
    bool send(const std::string& line) {
        std::scoped_lock lock(client_mutex_);
        if (!client_) {
            return false;
        }
        const auto framed = line + "\r\n";
        return net::send_all(client_.get(), framed.data(), framed.size());
    }

    void drop_client() {
        std::scoped_lock lock(client_mutex_);
        if (client_) {
            client_.shutdown();
        }
    }

    std::vector<std::string> received() const {
        std::scoped_lock lock(mutex_);
        return lines_;
    }

    std::size_t count_prefixed(const std::string& prefix) const {
        std::scoped_lock lock(mutex_);
        return static_cast<std::size_t>(std::count_if(lines_.begin(), lines_.end(), [&](const std::string& line) {
            return line.rfind(prefix, 0) == 0;
        }));
    }

    // Waits until a received line starts with `prefix`.
    bool wait_for(const std::string& prefix, std::chrono::milliseconds timeout) {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, timeout, [&]() {
            return std::any_of(lines_.begin(), lines_.end(), [&](const std::string& line) {
                return line.rfind(prefix, 0) == 0;
            });
        });
    }

    std::string nickname() const {
        std::scoped_lock lock(mutex_);
        return nickname_;
    }

private:
    void serve() {
        while (running_.load()) {
            auto client = accept_client(listener_.get(), running_);
            if (!client) {
                continue;
            }
            ++connections_;
            {
                std::scoped_lock lock(client_mutex_);
                client_ = std::move(client);
            }
            session_loop();
            std::scoped_lock lock(client_mutex_);
            client_.reset();
        }
    }

    void session_loop() {
        net::NativeSocket handle = net::kInvalidNativeSocket;
        {
            std::scoped_lock lock(client_mutex_);
            handle = client_.get();
        }
        bool nick_ok = false;
        bool user_seen = false;
        std::string buffer;
        char chunk[1024];
        while (running_.load()) {
            const auto ready = net::wait_readable(handle, 100ms);
            if (ready == net::WaitResult::Timeout) {
                continue;
            }
            if (ready == net::WaitResult::Error) {
                return;
            }
            const auto got = ::recv(handle, chunk, sizeof(chunk), 0);
            if (got <= 0) {
                return;
            }
            buffer.append(chunk, static_cast<std::size_t>(got));
            std::size_t newline = 0;
            while ((newline = buffer.find('\n')) != std::string::npos) {
                auto line = buffer.substr(0, newline);
                buffer.erase(0, newline + 1);
                if (!line.empty() && line.back() == '\r') {
                    line.pop_back();
                }
                handle_line(line, nick_ok, user_seen);
            }
        }
    }

    void handle_line(const std::string& line, bool& nick_ok, bool& user_seen) {
        ChannelHandler handler;
        {
            std::scoped_lock lock(mutex_);
            lines_.push_back(line);
            handler = handler_;
        }
        cv_.notify_all();

        if (line.rfind("NICK ", 0) == 0) {
            const auto nick = line.substr(5);
            if (nick_collisions_.load() > 0) {
                --nick_collisions_;
                send(":irc.test 433 * " + nick + " :Nickname is already in use");
                return;
            }
            {
                std::scoped_lock lock(mutex_);
                nickname_ = nick;
            }
            nick_ok = true;
            if (user_seen) {
                welcome();
            }
            return;
        }
        if (line.rfind("USER ", 0) == 0) {
            user_seen = true;
            if (nick_ok) {
                welcome();
            }
            return;
        }
        if (line.rfind("JOIN ", 0) == 0) {
            const auto channel = line.substr(5);
            const auto nick = nickname();
            send(":" + nick + "!user@test JOIN :" + channel);
            send(":irc.test 366 " + nick + " " + channel + " :End of /NAMES list.");
            return;
        }
        if (line.rfind("PRIVMSG ", 0) == 0 && handler) {
            const auto colon = line.find(" :");
            if (colon == std::string::npos) {
                return;
            }
            for (const auto& reply : handler(nickname(), line.substr(colon + 2))) {
                send(reply);
            }
        }
    }

    void welcome() {
        if (!welcome_.load()) {
            return;
        }
        send(":irc.test 001 " + nickname() + " :Welcome to the Test IRC Network");
    }

    std::uint16_t port_{0};
    net::ScopedSocket listener_;
    std::atomic<bool> running_{false};
    std::atomic<int> nick_collisions_{0};
    std::atomic<bool> welcome_{true};
    std::atomic<std::size_t> connections_{0};
    std::thread worker_;

    std::mutex client_mutex_;
    net::ScopedSocket client_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::string> lines_;
    std::string nickname_;
    ChannelHandler handler_;
};

// Session settings for loopback tests: plain TCP, no pacing, short windows.
inline Config loopback_config(std::uint16_t port, const std::string& download_directory) {
    Config config{};
    config.server_host = "127.0.0.1";
    config.server_port = port;
    config.use_tls = false;
    config.identity_seed = 0x5EEDu;
    config.connect_timeout = std::chrono::seconds(3);
    config.response_timeout = std::chrono::seconds(3);
    config.transfer_timeout = std::chrono::seconds(3);
    config.command_interval = std::chrono::milliseconds(0);
    config.connect_attempts = 2;
    config.connect_backoff_step = std::chrono::milliseconds(50);
    config.join_settle_delay = std::chrono::milliseconds(0);
    config.join_timeout = std::chrono::seconds(2);
    config.search_window = std::chrono::seconds(3);
    config.search_quiet_period = std::chrono::milliseconds(400);
    config.fallback_attempt_timeout = std::chrono::seconds(3);
    config.download_directory = download_directory;
    return config;
}

}  // namespace bookhound::test
