#include "bookhound/transfer/TransferClient.hpp"

#include "bookhound/core/Socket.hpp"
#include "bookhound/core/StructuredLogger.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>
#include <vector>

#ifndef _WIN32
#include <sys/socket.h>
#endif

namespace bookhound::transfer {

namespace {

std::chrono::milliseconds remaining_until(std::chrono::steady_clock::time_point deadline) {
    const auto now = std::chrono::steady_clock::now();
    if (deadline <= now) {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
}

TransferOutcome make_failure(const TransferOffer& offer,
                             const std::filesystem::path& destination,
                             std::string message,
                             std::uint64_t received = 0) {
    TransferOutcome outcome{};
    outcome.success = false;
    outcome.message = std::move(message);
    outcome.bytes_received = received;
    outcome.bytes_expected = offer.declared_size;
    outcome.path = destination;
    log_event(StructuredLogger::Level::Warning,
              "transfer.failed",
              {{"file", offer.filename},
               {"peer", offer.peer_address + ":" + std::to_string(offer.peer_port)},
               {"received", std::to_string(received)},
               {"expected", std::to_string(offer.declared_size)},
               {"reason", outcome.message}});
    return outcome;
}

}  // namespace

TransferClient::TransferClient(TransferOptions options)
    : options_(std::move(options)) {
    if (options_.chunk_bytes == 0) {
        options_.chunk_bytes = 4096;
    }
}

TransferOutcome TransferClient::fetch(const TransferOffer& offer, const std::filesystem::path& destination) const {
    auto connect_timeout = options_.connect_timeout;
    if (options_.deadline) {
        connect_timeout = std::min(connect_timeout, remaining_until(*options_.deadline));
    }

    log_event(StructuredLogger::Level::Info,
              "transfer.connect",
              {{"file", offer.filename},
               {"peer", offer.peer_address + ":" + std::to_string(offer.peer_port)},
               {"size", std::to_string(offer.declared_size)}});

    std::string connect_error;
    auto socket = net::connect_tcp(offer.peer_address, offer.peer_port, connect_timeout, &connect_error);
    if (!socket) {
        return make_failure(offer, destination, "DCC download failed: " + connect_error);
    }
    if (!net::set_recv_timeout(socket.get(), options_.read_timeout)) {
        return make_failure(offer, destination, net::format_socket_error("DCC download failed: socket timeout"));
    }

    std::error_code ec;
    if (const auto parent = destination.parent_path(); !parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return make_failure(offer, destination, "Cannot create " + parent.string() + ": " + ec.message());
        }
    }
    std::ofstream output(destination, std::ios::binary | std::ios::trunc);
    if (!output) {
        return make_failure(offer, destination, "Cannot open " + destination.string() + " for writing");
    }

    std::vector<char> buffer(options_.chunk_bytes);
    std::uint64_t received = 0;
    bool deadline_hit = false;
    while (received < offer.declared_size) {
        if (options_.deadline) {
            const auto left = remaining_until(*options_.deadline);
            if (left.count() == 0) {
                deadline_hit = true;
                break;
            }
            if (!net::set_recv_timeout(socket.get(), std::min(options_.read_timeout, left))) {
                return make_failure(offer, destination, net::format_socket_error("DCC download failed: socket timeout"),
                                    received);
            }
        }
        const auto wanted = static_cast<std::size_t>(
            std::min<std::uint64_t>(buffer.size(), offer.declared_size - received));
#ifdef _WIN32
        const auto got = ::recv(socket.get(), buffer.data(), static_cast<int>(wanted), 0);
#else
        const auto got = ::recv(socket.get(), buffer.data(), wanted, 0);
#endif
        if (got <= 0) {
            break;
        }
        output.write(buffer.data(), got);
        if (!output) {
            return make_failure(offer, destination, "Write to " + destination.string() + " failed", received);
        }
        received += static_cast<std::uint64_t>(got);

        if (options_.on_progress) {
            const double percent = offer.declared_size == 0
                                       ? 100.0
                                       : static_cast<double>(received) * 100.0 / static_cast<double>(offer.declared_size);
            options_.on_progress(received, offer.declared_size, percent);
        }
    }
    output.close();

    if (received != offer.declared_size) {
        auto message = "Download incomplete: " + std::to_string(received) + "/" +
                       std::to_string(offer.declared_size) + " bytes";
        if (deadline_hit) {
            message += " (deadline exceeded)";
        }
        return make_failure(offer, destination, std::move(message), received);
    }

    TransferOutcome outcome{};
    outcome.success = true;
    outcome.message = "Downloaded " + offer.filename;
    outcome.bytes_received = received;
    outcome.bytes_expected = offer.declared_size;
    outcome.path = destination;
    log_event(StructuredLogger::Level::Info,
              "transfer.complete",
              {{"file", offer.filename},
               {"path", destination.string()},
               {"bytes", std::to_string(received)}});
    return outcome;
}

}  // namespace bookhound::transfer
