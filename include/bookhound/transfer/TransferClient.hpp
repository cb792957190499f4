#pragma once

#include "bookhound/Types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace bookhound::transfer {

using ProgressCallback = std::function<void(std::uint64_t received, std::uint64_t total, double percent)>;

struct TransferOptions {
    std::chrono::milliseconds connect_timeout{std::chrono::seconds(30)};
    std::chrono::milliseconds read_timeout{std::chrono::seconds(30)};
    std::size_t chunk_bytes{4096};
    // Hard stop for the whole transfer, checked between chunks.
    std::optional<std::chrono::steady_clock::time_point> deadline{};
    ProgressCallback on_progress{};
};

struct TransferOutcome {
    bool success{false};
    std::string message;
    std::uint64_t bytes_received{0};
    std::uint64_t bytes_expected{0};
    std::filesystem::path path;
};

// Passive DCC receiver: connects to the sender announced in a TransferOffer and
// copies exactly `declared_size` bytes. Blocking; callers run it off the
// session reader thread.
class TransferClient {
public:
    explicit TransferClient(TransferOptions options = {});

    TransferOutcome fetch(const TransferOffer& offer, const std::filesystem::path& destination) const;

private:
    TransferOptions options_;
};

}  // namespace bookhound::transfer
