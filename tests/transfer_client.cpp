#include "bookhound/transfer/OfferCodec.hpp"
#include "bookhound/transfer/TransferClient.hpp"
#include "fake_peers.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

using namespace std::chrono_literals;
using namespace bookhound;

namespace {

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

}  // namespace

int main() {
    const auto root = std::filesystem::temp_directory_path() / "bookhound_transfer_test";
    std::filesystem::remove_all(root);

    std::string payload(1000, '\0');
    for (std::size_t i = 0; i < payload.size(); ++i) {
        payload[i] = static_cast<char>('a' + i % 26);
    }

    {
        test::FakeDccServer peer(payload);
        const auto offer = transfer::parse_offer(peer.offer_line("complete.epub"));
        assert(offer.has_value());
        assert(offer->peer_address == "127.0.0.1");
        assert(offer->declared_size == 1000u);

        std::vector<double> percents;
        transfer::TransferOptions options{};
        options.connect_timeout = 2s;
        options.read_timeout = 2s;
        options.chunk_bytes = 256;
        options.on_progress = [&](std::uint64_t received, std::uint64_t total, double percent) {
            assert(received <= total);
            percents.push_back(percent);
        };
        const auto outcome = transfer::TransferClient(options).fetch(*offer, root / "nested" / "complete.epub");
        assert(outcome.success);
        assert(outcome.bytes_received == 1000u);
        assert(outcome.bytes_expected == 1000u);
        assert(read_file(outcome.path) == payload);
        assert(!percents.empty());
        assert(percents.back() == 100.0);
        for (std::size_t i = 1; i < percents.size(); ++i) {
            assert(percents[i] >= percents[i - 1]);
        }
    }

    {
        // The peer announces 1000 bytes but hangs up after 800.
        test::FakeDccServer peer(payload, 800);
        const auto offer = transfer::parse_offer(peer.offer_line("short.epub"));
        assert(offer.has_value());
        transfer::TransferOptions options{};
        options.connect_timeout = 2s;
        options.read_timeout = 2s;
        const auto outcome = transfer::TransferClient(options).fetch(*offer, root / "short.epub");
        assert(!outcome.success);
        assert(outcome.bytes_received == 800u);
        assert(outcome.bytes_expected == 1000u);
        assert(outcome.message.find("800/1000") != std::string::npos);
    }

    {
        // Nobody listens on the announced port.
        std::uint16_t closed_port = 0;
        {
            auto listener = net::listen_tcp("127.0.0.1", 0, &closed_port);
        }
        TransferOffer offer{};
        offer.filename = "nobody.epub";
        offer.peer_address = "127.0.0.1";
        offer.peer_port = closed_port;
        offer.declared_size = 10;
        transfer::TransferOptions options{};
        options.connect_timeout = 1s;
        const auto outcome = transfer::TransferClient(options).fetch(offer, root / "nobody.epub");
        assert(!outcome.success);
        assert(outcome.bytes_received == 0u);
        assert(outcome.bytes_expected == 10u);
        assert(outcome.message.rfind("DCC download failed", 0) == 0);
    }

    {
        // An expired deadline stops the copy before the declared size.
        test::FakeDccServer peer(payload);
        const auto offer = transfer::parse_offer(peer.offer_line("late.epub"));
        transfer::TransferOptions options{};
        options.connect_timeout = 2s;
        options.read_timeout = 2s;
        options.chunk_bytes = 100;
        std::size_t chunks = 0;
        options.deadline = std::chrono::steady_clock::now() + 2s;
        options.on_progress = [&](std::uint64_t, std::uint64_t, double) {
            if (++chunks == 1) {
                std::this_thread::sleep_for(2100ms);
            }
        };
        const auto outcome = transfer::TransferClient(options).fetch(*offer, root / "late.epub");
        assert(!outcome.success);
        assert(outcome.bytes_received < 1000u);
        assert(outcome.message.find("deadline exceeded") != std::string::npos);
    }

    std::filesystem::remove_all(root);
    return 0;
}
