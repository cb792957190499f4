#pragma once

#include "bookhound/Config.hpp"
#include "bookhound/Types.hpp"
#include "bookhound/identity/IdentityGenerator.hpp"
#include "bookhound/search/ResultParser.hpp"
#include "bookhound/session/CommandThrottle.hpp"
#include "bookhound/session/Transport.hpp"
#include "bookhound/transfer/TransferClient.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace bookhound::session {

struct SearchCollection {
    bool success{false};
    std::string message;
    // The text sent to the channel, e.g. "@search Asimov Foundation".
    std::string query;
    std::vector<std::string> lines;
    // Offers that arrived during the window; search bots deliver result packages this way.
    std::vector<TransferOffer> offers;
};

struct DownloadRequest {
    std::string reply_command;
    std::optional<std::string> filename{};
    std::optional<std::chrono::steady_clock::time_point> deadline{};
    transfer::ProgressCallback on_progress{};
    // Nick that must announce the offer (case-insensitive); offers from
    // anyone else are dropped. Unset accepts the first offer.
    std::optional<std::string> expected_sender{};
};

// One IRC connection. State moves Disconnected -> Connecting -> Registering
// -> JoiningChannel -> Ready; search and download primitives only run in
// Ready. Once Ready a single reader thread owns all socket reads and feeds
// the per-operation buffers.
class ChatSession {
public:
    ChatSession(SessionId id, Config config);
    ~ChatSession();

    ChatSession(const ChatSession&) = delete;
    ChatSession& operator=(const ChatSession&) = delete;

    // Runs the connect sequence with bounded retries. Never throws; failures
    // are recorded in the status and reported as false.
    bool connect();

    // Best-effort QUIT, then closes the connection. Safe to call repeatedly
    // and from any thread.
    void disconnect();

    [[nodiscard]] bool ready() const noexcept;
    [[nodiscard]] SessionStatus status() const;
    [[nodiscard]] const SessionId& id() const noexcept { return id_; }
    [[nodiscard]] const Config& config() const noexcept { return config_; }
    [[nodiscard]] const search::ResultParser& parser() const noexcept { return parser_; }

    // Held by callers for the duration of one search or download.
    [[nodiscard]] std::mutex& operation_mutex() noexcept { return operation_mutex_; }

    // Sends `@<bot> author [title]` and collects result lines until
    // `max_lines`, a quiet period after the first reply, or the window ends.
    SearchCollection collect_search(const std::string& author,
                                    const std::optional<std::string>& title,
                                    std::size_t max_lines);

    // Resends a reply command, waits for the matching DCC offer and receives it.
    TransferResult download(const DownloadRequest& request);

    // Receives an already announced offer into the download directory.
    TransferResult receive_offer(const TransferOffer& offer,
                                 const std::optional<std::string>& filename,
                                 std::optional<std::chrono::steady_clock::time_point> deadline = std::nullopt,
                                 const transfer::ProgressCallback& on_progress = {});

    void record_search(const std::string& query, std::size_t results, std::size_t parse_errors);

private:
    using StatusUpdate = std::function<void(SessionStatus&)>;

    void update_status(const StatusUpdate& update);
    void record_error(std::string message);

    bool attempt_connect(std::string& error);
    bool register_identity(std::string& error);
    void join_channel();
    void close_transport();

    bool send_line(const std::string& line, std::string* error = nullptr);
    void reader_loop();
    void handle_line(const std::string& line);
    void reset_buffers();
    // False when disconnect() interrupted the wait.
    bool sleep_unless_closing(std::chrono::milliseconds duration);

    SessionId id_;
    Config config_;
    identity::IdentityGenerator identities_;
    search::ResultParser parser_;
    CommandThrottle throttle_;
    std::mutex operation_mutex_;

    mutable std::mutex status_mutex_;
    SessionStatus status_;
    std::atomic<bool> ready_{false};
    std::atomic<bool> stopping_{false};

    std::mutex lifecycle_mutex_;
    std::mutex closing_mutex_;
    std::condition_variable closing_cv_;

    std::mutex transport_mutex_;
    std::shared_ptr<Transport> transport_;
    std::unique_ptr<LineReader> line_reader_;
    std::thread reader_;

    std::mutex buffer_mutex_;
    std::condition_variable buffer_cv_;
    std::vector<std::string> pending_lines_;
    struct PendingOffer {
        TransferOffer offer;
        std::string sender;
    };
    std::vector<PendingOffer> pending_offers_;
    std::chrono::steady_clock::time_point last_arrival_{};
};

}  // namespace bookhound::session
