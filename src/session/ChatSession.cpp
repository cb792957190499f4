#include "bookhound/session/ChatSession.hpp"

#include "bookhound/core/StructuredLogger.hpp"
#include "bookhound/search/ListingPackage.hpp"
#include "bookhound/session/IrcMessage.hpp"
#include "bookhound/text/Encoding.hpp"
#include "bookhound/transfer/OfferCodec.hpp"

#include <algorithm>
#include <filesystem>

namespace bookhound::session {

namespace {

constexpr std::chrono::milliseconds kReaderPollInterval{250};
constexpr std::size_t kMaxStatusErrors = 50;

std::string sanitize_filename(const std::string& name) {
    const auto leaf = std::filesystem::path(name).filename().string();
    if (leaf.empty() || leaf == "." || leaf == "..") {
        return {};
    }
    return leaf;
}

bool has_zip_extension(const std::filesystem::path& path) {
    return to_lower(path.extension().string()) == ".zip";
}

bool same_channel(const std::string& lhs, const std::string& rhs) {
    return to_lower(lhs) == to_lower(rhs);
}

std::chrono::milliseconds until(std::chrono::steady_clock::time_point deadline) {
    const auto now = std::chrono::steady_clock::now();
    return deadline <= now ? std::chrono::milliseconds(0)
                           : std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
}

}  // namespace

ChatSession::ChatSession(SessionId id, Config config)
    : id_(std::move(id)),
      config_(std::move(config)),
      identities_(config_.identity_seed),
      throttle_(config_.command_interval) {
    status_.session_id = id_;
    status_.server = config_.server_host + ":" + std::to_string(config_.server_port);
    status_.channel = config_.channel;
    status_.nickname = config_.nickname.value_or(identities_.next());
}

ChatSession::~ChatSession() {
    disconnect();
}

bool ChatSession::ready() const noexcept {
    return ready_.load(std::memory_order_acquire);
}

SessionStatus ChatSession::status() const {
    std::scoped_lock lock(status_mutex_);
    return status_;
}

void ChatSession::update_status(const StatusUpdate& update) {
    std::scoped_lock lock(status_mutex_);
    update(status_);
    status_.last_activity = std::chrono::system_clock::now();
}

void ChatSession::record_error(std::string message) {
    update_status([&](SessionStatus& status) {
        status.errors.push_back(std::move(message));
        if (status.errors.size() > kMaxStatusErrors) {
            status.errors.erase(status.errors.begin());
        }
    });
}

bool ChatSession::connect() {
    std::scoped_lock lifecycle(lifecycle_mutex_);
    if (ready()) {
        return true;
    }
    if (reader_.joinable()) {
        reader_.join();
    }
    close_transport();
    stopping_.store(false, std::memory_order_release);

    const auto attempts = std::max<unsigned>(1, config_.connect_attempts);
    std::string last_error;
    for (unsigned attempt = 1; attempt <= attempts; ++attempt) {
        log_event(StructuredLogger::Level::Info,
                  "session.connect.attempt",
                  {{"session", id_},
                   {"server", config_.server_host + ":" + std::to_string(config_.server_port)},
                   {"tls", config_.use_tls ? "1" : "0"},
                   {"attempt", std::to_string(attempt)}});
        if (attempt_connect(last_error)) {
            reader_ = std::thread(&ChatSession::reader_loop, this);
            const auto snapshot = status();
            log_event(StructuredLogger::Level::Info,
                      "session.connect.ready",
                      {{"session", id_}, {"nickname", snapshot.nickname}, {"channel", snapshot.channel}});
            return true;
        }

        log_event(StructuredLogger::Level::Warning,
                  "session.connect.failed",
                  {{"session", id_}, {"attempt", std::to_string(attempt)}, {"reason", last_error}});
        close_transport();
        update_status([](SessionStatus& status) { status.state = SessionState::Disconnected; });
        if (stopping_.load(std::memory_order_acquire)) {
            break;
        }
        if (attempt < attempts && !sleep_unless_closing(config_.connect_backoff_step * attempt)) {
            break;
        }
    }

    auto message = "Failed to connect after " + std::to_string(attempts) + " attempts: " + last_error;
    log_event(StructuredLogger::Level::Error, "session.connect.exhausted", {{"session", id_}, {"reason", message}});
    update_status([](SessionStatus& status) {
        status.connected = false;
        status.joined_channel = false;
        status.state = SessionState::Disconnected;
    });
    record_error(std::move(message));
    return false;
}

bool ChatSession::attempt_connect(std::string& error) {
    update_status([](SessionStatus& status) { status.state = SessionState::Connecting; });

    auto transport = open_transport(config_.server_host,
                                    config_.server_port,
                                    config_.use_tls,
                                    config_.connect_timeout,
                                    &error);
    if (!transport) {
        return false;
    }
    {
        std::scoped_lock lock(transport_mutex_);
        transport_ = std::move(transport);
        line_reader_ = std::make_unique<LineReader>(*transport_);
    }

    update_status([](SessionStatus& status) { status.state = SessionState::Registering; });
    if (!register_identity(error)) {
        return false;
    }

    update_status([](SessionStatus& status) { status.state = SessionState::JoiningChannel; });
    if (!sleep_unless_closing(config_.join_settle_delay)) {
        error = "Connection cancelled";
        return false;
    }
    join_channel();
    if (stopping_.load(std::memory_order_acquire)) {
        error = "Connection cancelled";
        return false;
    }

    reset_buffers();
    ready_.store(true, std::memory_order_release);
    update_status([](SessionStatus& status) {
        status.state = SessionState::Ready;
        status.connected = true;
        status.joined_channel = true;
    });
    return true;
}

bool ChatSession::register_identity(std::string& error) {
    auto nickname = status().nickname;
    if (!send_line("NICK " + nickname, &error) || !send_line("USER " + nickname + " 0 * :" + nickname, &error)) {
        return false;
    }

    const auto deadline = std::chrono::steady_clock::now() + config_.connect_timeout;
    unsigned nick_retries = 0;
    std::string line;
    while (true) {
        if (stopping_.load(std::memory_order_acquire)) {
            error = "Connection cancelled";
            return false;
        }
        const auto left = until(deadline);
        if (left.count() == 0) {
            error = "Connection timeout during registration";
            return false;
        }
        const auto read = line_reader_->next_line(line, std::min(left, kReaderPollInterval));
        if (read == ReadStatus::Timeout) {
            continue;
        }
        if (read != ReadStatus::Data) {
            error = "Connection closed during registration";
            return false;
        }

        const auto message = parse_irc_line(line);
        if (!message) {
            continue;
        }
        if (message->command == "PING") {
            if (!send_line("PONG :" + message->text(), &error)) {
                return false;
            }
            continue;
        }
        if (message->command == "001" || message->command == "004" || line.find("Welcome") != std::string::npos) {
            return true;
        }
        if (message->command == "433") {
            if (nick_retries >= config_.nick_retry_limit) {
                error = "Failed to register nickname after maximum retries";
                return false;
            }
            ++nick_retries;
            const auto previous = nickname;
            nickname = identities_.next();
            log_event(StructuredLogger::Level::Info,
                      "session.nick.collision",
                      {{"session", id_}, {"previous", previous}, {"nickname", nickname}});
            update_status([&](SessionStatus& status) { status.nickname = nickname; });
            if (!send_line("NICK " + nickname, &error)) {
                return false;
            }
            continue;
        }
        if (message->command == "ERROR" || line.find("Closing Link") != std::string::npos) {
            error = "IRC connection error: " + line;
            return false;
        }
    }
}

void ChatSession::join_channel() {
    std::string error;
    if (!send_line("JOIN " + config_.channel, &error)) {
        log_event(StructuredLogger::Level::Warning,
                  "session.join.send_failed",
                  {{"session", id_}, {"reason", error}});
        return;
    }

    const auto deadline = std::chrono::steady_clock::now() + config_.join_timeout;
    std::string line;
    while (!stopping_.load(std::memory_order_acquire)) {
        const auto left = until(deadline);
        if (left.count() == 0) {
            break;
        }
        const auto read = line_reader_->next_line(line, std::min(left, kReaderPollInterval));
        if (read == ReadStatus::Timeout) {
            continue;
        }
        if (read != ReadStatus::Data) {
            break;
        }
        const auto message = parse_irc_line(line);
        if (!message) {
            continue;
        }
        if (message->command == "PING") {
            send_line("PONG :" + message->text());
            continue;
        }
        const bool joined = message->command == "366" ||
                            (message->command == "JOIN" &&
                             ((!message->params.empty() && same_channel(message->params.front(), config_.channel)) ||
                              (message->trailing && same_channel(*message->trailing, config_.channel))));
        if (joined) {
            log_event(StructuredLogger::Level::Info, "session.join.confirmed", {{"session", id_}, {"channel", config_.channel}});
            return;
        }
    }
    log_event(StructuredLogger::Level::Warning,
              "session.join.unconfirmed",
              {{"session", id_}, {"channel", config_.channel}});
}

void ChatSession::close_transport() {
    std::shared_ptr<Transport> transport;
    {
        std::scoped_lock lock(transport_mutex_);
        transport = std::move(transport_);
        line_reader_.reset();
    }
    if (transport) {
        transport->shutdown();
    }
}

void ChatSession::disconnect() {
    stopping_.store(true, std::memory_order_release);
    closing_cv_.notify_all();
    buffer_cv_.notify_all();

    std::shared_ptr<Transport> transport;
    {
        std::scoped_lock lock(transport_mutex_);
        transport = transport_;
    }
    if (transport && ready_.exchange(false, std::memory_order_acq_rel)) {
        std::string error;
        if (!transport->write("QUIT :" + config_.user_agent + "\r\n", &error)) {
            log_event(StructuredLogger::Level::Warning, "session.quit.failed", {{"session", id_}, {"reason", error}});
        }
    }
    if (transport) {
        transport->shutdown();
    }

    std::scoped_lock lifecycle(lifecycle_mutex_);
    if (reader_.joinable() && reader_.get_id() != std::this_thread::get_id()) {
        reader_.join();
    }
    close_transport();
    ready_.store(false, std::memory_order_release);

    bool was_connected = false;
    update_status([&](SessionStatus& status) {
        was_connected = status.connected;
        status.connected = false;
        status.joined_channel = false;
        status.state = SessionState::Disconnected;
    });
    if (was_connected) {
        log_event(StructuredLogger::Level::Info, "session.disconnected", {{"session", id_}});
    }
}

bool ChatSession::sleep_unless_closing(std::chrono::milliseconds duration) {
    std::unique_lock lock(closing_mutex_);
    return !closing_cv_.wait_for(lock, duration, [this]() { return stopping_.load(std::memory_order_acquire); });
}

bool ChatSession::send_line(const std::string& line, std::string* error) {
    std::shared_ptr<Transport> transport;
    {
        std::scoped_lock lock(transport_mutex_);
        transport = transport_;
    }
    if (!transport) {
        if (error) {
            *error = "Not connected to IRC";
        }
        return false;
    }
    return transport->write(line + "\r\n", error);
}

void ChatSession::reader_loop() {
    LineReader* reader = nullptr;
    {
        std::scoped_lock lock(transport_mutex_);
        reader = line_reader_.get();
    }
    if (reader == nullptr) {
        return;
    }

    std::string line;
    while (!stopping_.load(std::memory_order_acquire)) {
        const auto read = reader->next_line(line, kReaderPollInterval);
        if (read == ReadStatus::Timeout) {
            continue;
        }
        if (read == ReadStatus::Data) {
            handle_line(line);
            continue;
        }
        if (!stopping_.load(std::memory_order_acquire)) {
            ready_.store(false, std::memory_order_release);
            log_event(StructuredLogger::Level::Warning,
                      "session.connection.lost",
                      {{"session", id_}, {"reason", read == ReadStatus::Closed ? "closed" : "error"}});
            update_status([](SessionStatus& status) {
                status.connected = false;
                status.joined_channel = false;
                status.state = SessionState::Disconnected;
            });
            record_error("Connection lost");
            buffer_cv_.notify_all();
        }
        break;
    }
}

void ChatSession::handle_line(const std::string& line) {
    const auto message = parse_irc_line(line);
    if (!message) {
        return;
    }
    update_status([](SessionStatus&) {});

    if (message->command == "PING") {
        send_line("PONG :" + message->text());
        return;
    }
    if (is_ctcp_version_request(*message, status().nickname)) {
        const auto sender = message->nick();
        std::string error;
        if (send_line("NOTICE " + sender + " :\x01VERSION " + config_.user_agent + "\x01", &error)) {
            log_event(StructuredLogger::Level::Info, "session.ctcp.version", {{"session", id_}, {"to", sender}});
        } else {
            log_event(StructuredLogger::Level::Warning, "session.ctcp.version_failed", {{"session", id_}, {"reason", error}});
        }
        return;
    }
    if (message->command != "PRIVMSG" && message->command != "NOTICE") {
        return;
    }

    const auto body = message->text();
    if (transfer::looks_like_offer(body)) {
        if (auto offer = transfer::parse_offer(body)) {
            log_event(StructuredLogger::Level::Info,
                      "session.offer.received",
                      {{"session", id_},
                       {"from", message->nick()},
                       {"file", offer->filename},
                       {"size", std::to_string(offer->declared_size)}});
            {
                std::scoped_lock lock(buffer_mutex_);
                pending_offers_.push_back(PendingOffer{std::move(*offer), message->nick()});
                last_arrival_ = std::chrono::steady_clock::now();
            }
            buffer_cv_.notify_all();
        }
        return;
    }

    auto text = trim(strip_formatting(body));
    if (!search::is_likely_result(text)) {
        return;
    }
    if (!text::is_valid_utf8(text)) {
        if (auto decoded = text::decode_to_utf8(text)) {
            text = std::move(decoded->utf8);
        }
    }
    {
        std::scoped_lock lock(buffer_mutex_);
        pending_lines_.push_back(std::move(text));
        last_arrival_ = std::chrono::steady_clock::now();
    }
    buffer_cv_.notify_all();
}

void ChatSession::reset_buffers() {
    std::scoped_lock lock(buffer_mutex_);
    pending_lines_.clear();
    pending_offers_.clear();
    last_arrival_ = {};
}

SearchCollection ChatSession::collect_search(const std::string& author,
                                             const std::optional<std::string>& title,
                                             std::size_t max_lines) {
    SearchCollection collection{};
    if (!ready()) {
        collection.message = "Not connected to IRC";
        return collection;
    }

    throttle_.acquire();
    reset_buffers();

    collection.query = "@" + config_.search_bot + " " + author;
    if (title && !title->empty()) {
        collection.query += " " + *title;
    }
    std::string error;
    if (!send_line("PRIVMSG " + config_.channel + " :" + collection.query, &error)) {
        collection.message = "Failed to send search command: " + error;
        record_error(collection.message);
        return collection;
    }
    log_event(StructuredLogger::Level::Info, "session.search.sent", {{"session", id_}, {"query", collection.query}});

    const auto deadline = std::chrono::steady_clock::now() + config_.search_window;
    bool lost = false;
    {
        std::unique_lock lock(buffer_mutex_);
        while (true) {
            if (max_lines > 0 && pending_lines_.size() >= max_lines) {
                break;
            }
            if (!ready()) {
                lost = true;
                break;
            }
            const auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                break;
            }
            auto wake_at = deadline;
            if (!pending_lines_.empty() || !pending_offers_.empty()) {
                const auto quiet_at = last_arrival_ + config_.search_quiet_period;
                if (now >= quiet_at) {
                    break;
                }
                wake_at = std::min(wake_at, quiet_at);
            }
            buffer_cv_.wait_until(lock, wake_at);
        }
        collection.lines = std::move(pending_lines_);
        for (auto& pending : pending_offers_) {
            collection.offers.push_back(std::move(pending.offer));
        }
        pending_lines_.clear();
        pending_offers_.clear();
    }

    if (lost) {
        collection.message = "Connection lost during search";
        return collection;
    }
    collection.success = true;
    collection.message = "Collected " + std::to_string(collection.lines.size()) + " result lines";
    log_event(StructuredLogger::Level::Info,
              "session.search.collected",
              {{"session", id_},
               {"query", collection.query},
               {"lines", std::to_string(collection.lines.size())},
               {"offers", std::to_string(collection.offers.size())}});
    return collection;
}

TransferResult ChatSession::download(const DownloadRequest& request) {
    TransferResult result{};
    if (!ready()) {
        result.message = "Not connected to IRC";
        return result;
    }

    throttle_.acquire();
    if (request.deadline && std::chrono::steady_clock::now() >= *request.deadline) {
        result.message = "Download deadline exceeded while waiting for the command interval";
        log_event(StructuredLogger::Level::Warning,
                  "session.download.throttled_out",
                  {{"session", id_}, {"command", request.reply_command}});
        return result;
    }
    reset_buffers();

    std::string error;
    if (!send_line("PRIVMSG " + config_.channel + " :" + request.reply_command, &error)) {
        result.message = "Failed to send download command: " + error;
        record_error(result.message);
        return result;
    }
    log_event(StructuredLogger::Level::Info,
              "session.download.requested",
              {{"session", id_}, {"command", request.reply_command}});

    auto offer_deadline = std::chrono::steady_clock::now() + config_.response_timeout;
    if (request.deadline) {
        offer_deadline = std::min(offer_deadline, *request.deadline);
    }

    const auto from_expected = [&](const PendingOffer& pending) {
        return !request.expected_sender || to_lower(pending.sender) == to_lower(*request.expected_sender);
    };

    std::optional<TransferOffer> offer;
    {
        std::unique_lock lock(buffer_mutex_);
        while (true) {
            for (const auto& pending : pending_offers_) {
                if (from_expected(pending)) {
                    if (!offer) {
                        offer = pending.offer;
                    }
                } else {
                    log_event(StructuredLogger::Level::Warning,
                              "session.offer.ignored",
                              {{"session", id_},
                               {"from", pending.sender},
                               {"expected", *request.expected_sender},
                               {"file", pending.offer.filename}});
                }
            }
            pending_offers_.clear();
            if (offer || !ready() || std::chrono::steady_clock::now() >= offer_deadline) {
                break;
            }
            buffer_cv_.wait_until(lock, offer_deadline);
        }
    }
    if (!offer) {
        result.message = ready() ? "No DCC offer received" : "Connection lost while waiting for DCC offer";
        log_event(StructuredLogger::Level::Warning,
                  "session.download.no_offer",
                  {{"session", id_}, {"command", request.reply_command}, {"reason", result.message}});
        return result;
    }
    result = receive_offer(*offer, request.filename, request.deadline, request.on_progress);
    if (result.success) {
        update_status([](SessionStatus& status) { ++status.total_downloads; });
    }
    return result;
}

TransferResult ChatSession::receive_offer(const TransferOffer& offer,
                                          const std::optional<std::string>& filename,
                                          std::optional<std::chrono::steady_clock::time_point> deadline,
                                          const transfer::ProgressCallback& on_progress) {
    TransferResult result{};
    result.offer = offer;
    result.bytes_expected = offer.declared_size;

    const auto name = sanitize_filename(filename.value_or(offer.filename));
    if (name.empty()) {
        result.message = "DCC download failed: invalid filename '" + filename.value_or(offer.filename) + "'";
        return result;
    }

    transfer::TransferOptions options{};
    options.connect_timeout = config_.connect_timeout;
    options.read_timeout = config_.transfer_timeout;
    options.chunk_bytes = config_.transfer_chunk_bytes;
    options.deadline = deadline;
    options.on_progress = on_progress;

    const auto outcome = transfer::TransferClient(options).fetch(offer, std::filesystem::path(config_.download_directory) / name);
    result.success = outcome.success;
    result.message = outcome.message;
    result.file_path = outcome.path;
    result.bytes_received = outcome.bytes_received;
    if (!outcome.success) {
        return result;
    }

    if (has_zip_extension(result.file_path)) {
        auto contents = search::unpack_listing_package(result.file_path, parser_);
        result.extracted_files = std::move(contents.extracted_files);
        result.listed_records = std::move(contents.records);
        update_status([&](SessionStatus& status) { status.parse_errors += contents.rejected_lines; });
    }
    return result;
}

void ChatSession::record_search(const std::string& query, std::size_t results, std::size_t parse_errors) {
    update_status([&](SessionStatus& status) {
        ++status.total_searches;
        status.last_search_query = query;
        status.last_search_results = results;
        status.parse_errors += parse_errors;
    });
}

}  // namespace bookhound::session
