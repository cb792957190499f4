#include "bookhound/daemon/ControlPlane.hpp"
#include "bookhound/daemon/ControlWire.hpp"

#include "bookhound/core/StructuredLogger.hpp"
#include "bookhound/search/SearchOrchestrator.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <list>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#ifndef _WIN32
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/types.h>
#endif

namespace bookhound::daemon {

namespace {

using net::NativeSocket;

struct ParsedRequest {
    ControlFields fields;
    std::vector<std::uint8_t> payload;
};

struct ParseResult {
    bool success{false};
    bool connection_closed{false};
    ParsedRequest request;
    std::string error_code;
    std::string error_message;
    std::string error_hint;
};

ParseResult parse_request(NativeSocket client) {
    ParseResult result;
    std::string line;
    std::size_t payload_length = 0;
    bool saw_any_lines = false;

    while (wire::recv_line(client, line)) {
        if (line.empty()) {
            break;
        }
        saw_any_lines = true;
        const auto pos = line.find(':');
        if (pos == std::string::npos) {
            result.error_code = "ERR_CONTROL_HEADER";
            result.error_message = "Malformed control header";
            result.error_hint = "Use the bookhound CLI to talk to the daemon";
            return result;
        }
        const auto key = wire::to_upper(line.substr(0, pos));
        const auto value = line.substr(pos + 1);
        if (key == "PAYLOAD-LENGTH") {
            const auto parsed = wire::parse_uint64(value);
            if (!parsed) {
                result.error_code = "ERR_CONTROL_PAYLOAD_LENGTH";
                result.error_message = "Invalid PAYLOAD-LENGTH";
                return result;
            }
            if (*parsed > kMaxControlPayloadBytes) {
                result.error_code = "ERR_CONTROL_PAYLOAD_TOO_LARGE";
                result.error_message = "Payload exceeds server allowance";
                result.error_hint = "Send fewer candidates per request";
                return result;
            }
            payload_length = static_cast<std::size_t>(*parsed);
        }
        result.request.fields[key] = value;
    }

    if (!saw_any_lines) {
        result.connection_closed = true;
        return result;
    }
    if (payload_length > 0) {
        result.request.payload.resize(payload_length);
        if (!wire::recv_exact(client, result.request.payload.data(), payload_length)) {
            result.error_code = "ERR_CONTROL_PAYLOAD_TRUNCATED";
            result.error_message = "Truncated control payload";
            result.error_hint = "Retry the command";
            return result;
        }
    }
    result.success = true;
    return result;
}

bool constant_time_equal(const std::string& expected, const std::string& provided) {
    if (expected.size() != provided.size()) {
        return false;
    }
    unsigned char diff = 0;
    for (std::size_t i = 0; i < expected.size(); ++i) {
        diff |= static_cast<unsigned char>(expected[i] ^ provided[i]);
    }
    return diff == 0;
}

ControlFields make_ok(std::string_view code = "OK") {
    ControlFields fields;
    fields["CODE"] = std::string(code);
    return fields;
}

ControlFields make_error(std::string_view code, std::string_view message, std::string_view hint = {}) {
    ControlFields fields;
    fields["CODE"] = std::string(code);
    fields["MESSAGE"] = wire::flatten(message);
    if (!hint.empty()) {
        fields["HINT"] = std::string(hint);
    }
    return fields;
}

std::string to_bytes_text(const std::vector<std::string>& lines) {
    std::string text;
    for (const auto& line : lines) {
        text += wire::flatten(line);
        text += '\n';
    }
    return text;
}

std::optional<std::string> optional_field(const ParsedRequest& request, const std::string& key) {
    const auto it = request.fields.find(key);
    if (it == request.fields.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::size_t> count_field(const ParsedRequest& request, const std::string& key) {
    if (auto text = optional_field(request, key)) {
        if (auto parsed = wire::parse_uint64(*text)) {
            return static_cast<std::size_t>(*parsed);
        }
    }
    return std::nullopt;
}

bool flag_field(const ParsedRequest& request, const std::string& key) {
    const auto value = optional_field(request, key);
    return value && (*value == "1" || wire::to_upper(*value) == "TRUE" || wire::to_upper(*value) == "YES");
}

void add_status_fields(ControlFields& fields, const SessionStatus& status) {
    fields["SESSION_ID"] = status.session_id;
    fields["STATE"] = session_state_to_string(status.state);
    fields["CONNECTED"] = status.connected ? "1" : "0";
    fields["JOINED"] = status.joined_channel ? "1" : "0";
    fields["NICKNAME"] = status.nickname;
    fields["SERVER"] = status.server;
    fields["CHANNEL"] = status.channel;
    fields["LAST_ACTIVITY"] = format_timestamp(status.last_activity);
    fields["TOTAL_SEARCHES"] = std::to_string(status.total_searches);
    fields["TOTAL_DOWNLOADS"] = std::to_string(status.total_downloads);
    fields["LAST_QUERY"] = wire::flatten(status.last_search_query);
    fields["LAST_RESULTS"] = std::to_string(status.last_search_results);
    fields["PARSE_ERRORS"] = std::to_string(status.parse_errors);
    fields["ERROR_COUNT"] = std::to_string(status.errors.size());
}

void add_transfer_fields(ControlFields& fields, const TransferResult& transfer) {
    if (!transfer.file_path.empty()) {
        fields["PATH"] = transfer.file_path.string();
    }
    fields["BYTES"] = std::to_string(transfer.bytes_received);
    fields["EXPECTED"] = std::to_string(transfer.bytes_expected);
    if (!transfer.extracted_files.empty()) {
        fields["EXTRACTED_COUNT"] = std::to_string(transfer.extracted_files.size());
    }
    if (!transfer.listed_records.empty()) {
        fields["LISTED_COUNT"] = std::to_string(transfer.listed_records.size());
    }
}

std::string join(const std::vector<std::string>& values, char separator) {
    std::string joined;
    for (const auto& value : values) {
        if (!joined.empty()) {
            joined.push_back(separator);
        }
        joined += value;
    }
    return joined;
}

}  // namespace

class ControlServer::Impl {
public:
    Impl(session::SessionRegistry& registry, Config defaults, StopCallback stop_callback)
        : registry_(registry), defaults_(std::move(defaults)), stop_callback_(std::move(stop_callback)) {
        net::ensure_socket_runtime();
    }

    ~Impl() {
        stop();
    }

    void start(const std::string& host, std::uint16_t port) {
        if (running_) {
            return;
        }
        std::uint16_t bound = 0;
        listen_socket_ = net::listen_tcp(host, port, &bound);
        port_.store(bound, std::memory_order_release);
        running_.store(true, std::memory_order_release);
        accept_thread_ = std::thread(&Impl::accept_loop, this);
        log_event(StructuredLogger::Level::Info,
                  "control.listening",
                  {{"host", host}, {"port", std::to_string(bound)}});
    }

    void stop() {
        if (!running_.exchange(false, std::memory_order_acq_rel)) {
            return;
        }
        listen_socket_.shutdown();
        if (accept_thread_.joinable() && accept_thread_.get_id() != std::this_thread::get_id()) {
            accept_thread_.join();
        }
        listen_socket_.reset();

        std::list<Worker> workers;
        {
            std::scoped_lock lock(workers_mutex_);
            workers.swap(workers_);
        }
        for (auto& worker : workers) {
            if (worker.thread.get_id() == std::this_thread::get_id()) {
                worker.thread.detach();
            } else if (worker.thread.joinable()) {
                worker.thread.join();
            }
        }
    }

    bool running() const noexcept {
        return running_.load(std::memory_order_acquire);
    }

    std::uint16_t port() const noexcept {
        return port_.load(std::memory_order_acquire);
    }

private:
    session::SessionRegistry& registry_;
    Config defaults_;
    StopCallback stop_callback_;
    std::atomic<bool> running_{false};
    std::atomic<std::uint16_t> port_{0};
    net::ScopedSocket listen_socket_;
    std::thread accept_thread_;
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    std::mutex workers_mutex_;
    std::list<Worker> workers_;

    // Joins workers whose connection already finished. Caller holds workers_mutex_.
    void reap_finished_workers() {
        for (auto it = workers_.begin(); it != workers_.end();) {
            if (it->done->load(std::memory_order_acquire)) {
                it->thread.join();
                it = workers_.erase(it);
            } else {
                ++it;
            }
        }
    }

    void accept_loop() {
        while (running_.load(std::memory_order_acquire)) {
            sockaddr_in client_addr{};
#ifdef _WIN32
            int addr_len = sizeof(client_addr);
#else
            socklen_t addr_len = sizeof(client_addr);
#endif
            const auto client = ::accept(listen_socket_.get(), reinterpret_cast<sockaddr*>(&client_addr), &addr_len);
            if (client == net::kInvalidNativeSocket) {
                if (running_.load(std::memory_order_acquire)) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(50));
                }
                continue;
            }
            if (!running_.load(std::memory_order_acquire)) {
                net::ScopedSocket discard(client);
                break;
            }

            std::string remote{"unknown"};
            char buffer[INET_ADDRSTRLEN] = {0};
            if (inet_ntop(AF_INET, &client_addr.sin_addr, buffer, sizeof(buffer)) != nullptr) {
                remote = buffer;
            }
            log_event(StructuredLogger::Level::Info, "control.connection.accepted", {{"remote", remote}});

            std::scoped_lock lock(workers_mutex_);
            reap_finished_workers();
            auto done = std::make_shared<std::atomic<bool>>(false);
            std::thread thread([this, client, remote, done]() {
                {
                    net::ScopedSocket socket(client);
                    handle_client(socket.get(), remote);
                }
                done->store(true, std::memory_order_release);
            });
            workers_.push_back(Worker{std::move(thread), std::move(done)});
        }
    }

    static void send_response(NativeSocket client,
                              ControlFields fields,
                              bool success,
                              std::string_view payload = {},
                              bool force_payload = false) {
        const bool has_payload = force_payload || !payload.empty();
        if (has_payload) {
            fields["PAYLOAD-LENGTH"] = std::to_string(payload.size());
        }
        std::ostringstream oss;
        oss << "STATUS:" << (success ? "OK" : "ERROR") << "\n";
        for (const auto& [key, value] : fields) {
            oss << key << ':' << value << "\n";
        }
        oss << "\n";
        const auto header = oss.str();
        if (!net::send_all(client, header.c_str(), header.size())) {
            return;
        }
        if (!payload.empty()) {
            net::send_all(client, payload.data(), payload.size());
        }
    }

    bool authorized(NativeSocket client, const ParsedRequest& request, const std::string& remote) {
        if (!defaults_.control_token) {
            return true;
        }
        const auto it = request.fields.find("TOKEN");
        if (it == request.fields.end()) {
            log_event(StructuredLogger::Level::Warning, "control.auth.missing", {{"remote", remote}});
            send_response(client,
                          make_error("ERR_AUTH_REQUIRED", "Control token required", "Pass --token or set control.token"),
                          false);
            return false;
        }
        if (!constant_time_equal(*defaults_.control_token, it->second)) {
            log_event(StructuredLogger::Level::Warning, "control.auth.failed", {{"remote", remote}});
            send_response(client, make_error("ERR_AUTH_FAILED", "Control token rejected"), false);
            return false;
        }
        return true;
    }

    std::shared_ptr<session::ChatSession> require_session(NativeSocket client, const ParsedRequest& request) {
        const auto id = optional_field(request, "SESSION_ID");
        if (!id) {
            send_response(client,
                          make_error("ERR_MISSING_SESSION", "SESSION_ID header missing", "Create a session first"),
                          false);
            return nullptr;
        }
        auto session = registry_.get(*id);
        if (!session) {
            send_response(client,
                          make_error("ERR_UNKNOWN_SESSION", "Session not found: " + *id, "List sessions with `bookhound sessions`"),
                          false);
            return nullptr;
        }
        return session;
    }

    std::optional<std::string> require_field(NativeSocket client, const ParsedRequest& request, const std::string& key) {
        auto value = optional_field(request, key);
        if (!value) {
            send_response(client, make_error("ERR_MISSING_ARGUMENT", key + " header missing"), false);
        }
        return value;
    }

    void handle_client(NativeSocket client, const std::string& remote) {
        auto parse = parse_request(client);
        if (parse.connection_closed) {
            return;
        }
        if (!parse.success) {
            auto error = make_error(parse.error_code.empty() ? "ERR_CONTROL_REQUEST" : parse.error_code,
                                    parse.error_message.empty() ? "Malformed control request" : parse.error_message,
                                    parse.error_hint);
            log_event(StructuredLogger::Level::Warning,
                      "control.request.parse_error",
                      {{"remote", remote}, {"code", error.at("CODE")}});
            send_response(client, std::move(error), false);
            return;
        }

        const auto request = std::move(parse.request);
        const auto it = request.fields.find("COMMAND");
        if (it == request.fields.end()) {
            log_event(StructuredLogger::Level::Warning, "control.request.missing_command", {{"remote", remote}});
            send_response(client,
                          make_error("ERR_MISSING_COMMAND", "COMMAND header missing", "Include the COMMAND header in the request"),
                          false);
            return;
        }

        const auto command = wire::to_upper(it->second);
        if (command == "PING") {
            auto fields = make_ok("OK_PING");
            fields["MESSAGE"] = "pong";
            send_response(client, fields, true);
            return;
        }
        if (!authorized(client, request, remote)) {
            return;
        }
        log_event(StructuredLogger::Level::Info,
                  "control.command",
                  {{"remote", remote}, {"command", command}});

        if (command == "CREATE_SESSION") {
            handle_create(client, request);
        } else if (command == "CLOSE_SESSION") {
            handle_close(client, request);
        } else if (command == "STATUS") {
            handle_status(client, request);
        } else if (command == "SESSIONS") {
            handle_sessions(client);
        } else if (command == "SEARCH") {
            handle_search(client, request);
        } else if (command == "AUTHOR") {
            handle_author(client, request);
        } else if (command == "TITLE") {
            handle_title(client, request);
        } else if (command == "DOWNLOAD") {
            handle_download(client, request);
        } else if (command == "SMART") {
            handle_smart(client, request);
        } else if (command == "STOP") {
            auto fields = make_ok("OK_STOP");
            fields["MESSAGE"] = "Daemon shutting down";
            send_response(client, fields, true);
            log_event(StructuredLogger::Level::Info, "control.command.stop", {{"remote", remote}});
            if (stop_callback_) {
                stop_callback_();
            }
        } else {
            log_event(StructuredLogger::Level::Warning,
                      "control.command.unsupported",
                      {{"remote", remote}, {"command", command}});
            send_response(client,
                          make_error("ERR_UNSUPPORTED_COMMAND", "Unsupported command", "Run `bookhound help` for the command list"),
                          false);
        }
    }

    void handle_create(NativeSocket client, const ParsedRequest& request) {
        auto config = defaults_;
        if (auto server = optional_field(request, "SERVER")) {
            config.server_host = *server;
        }
        if (auto port = count_field(request, "PORT")) {
            if (*port == 0 || *port > 65535) {
                send_response(client, make_error("ERR_INVALID_ARGUMENT", "PORT must be between 1 and 65535"), false);
                return;
            }
            config.server_port = static_cast<std::uint16_t>(*port);
        }
        if (optional_field(request, "TLS")) {
            config.use_tls = flag_field(request, "TLS");
        }
        if (auto channel = optional_field(request, "CHANNEL")) {
            config.channel = *channel;
        }
        if (auto nickname = optional_field(request, "NICKNAME")) {
            config.nickname = *nickname;
        }
        if (auto directory = optional_field(request, "DOWNLOAD_DIR")) {
            config.download_directory = *directory;
        }

        const auto created = registry_.create(std::move(config));
        ControlFields fields = created.connected
                                   ? make_ok("OK_CREATE_SESSION")
                                   : make_error("ERR_CONNECT_FAILED", created.message, "Check the IRC server address and retry");
        fields["SESSION_ID"] = created.session_id;
        fields["CONNECTED"] = created.connected ? "1" : "0";
        fields["MESSAGE"] = wire::flatten(created.message);
        send_response(client, fields, created.connected);
    }

    void handle_close(NativeSocket client, const ParsedRequest& request) {
        const auto id = require_field(client, request, "SESSION_ID");
        if (!id) {
            return;
        }
        if (!registry_.close(*id)) {
            send_response(client, make_error("ERR_UNKNOWN_SESSION", "Session not found: " + *id), false);
            return;
        }
        auto fields = make_ok("OK_CLOSE_SESSION");
        fields["SESSION_ID"] = *id;
        fields["CLOSED"] = "1";
        send_response(client, fields, true);
    }

    void handle_status(NativeSocket client, const ParsedRequest& request) {
        if (!optional_field(request, "SESSION_ID")) {
            auto fields = make_ok("OK_STATUS");
            fields["SESSIONS"] = std::to_string(registry_.size());
            fields["CONTROL_PORT"] = std::to_string(port());
            send_response(client, fields, true);
            return;
        }
        const auto session = require_session(client, request);
        if (!session) {
            return;
        }
        const auto status = session->status();
        auto fields = make_ok("OK_STATUS");
        add_status_fields(fields, status);
        send_response(client, fields, true, to_bytes_text(status.errors), true);
    }

    void handle_sessions(NativeSocket client) {
        std::vector<std::string> lines;
        for (const auto& summary : registry_.list_active_sessions()) {
            lines.push_back(summary.session_id + '\t' + session_state_to_string(summary.status.state) + '\t' +
                            summary.status.nickname + '\t' + (summary.status.connected ? "1" : "0"));
        }
        auto fields = make_ok("OK_SESSIONS");
        fields["COUNT"] = std::to_string(lines.size());
        std::string payload;
        for (const auto& line : lines) {
            payload += line + '\n';
        }
        send_response(client, fields, true, payload, true);
    }

    void send_search(NativeSocket client, const search::SearchOutcome& outcome, std::string_view ok_code) {
        if (!outcome.success) {
            auto fields = make_error("ERR_SEARCH_FAILED", outcome.message);
            fields["QUERY"] = wire::flatten(outcome.query);
            send_response(client, fields, false);
            return;
        }
        auto fields = make_ok(ok_code);
        fields["MESSAGE"] = wire::flatten(outcome.message);
        fields["QUERY"] = wire::flatten(outcome.query);
        fields["COUNT"] = std::to_string(outcome.candidates.size());
        fields["RAW_LINES"] = std::to_string(outcome.raw_lines);
        fields["PARSE_ERRORS"] = std::to_string(outcome.parse_errors);
        send_response(client, fields, true, encode_records(outcome.candidates), true);
    }

    void handle_search(NativeSocket client, const ParsedRequest& request) {
        const auto session = require_session(client, request);
        if (!session) {
            return;
        }
        const auto author = require_field(client, request, "AUTHOR");
        if (!author) {
            return;
        }
        search::SearchOptions options{};
        options.max_results = count_field(request, "MAX_RESULTS").value_or(0);
        options.epub_only = flag_field(request, "EPUB_ONLY");
        options.format = optional_field(request, "FORMAT");
        search::SearchOrchestrator orchestrator(*session);
        send_search(client, orchestrator.search_books(*author, optional_field(request, "TITLE"), options), "OK_SEARCH");
    }

    void handle_author(NativeSocket client, const ParsedRequest& request) {
        const auto session = require_session(client, request);
        if (!session) {
            return;
        }
        const auto author = require_field(client, request, "AUTHOR");
        if (!author) {
            return;
        }
        search::SearchOrchestrator orchestrator(*session);
        send_search(client,
                    orchestrator.search_author_level(*author, count_field(request, "MAX_RESULTS").value_or(0)),
                    "OK_AUTHOR");
    }

    void handle_title(NativeSocket client, const ParsedRequest& request) {
        const auto session = require_session(client, request);
        if (!session) {
            return;
        }
        const auto author = require_field(client, request, "AUTHOR");
        if (!author) {
            return;
        }
        const auto title = require_field(client, request, "TITLE");
        if (!title) {
            return;
        }
        search::SearchOrchestrator orchestrator(*session);
        send_search(client,
                    orchestrator.search_title_level(*author, *title, count_field(request, "MAX_RESULTS").value_or(0)),
                    "OK_TITLE");
    }

    static void add_fallback_fields(ControlFields& fields, const search::FallbackResult& result) {
        add_transfer_fields(fields, result.transfer);
        fields["TOTAL_ATTEMPTS"] = std::to_string(result.total_attempts);
        if (result.success) {
            fields["ATTEMPT"] = std::to_string(result.attempt_number);
            if (result.used_candidate) {
                fields["USED_SERVER"] = result.used_candidate->server_tag;
                fields["USED_COMMAND"] = wire::flatten(result.used_candidate->reply_command);
            }
        } else if (!result.candidates_tried.empty()) {
            fields["CANDIDATES_TRIED"] = join(result.candidates_tried, ',');
        }
    }

    static std::string extracted_payload(const TransferResult& transfer) {
        std::vector<std::string> lines;
        for (const auto& path : transfer.extracted_files) {
            lines.push_back(path.string());
        }
        return to_bytes_text(lines);
    }

    void handle_download(NativeSocket client, const ParsedRequest& request) {
        const auto session = require_session(client, request);
        if (!session) {
            return;
        }
        const std::string_view text(reinterpret_cast<const char*>(request.payload.data()), request.payload.size());
        std::vector<BookRecord> candidates;
        for (auto& entry : decode_records(text)) {
            candidates.push_back(std::move(entry.record));
        }
        if (auto command = optional_field(request, "COMMAND_TEXT")) {
            BookRecord record{};
            record.reply_command = *command;
            const auto space = command->find(' ');
            if (command->front() == '!') {
                record.server_tag = command->substr(1, space == std::string::npos ? space : space - 1);
            }
            candidates.insert(candidates.begin(), std::move(record));
        }

        std::chrono::milliseconds per_attempt = session->config().fallback_attempt_timeout;
        if (auto seconds = count_field(request, "TIMEOUT")) {
            if (*seconds == 0) {
                send_response(client, make_error("ERR_INVALID_ARGUMENT", "TIMEOUT must be positive"), false);
                return;
            }
            per_attempt = std::chrono::seconds(*seconds);
        }

        search::SearchOrchestrator orchestrator(*session);
        const auto result = orchestrator.download_with_fallback(candidates, per_attempt, optional_field(request, "FILENAME"));
        auto fields = result.success ? make_ok("OK_DOWNLOAD") : make_error("ERR_DOWNLOAD_FAILED", result.message);
        fields["MESSAGE"] = wire::flatten(result.message);
        add_fallback_fields(fields, result);
        send_response(client, fields, result.success, extracted_payload(result.transfer), result.success);
    }

    void handle_smart(NativeSocket client, const ParsedRequest& request) {
        const auto session = require_session(client, request);
        if (!session) {
            return;
        }
        const auto author = require_field(client, request, "AUTHOR");
        if (!author) {
            return;
        }
        search::SearchOrchestrator orchestrator(*session);
        const auto outcome = orchestrator.smart_search_and_download(*author,
                                                                    optional_field(request, "TITLE"),
                                                                    optional_field(request, "FILENAME"));
        auto fields = outcome.success ? make_ok("OK_SMART") : make_error("ERR_SMART_FAILED", outcome.message);
        fields["MESSAGE"] = wire::flatten(outcome.message);
        fields["MODE"] = search::smart_mode_to_string(outcome.mode);
        fields["QUERY"] = wire::flatten(outcome.query);
        fields["COUNT"] = std::to_string(outcome.unique_books.size());
        if (outcome.download) {
            add_fallback_fields(fields, *outcome.download);
        }
        send_response(client, fields, outcome.success, encode_records(outcome.unique_books), true);
    }
};

ControlServer::ControlServer(session::SessionRegistry& registry, Config defaults, StopCallback stop_callback)
    : impl_(std::make_unique<Impl>(registry, std::move(defaults), std::move(stop_callback))) {}

ControlServer::~ControlServer() = default;

void ControlServer::start(const std::string& host, std::uint16_t port) {
    impl_->start(host, port);
}

void ControlServer::stop() {
    impl_->stop();
}

bool ControlServer::running() const noexcept {
    return impl_->running();
}

std::uint16_t ControlServer::port() const noexcept {
    return impl_->port();
}

}  // namespace bookhound::daemon
