#include "bookhound/daemon/ControlPlane.hpp"
#include "bookhound/daemon/ControlWire.hpp"

#include <chrono>
#include <optional>
#include <sstream>
#include <string>
#include <utility>

namespace bookhound::daemon {

namespace {

constexpr std::chrono::seconds kControlConnectTimeout{5};

std::optional<ControlResponse> parse_response(net::NativeSocket socket) {
    ControlResponse response{};
    std::string line;
    bool status_seen = false;
    std::optional<std::size_t> payload_length;

    while (true) {
        if (!wire::recv_line(socket, line)) {
            return std::nullopt;
        }
        if (line.empty()) {
            break;
        }
        const auto pos = line.find(':');
        if (pos == std::string::npos) {
            continue;
        }
        const auto key = wire::to_upper(line.substr(0, pos));
        const auto value = line.substr(pos + 1);
        if (key == "STATUS") {
            status_seen = true;
            response.success = wire::to_upper(value) == "OK";
            continue;
        }
        if (key == "PAYLOAD-LENGTH") {
            const auto parsed = wire::parse_uint64(value);
            if (!parsed || *parsed > kMaxControlPayloadBytes) {
                response.success = false;
                response.fields["MESSAGE"] = "Invalid payload length";
                return response;
            }
            payload_length = static_cast<std::size_t>(*parsed);
        }
        response.fields[key] = value;
    }

    if (!status_seen) {
        response.success = false;
        response.fields["MESSAGE"] = "Incomplete response from daemon";
    }
    if (payload_length) {
        response.has_payload = true;
        response.payload.resize(*payload_length);
        if (*payload_length > 0 && !wire::recv_exact(socket, response.payload.data(), *payload_length)) {
            return std::nullopt;
        }
    }
    return response;
}

}  // namespace

class ControlClient::Impl {
public:
    Impl(std::string host, std::uint16_t port, std::optional<std::string> token)
        : host_(std::move(host)), port_(port), token_(std::move(token)) {
        net::ensure_socket_runtime();
    }

    std::optional<ControlResponse> send(const std::string& command,
                                        const ControlFields& fields,
                                        std::span<const std::uint8_t> payload) {
        if (payload.size() > kMaxControlPayloadBytes) {
            return std::nullopt;
        }
        const auto host = host_.empty() || host_ == "0.0.0.0" ? std::string("127.0.0.1") : host_;
        auto socket = net::connect_tcp(host, port_, kControlConnectTimeout);
        if (!socket) {
            return std::nullopt;
        }

        std::ostringstream request;
        request << "COMMAND:" << wire::to_upper(command) << "\n";
        if (token_) {
            request << "TOKEN:" << *token_ << "\n";
        }
        for (const auto& [key, value] : fields) {
            request << wire::to_upper(key) << ':' << wire::flatten(value) << "\n";
        }
        if (!payload.empty()) {
            request << "PAYLOAD-LENGTH:" << payload.size() << "\n";
        }
        request << "\n";

        const auto serialized = request.str();
        if (!net::send_all(socket.get(), serialized.c_str(), serialized.size())) {
            return std::nullopt;
        }
        if (!payload.empty() &&
            !net::send_all(socket.get(), reinterpret_cast<const char*>(payload.data()), payload.size())) {
            return std::nullopt;
        }
        return parse_response(socket.get());
    }

private:
    std::string host_;
    std::uint16_t port_;
    std::optional<std::string> token_;
};

ControlClient::ControlClient(std::string host, std::uint16_t port, std::optional<std::string> token)
    : impl_(std::make_unique<Impl>(std::move(host), port, std::move(token))) {}

ControlClient::~ControlClient() = default;

std::optional<ControlResponse> ControlClient::send(const std::string& command,
                                                   const ControlFields& fields,
                                                   std::span<const std::uint8_t> payload) {
    return impl_->send(command, fields, payload);
}

}  // namespace bookhound::daemon
