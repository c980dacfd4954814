#include "zapwire/network/RelayedConnection.hpp"

#include "zapwire/Error.hpp"
#include "zapwire/core/StructuredLogger.hpp"
#include "zapwire/crypto/CodeHash.hpp"
#include "zapwire/network/Socket.hpp"

#include <array>

namespace zapwire::network {

namespace {

using core::StructuredLogger;

void log_event(StructuredLogger::Level level, std::string_view event, StructuredLogger::FieldList fields = {}) {
    StructuredLogger::instance().log(level, event, std::move(fields));
}

std::string_view as_text(const ByteBuffer& payload) {
    return std::string_view(reinterpret_cast<const char*>(payload.data()), payload.size());
}

}  // namespace

RelayedConnection::RelayedConnection(ConstructionTag, int socket, std::size_t max_frame_size, std::string endpoint)
    : socket_(socket),
      max_frame_size_(max_frame_size),
      endpoint_(std::move(endpoint)) {}

RelayedConnection::~RelayedConnection() {
    close();
    close_socket(socket_);
}

std::unique_ptr<RelayedConnection> RelayedConnection::connect(const std::string& host,
                                                              std::uint16_t port,
                                                              std::string_view code,
                                                              Role role,
                                                              std::size_t max_frame_size) {
    return connect_with_hash(host, port, crypto::relay_code_hash(code), role, max_frame_size);
}

std::unique_ptr<RelayedConnection> RelayedConnection::connect_with_hash(const std::string& host,
                                                                        std::uint16_t port,
                                                                        const std::string& code_hash,
                                                                        Role role,
                                                                        std::size_t max_frame_size) {
    const int socket = open_socket(host, port);
    if (socket == kInvalidSocket) {
        throw Error(ErrorCode::IOError, "unable to reach relay " + host + ":" + std::to_string(port));
    }
    auto connection = std::make_unique<RelayedConnection>(ConstructionTag{}, socket, max_frame_size,
                                                          host + ":" + std::to_string(port));

    connection->send_control(relay::ControlMessage::register_peer(role, code_hash));
    log_event(StructuredLogger::Level::Info, "relay.client.registered",
              {{"relay", connection->endpoint_}, {"role", std::string(role_to_string(role))}});
    connection->await_match();
    log_event(StructuredLogger::Level::Info, "relay.client.matched", {{"relay", connection->endpoint_}});
    return connection;
}

void RelayedConnection::await_match() {
    while (true) {
        auto record = read_record();
        if (record.kind == relay::RecordKind::Binary) {
            throw Error(ErrorCode::RelayError, "relay forwarded data before the match");
        }
        const auto control = relay::parse_control(as_text(record.payload));
        if (!control.has_value()) {
            continue;
        }
        switch (control->type) {
            case relay::ControlType::Matched:
                return;
            case relay::ControlType::Error:
                throw Error(ErrorCode::RelayError, control->message.empty() ? "relay error" : control->message);
            case relay::ControlType::Ping:
                send_control(relay::ControlMessage::pong());
                break;
            default:
                break;
        }
    }
}

void RelayedConnection::send(std::span<const std::uint8_t> frame) {
    if (frame.size() > max_frame_size_) {
        throw Error(ErrorCode::FrameTooLarge,
                    "outbound frame of " + std::to_string(frame.size()) + " bytes exceeds limit");
    }
    send_record(relay::RecordKind::Binary, frame);
}

ByteBuffer RelayedConnection::receive() {
    while (true) {
        auto record = read_record();
        if (record.kind == relay::RecordKind::Binary) {
            return std::move(record.payload);
        }
        const auto control = relay::parse_control(as_text(record.payload));
        if (!control.has_value()) {
            continue;
        }
        if (control->type == relay::ControlType::Ping) {
            send_control(relay::ControlMessage::pong());
        } else if (control->type == relay::ControlType::Error) {
            throw Error(ErrorCode::RelayError, control->message.empty() ? "relay error" : control->message);
        }
    }
}

void RelayedConnection::close() {
    if (closed_.exchange(true)) {
        return;
    }
    shutdown_socket(socket_);
}

std::string RelayedConnection::describe() const {
    return "relay " + endpoint_;
}

void RelayedConnection::send_record(relay::RecordKind kind, std::span<const std::uint8_t> payload) {
    if (closed_.load()) {
        throw Error(ErrorCode::IOError, "connection closed");
    }
    const auto header = relay::encode_record_header(kind, static_cast<std::uint32_t>(payload.size()));
    std::scoped_lock lock(send_mutex_);
    if (!send_all(socket_, header.data(), header.size()) ||
        (!payload.empty() && !send_all(socket_, payload.data(), payload.size()))) {
        throw Error(ErrorCode::IOError, "send to relay " + endpoint_ + " failed");
    }
}

void RelayedConnection::send_control(const relay::ControlMessage& message) {
    const auto text = relay::format_control(message);
    send_record(relay::RecordKind::Control,
                std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(text.data()), text.size()));
}

RelayedConnection::Record RelayedConnection::read_record() {
    if (closed_.load()) {
        throw Error(ErrorCode::IOError, "connection closed");
    }
    std::array<std::uint8_t, relay::kRecordHeaderSize> header{};
    if (!recv_all(socket_, header.data(), header.size())) {
        throw Error(ErrorCode::IOError, "relay connection " + endpoint_ + " closed");
    }
    const auto parsed = relay::parse_record_header(header);
    if (!parsed.has_value()) {
        close();
        throw Error(ErrorCode::RelayError, "relay sent an unknown record kind");
    }
    if (parsed->length > max_frame_size_) {
        close();
        throw Error(ErrorCode::FrameTooLarge,
                    "inbound record of " + std::to_string(parsed->length) + " bytes exceeds limit");
    }
    Record record;
    record.kind = parsed->kind;
    record.payload.resize(parsed->length);
    if (parsed->length > 0 && !recv_all(socket_, record.payload.data(), record.payload.size())) {
        throw Error(ErrorCode::IOError, "relay connection " + endpoint_ + " closed mid-record");
    }
    return record;
}

}  // namespace zapwire::network
