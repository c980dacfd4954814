#include "zapwire/network/DirectConnection.hpp"

#include "zapwire/Error.hpp"
#include "zapwire/core/StructuredLogger.hpp"
#include "zapwire/network/Socket.hpp"

#include <array>
#include <cerrno>

#include <sys/socket.h>

namespace zapwire::network {

namespace {

using core::StructuredLogger;

constexpr std::size_t kLengthFieldSize = sizeof(std::uint32_t);

void log_event(StructuredLogger::Level level, std::string_view event, StructuredLogger::FieldList fields = {}) {
    StructuredLogger::instance().log(level, event, std::move(fields));
}

}  // namespace

DirectConnection::DirectConnection(int socket, std::size_t max_frame_size)
    : socket_(socket),
      max_frame_size_(max_frame_size),
      endpoint_(endpoint_string(socket)) {}

DirectConnection::~DirectConnection() {
    close();
    close_socket(socket_);
}

std::unique_ptr<DirectConnection> DirectConnection::connect(const std::string& host,
                                                            std::uint16_t port,
                                                            std::size_t max_frame_size) {
    const int socket = open_socket(host, port);
    if (socket == kInvalidSocket) {
        throw Error(ErrorCode::IOError, "unable to connect to " + host + ":" + std::to_string(port));
    }
    auto connection = std::make_unique<DirectConnection>(socket, max_frame_size);
    log_event(StructuredLogger::Level::Info, "direct.connected", {{"peer", connection->describe()}});
    return connection;
}

std::unique_ptr<DirectConnection> DirectConnection::listen(const std::string& host,
                                                           std::uint16_t port,
                                                           std::size_t max_frame_size) {
    DirectListener listener(host, port);
    return listener.accept(max_frame_size);
}

void DirectConnection::send(std::span<const std::uint8_t> frame) {
    if (frame.size() > max_frame_size_) {
        throw Error(ErrorCode::FrameTooLarge,
                    "outbound frame of " + std::to_string(frame.size()) + " bytes exceeds limit");
    }
    if (closed_.load()) {
        throw Error(ErrorCode::IOError, "connection closed");
    }

    const auto length = static_cast<std::uint32_t>(frame.size());
    const std::array<std::uint8_t, kLengthFieldSize> header{
        static_cast<std::uint8_t>((length >> 24) & 0xFFu),
        static_cast<std::uint8_t>((length >> 16) & 0xFFu),
        static_cast<std::uint8_t>((length >> 8) & 0xFFu),
        static_cast<std::uint8_t>(length & 0xFFu),
    };

    std::scoped_lock lock(send_mutex_);
    if (!send_all(socket_, header.data(), header.size()) ||
        (!frame.empty() && !send_all(socket_, frame.data(), frame.size()))) {
        throw Error(ErrorCode::IOError, "send to " + endpoint_ + " failed");
    }
}

ByteBuffer DirectConnection::receive() {
    if (closed_.load()) {
        throw Error(ErrorCode::IOError, "connection closed");
    }
    std::array<std::uint8_t, kLengthFieldSize> header{};
    if (!recv_all(socket_, header.data(), header.size())) {
        throw Error(ErrorCode::IOError, "connection to " + endpoint_ + " closed");
    }
    const std::uint32_t length = (static_cast<std::uint32_t>(header[0]) << 24) |
                                 (static_cast<std::uint32_t>(header[1]) << 16) |
                                 (static_cast<std::uint32_t>(header[2]) << 8) |
                                 static_cast<std::uint32_t>(header[3]);
    if (length > max_frame_size_) {
        // Nothing is allocated for an oversized frame and the stream cannot be resynchronised.
        close();
        log_event(StructuredLogger::Level::Warning, "direct.frame_too_large",
                  {{"peer", endpoint_}, {"length", std::to_string(length)}});
        throw Error(ErrorCode::FrameTooLarge,
                    "inbound frame of " + std::to_string(length) + " bytes exceeds limit");
    }

    ByteBuffer frame(length);
    if (length > 0 && !recv_all(socket_, frame.data(), frame.size())) {
        throw Error(ErrorCode::IOError, "connection to " + endpoint_ + " closed mid-frame");
    }
    return frame;
}

void DirectConnection::close() {
    if (closed_.exchange(true)) {
        return;
    }
    // The descriptor itself is released by the destructor so a concurrent receive never sees a reused fd.
    shutdown_socket(socket_);
}

std::string DirectConnection::describe() const {
    return "direct " + endpoint_;
}

DirectListener::DirectListener(const std::string& host, std::uint16_t port) {
    socket_ = open_listener(host, port);
    if (socket_ == kInvalidSocket) {
        throw Error(ErrorCode::IOError, "unable to listen on " + host + ":" + std::to_string(port));
    }
    port_ = local_port(socket_);
    log_event(StructuredLogger::Level::Info, "direct.listening",
              {{"host", host}, {"port", std::to_string(port_)}});
}

DirectListener::~DirectListener() {
    close();
    close_socket(socket_);
}

std::unique_ptr<DirectConnection> DirectListener::accept(std::size_t max_frame_size) {
    while (true) {
        if (closed_.load()) {
            throw Error(ErrorCode::IOError, "listener closed");
        }
        const int client = ::accept(socket_, nullptr, nullptr);
        if (client < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw Error(ErrorCode::IOError, "accept failed");
        }
        auto connection = std::make_unique<DirectConnection>(client, max_frame_size);
        log_event(StructuredLogger::Level::Info, "direct.accepted", {{"peer", connection->describe()}});
        return connection;
    }
}

void DirectListener::close() {
    if (closed_.exchange(true)) {
        return;
    }
    shutdown_socket(socket_);
}

}  // namespace zapwire::network
