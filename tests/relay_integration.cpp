#include "zapwire/Error.hpp"
#include "zapwire/core/StructuredLogger.hpp"
#include "zapwire/crypto/Sha256.hpp"
#include "zapwire/network/RelayedConnection.hpp"
#include "zapwire/network/Socket.hpp"
#include "zapwire/relay/EventLoop.hpp"
#include "zapwire/relay/PeerTable.hpp"
#include "zapwire/relay/RelayProtocol.hpp"
#include "zapwire/relay/RelayServer.hpp"
#include "zapwire/transfer/ChunkIO.hpp"
#include "zapwire/transfer/TransferSession.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>

#include <sys/socket.h>
#include <sys/time.h>

using namespace std::chrono_literals;
using namespace zapwire;

namespace {

struct RawRecord {
    relay::RecordKind kind{relay::RecordKind::Control};
    ByteBuffer payload;

    std::string text() const { return std::string(payload.begin(), payload.end()); }
};

void expect(bool condition, const std::string& what) {
    if (!condition) {
        throw std::runtime_error(what);
    }
}

std::string hash_of(char fill) {
    return std::string(64, fill);
}

class RawClient {
public:
    explicit RawClient(std::uint16_t port)
        : fd_(network::open_socket("127.0.0.1", port)) {
        expect(fd_ != network::kInvalidSocket, "raw client could not connect");
        timeval timeout{};
        timeout.tv_sec = 5;
        ::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));
    }

    ~RawClient() { network::close_socket(fd_); }

    RawClient(const RawClient&) = delete;
    RawClient& operator=(const RawClient&) = delete;

    void send_control(const relay::ControlMessage& message) {
        const auto record = relay::encode_control(message);
        expect(network::send_all(fd_, record.data(), record.size()), "control send failed");
    }

    void send_line(const std::string& line) {
        const auto record = relay::encode_record(relay::RecordKind::Control, to_bytes(line));
        expect(network::send_all(fd_, record.data(), record.size()), "line send failed");
    }

    void send_binary(const ByteBuffer& payload) {
        const auto record = relay::encode_record(relay::RecordKind::Binary, payload);
        expect(network::send_all(fd_, record.data(), record.size()), "binary send failed");
    }

    // Empty on EOF.
    std::optional<RawRecord> read_record() {
        std::array<std::uint8_t, relay::kRecordHeaderSize> header{};
        if (!network::recv_all(fd_, header.data(), header.size())) {
            return std::nullopt;
        }
        const auto parsed = relay::parse_record_header(header);
        expect(parsed.has_value(), "relay sent a malformed record");
        RawRecord record;
        record.kind = parsed->kind;
        record.payload.resize(parsed->length);
        if (parsed->length > 0) {
            expect(network::recv_all(fd_, record.payload.data(), record.payload.size()), "truncated record");
        }
        return record;
    }

    std::string read_control() {
        const auto record = read_record();
        expect(record.has_value(), "connection closed while waiting for a control record");
        expect(record->kind == relay::RecordKind::Control, "expected a control record");
        return record->text();
    }

    bool closed_by_peer() {
        return !read_record().has_value();
    }

    void close() {
        network::close_socket(fd_);
        fd_ = network::kInvalidSocket;
    }

private:
    int fd_{network::kInvalidSocket};
};

void wait_until(const std::function<bool()>& predicate, const std::string& what) {
    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (!predicate()) {
        if (std::chrono::steady_clock::now() > deadline) {
            throw std::runtime_error("timed out waiting for " + what);
        }
        std::this_thread::sleep_for(10ms);
    }
}

// Blocks until the sender has made no progress for half a second or has sent everything.
void wait_for_sender_stall(const std::atomic<std::uint64_t>& sent, std::uint64_t total) {
    const auto deadline = std::chrono::steady_clock::now() + 10s;
    auto last = sent.load();
    auto last_change = std::chrono::steady_clock::now();
    while (std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(50ms);
        const auto current = sent.load();
        const auto now = std::chrono::steady_clock::now();
        if (current >= total) {
            return;
        }
        if (current != last) {
            last = current;
            last_change = now;
        } else if (now - last_change > 500ms) {
            return;
        }
    }
}

ByteBuffer make_content(std::size_t size) {
    ByteBuffer content(size);
    for (std::size_t index = 0; index < size; ++index) {
        content[index] = static_cast<std::uint8_t>((index * 131 + 17) & 0xFF);
    }
    return content;
}

// A relay with its own loop thread, stopped on scope exit.
class ScopedRelay {
public:
    explicit ScopedRelay(relay::RelayServerConfig config)
        : server_(loop_, peers_, std::move(config)) {
        expect(server_.start(), "relay server failed to start");
        thread_ = std::thread([this] { loop_.run(); });
    }

    ~ScopedRelay() {
        loop_.stop();
        thread_.join();
        server_.stop();
    }

    ScopedRelay(const ScopedRelay&) = delete;
    ScopedRelay& operator=(const ScopedRelay&) = delete;

    std::uint16_t port() const noexcept { return server_.port(); }

private:
    relay::EventLoop loop_;
    relay::PeerTable peers_;
    relay::RelayServer server_;
    std::thread thread_;
};

}  // namespace

int main() {
    std::ostringstream log_sink;
    core::StructuredLogger::instance().set_output(&log_sink);
    core::StructuredLogger::instance().set_min_level(core::StructuredLogger::Level::Debug);

    relay::EventLoop loop;
    relay::PeerTable peers;
    relay::RelayServerConfig config;
    config.listen_host = "127.0.0.1";
    config.listen_port = 0;
    config.max_frame_size = 1024 * 1024;
    relay::RelayServer server(loop, peers, config);
    if (!server.start()) {
        std::cerr << "relay server failed to start" << std::endl;
        return 1;
    }
    const auto port = server.port();
    std::thread loop_thread([&] { loop.run(); });

    int status = 0;
    try {
        // Sender and receiver pair up and exchange frames both ways.
        {
            std::unique_ptr<network::RelayedConnection> sender;
            std::thread sender_thread([&] {
                sender = network::RelayedConnection::connect("127.0.0.1", port, "alpha-bravo-charlie", Role::Sender);
            });
            wait_until([&] { return peers.size() == 1; }, "sender registration");
            auto receiver =
                network::RelayedConnection::connect("127.0.0.1", port, "alpha-bravo-charlie", Role::Receiver);
            sender_thread.join();
            expect(sender != nullptr, "sender was not matched");
            expect(peers.size() == 0, "matched entry still waiting");

            const auto first = to_bytes("first frame");
            const ByteBuffer second(64 * 1024, 0x5C);
            sender->send(first);
            sender->send(second);
            sender->send(ByteBuffer{});
            expect(receiver->receive() == first, "first frame mismatch");
            expect(receiver->receive() == second, "second frame mismatch");
            expect(receiver->receive().empty(), "empty frame mismatch");

            receiver->send(to_bytes("ack"));
            expect(sender->receive() == to_bytes("ack"), "reverse frame mismatch");

            // Dropping one side closes the other without a message.
            sender.reset();
            bool io_error = false;
            try {
                (void)receiver->receive();
            } catch (const Error& error) {
                io_error = error.code() == ErrorCode::IOError;
            }
            expect(io_error, "receiver was not disconnected after the sender left");
        }

        // A second registration with the same role is refused; the original keeps waiting.
        {
            RawClient original(port);
            original.send_control(relay::ControlMessage::register_peer(Role::Sender, hash_of('d')));
            wait_until([&] { return peers.waiting(hash_of('d')).has_value(); }, "original registration");

            RawClient duplicate(port);
            duplicate.send_control(relay::ControlMessage::register_peer(Role::Sender, hash_of('d')));
            expect(duplicate.read_control() == "ERROR duplicate role", "duplicate role not reported");
            expect(duplicate.closed_by_peer(), "duplicate session left open");

            RawClient receiver(port);
            receiver.send_control(relay::ControlMessage::register_peer(Role::Receiver, hash_of('d')));
            expect(receiver.read_control() == "MATCHED", "receiver not matched");
            expect(original.read_control() == "MATCHED", "original not matched");

            // Once matched, stray control records are ignored and PING still answers.
            receiver.send_control(relay::ControlMessage::pong());
            receiver.send_control(relay::ControlMessage::matched());
            receiver.send_control(relay::ControlMessage::register_peer(Role::Receiver, hash_of('d')));
            receiver.send_control(relay::ControlMessage::ping());
            expect(receiver.read_control() == "PONG", "ping while matched");

            // Frames queued before a disconnect are still delivered, then the partner is closed.
            original.send_binary(to_bytes("last words"));
            original.close();
            const auto forwarded = receiver.read_record();
            expect(forwarded.has_value() && forwarded->kind == relay::RecordKind::Binary, "frame not forwarded");
            expect(forwarded->text() == "last words", "forwarded frame altered");
            expect(receiver.closed_by_peer(), "partner left open");
        }

        {
            RawClient client(port);
            client.send_control(relay::ControlMessage::ping());
            expect(client.read_control() == "PONG", "ping before registration");
            client.send_control(relay::ControlMessage::register_peer(Role::Receiver, hash_of('e')));
            client.send_control(relay::ControlMessage::ping());
            expect(client.read_control() == "PONG", "ping while waiting");
            client.send_control(relay::ControlMessage::register_peer(Role::Receiver, hash_of('e')));
            expect(client.read_control() == "ERROR already registered", "second register accepted");

            // Leaving before the match withdraws the registration.
            client.close();
            wait_until([&] { return !peers.waiting(hash_of('e')).has_value(); }, "registration removal");
        }

        {
            RawClient client(port);
            client.send_binary(to_bytes("too early"));
            expect(client.read_control() == "ERROR not matched", "binary before match accepted");
            expect(client.closed_by_peer(), "unmatched sender left open");
        }

        {
            RawClient client(port);
            client.send_line("REGISTER sender not-a-hash");
            expect(client.read_control() == "ERROR malformed registration", "bad hash accepted");
            expect(client.closed_by_peer(), "malformed session left open");
        }

        {
            RawClient client(port);
            client.send_line("REGISTER courier " + hash_of('f'));
            expect(client.read_control() == "ERROR malformed registration", "bad role accepted");
            expect(client.closed_by_peer(), "malformed session left open");
        }

        // The relay reports refusals to the library client as RelayError.
        {
            RawClient waiting(port);
            waiting.send_control(relay::ControlMessage::register_peer(Role::Receiver, hash_of('c')));
            wait_until([&] { return peers.waiting(hash_of('c')).has_value(); }, "waiting receiver");
            bool relay_error = false;
            try {
                (void)network::RelayedConnection::connect_with_hash("127.0.0.1", port, hash_of('c'), Role::Receiver);
            } catch (const Error& error) {
                relay_error = error.code() == ErrorCode::RelayError;
            }
            expect(relay_error, "duplicate role did not surface as RelayError");
        }

        // A connection that never registers is told why and dropped.
        {
            relay::RelayServerConfig quick = config;
            quick.registration_timeout = 1s;
            ScopedRelay impatient(quick);
            RawClient idle(impatient.port());
            expect(idle.read_control() == "ERROR registration timeout", "registration timeout not reported");
            expect(idle.closed_by_peer(), "idle session left open");
        }

        // A whole transfer through the relay while the receiver stalls long enough
        // for the relay to stop reading from the sender.
        {
            const auto content = make_content(48 * 1024 * 1024);
            transfer::MemoryChunkSource source(content);
            transfer::FileMetadata file{};
            file.name = "relayed.bin";
            file.size = content.size();
            file.checksum = crypto::Sha256::hex_digest(content);

            std::atomic<std::uint64_t> sender_progress{0};
            std::optional<transfer::SendReport> sent;
            std::optional<ErrorCode> sender_error;
            std::thread sender_thread([&] {
                try {
                    auto connection =
                        network::RelayedConnection::connect("127.0.0.1", port, "golf-hotel-kilo", Role::Sender);
                    transfer::SessionOptions options;
                    options.progress = [&](const transfer::Progress& progress) {
                        sender_progress.store(progress.transferred);
                    };
                    transfer::TransferSession session(*connection, "golf-hotel-kilo", Role::Sender, options);
                    sent = session.send(file, source);
                } catch (const Error& error) {
                    sender_error = error.code();
                }
            });

            bool stalled = false;
            transfer::SessionOptions receiver_options;
            receiver_options.progress = [&](const transfer::Progress&) {
                if (!stalled) {
                    stalled = true;
                    wait_for_sender_stall(sender_progress, content.size());
                }
            };

            std::optional<ErrorCode> receiver_error;
            bool identical = false;
            try {
                auto connection =
                    network::RelayedConnection::connect("127.0.0.1", port, "golf-hotel-kilo", Role::Receiver);
                transfer::TransferSession session(*connection, "golf-hotel-kilo", Role::Receiver, receiver_options);
                transfer::MemoryChunkSink* sink = nullptr;
                const auto report = session.receive([&](const protocol::MetadataPayload&) {
                    auto owned = std::make_unique<transfer::MemoryChunkSink>();
                    sink = owned.get();
                    return owned;
                });
                identical = sink != nullptr && report.bytes_written == content.size() && sink->content() == content;
            } catch (const Error& error) {
                receiver_error = error.code();
            }
            sender_thread.join();

            expect(!sender_error && !receiver_error, "relayed transfer failed");
            expect(sent.has_value() && sent->bytes_sent == content.size(), "sender report incomplete");
            expect(stalled, "receiver never reported progress");
            expect(identical, "relayed content differs");
        }
    } catch (const std::exception& ex) {
        std::cerr << "relay integration failure: " << ex.what() << std::endl;
        status = 1;
    }

    loop.stop();
    loop_thread.join();
    server.stop();

    // The stalled receiver must have pushed the relay past its high watermark and back.
    if (status == 0) {
        const auto log = log_sink.str();
        if (log.find("relay.session.paused") == std::string::npos ||
            log.find("relay.session.resumed") == std::string::npos) {
            std::cerr << "relay integration failure: backpressure was not applied" << std::endl;
            status = 1;
        }
    }

    core::StructuredLogger::instance().set_min_level(core::StructuredLogger::Level::Info);
    core::StructuredLogger::instance().set_output(nullptr);
    return status;
}
