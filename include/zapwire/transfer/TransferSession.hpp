#pragma once

#include "zapwire/Config.hpp"
#include "zapwire/Error.hpp"
#include "zapwire/Types.hpp"
#include "zapwire/crypto/AuthenticatedChannel.hpp"
#include "zapwire/network/FramedTransport.hpp"
#include "zapwire/protocol/Message.hpp"
#include "zapwire/transfer/ChunkIO.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <variant>

namespace zapwire::transfer {

struct Progress {
    std::uint64_t transferred{0};
    std::uint64_t total{0};
    double bytes_per_second{0.0};
};

using ProgressCallback = std::function<void(const Progress&)>;

// Called once the metadata is known. Returning null aborts the transfer with IOError.
using SinkProvider = std::function<std::unique_ptr<ChunkSink>(const protocol::MetadataPayload&)>;

struct SessionOptions {
    std::uint32_t protocol_version{kProtocolVersion};
    std::size_t chunk_size{kDefaultChunkSize};
    std::size_t max_frame_size{kMaxFrameSize};
    // Receiver only: continue from the content the sink already holds.
    bool resume{false};
    ProgressCallback progress{};
};

struct SendReport {
    std::uint64_t chunks_sent{0};
    std::uint64_t bytes_sent{0};
    std::uint64_t first_chunk{0};
};

struct ReceiveReport {
    protocol::MetadataPayload metadata{};
    std::uint64_t bytes_written{0};
    std::uint64_t resumed_from_chunk{0};
};

// One transfer over one FramedTransport. Hello and KeyExchange travel in the clear;
// every later message is sealed with the key agreed from the shared code.
//
// The session does not own the transport but closes it when it fails.
class TransferSession {
public:
    TransferSession(network::FramedTransport& transport, std::string code, Role role, SessionOptions options = {});
    ~TransferSession();

    TransferSession(const TransferSession&) = delete;
    TransferSession& operator=(const TransferSession&) = delete;

    // Version check followed by the key exchange. send and receive run it when needed.
    void handshake();

    SendReport send(const FileMetadata& file, ChunkSource& source);
    ReceiveReport receive(const SinkProvider& provide_sink);

    Role role() const noexcept { return role_; }
    std::string_view state_name() const noexcept;
    bool failed() const noexcept;

private:
    struct Init {};
    struct HandshakeSent {};
    struct HandshakeConfirmed {};
    struct MetadataSent {
        protocol::MetadataPayload metadata;
        std::uint64_t total_chunks{0};
        std::uint64_t from_chunk{0};
        bool resume_seen{false};
    };
    struct MetadataReceived {
        protocol::MetadataPayload metadata;
        std::uint64_t total_chunks{0};
    };
    struct AckExchanged {
        protocol::MetadataPayload metadata;
        std::uint64_t total_chunks{0};
        std::uint64_t from_chunk{0};
    };
    struct Transferring {
        protocol::MetadataPayload metadata;
        std::uint64_t total_chunks{0};
        std::uint64_t from_chunk{0};
        std::uint64_t next_index{0};
    };
    struct Completed {};
    struct Failed {
        ErrorCode code{ErrorCode::ProtocolViolation};
    };

    using State = std::variant<Init,
                               HandshakeSent,
                               HandshakeConfirmed,
                               MetadataSent,
                               MetadataReceived,
                               AckExchanged,
                               Transferring,
                               Completed,
                               Failed>;

    template <typename Expected>
    Expected& expect_state(std::string_view transition);

    // Handshake
    void send_hello();
    void confirm_hello();
    void exchange_keys();

    // Sender
    void announce_metadata(const FileMetadata& file);
    void await_ack();
    SendReport stream_chunks(ChunkSource& source);

    // Receiver
    void accept_metadata();
    void prepare_sink(const SinkProvider& provide_sink);
    ReceiveReport collect_chunks();

    void send_plain(const protocol::Message& message);
    protocol::Message receive_plain();
    void send_sealed(const protocol::Message& message);
    protocol::Message receive_sealed();

    void report_progress(std::uint64_t transferred, std::uint64_t total);
    void fail(ErrorCode code, const std::string& reason);

    template <typename Body>
    auto guarded(Body&& body) -> decltype(body());

    network::FramedTransport& transport_;
    std::string code_;
    Role role_;
    SessionOptions options_;
    State state_{Init{}};
    std::unique_ptr<crypto::AuthenticatedChannel> channel_;
    std::unique_ptr<ChunkSink> sink_;
    std::chrono::steady_clock::time_point started_{};
    std::uint64_t transferred_at_start_{0};
};

}  // namespace zapwire::transfer
