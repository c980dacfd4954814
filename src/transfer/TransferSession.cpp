#include "zapwire/transfer/TransferSession.hpp"

#include "zapwire/core/StructuredLogger.hpp"
#include "zapwire/crypto/CodeExchange.hpp"
#include "zapwire/crypto/Random.hpp"

#include <algorithm>
#include <exception>
#include <type_traits>
#include <utility>

namespace zapwire::transfer {

namespace {

using core::StructuredLogger;
using protocol::Message;
using protocol::MessageType;

// Room for the message tag, chunk index, length prefix and the AEAD overhead.
constexpr std::size_t kFrameHeadroom = 1024;

void log_event(StructuredLogger::Level level, std::string_view event, StructuredLogger::FieldList fields = {}) {
    StructuredLogger::instance().log(level, event, std::move(fields));
}

std::uint64_t chunk_count(std::uint64_t size, std::uint64_t chunk_size) {
    return size / chunk_size + (size % chunk_size != 0 ? 1 : 0);
}

std::uint64_t chunk_length(const protocol::MetadataPayload& metadata, std::uint64_t index) {
    const auto offset = index * metadata.chunk_size;
    return std::min<std::uint64_t>(metadata.chunk_size, metadata.size - offset);
}

[[noreturn]] void unexpected_message(const Message& message, std::string_view while_doing) {
    if (const auto* error = std::get_if<protocol::ErrorPayload>(&message.payload)) {
        throw Error(ErrorCode::PeerAborted, error->message);
    }
    throw Error(ErrorCode::ProtocolViolation,
                "unexpected " + std::string(protocol::message_type_name(message.type())) + " while " +
                    std::string(while_doing));
}

}  // namespace

TransferSession::TransferSession(network::FramedTransport& transport,
                                 std::string code,
                                 Role role,
                                 SessionOptions options)
    : transport_(transport),
      code_(std::move(code)),
      role_(role),
      options_(std::move(options)) {
    if (options_.chunk_size == 0 || options_.chunk_size > UINT32_MAX) {
        throw std::invalid_argument("chunk size out of range");
    }
}

TransferSession::~TransferSession() {
    crypto::secure_wipe(std::span<std::uint8_t>(reinterpret_cast<std::uint8_t*>(code_.data()), code_.size()));
}

std::string_view TransferSession::state_name() const noexcept {
    return std::visit(
        [](const auto& state) -> std::string_view {
            using StateType = std::decay_t<decltype(state)>;
            if constexpr (std::is_same_v<StateType, Init>) {
                return "Init";
            } else if constexpr (std::is_same_v<StateType, HandshakeSent>) {
                return "HandshakeSent";
            } else if constexpr (std::is_same_v<StateType, HandshakeConfirmed>) {
                return "HandshakeConfirmed";
            } else if constexpr (std::is_same_v<StateType, MetadataSent>) {
                return "MetadataSent";
            } else if constexpr (std::is_same_v<StateType, MetadataReceived>) {
                return "MetadataReceived";
            } else if constexpr (std::is_same_v<StateType, AckExchanged>) {
                return "AckExchanged";
            } else if constexpr (std::is_same_v<StateType, Transferring>) {
                return "Transferring";
            } else if constexpr (std::is_same_v<StateType, Completed>) {
                return "Completed";
            } else {
                return "Failed";
            }
        },
        state_);
}

bool TransferSession::failed() const noexcept {
    return std::holds_alternative<Failed>(state_);
}

template <typename Expected>
Expected& TransferSession::expect_state(std::string_view transition) {
    auto* state = std::get_if<Expected>(&state_);
    if (!state) {
        throw Error(ErrorCode::ProtocolViolation,
                    std::string(transition) + " is not allowed in state " + std::string(state_name()));
    }
    return *state;
}

template <typename Body>
auto TransferSession::guarded(Body&& body) -> decltype(body()) {
    try {
        return body();
    } catch (const Error& error) {
        fail(error.code(), error.what());
        throw;
    } catch (const std::exception& error) {
        fail(ErrorCode::IOError, error.what());
        throw;
    }
}

void TransferSession::handshake() {
    guarded([&] {
        if (std::holds_alternative<Init>(state_)) {
            send_hello();
        }
        if (std::holds_alternative<HandshakeSent>(state_)) {
            confirm_hello();
        }
        if (!channel_) {
            exchange_keys();
        }
    });
}

SendReport TransferSession::send(const FileMetadata& file, ChunkSource& source) {
    if (role_ != Role::Sender) {
        throw Error(ErrorCode::ProtocolViolation, "send called on a receiving session");
    }
    handshake();
    return guarded([&] {
        if (file.is_directory) {
            throw Error(ErrorCode::IOError, "directory transfer requires an archive");
        }
        if (source.size() != file.size) {
            throw Error(ErrorCode::IOError, "source size does not match the announced size");
        }
        announce_metadata(file);
        await_ack();
        return stream_chunks(source);
    });
}

ReceiveReport TransferSession::receive(const SinkProvider& provide_sink) {
    if (role_ != Role::Receiver) {
        throw Error(ErrorCode::ProtocolViolation, "receive called on a sending session");
    }
    handshake();
    return guarded([&] {
        accept_metadata();
        prepare_sink(provide_sink);
        return collect_chunks();
    });
}

void TransferSession::send_hello() {
    expect_state<Init>("hello");
    send_plain(Message{protocol::HelloPayload{options_.protocol_version}});
    state_ = HandshakeSent{};
}

void TransferSession::confirm_hello() {
    expect_state<HandshakeSent>("hello confirmation");
    const auto message = receive_plain();
    const auto* hello = std::get_if<protocol::HelloPayload>(&message.payload);
    if (!hello) {
        unexpected_message(message, "waiting for hello");
    }
    if (hello->version != options_.protocol_version) {
        throw Error(ErrorCode::ProtocolVersionMismatch,
                    "peer speaks version " + std::to_string(hello->version) + ", we speak " +
                        std::to_string(options_.protocol_version));
    }
    state_ = HandshakeConfirmed{};
    log_event(StructuredLogger::Level::Debug, "transfer.handshake.confirmed",
              {{"peer", transport_.describe()}, {"version", std::to_string(hello->version)}});
}

void TransferSession::exchange_keys() {
    expect_state<HandshakeConfirmed>("key exchange");
    crypto::CodeExchange exchange(code_, role_);
    send_plain(Message{protocol::KeyExchangePayload{exchange.outbound_payload()}});

    const auto message = receive_plain();
    const auto* peer = std::get_if<protocol::KeyExchangePayload>(&message.payload);
    if (!peer) {
        unexpected_message(message, "waiting for key exchange");
    }
    const auto secret = exchange.finish(peer->data);
    channel_ = std::make_unique<crypto::AuthenticatedChannel>(secret);
    log_event(StructuredLogger::Level::Info, "transfer.channel.established",
              {{"peer", transport_.describe()}, {"role", std::string(role_to_string(role_))}});
}

void TransferSession::announce_metadata(const FileMetadata& file) {
    expect_state<HandshakeConfirmed>("metadata announcement");
    protocol::MetadataPayload metadata{};
    metadata.filename = file.name;
    metadata.size = file.size;
    metadata.is_directory = file.is_directory;
    metadata.checksum = file.checksum;
    metadata.chunk_size = static_cast<std::uint32_t>(options_.chunk_size);

    send_sealed(Message{metadata});
    const auto total = chunk_count(metadata.size, metadata.chunk_size);
    log_event(StructuredLogger::Level::Info, "transfer.metadata.sent",
              {{"size", std::to_string(metadata.size)}, {"chunks", std::to_string(total)}});
    state_ = MetadataSent{std::move(metadata), total, 0, false};
}

void TransferSession::await_ack() {
    for (;;) {
        auto& state = expect_state<MetadataSent>("acknowledgement");
        const auto message = receive_sealed();
        if (const auto* resume = std::get_if<protocol::ResumePayload>(&message.payload)) {
            if (state.resume_seen) {
                throw Error(ErrorCode::ProtocolViolation, "peer sent a second resume");
            }
            if (resume->from_chunk > state.total_chunks) {
                throw Error(ErrorCode::ProtocolViolation,
                            "resume from chunk " + std::to_string(resume->from_chunk) + " beyond " +
                                std::to_string(state.total_chunks) + " chunks");
            }
            state.resume_seen = true;
            state.from_chunk = resume->from_chunk;
            log_event(StructuredLogger::Level::Info, "transfer.resume.accepted",
                      {{"from_chunk", std::to_string(resume->from_chunk)}});
            continue;
        }
        if (std::holds_alternative<protocol::AckPayload>(message.payload)) {
            state_ = AckExchanged{std::move(state.metadata), state.total_chunks, state.from_chunk};
            return;
        }
        unexpected_message(message, "waiting for acknowledgement");
    }
}

SendReport TransferSession::stream_chunks(ChunkSource& source) {
    auto& ready = expect_state<AckExchanged>("chunk transfer");
    state_ = Transferring{std::move(ready.metadata), ready.total_chunks, ready.from_chunk, ready.from_chunk};
    auto& state = std::get<Transferring>(state_);
    const auto& metadata = state.metadata;

    source.seek(state.from_chunk * metadata.chunk_size);
    started_ = std::chrono::steady_clock::now();
    transferred_at_start_ = state.from_chunk * metadata.chunk_size;

    SendReport report{};
    report.first_chunk = state.from_chunk;
    for (; state.next_index < state.total_chunks; ++state.next_index) {
        const auto expected = chunk_length(metadata, state.next_index);
        auto data = source.next_chunk(static_cast<std::size_t>(expected));
        if (!data || data->size() != expected) {
            throw Error(ErrorCode::IOError, "source ended before chunk " + std::to_string(state.next_index));
        }
        report.bytes_sent += data->size();
        send_sealed(Message{protocol::ChunkPayload{state.next_index, std::move(*data)}});
        ++report.chunks_sent;
        log_event(StructuredLogger::Level::Debug, "transfer.chunk.sent",
                  {{"index", std::to_string(state.next_index)}});
        report_progress(transferred_at_start_ + report.bytes_sent, metadata.size);
    }

    send_sealed(Message{protocol::CompletePayload{}});
    state_ = Completed{};
    log_event(StructuredLogger::Level::Info, "transfer.completed",
              {{"role", "sender"}, {"chunks", std::to_string(report.chunks_sent)}});
    return report;
}

void TransferSession::accept_metadata() {
    expect_state<HandshakeConfirmed>("metadata");
    auto message = receive_sealed();
    auto* metadata = std::get_if<protocol::MetadataPayload>(&message.payload);
    if (!metadata) {
        unexpected_message(message, "waiting for metadata");
    }
    if (metadata->chunk_size == 0 || metadata->chunk_size + kFrameHeadroom > options_.max_frame_size) {
        throw Error(ErrorCode::ProtocolViolation, "unusable chunk size " + std::to_string(metadata->chunk_size));
    }
    if (metadata->is_directory) {
        throw Error(ErrorCode::IOError, "directory transfer requires an archive");
    }
    const auto total = chunk_count(metadata->size, metadata->chunk_size);
    log_event(StructuredLogger::Level::Info, "transfer.metadata.received",
              {{"size", std::to_string(metadata->size)}, {"chunks", std::to_string(total)}});
    state_ = MetadataReceived{std::move(*metadata), total};
}

void TransferSession::prepare_sink(const SinkProvider& provide_sink) {
    auto& state = expect_state<MetadataReceived>("sink preparation");
    sink_ = provide_sink ? provide_sink(state.metadata) : nullptr;
    if (!sink_) {
        throw Error(ErrorCode::IOError, "no destination for " + state.metadata.filename);
    }

    std::uint64_t from_chunk = 0;
    if (options_.resume) {
        const auto held = std::min(sink_->bytes_written(), state.metadata.size);
        from_chunk = held / state.metadata.chunk_size;
    }
    const auto keep = from_chunk * state.metadata.chunk_size;
    if (sink_->bytes_written() != keep) {
        sink_->truncate(keep);
    }
    if (options_.resume) {
        send_sealed(Message{protocol::ResumePayload{from_chunk}});
        log_event(StructuredLogger::Level::Info, "transfer.resume.requested",
                  {{"from_chunk", std::to_string(from_chunk)}});
    }
    send_sealed(Message{protocol::AckPayload{}});
    state_ = AckExchanged{std::move(state.metadata), state.total_chunks, from_chunk};
}

ReceiveReport TransferSession::collect_chunks() {
    auto& ready = expect_state<AckExchanged>("chunk reception");
    state_ = Transferring{std::move(ready.metadata), ready.total_chunks, ready.from_chunk, ready.from_chunk};
    auto& state = std::get<Transferring>(state_);
    const auto& metadata = state.metadata;
    started_ = std::chrono::steady_clock::now();
    transferred_at_start_ = sink_->bytes_written();

    for (;;) {
        auto message = receive_sealed();
        if (auto* chunk = std::get_if<protocol::ChunkPayload>(&message.payload)) {
            if (chunk->index != state.next_index) {
                throw Error(ErrorCode::ProtocolViolation,
                            "expected chunk " + std::to_string(state.next_index) + ", got " +
                                std::to_string(chunk->index));
            }
            if (chunk->index >= state.total_chunks) {
                throw Error(ErrorCode::ProtocolViolation, "chunk beyond the announced size");
            }
            if (chunk->data.size() != chunk_length(metadata, chunk->index)) {
                throw Error(ErrorCode::ProtocolViolation,
                            "chunk " + std::to_string(chunk->index) + " has the wrong length");
            }
            const auto written = sink_->write_chunk(chunk->data);
            ++state.next_index;
            report_progress(written, metadata.size);
            continue;
        }
        if (std::holds_alternative<protocol::CompletePayload>(message.payload)) {
            break;
        }
        unexpected_message(message, "receiving chunks");
    }

    sink_->finalize();
    const auto written = sink_->bytes_written();
    if (written != metadata.size) {
        throw Error(ErrorCode::TransferIncomplete,
                    "received " + std::to_string(written) + " of " + std::to_string(metadata.size) + " bytes");
    }
    if (!metadata.checksum.empty() && to_hex(sink_->content_digest()) != metadata.checksum) {
        throw Error(ErrorCode::TransferIncomplete, "checksum mismatch for " + metadata.filename);
    }

    ReceiveReport report{};
    report.metadata = std::move(state.metadata);
    report.bytes_written = written;
    report.resumed_from_chunk = state.from_chunk;
    state_ = Completed{};
    log_event(StructuredLogger::Level::Info, "transfer.completed",
              {{"role", "receiver"}, {"bytes", std::to_string(written)}});
    return report;
}

void TransferSession::send_plain(const Message& message) {
    const auto encoded = protocol::encode(message);
    transport_.send(encoded);
}

Message TransferSession::receive_plain() {
    const auto frame = transport_.receive();
    auto message = protocol::decode(frame);
    if (!message) {
        throw Error(ErrorCode::ProtocolViolation, "undecodable handshake message");
    }
    return std::move(*message);
}

void TransferSession::send_sealed(const Message& message) {
    auto encoded = protocol::encode(message);
    const auto frame = channel_->seal(encoded);
    crypto::secure_wipe(encoded);
    transport_.send(frame);
}

Message TransferSession::receive_sealed() {
    const auto frame = transport_.receive();
    auto plaintext = channel_->open(frame);
    if (!plaintext) {
        throw Error(ErrorCode::AuthFailure, "frame failed authentication");
    }
    auto message = protocol::decode(*plaintext);
    if (!message) {
        throw Error(ErrorCode::ProtocolViolation, "undecodable message");
    }
    return std::move(*message);
}

void TransferSession::report_progress(std::uint64_t transferred, std::uint64_t total) {
    if (!options_.progress) {
        return;
    }
    const auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started_).count();
    Progress progress{};
    progress.transferred = transferred;
    progress.total = total;
    if (elapsed > 0.0 && transferred >= transferred_at_start_) {
        progress.bytes_per_second = static_cast<double>(transferred - transferred_at_start_) / elapsed;
    }
    options_.progress(progress);
}

void TransferSession::fail(ErrorCode code, const std::string& reason) {
    if (std::holds_alternative<Failed>(state_)) {
        return;
    }
    // Nothing sealed is sent once the key is in doubt.
    if (channel_ && code != ErrorCode::AuthFailure && code != ErrorCode::PeerAborted) {
        try {
            send_sealed(Message{protocol::ErrorPayload{reason}});
        } catch (const Error& error) {
            log_event(StructuredLogger::Level::Debug, "transfer.abort_notice_failed", {{"reason", error.what()}});
        }
    }
    state_ = Failed{code};
    transport_.close();
    log_event(StructuredLogger::Level::Warning, "transfer.failed",
              {{"role", std::string(role_to_string(role_))},
               {"error", std::string(error_code_name(code))},
               {"reason", reason}});
}

}  // namespace zapwire::transfer
