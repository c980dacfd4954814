#include "zapwire/protocol/Message.hpp"

#include <type_traits>
#include <utility>

namespace zapwire::protocol {

namespace {

void write_u32(ByteBuffer& out, std::uint32_t value) {
    out.push_back(static_cast<std::uint8_t>((value >> 24) & 0xFFu));
    out.push_back(static_cast<std::uint8_t>((value >> 16) & 0xFFu));
    out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFFu));
    out.push_back(static_cast<std::uint8_t>(value & 0xFFu));
}

void write_u64(ByteBuffer& out, std::uint64_t value) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        out.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFFu));
    }
}

void write_bytes(ByteBuffer& out, std::span<const std::uint8_t> bytes) {
    write_u32(out, static_cast<std::uint32_t>(bytes.size()));
    out.insert(out.end(), bytes.begin(), bytes.end());
}

void write_string(ByteBuffer& out, const std::string& text) {
    write_u32(out, static_cast<std::uint32_t>(text.size()));
    out.insert(out.end(), text.begin(), text.end());
}

class Reader {
public:
    explicit Reader(std::span<const std::uint8_t> data)
        : data_(data) {}

    bool read_u8(std::uint8_t& value) {
        if (remaining() < 1) {
            return false;
        }
        value = data_[cursor_++];
        return true;
    }

    bool read_bool(bool& value) {
        std::uint8_t raw = 0;
        if (!read_u8(raw) || raw > 1) {
            return false;
        }
        value = raw == 1;
        return true;
    }

    bool read_u32(std::uint32_t& value) {
        if (remaining() < 4) {
            return false;
        }
        value = (static_cast<std::uint32_t>(data_[cursor_]) << 24) |
                (static_cast<std::uint32_t>(data_[cursor_ + 1]) << 16) |
                (static_cast<std::uint32_t>(data_[cursor_ + 2]) << 8) |
                static_cast<std::uint32_t>(data_[cursor_ + 3]);
        cursor_ += 4;
        return true;
    }

    bool read_u64(std::uint64_t& value) {
        if (remaining() < 8) {
            return false;
        }
        value = 0;
        for (int index = 0; index < 8; ++index) {
            value = (value << 8) | static_cast<std::uint64_t>(data_[cursor_++]);
        }
        return true;
    }

    bool read_bytes(ByteBuffer& value) {
        std::uint32_t length = 0;
        if (!read_u32(length) || remaining() < length) {
            return false;
        }
        value.assign(data_.begin() + static_cast<std::ptrdiff_t>(cursor_),
                     data_.begin() + static_cast<std::ptrdiff_t>(cursor_ + length));
        cursor_ += length;
        return true;
    }

    bool read_string(std::string& value) {
        std::uint32_t length = 0;
        if (!read_u32(length) || remaining() < length) {
            return false;
        }
        value.assign(reinterpret_cast<const char*>(data_.data() + cursor_), length);
        cursor_ += length;
        return true;
    }

    std::size_t remaining() const noexcept { return data_.size() - cursor_; }

private:
    std::span<const std::uint8_t> data_;
    std::size_t cursor_{0};
};

std::optional<Payload> decode_payload(MessageType type, Reader& reader) {
    switch (type) {
        case MessageType::Hello: {
            HelloPayload payload{};
            if (!reader.read_u32(payload.version)) {
                return std::nullopt;
            }
            return Payload{payload};
        }
        case MessageType::KeyExchange: {
            KeyExchangePayload payload{};
            if (!reader.read_bytes(payload.data)) {
                return std::nullopt;
            }
            return Payload{std::move(payload)};
        }
        case MessageType::Metadata: {
            MetadataPayload payload{};
            if (!reader.read_string(payload.filename) ||
                !reader.read_u64(payload.size) ||
                !reader.read_bool(payload.is_directory) ||
                !reader.read_string(payload.checksum) ||
                !reader.read_u32(payload.chunk_size)) {
                return std::nullopt;
            }
            return Payload{std::move(payload)};
        }
        case MessageType::Chunk: {
            ChunkPayload payload{};
            if (!reader.read_u64(payload.index) || !reader.read_bytes(payload.data)) {
                return std::nullopt;
            }
            return Payload{std::move(payload)};
        }
        case MessageType::Resume: {
            ResumePayload payload{};
            if (!reader.read_u64(payload.from_chunk)) {
                return std::nullopt;
            }
            return Payload{payload};
        }
        case MessageType::Complete:
            return Payload{CompletePayload{}};
        case MessageType::Error: {
            ErrorPayload payload{};
            if (!reader.read_string(payload.message)) {
                return std::nullopt;
            }
            return Payload{std::move(payload)};
        }
        case MessageType::Ack:
            return Payload{AckPayload{}};
    }
    return std::nullopt;
}

}  // namespace

std::string_view message_type_name(MessageType type) noexcept {
    switch (type) {
        case MessageType::Hello:
            return "Hello";
        case MessageType::KeyExchange:
            return "KeyExchange";
        case MessageType::Metadata:
            return "Metadata";
        case MessageType::Chunk:
            return "Chunk";
        case MessageType::Resume:
            return "Resume";
        case MessageType::Complete:
            return "Complete";
        case MessageType::Error:
            return "Error";
        case MessageType::Ack:
            return "Ack";
    }
    return "Unknown";
}

MessageType Message::type() const noexcept {
    return std::visit(
        [](const auto& value) {
            using PayloadType = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<PayloadType, HelloPayload>) {
                return MessageType::Hello;
            } else if constexpr (std::is_same_v<PayloadType, KeyExchangePayload>) {
                return MessageType::KeyExchange;
            } else if constexpr (std::is_same_v<PayloadType, MetadataPayload>) {
                return MessageType::Metadata;
            } else if constexpr (std::is_same_v<PayloadType, ChunkPayload>) {
                return MessageType::Chunk;
            } else if constexpr (std::is_same_v<PayloadType, ResumePayload>) {
                return MessageType::Resume;
            } else if constexpr (std::is_same_v<PayloadType, CompletePayload>) {
                return MessageType::Complete;
            } else if constexpr (std::is_same_v<PayloadType, ErrorPayload>) {
                return MessageType::Error;
            } else {
                return MessageType::Ack;
            }
        },
        payload);
}

ByteBuffer encode(const Message& message) {
    ByteBuffer out{};
    out.reserve(64);
    out.push_back(static_cast<std::uint8_t>(message.type()));

    std::visit(
        [&](const auto& payload) {
            using PayloadType = std::decay_t<decltype(payload)>;

            if constexpr (std::is_same_v<PayloadType, HelloPayload>) {
                write_u32(out, payload.version);
            } else if constexpr (std::is_same_v<PayloadType, KeyExchangePayload>) {
                write_bytes(out, payload.data);
            } else if constexpr (std::is_same_v<PayloadType, MetadataPayload>) {
                write_string(out, payload.filename);
                write_u64(out, payload.size);
                out.push_back(static_cast<std::uint8_t>(payload.is_directory ? 1 : 0));
                write_string(out, payload.checksum);
                write_u32(out, payload.chunk_size);
            } else if constexpr (std::is_same_v<PayloadType, ChunkPayload>) {
                out.reserve(1 + 8 + 4 + payload.data.size());
                write_u64(out, payload.index);
                write_bytes(out, payload.data);
            } else if constexpr (std::is_same_v<PayloadType, ResumePayload>) {
                write_u64(out, payload.from_chunk);
            } else if constexpr (std::is_same_v<PayloadType, ErrorPayload>) {
                write_string(out, payload.message);
            }
        },
        message.payload);

    return out;
}

std::optional<Message> decode(std::span<const std::uint8_t> buffer) {
    if (buffer.empty()) {
        return std::nullopt;
    }
    const auto tag = buffer[0];
    if (tag < static_cast<std::uint8_t>(MessageType::Hello) || tag > static_cast<std::uint8_t>(MessageType::Ack)) {
        return std::nullopt;
    }

    Reader reader(buffer.subspan(1));
    auto payload = decode_payload(static_cast<MessageType>(tag), reader);
    if (!payload.has_value() || reader.remaining() != 0) {
        return std::nullopt;
    }

    Message message{};
    message.payload = std::move(*payload);
    return message;
}

}  // namespace zapwire::protocol
