#pragma once

#include "zapwire/Types.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace zapwire::protocol {

enum class MessageType : std::uint8_t {
    Hello = 0x01,
    KeyExchange = 0x02,
    Metadata = 0x03,
    Chunk = 0x04,
    Resume = 0x05,
    Complete = 0x06,
    Error = 0x07,
    Ack = 0x08,
};

std::string_view message_type_name(MessageType type) noexcept;

struct HelloPayload {
    std::uint32_t version{0};
};

struct KeyExchangePayload {
    ByteBuffer data;
};

struct MetadataPayload {
    std::string filename;
    std::uint64_t size{0};
    bool is_directory{false};
    // Lowercase hex SHA-256 of the content, empty when not provided.
    std::string checksum;
    std::uint32_t chunk_size{0};
};

struct ChunkPayload {
    std::uint64_t index{0};
    ByteBuffer data;
};

struct ResumePayload {
    std::uint64_t from_chunk{0};
};

struct CompletePayload {};

struct ErrorPayload {
    std::string message;
};

struct AckPayload {};

using Payload = std::variant<HelloPayload,
                             KeyExchangePayload,
                             MetadataPayload,
                             ChunkPayload,
                             ResumePayload,
                             CompletePayload,
                             ErrorPayload,
                             AckPayload>;

struct Message {
    Payload payload{};

    MessageType type() const noexcept;
};

// tag(1) followed by the payload fields. Integers are big-endian, strings and
// byte strings carry a u32 length prefix, booleans are a single 0/1 byte.
ByteBuffer encode(const Message& message);

// Rejects unknown tags, truncated fields and trailing bytes.
std::optional<Message> decode(std::span<const std::uint8_t> buffer);

}  // namespace zapwire::protocol
