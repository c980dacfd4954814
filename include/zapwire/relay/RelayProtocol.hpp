#pragma once

#include "zapwire/Types.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace zapwire::relay {

// Record: kind(1) || length(4, big-endian) || payload.
enum class RecordKind : std::uint8_t {
    Control = 0x01,
    Binary = 0x02,
};

inline constexpr std::size_t kRecordHeaderSize = 5;

struct RecordHeader {
    RecordKind kind{RecordKind::Control};
    std::uint32_t length{0};
};

ByteBuffer encode_record(RecordKind kind, std::span<const std::uint8_t> payload);
std::array<std::uint8_t, kRecordHeaderSize> encode_record_header(RecordKind kind, std::uint32_t length);
std::optional<RecordHeader> parse_record_header(std::span<const std::uint8_t> header);

enum class ControlType {
    Register,
    Matched,
    Error,
    Ping,
    Pong,
};

// One text command per control record; the first token selects the type.
//   REGISTER <sender|receiver> <code-hash>
//   MATCHED
//   ERROR <message>
//   PING / PONG
struct ControlMessage {
    ControlType type{ControlType::Ping};
    Role role{Role::Sender};
    std::string code_hash;
    std::string message;

    static ControlMessage register_peer(Role role, std::string code_hash);
    static ControlMessage matched();
    static ControlMessage error(std::string message);
    static ControlMessage ping();
    static ControlMessage pong();
};

std::string format_control(const ControlMessage& message);
ByteBuffer encode_control(const ControlMessage& message);

// Empty for unknown commands and malformed REGISTER lines. The code hash format is left to the caller.
std::optional<ControlMessage> parse_control(std::string_view line);

}  // namespace zapwire::relay
