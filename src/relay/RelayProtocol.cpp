#include "zapwire/relay/RelayProtocol.hpp"

#include <utility>
#include <vector>

namespace zapwire::relay {

namespace {

std::vector<std::string_view> split_arguments(std::string_view text) {
    std::vector<std::string_view> tokens;
    std::size_t start = 0;
    while (start < text.size()) {
        while (start < text.size() && text[start] == ' ') {
            ++start;
        }
        if (start >= text.size()) {
            break;
        }
        auto end = text.find(' ', start);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        tokens.push_back(text.substr(start, end - start));
        start = end;
    }
    return tokens;
}

}  // namespace

std::array<std::uint8_t, kRecordHeaderSize> encode_record_header(RecordKind kind, std::uint32_t length) {
    return {
        static_cast<std::uint8_t>(kind),
        static_cast<std::uint8_t>((length >> 24) & 0xFFu),
        static_cast<std::uint8_t>((length >> 16) & 0xFFu),
        static_cast<std::uint8_t>((length >> 8) & 0xFFu),
        static_cast<std::uint8_t>(length & 0xFFu),
    };
}

ByteBuffer encode_record(RecordKind kind, std::span<const std::uint8_t> payload) {
    const auto header = encode_record_header(kind, static_cast<std::uint32_t>(payload.size()));
    ByteBuffer out;
    out.reserve(header.size() + payload.size());
    out.insert(out.end(), header.begin(), header.end());
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

std::optional<RecordHeader> parse_record_header(std::span<const std::uint8_t> header) {
    if (header.size() < kRecordHeaderSize) {
        return std::nullopt;
    }
    RecordHeader parsed{};
    if (header[0] == static_cast<std::uint8_t>(RecordKind::Control)) {
        parsed.kind = RecordKind::Control;
    } else if (header[0] == static_cast<std::uint8_t>(RecordKind::Binary)) {
        parsed.kind = RecordKind::Binary;
    } else {
        return std::nullopt;
    }
    parsed.length = (static_cast<std::uint32_t>(header[1]) << 24) |
                    (static_cast<std::uint32_t>(header[2]) << 16) |
                    (static_cast<std::uint32_t>(header[3]) << 8) |
                    static_cast<std::uint32_t>(header[4]);
    return parsed;
}

ControlMessage ControlMessage::register_peer(Role role, std::string code_hash) {
    ControlMessage message;
    message.type = ControlType::Register;
    message.role = role;
    message.code_hash = std::move(code_hash);
    return message;
}

ControlMessage ControlMessage::matched() {
    ControlMessage message;
    message.type = ControlType::Matched;
    return message;
}

ControlMessage ControlMessage::error(std::string text) {
    ControlMessage message;
    message.type = ControlType::Error;
    message.message = std::move(text);
    return message;
}

ControlMessage ControlMessage::ping() {
    ControlMessage message;
    message.type = ControlType::Ping;
    return message;
}

ControlMessage ControlMessage::pong() {
    ControlMessage message;
    message.type = ControlType::Pong;
    return message;
}

std::string format_control(const ControlMessage& message) {
    switch (message.type) {
        case ControlType::Register:
            return "REGISTER " + std::string(role_to_string(message.role)) + " " + message.code_hash;
        case ControlType::Matched:
            return "MATCHED";
        case ControlType::Error:
            return message.message.empty() ? "ERROR" : "ERROR " + message.message;
        case ControlType::Ping:
            return "PING";
        case ControlType::Pong:
            return "PONG";
    }
    return "PING";
}

ByteBuffer encode_control(const ControlMessage& message) {
    const auto text = format_control(message);
    return encode_record(RecordKind::Control,
                         std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(text.data()), text.size()));
}

std::optional<ControlMessage> parse_control(std::string_view line) {
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.remove_suffix(1);
    }
    const auto space = line.find(' ');
    const auto command = line.substr(0, space);
    const auto arguments = space == std::string_view::npos ? std::string_view{} : line.substr(space + 1);

    if (command == "REGISTER") {
        const auto tokens = split_arguments(arguments);
        if (tokens.size() != 2) {
            return std::nullopt;
        }
        const auto role = role_from_string(tokens[0]);
        if (!role.has_value()) {
            return std::nullopt;
        }
        return ControlMessage::register_peer(*role, std::string(tokens[1]));
    }
    if (command == "MATCHED" && arguments.empty()) {
        return ControlMessage::matched();
    }
    if (command == "ERROR") {
        return ControlMessage::error(std::string(arguments));
    }
    if (command == "PING" && arguments.empty()) {
        return ControlMessage::ping();
    }
    if (command == "PONG" && arguments.empty()) {
        return ControlMessage::pong();
    }
    return std::nullopt;
}

}  // namespace zapwire::relay
