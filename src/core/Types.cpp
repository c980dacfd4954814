#include "zapwire/Types.hpp"

namespace zapwire {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

}  // namespace

std::string_view role_to_string(Role role) noexcept {
    switch (role) {
        case Role::Sender:
            return "sender";
        case Role::Receiver:
            return "receiver";
    }
    return "sender";
}

std::optional<Role> role_from_string(std::string_view text) {
    if (text == "sender") {
        return Role::Sender;
    }
    if (text == "receiver") {
        return Role::Receiver;
    }
    return std::nullopt;
}

std::string to_hex(std::span<const std::uint8_t> bytes) {
    std::string out;
    out.reserve(bytes.size() * 2);
    for (const auto byte : bytes) {
        out.push_back(kHexDigits[byte >> 4]);
        out.push_back(kHexDigits[byte & 0x0F]);
    }
    return out;
}

ByteBuffer to_bytes(std::string_view text) {
    return ByteBuffer(text.begin(), text.end());
}

}  // namespace zapwire
