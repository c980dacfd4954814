#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace zapwire {

using ByteBuffer = std::vector<std::uint8_t>;
using Digest = std::array<std::uint8_t, 32>;

enum class Role : std::uint8_t {
    Sender = 0x01,
    Receiver = 0x02,
};

std::string_view role_to_string(Role role) noexcept;
std::optional<Role> role_from_string(std::string_view text);

std::string to_hex(std::span<const std::uint8_t> bytes);

ByteBuffer to_bytes(std::string_view text);

}  // namespace zapwire
