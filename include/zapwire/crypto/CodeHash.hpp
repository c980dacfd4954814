#pragma once

#include <string>
#include <string_view>

namespace zapwire::crypto {

inline constexpr std::size_t kCodeHashHexLength = 64;

// Identifier under which the relay pairs two peers. PBKDF2-HMAC-SHA256 keeps guessing
// the code from its hash expensive for the relay operator.
std::string relay_code_hash(std::string_view code);

bool is_code_hash(std::string_view text);

}  // namespace zapwire::crypto
