#pragma once

#include <cstdint>
#include <span>

namespace zapwire::crypto {

// Fills the buffer from the OpenSSL CSPRNG. Throws std::runtime_error when it is unavailable.
void random_bytes(std::span<std::uint8_t> buffer);

// Uniform in [0, bound). bound must be non-zero.
std::uint32_t random_below(std::uint32_t bound);

void secure_wipe(std::span<std::uint8_t> buffer) noexcept;

}  // namespace zapwire::crypto
