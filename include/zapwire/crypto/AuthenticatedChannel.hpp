#pragma once

#include "zapwire/Types.hpp"
#include "zapwire/crypto/CodeExchange.hpp"

#include <array>
#include <optional>
#include <span>

namespace zapwire::crypto {

// ChaCha20-Poly1305 with a fresh random nonce per frame.
// Frame layout: nonce(12) || ciphertext || tag(16).
class AuthenticatedChannel {
public:
    static constexpr std::size_t kKeySize = 32;
    static constexpr std::size_t kNonceSize = 12;
    static constexpr std::size_t kTagSize = 16;
    static constexpr std::size_t kOverhead = kNonceSize + kTagSize;

    explicit AuthenticatedChannel(const SharedSecret& secret);
    ~AuthenticatedChannel();

    AuthenticatedChannel(const AuthenticatedChannel&) = delete;
    AuthenticatedChannel& operator=(const AuthenticatedChannel&) = delete;

    ByteBuffer seal(std::span<const std::uint8_t> plaintext) const;

    // Empty on a wrong key or any modification of the frame. The two cases are indistinguishable.
    std::optional<ByteBuffer> open(std::span<const std::uint8_t> frame) const;

private:
    std::array<std::uint8_t, kKeySize> key_{};
};

}  // namespace zapwire::crypto
