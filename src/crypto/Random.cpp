#include "zapwire/crypto/Random.hpp"

#include <openssl/crypto.h>
#include <openssl/rand.h>

#include <array>
#include <limits>
#include <stdexcept>

namespace zapwire::crypto {

void random_bytes(std::span<std::uint8_t> buffer) {
    if (buffer.empty()) {
        return;
    }
    if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
}

std::uint32_t random_below(std::uint32_t bound) {
    if (bound == 0) {
        throw std::invalid_argument("random_below requires a non-zero bound");
    }
    // Rejection sampling keeps the distribution uniform.
    const std::uint32_t limit = std::numeric_limits<std::uint32_t>::max() -
                                (std::numeric_limits<std::uint32_t>::max() % bound);
    while (true) {
        std::array<std::uint8_t, 4> bytes{};
        random_bytes(bytes);
        const std::uint32_t value = (static_cast<std::uint32_t>(bytes[0]) << 24) |
                                    (static_cast<std::uint32_t>(bytes[1]) << 16) |
                                    (static_cast<std::uint32_t>(bytes[2]) << 8) |
                                    static_cast<std::uint32_t>(bytes[3]);
        if (value < limit) {
            return value % bound;
        }
    }
}

void secure_wipe(std::span<std::uint8_t> buffer) noexcept {
    if (!buffer.empty()) {
        OPENSSL_cleanse(buffer.data(), buffer.size());
    }
}

}  // namespace zapwire::crypto
