#pragma once

#include "zapwire/Types.hpp"

#include <array>
#include <memory>
#include <span>
#include <string_view>

namespace zapwire::crypto {

// 32 bytes agreed by both peers. Wiped on destruction.
class SharedSecret {
public:
    static constexpr std::size_t kSize = 32;

    SharedSecret() = default;
    explicit SharedSecret(const std::array<std::uint8_t, kSize>& bytes);
    SharedSecret(const SharedSecret&) = default;
    SharedSecret& operator=(const SharedSecret&) = default;
    ~SharedSecret();

    std::span<const std::uint8_t> bytes() const noexcept { return bytes_; }

    bool operator==(const SharedSecret& other) const noexcept;

private:
    std::array<std::uint8_t, kSize> bytes_{};
};

// SPAKE2 over NIST P-256. Both peers derive the same secret only when they hold the same code;
// a wrong code yields unrelated secrets and is detected later by the authenticated channel.
class CodeExchange {
public:
    // role tag followed by a SEC1 compressed point
    static constexpr std::size_t kPayloadSize = 1 + 33;

    CodeExchange(std::string_view code, Role role);
    ~CodeExchange();

    CodeExchange(const CodeExchange&) = delete;
    CodeExchange& operator=(const CodeExchange&) = delete;

    Role role() const noexcept { return role_; }
    const ByteBuffer& outbound_payload() const noexcept { return outbound_; }

    // Throws Error(KeyExchangeFailed) for a malformed, reflected or repeated exchange.
    SharedSecret finish(std::span<const std::uint8_t> peer_payload);

private:
    struct State;

    Role role_;
    std::unique_ptr<State> state_;
    ByteBuffer outbound_;
    bool finished_{false};
};

}  // namespace zapwire::crypto
