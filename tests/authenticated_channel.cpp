#include "zapwire/crypto/AuthenticatedChannel.hpp"
#include "zapwire/crypto/CodeExchange.hpp"

#include <array>
#include <cassert>
#include <cstdint>

using namespace zapwire;
using namespace zapwire::crypto;

namespace {

SharedSecret make_secret(std::uint8_t seed) {
    std::array<std::uint8_t, SharedSecret::kSize> bytes{};
    for (auto& byte : bytes) {
        byte = seed++;
    }
    return SharedSecret(bytes);
}

}  // namespace

int main() {
    const AuthenticatedChannel channel(make_secret(0x10));
    const AuthenticatedChannel peer(make_secret(0x10));

    {
        const auto plaintext = to_bytes("chunk 42 of the holiday photos");
        const auto frame = channel.seal(plaintext);
        assert(frame.size() == plaintext.size() + AuthenticatedChannel::kOverhead);
        const auto opened = peer.open(frame);
        assert(opened.has_value());
        assert(*opened == plaintext);

        // Nonces are random, so sealing the same plaintext twice gives different frames.
        assert(channel.seal(plaintext) != frame);
    }

    {
        const auto frame = channel.seal(ByteBuffer{});
        assert(frame.size() == AuthenticatedChannel::kOverhead);
        const auto opened = peer.open(frame);
        assert(opened.has_value());
        assert(opened->empty());
    }

    {
        const auto frame = channel.seal(to_bytes("tamper"));
        for (std::size_t index = 0; index < frame.size(); ++index) {
            for (int bit = 0; bit < 8; ++bit) {
                auto modified = frame;
                modified[index] ^= static_cast<std::uint8_t>(1u << bit);
                assert(!peer.open(modified).has_value());
            }
        }

        for (std::size_t length = 0; length < frame.size(); ++length) {
            const ByteBuffer truncated(frame.begin(), frame.begin() + static_cast<std::ptrdiff_t>(length));
            assert(!peer.open(truncated).has_value());
        }
    }

    {
        const AuthenticatedChannel stranger(make_secret(0x11));
        const auto frame = channel.seal(to_bytes("for the peer only"));
        assert(!stranger.open(frame).has_value());
    }

    return 0;
}
