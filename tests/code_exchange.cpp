#include "zapwire/Error.hpp"
#include "zapwire/crypto/CodeExchange.hpp"

#include <cassert>
#include <string>

using namespace zapwire;
using namespace zapwire::crypto;

namespace {

bool fails_with_key_exchange_error(CodeExchange& exchange, const ByteBuffer& payload) {
    try {
        (void)exchange.finish(payload);
    } catch (const Error& error) {
        return error.code() == ErrorCode::KeyExchangeFailed;
    }
    return false;
}

}  // namespace

int main() {
    {
        CodeExchange sender("alpha-bravo-charlie", Role::Sender);
        CodeExchange receiver("alpha-bravo-charlie", Role::Receiver);
        assert(sender.outbound_payload().size() == CodeExchange::kPayloadSize);
        assert(sender.outbound_payload()[0] == static_cast<std::uint8_t>(Role::Sender));
        assert(receiver.outbound_payload()[0] == static_cast<std::uint8_t>(Role::Receiver));

        const auto sender_secret = sender.finish(receiver.outbound_payload());
        const auto receiver_secret = receiver.finish(sender.outbound_payload());
        assert(sender_secret == receiver_secret);
        assert(sender_secret.bytes().size() == SharedSecret::kSize);
    }

    // Fresh ephemeral scalars: two runs with the same code agree internally but differ from each other.
    {
        CodeExchange first_sender("delta-echo", Role::Sender);
        CodeExchange first_receiver("delta-echo", Role::Receiver);
        CodeExchange second_sender("delta-echo", Role::Sender);
        CodeExchange second_receiver("delta-echo", Role::Receiver);
        assert(first_sender.outbound_payload() != second_sender.outbound_payload());

        const auto first = first_sender.finish(first_receiver.outbound_payload());
        const auto second = second_sender.finish(second_receiver.outbound_payload());
        assert(!(first == second));
    }

    {
        CodeExchange sender("alpha-bravo-charlie", Role::Sender);
        CodeExchange receiver("alpha-bravo-delta", Role::Receiver);
        const auto sender_secret = sender.finish(receiver.outbound_payload());
        const auto receiver_secret = receiver.finish(sender.outbound_payload());
        assert(!(sender_secret == receiver_secret));
    }

    {
        CodeExchange sender("foxtrot", Role::Sender);
        CodeExchange receiver("foxtrot", Role::Receiver);

        // Wrong length.
        ByteBuffer truncated(receiver.outbound_payload().begin(), receiver.outbound_payload().end() - 1);
        assert(fails_with_key_exchange_error(sender, truncated));
    }

    {
        // Reflection of our own message.
        CodeExchange sender("foxtrot", Role::Sender);
        assert(fails_with_key_exchange_error(sender, sender.outbound_payload()));
    }

    {
        // Unknown role tag.
        CodeExchange sender("foxtrot", Role::Sender);
        CodeExchange receiver("foxtrot", Role::Receiver);
        auto payload = receiver.outbound_payload();
        payload[0] = 0x7F;
        assert(fails_with_key_exchange_error(sender, payload));
    }

    {
        // x coordinate that is not on the curve: 0x02 prefix followed by the field prime's top bytes.
        CodeExchange sender("foxtrot", Role::Sender);
        ByteBuffer payload(CodeExchange::kPayloadSize, 0xFF);
        payload[0] = static_cast<std::uint8_t>(Role::Receiver);
        payload[1] = 0x02;
        assert(fails_with_key_exchange_error(sender, payload));
    }

    {
        // A finished exchange cannot be reused.
        CodeExchange sender("golf", Role::Sender);
        CodeExchange receiver("golf", Role::Receiver);
        (void)sender.finish(receiver.outbound_payload());
        assert(fails_with_key_exchange_error(sender, receiver.outbound_payload()));
    }

    return 0;
}
