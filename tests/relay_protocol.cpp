#include "zapwire/crypto/CodeHash.hpp"
#include "zapwire/relay/RelayProtocol.hpp"

#include <cassert>
#include <string>

using namespace zapwire;
using namespace zapwire::relay;

int main() {
    {
        const ByteBuffer payload{0xDE, 0xAD, 0xBE, 0xEF};
        const auto record = encode_record(RecordKind::Binary, payload);
        assert(record.size() == kRecordHeaderSize + payload.size());
        const ByteBuffer expected_header{0x02, 0x00, 0x00, 0x00, 0x04};
        assert(ByteBuffer(record.begin(), record.begin() + kRecordHeaderSize) == expected_header);

        const auto header = parse_record_header(record);
        assert(header.has_value());
        assert(header->kind == RecordKind::Binary);
        assert(header->length == 4);
    }

    assert(!parse_record_header(ByteBuffer{0x01, 0x00, 0x00}).has_value());
    assert(!parse_record_header(ByteBuffer{0x03, 0x00, 0x00, 0x00, 0x00}).has_value());

    {
        const auto hash = crypto::relay_code_hash("alpha-bravo-charlie");
        assert(hash.size() == crypto::kCodeHashHexLength);
        assert(crypto::is_code_hash(hash));
        assert(hash == crypto::relay_code_hash("alpha-bravo-charlie"));
        assert(hash != crypto::relay_code_hash("alpha-bravo-delta"));
        assert(hash.find("alpha") == std::string::npos);

        const auto line = format_control(ControlMessage::register_peer(Role::Receiver, hash));
        assert(line == "REGISTER receiver " + hash);
        const auto parsed = parse_control(line);
        assert(parsed.has_value());
        assert(parsed->type == ControlType::Register);
        assert(parsed->role == Role::Receiver);
        assert(parsed->code_hash == hash);
    }

    assert(!crypto::is_code_hash(std::string(63, 'a')));
    assert(!crypto::is_code_hash(std::string(64, 'g')));
    assert(!crypto::is_code_hash(std::string(64, 'A')));

    assert(!parse_control("REGISTER sender").has_value());
    assert(!parse_control("REGISTER observer " + std::string(64, 'a')).has_value());
    assert(!parse_control("REGISTER sender abc extra").has_value());
    assert(!parse_control("HELLO").has_value());
    assert(!parse_control("").has_value());
    assert(!parse_control("MATCHED now").has_value());

    assert(parse_control("MATCHED")->type == ControlType::Matched);
    assert(parse_control("PING\r\n")->type == ControlType::Ping);
    assert(parse_control("PONG")->type == ControlType::Pong);
    {
        const auto error = parse_control("ERROR duplicate role");
        assert(error.has_value());
        assert(error->type == ControlType::Error);
        assert(error->message == "duplicate role");
        assert(format_control(*error) == "ERROR duplicate role");
    }

    {
        const auto record = encode_control(ControlMessage::pong());
        const auto header = parse_record_header(record);
        assert(header->kind == RecordKind::Control);
        assert(header->length == 4);
    }

    return 0;
}
