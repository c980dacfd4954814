#pragma once

#include "zapwire/Config.hpp"
#include "zapwire/network/FramedTransport.hpp"
#include "zapwire/relay/RelayProtocol.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace zapwire::network {

// Frames carried as binary records through a relay that paired us with the peer
// holding the same code. The relay only ever sees the code hash.
class RelayedConnection : public FramedTransport {
    struct ConstructionTag {
        explicit ConstructionTag() = default;
    };

public:
    // Use connect() or connect_with_hash().
    RelayedConnection(ConstructionTag, int socket, std::size_t max_frame_size, std::string endpoint);
    ~RelayedConnection() override;

    RelayedConnection(const RelayedConnection&) = delete;
    RelayedConnection& operator=(const RelayedConnection&) = delete;

    // Registers under the hash of code and blocks until the relay reports MATCHED.
    // Throws Error(RelayError) when the relay refuses or drops the registration.
    static std::unique_ptr<RelayedConnection> connect(const std::string& host,
                                                      std::uint16_t port,
                                                      std::string_view code,
                                                      Role role,
                                                      std::size_t max_frame_size = kMaxFrameSize);

    static std::unique_ptr<RelayedConnection> connect_with_hash(const std::string& host,
                                                                std::uint16_t port,
                                                                const std::string& code_hash,
                                                                Role role,
                                                                std::size_t max_frame_size = kMaxFrameSize);

    void send(std::span<const std::uint8_t> frame) override;
    ByteBuffer receive() override;
    void close() override;
    std::string describe() const override;

private:
    struct Record {
        relay::RecordKind kind{relay::RecordKind::Binary};
        ByteBuffer payload;
    };

    void send_record(relay::RecordKind kind, std::span<const std::uint8_t> payload);
    void send_control(const relay::ControlMessage& message);
    Record read_record();
    void await_match();

    int socket_{-1};
    std::size_t max_frame_size_;
    std::string endpoint_;
    std::atomic<bool> closed_{false};
    std::mutex send_mutex_;
};

}  // namespace zapwire::network
