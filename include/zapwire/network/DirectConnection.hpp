#pragma once

#include "zapwire/Config.hpp"
#include "zapwire/network/FramedTransport.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace zapwire::network {

// One TCP stream; each frame is a 4-byte big-endian length followed by the payload.
class DirectConnection : public FramedTransport {
public:
    // Takes ownership of a connected stream socket.
    explicit DirectConnection(int socket, std::size_t max_frame_size = kMaxFrameSize);
    ~DirectConnection() override;

    DirectConnection(const DirectConnection&) = delete;
    DirectConnection& operator=(const DirectConnection&) = delete;

    static std::unique_ptr<DirectConnection> connect(const std::string& host,
                                                     std::uint16_t port,
                                                     std::size_t max_frame_size = kMaxFrameSize);

    // Accepts exactly one peer on host:port.
    static std::unique_ptr<DirectConnection> listen(const std::string& host,
                                                    std::uint16_t port,
                                                    std::size_t max_frame_size = kMaxFrameSize);

    void send(std::span<const std::uint8_t> frame) override;
    ByteBuffer receive() override;
    void close() override;
    std::string describe() const override;

private:
    int socket_{-1};
    std::size_t max_frame_size_;
    std::string endpoint_;
    std::atomic<bool> closed_{false};
    std::mutex send_mutex_;
};

class DirectListener {
public:
    DirectListener(const std::string& host, std::uint16_t port);
    ~DirectListener();

    DirectListener(const DirectListener&) = delete;
    DirectListener& operator=(const DirectListener&) = delete;

    std::uint16_t port() const noexcept { return port_; }

    std::unique_ptr<DirectConnection> accept(std::size_t max_frame_size = kMaxFrameSize);

    // Unblocks a pending accept.
    void close();

private:
    int socket_{-1};
    std::uint16_t port_{0};
    std::atomic<bool> closed_{false};
};

}  // namespace zapwire::network
