#pragma once

#include "zapwire/Types.hpp"

#include <span>
#include <string>

namespace zapwire::network {

// Ordered delivery of whole frames between two peers. send and receive block the
// calling thread; close may be called from another thread to unblock them.
class FramedTransport {
public:
    virtual ~FramedTransport() = default;

    // Throws Error(FrameTooLarge) or Error(IOError).
    virtual void send(std::span<const std::uint8_t> frame) = 0;

    // Throws Error(FrameTooLarge), Error(IOError) or, for relayed peers, Error(RelayError).
    virtual ByteBuffer receive() = 0;

    virtual void close() = 0;

    virtual std::string describe() const = 0;
};

}  // namespace zapwire::network
