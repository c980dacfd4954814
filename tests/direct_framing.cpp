#include "zapwire/Error.hpp"
#include "zapwire/network/DirectConnection.hpp"
#include "zapwire/network/Socket.hpp"

#include <array>
#include <chrono>
#include <cassert>
#include <memory>
#include <thread>

#include <sys/socket.h>

using namespace zapwire;
using namespace zapwire::network;

namespace {

struct ConnectedPair {
    std::unique_ptr<DirectConnection> left;
    std::unique_ptr<DirectConnection> right;
};

ConnectedPair make_connected_pair(std::size_t max_frame) {
    int fds[2] = {-1, -1};
    const int result = ::socketpair(AF_UNIX, SOCK_STREAM, 0, fds);
    assert(result == 0);
    return {std::make_unique<DirectConnection>(fds[0], max_frame), std::make_unique<DirectConnection>(fds[1], max_frame)};
}

template <typename Fn>
bool throws_code(ErrorCode expected, Fn&& fn) {
    try {
        fn();
    } catch (const Error& error) {
        return error.code() == expected;
    }
    return false;
}

}  // namespace

int main() {
    {
        auto pair = make_connected_pair(1024);
        auto& left = pair.left;
        auto& right = pair.right;
        const auto hello = to_bytes("hello");
        left->send(hello);
        left->send(ByteBuffer{});
        left->send(ByteBuffer(1024, 0x42));
        assert(right->receive() == hello);
        assert(right->receive().empty());
        assert(right->receive() == ByteBuffer(1024, 0x42));
    }

    // Outbound frames over the limit are refused before anything is written.
    {
        auto pair = make_connected_pair(16);
        auto& left = pair.left;
        auto& right = pair.right;
        assert(throws_code(ErrorCode::FrameTooLarge, [&] { left->send(ByteBuffer(17, 0x00)); }));
        left->send(ByteBuffer(16, 0x01));
        assert(right->receive().size() == 16);
    }

    // An inbound header above the limit fails without reading the body.
    {
        int fds[2] = {-1, -1};
        const int result = ::socketpair(AF_UNIX, SOCK_STREAM, 0, fds);
        assert(result == 0);
        DirectConnection receiver(fds[1], 1024);
        const std::array<std::uint8_t, 4> header{0x00, 0x00, 0x04, 0x01};
        assert(send_all(fds[0], header.data(), header.size()));
        assert(throws_code(ErrorCode::FrameTooLarge, [&] { (void)receiver.receive(); }));
        // The stream cannot be resynchronised; the connection is closed.
        assert(throws_code(ErrorCode::IOError, [&] { (void)receiver.receive(); }));
        close_socket(fds[0]);
    }

    // EOF in the middle of a frame.
    {
        int fds[2] = {-1, -1};
        const int result = ::socketpair(AF_UNIX, SOCK_STREAM, 0, fds);
        assert(result == 0);
        DirectConnection receiver(fds[1], 1024);
        const std::array<std::uint8_t, 6> partial{0x00, 0x00, 0x00, 0x08, 'a', 'b'};
        assert(send_all(fds[0], partial.data(), partial.size()));
        close_socket(fds[0]);
        assert(throws_code(ErrorCode::IOError, [&] { (void)receiver.receive(); }));
    }

    // close() from another thread unblocks a pending receive.
    {
        auto pair = make_connected_pair(1024);
        auto& right = pair.right;
        bool unblocked = false;
        auto* conn = right.get();
        std::thread reader([&unblocked, conn] {
            unblocked = throws_code(ErrorCode::IOError, [conn] { (void)conn->receive(); });
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        right->close();
        reader.join();
        assert(unblocked);
        assert(throws_code(ErrorCode::IOError, [&] { right->send(to_bytes("late")); }));
    }

    // TCP over loopback through the listener.
    {
        DirectListener listener("127.0.0.1", 0);
        assert(listener.port() != 0);
        std::unique_ptr<DirectConnection> accepted;
        std::thread acceptor([&] { accepted = listener.accept(); });
        auto client = DirectConnection::connect("127.0.0.1", listener.port());
        acceptor.join();
        assert(accepted);
        client->send(to_bytes("over tcp"));
        assert(accepted->receive() == to_bytes("over tcp"));
        accepted->send(to_bytes("and back"));
        assert(client->receive() == to_bytes("and back"));
    }

    assert(throws_code(ErrorCode::IOError, [] { (void)DirectConnection::connect("127.0.0.1", 1); }));

    return 0;
}
