#include "zapwire/relay/EventLoop.hpp"

#include <array>
#include <cassert>
#include <chrono>
#include <cstdint>

#include <unistd.h>

using namespace zapwire::relay;

namespace {

struct Pipe {
    int read_fd{-1};
    int write_fd{-1};
};

Pipe make_pipe() {
    int fds[2] = {-1, -1};
    const int result = ::pipe(fds);
    assert(result == 0);
    return {fds[0], fds[1]};
}

void drain(int fd) {
    std::array<char, 64> buffer{};
    const auto consumed = ::read(fd, buffer.data(), buffer.size());
    (void)consumed;
}

}  // namespace

int main() {
    // Readiness for a descriptor removed earlier in the same batch must not reach
    // a watcher registered afterwards on the same descriptor number.
    {
        EventLoop loop;
        std::array<Pipe, 2> pipes{make_pipe(), make_pipe()};
        Pipe replacement = make_pipe();
        bool replaced = false;
        bool stale_delivered = false;
        int first_callbacks = 0;

        for (std::size_t index = 0; index < pipes.size(); ++index) {
            const char byte = 'x';
            const auto written = ::write(pipes[index].write_fd, &byte, 1);
            assert(written == 1);

            loop.add(pipes[index].read_fd, EventLoop::kEventReadable, [&, index](int fd, std::uint32_t) {
                ++first_callbacks;
                drain(fd);
                if (replaced) {
                    return;
                }
                replaced = true;
                const int other = pipes[1 - index].read_fd;
                loop.remove(other);
                ::close(other);
                // The replacement pipe stays empty with its writer open, so it never becomes readable.
                const int reused = ::dup2(replacement.read_fd, other);
                assert(reused == other);
                loop.add(other, EventLoop::kEventReadable, [&](int, std::uint32_t) { stale_delivered = true; });
            });
        }

        loop.set_tick(std::chrono::milliseconds(100), [&] { loop.stop(); });
        loop.run();

        assert(replaced);
        assert(first_callbacks == 1);
        assert(!stale_delivered);

        for (const auto& pipe : pipes) {
            ::close(pipe.read_fd);
            ::close(pipe.write_fd);
        }
        ::close(replacement.read_fd);
        ::close(replacement.write_fd);
    }

    // update() changes the interest set; remove() silences a watcher for good.
    {
        EventLoop loop;
        Pipe pipe = make_pipe();
        const char byte = 'y';
        const auto written = ::write(pipe.write_fd, &byte, 1);
        assert(written == 1);

        int readable_calls = 0;
        loop.add(pipe.read_fd, EventLoop::kEventNone, [&](int, std::uint32_t events) {
            assert(events & EventLoop::kEventReadable);
            ++readable_calls;
            loop.remove(pipe.read_fd);
        });

        int ticks = 0;
        loop.set_tick(std::chrono::milliseconds(20), [&] {
            ++ticks;
            if (ticks == 2) {
                assert(readable_calls == 0);
                loop.update(pipe.read_fd, EventLoop::kEventReadable);
            }
            if (ticks == 5) {
                loop.stop();
            }
        });
        loop.run();

        assert(readable_calls == 1);
        ::close(pipe.read_fd);
        ::close(pipe.write_fd);
    }

    // A stop requested before run() returns immediately.
    {
        EventLoop loop;
        loop.stop();
        loop.run();
    }

    return 0;
}
