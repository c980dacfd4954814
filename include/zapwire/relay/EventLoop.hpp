#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <unordered_map>

namespace zapwire::relay {

// Single-threaded readiness loop (epoll on Linux, kqueue on macOS). Every method
// except stop() must be called from the loop thread or before run().
class EventLoop {
public:
    using EventCallback = std::function<void(int fd, std::uint32_t events)>;
    using TickCallback = std::function<void()>;

    static constexpr std::uint32_t kEventNone = 0;
    static constexpr std::uint32_t kEventReadable = 1u << 0;
    static constexpr std::uint32_t kEventWritable = 1u << 1;
    static constexpr std::uint32_t kEventError = 1u << 2;

    EventLoop();
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    void add(int fd, std::uint32_t events, EventCallback callback);
    void update(int fd, std::uint32_t events);
    void remove(int fd);

    // Invoked roughly every interval while the loop runs.
    void set_tick(std::chrono::milliseconds interval, TickCallback callback);

    // Returns once stop() has been called, including a call made before run().
    void run();
    // Safe from any thread and from signal handlers.
    void stop();

private:
    // Each registration gets a fresh token so readiness reported for a removed
    // descriptor is not delivered to a later watcher that reuses its number.
    struct Watcher {
        std::uint64_t token{0};
        std::uint32_t events{0};
        EventCallback callback;
    };

    void apply_interest(int fd, std::uint64_t token, std::uint32_t previous, std::uint32_t events, bool adding);
    void dispatch(std::uint64_t token, std::uint32_t mask);
    void maybe_tick();
    int wait_timeout_ms() const;
    void wake();

#ifdef __linux__
    int backend_fd_{-1};
    int wake_fd_{-1};
#elif defined(__APPLE__)
    int backend_fd_{-1};
    int wake_pipe_[2]{-1, -1};
#else
#error "EventLoop supports Linux and macOS only."
#endif

    std::unordered_map<int, Watcher> watchers_;
    std::unordered_map<std::uint64_t, int> fd_by_token_;
    std::uint64_t next_token_{1};
    std::chrono::milliseconds tick_interval_{0};
    TickCallback tick_;
    std::chrono::steady_clock::time_point next_tick_{};
    std::atomic<bool> stop_requested_{false};
};

}  // namespace zapwire::relay
