#include "zapwire/relay/EventLoop.hpp"

#include <array>
#include <cerrno>
#include <cstdint>
#include <system_error>

#ifdef __linux__
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <unistd.h>
#elif defined(__APPLE__)
#include <fcntl.h>
#include <sys/event.h>
#include <sys/time.h>
#include <unistd.h>
#endif

namespace zapwire::relay {

namespace {

constexpr int kMaxEvents = 64;
constexpr std::uint64_t kWakeToken = 0;

[[noreturn]] void throw_errno(const char* what) {
    throw std::system_error(errno, std::generic_category(), what);
}

#ifdef __linux__
std::uint32_t to_epoll(std::uint32_t events) {
    std::uint32_t mask = 0;
    if (events & EventLoop::kEventReadable) {
        mask |= EPOLLIN;
    }
    if (events & EventLoop::kEventWritable) {
        mask |= EPOLLOUT;
    }
    return mask;
}

std::uint32_t from_epoll(std::uint32_t backend_mask) {
    std::uint32_t mask = EventLoop::kEventNone;
    if (backend_mask & EPOLLIN) {
        mask |= EventLoop::kEventReadable;
    }
    if (backend_mask & EPOLLOUT) {
        mask |= EventLoop::kEventWritable;
    }
    if (backend_mask & (EPOLLERR | EPOLLHUP)) {
        mask |= EventLoop::kEventError;
    }
    return mask;
}
#endif

#ifdef __APPLE__
void make_pipe(int fds[2]) {
    if (::pipe(fds) != 0) {
        throw_errno("pipe failed");
    }
    for (int i = 0; i < 2; ++i) {
        const int flags = ::fcntl(fds[i], F_GETFL, 0);
        if (flags == -1 || ::fcntl(fds[i], F_SETFL, flags | O_NONBLOCK) == -1) {
            throw_errno("fcntl failed");
        }
        const int cloexec = ::fcntl(fds[i], F_GETFD, 0);
        if (cloexec != -1) {
            ::fcntl(fds[i], F_SETFD, cloexec | FD_CLOEXEC);
        }
    }
}
#endif

}  // namespace

EventLoop::EventLoop() {
#ifdef __linux__
    backend_fd_ = ::epoll_create1(EPOLL_CLOEXEC);
    if (backend_fd_ < 0) {
        throw_errno("epoll_create1 failed");
    }
    wake_fd_ = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wake_fd_ < 0) {
        ::close(backend_fd_);
        throw_errno("eventfd failed");
    }
    epoll_event event{};
    event.events = EPOLLIN;
    event.data.u64 = kWakeToken;
    if (::epoll_ctl(backend_fd_, EPOLL_CTL_ADD, wake_fd_, &event) != 0) {
        ::close(wake_fd_);
        ::close(backend_fd_);
        throw_errno("epoll_ctl ADD wake_fd failed");
    }
#elif defined(__APPLE__)
    backend_fd_ = ::kqueue();
    if (backend_fd_ < 0) {
        throw_errno("kqueue failed");
    }
    make_pipe(wake_pipe_);
    struct kevent kev{};
    EV_SET(&kev, wake_pipe_[0], EVFILT_READ, EV_ADD, 0, 0, nullptr);
    if (::kevent(backend_fd_, &kev, 1, nullptr, 0, nullptr) != 0) {
        throw_errno("kevent add wake pipe failed");
    }
#endif
}

EventLoop::~EventLoop() {
#ifdef __linux__
    if (wake_fd_ >= 0) {
        ::close(wake_fd_);
    }
#elif defined(__APPLE__)
    for (int fd : wake_pipe_) {
        if (fd >= 0) {
            ::close(fd);
        }
    }
#endif
    if (backend_fd_ >= 0) {
        ::close(backend_fd_);
    }
}

void EventLoop::add(int fd, std::uint32_t events, EventCallback callback) {
    const auto token = next_token_++;
    apply_interest(fd, token, kEventNone, events, true);
    watchers_[fd] = Watcher{token, events, std::move(callback)};
    fd_by_token_[token] = fd;
}

void EventLoop::update(int fd, std::uint32_t events) {
    auto it = watchers_.find(fd);
    if (it == watchers_.end() || it->second.events == events) {
        return;
    }
    apply_interest(fd, it->second.token, it->second.events, events, false);
    it->second.events = events;
}

void EventLoop::remove(int fd) {
    auto it = watchers_.find(fd);
    if (it == watchers_.end()) {
        return;
    }
#ifdef __linux__
    ::epoll_ctl(backend_fd_, EPOLL_CTL_DEL, fd, nullptr);
#elif defined(__APPLE__)
    std::array<struct kevent, 2> changes{};
    int count = 0;
    if (it->second.events & kEventReadable) {
        EV_SET(&changes[count++], fd, EVFILT_READ, EV_DELETE, 0, 0, nullptr);
    }
    if (it->second.events & kEventWritable) {
        EV_SET(&changes[count++], fd, EVFILT_WRITE, EV_DELETE, 0, 0, nullptr);
    }
    if (count > 0) {
        ::kevent(backend_fd_, changes.data(), count, nullptr, 0, nullptr);
    }
#endif
    fd_by_token_.erase(it->second.token);
    watchers_.erase(it);
}

void EventLoop::set_tick(std::chrono::milliseconds interval, TickCallback callback) {
    tick_interval_ = interval;
    tick_ = std::move(callback);
    next_tick_ = std::chrono::steady_clock::now() + interval;
}

void EventLoop::apply_interest(int fd, std::uint64_t token, std::uint32_t previous, std::uint32_t events,
                               bool adding) {
#ifdef __linux__
    epoll_event event{};
    event.events = to_epoll(events);
    event.data.u64 = token;
    if (::epoll_ctl(backend_fd_, adding ? EPOLL_CTL_ADD : EPOLL_CTL_MOD, fd, &event) != 0) {
        throw_errno(adding ? "epoll_ctl ADD failed" : "epoll_ctl MOD failed");
    }
    (void)previous;
#elif defined(__APPLE__)
    std::array<struct kevent, 2> changes{};
    int count = 0;
    const auto toggle = [&](std::uint32_t flag, short filter) {
        const bool before = (previous & flag) != 0;
        const bool after = (events & flag) != 0;
        if (before != after) {
            EV_SET(&changes[count++], fd, filter, after ? EV_ADD : EV_DELETE, 0, 0,
                   reinterpret_cast<void*>(static_cast<std::uintptr_t>(token)));
        }
    };
    toggle(kEventReadable, EVFILT_READ);
    toggle(kEventWritable, EVFILT_WRITE);
    if (count > 0 && ::kevent(backend_fd_, changes.data(), count, nullptr, 0, nullptr) != 0 && adding) {
        throw_errno("kevent add failed");
    }
#endif
}

void EventLoop::dispatch(std::uint64_t token, std::uint32_t mask) {
    const auto registered = fd_by_token_.find(token);
    if (registered == fd_by_token_.end() || mask == kEventNone) {
        return;
    }
    const int fd = registered->second;
    auto it = watchers_.find(fd);
    if (it == watchers_.end() || it->second.token != token) {
        return;
    }
    // The callback may remove its own watcher.
    auto callback = it->second.callback;
    callback(fd, mask);
}

void EventLoop::maybe_tick() {
    if (!tick_ || tick_interval_.count() <= 0) {
        return;
    }
    const auto now = std::chrono::steady_clock::now();
    if (now < next_tick_) {
        return;
    }
    next_tick_ = now + tick_interval_;
    tick_();
}

int EventLoop::wait_timeout_ms() const {
    if (!tick_ || tick_interval_.count() <= 0) {
        return -1;
    }
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        next_tick_ - std::chrono::steady_clock::now());
    return remaining.count() < 0 ? 0 : static_cast<int>(remaining.count());
}

void EventLoop::run() {
#ifdef __linux__
    std::array<epoll_event, kMaxEvents> events;
    while (!stop_requested_.load()) {
        const int ready = ::epoll_wait(backend_fd_, events.data(), static_cast<int>(events.size()), wait_timeout_ms());
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        for (int i = 0; i < ready && !stop_requested_.load(); ++i) {
            const auto token = events[i].data.u64;
            if (token == kWakeToken) {
                std::uint64_t value = 0;
                const auto consumed = ::read(wake_fd_, &value, sizeof(value));
                (void)consumed;
                continue;
            }
            dispatch(token, from_epoll(events[i].events));
        }
        maybe_tick();
    }
#elif defined(__APPLE__)
    std::array<struct kevent, kMaxEvents> events;
    while (!stop_requested_.load()) {
        const int timeout_ms = wait_timeout_ms();
        timespec timeout{};
        timeout.tv_sec = timeout_ms / 1000;
        timeout.tv_nsec = static_cast<long>(timeout_ms % 1000) * 1000000L;
        const int ready = ::kevent(backend_fd_, nullptr, 0, events.data(), static_cast<int>(events.size()),
                                   timeout_ms < 0 ? nullptr : &timeout);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        std::unordered_map<std::uint64_t, std::uint32_t> aggregated;
        for (int i = 0; i < ready; ++i) {
            const auto& ev = events[i];
            if (static_cast<int>(ev.ident) == wake_pipe_[0]) {
                char buf[32];
                const auto consumed = ::read(wake_pipe_[0], buf, sizeof(buf));
                (void)consumed;
                continue;
            }
            auto& mask = aggregated[static_cast<std::uint64_t>(reinterpret_cast<std::uintptr_t>(ev.udata))];
            if (ev.filter == EVFILT_READ) {
                mask |= kEventReadable;
            } else if (ev.filter == EVFILT_WRITE) {
                mask |= kEventWritable;
            }
            if (ev.flags & EV_ERROR) {
                mask |= kEventError;
            }
        }
        for (const auto& [token, mask] : aggregated) {
            if (stop_requested_.load()) {
                break;
            }
            dispatch(token, mask);
        }
        maybe_tick();
    }
#endif
    stop_requested_.store(false);
}

void EventLoop::stop() {
    stop_requested_.store(true);
    wake();
}

void EventLoop::wake() {
#ifdef __linux__
    if (wake_fd_ >= 0) {
        const std::uint64_t value = 1;
        const auto written = ::write(wake_fd_, &value, sizeof(value));
        (void)written;
    }
#elif defined(__APPLE__)
    if (wake_pipe_[1] >= 0) {
        const char byte = 1;
        const auto written = ::write(wake_pipe_[1], &byte, sizeof(byte));
        (void)written;
    }
#endif
}

}  // namespace zapwire::relay
