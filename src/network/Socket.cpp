#include "zapwire/network/Socket.hpp"

#include <cerrno>
#include <cstdio>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>

namespace zapwire::network {

namespace {

#ifdef MSG_NOSIGNAL
constexpr int kSendFlags = MSG_NOSIGNAL;
#else
constexpr int kSendFlags = 0;
#endif

void set_cloexec(int socket) {
    const int opts = ::fcntl(socket, F_GETFD, 0);
    if (opts >= 0) {
        ::fcntl(socket, F_SETFD, opts | FD_CLOEXEC);
    }
}

}  // namespace

bool send_all(int socket, const std::uint8_t* data, std::size_t length) {
    std::size_t total = 0;
    while (total < length) {
        const auto sent = ::send(socket, data + total, length - total, kSendFlags);
        if (sent < 0 && errno == EINTR) {
            continue;
        }
        if (sent <= 0) {
            return false;
        }
        total += static_cast<std::size_t>(sent);
    }
    return true;
}

bool recv_all(int socket, std::uint8_t* buffer, std::size_t length) {
    std::size_t total = 0;
    while (total < length) {
        const auto received = ::recv(socket, buffer + total, length - total, 0);
        if (received < 0 && errno == EINTR) {
            continue;
        }
        if (received <= 0) {
            return false;
        }
        total += static_cast<std::size_t>(received);
    }
    return true;
}

void shutdown_socket(int socket) {
    if (socket != kInvalidSocket) {
        ::shutdown(socket, SHUT_RDWR);
    }
}

void close_socket(int socket) {
    if (socket != kInvalidSocket) {
        ::close(socket);
    }
}

int open_socket(const std::string& host, std::uint16_t port) {
    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    addrinfo* result = nullptr;
    if (::getaddrinfo(host.c_str(), nullptr, &hints, &result) != 0 || result == nullptr) {
        if (result) {
            ::freeaddrinfo(result);
        }
        return kInvalidSocket;
    }

    const int socket = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (socket == kInvalidSocket) {
        ::freeaddrinfo(result);
        return kInvalidSocket;
    }
    set_cloexec(socket);

    sockaddr_in address = *reinterpret_cast<sockaddr_in*>(result->ai_addr);
    address.sin_port = htons(port);
    ::freeaddrinfo(result);

    if (::connect(socket, reinterpret_cast<const sockaddr*>(&address), sizeof(address)) < 0) {
        close_socket(socket);
        return kInvalidSocket;
    }

    int enable = 1;
    ::setsockopt(socket, IPPROTO_TCP, TCP_NODELAY, &enable, sizeof(enable));
    return socket;
}

int open_listener(const std::string& host, std::uint16_t port) {
    const int socket = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (socket == kInvalidSocket) {
        std::perror("socket");
        return kInvalidSocket;
    }
    set_cloexec(socket);

    int enable = 1;
    ::setsockopt(socket, SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(enable));

    sockaddr_in address{};
    address.sin_family = AF_INET;
    address.sin_port = htons(port);
    if (::inet_pton(AF_INET, host.c_str(), &address.sin_addr) != 1) {
        close_socket(socket);
        return kInvalidSocket;
    }
    if (::bind(socket, reinterpret_cast<sockaddr*>(&address), sizeof(address)) != 0) {
        std::perror("bind");
        close_socket(socket);
        return kInvalidSocket;
    }
    if (::listen(socket, SOMAXCONN) != 0) {
        std::perror("listen");
        close_socket(socket);
        return kInvalidSocket;
    }
    return socket;
}

std::uint16_t local_port(int socket) {
    sockaddr_in address{};
    socklen_t length = sizeof(address);
    if (::getsockname(socket, reinterpret_cast<sockaddr*>(&address), &length) != 0) {
        return 0;
    }
    return ntohs(address.sin_port);
}

std::string endpoint_string(int socket) {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (::getpeername(socket, reinterpret_cast<sockaddr*>(&addr), &len) == 0 && addr.sin_family == AF_INET) {
        char buffer[INET_ADDRSTRLEN]{};
        const char* text = ::inet_ntop(AF_INET, &addr.sin_addr, buffer, sizeof(buffer));
        if (text) {
            return std::string(text) + ":" + std::to_string(ntohs(addr.sin_port));
        }
    }
    return "unknown";
}

}  // namespace zapwire::network
