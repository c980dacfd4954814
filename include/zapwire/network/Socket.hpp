#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace zapwire::network {

inline constexpr int kInvalidSocket = -1;

// Blocking helpers. They return false on EOF or any socket error.
bool send_all(int socket, const std::uint8_t* data, std::size_t length);
bool recv_all(int socket, std::uint8_t* buffer, std::size_t length);

void shutdown_socket(int socket);
void close_socket(int socket);

// Resolves host (IPv4) and connects. Returns kInvalidSocket on failure.
int open_socket(const std::string& host, std::uint16_t port);

// Bound and listening socket; port 0 picks an ephemeral port. Returns kInvalidSocket on failure.
int open_listener(const std::string& host, std::uint16_t port);
std::uint16_t local_port(int socket);

std::string endpoint_string(int socket);

}  // namespace zapwire::network
