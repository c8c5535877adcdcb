#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace chunknet::network {

using SocketHandle = intptr_t;
constexpr SocketHandle INVALID_SOCKET_HANDLE = static_cast<SocketHandle>(-1);

struct Endpoint {
    std::string host;
    std::uint16_t port{0};
};

// "10.0.0.4" -> {10.0.0.4, default_port}; "10.0.0.4:5003" -> {10.0.0.4, 5003}.
std::optional<Endpoint> parse_endpoint(std::string_view peer, std::uint16_t default_port);

int last_network_error();

// Throws std::runtime_error if the socket cannot be created, bound or put into listening mode.
SocketHandle open_tcp_listener(const std::string& host, std::uint16_t port, std::uint16_t& bound_port);
SocketHandle open_udp_socket(const std::string& host, std::uint16_t port, bool broadcast);

// Blocking connect bounded by `timeout`; INVALID_SOCKET_HANDLE on failure.
SocketHandle connect_with_timeout(const Endpoint& endpoint, std::chrono::milliseconds timeout);

bool configure_socket(SocketHandle handle, bool server_mode);
bool set_recv_timeout(SocketHandle handle, std::chrono::milliseconds timeout);
bool set_send_timeout(SocketHandle handle, std::chrono::milliseconds timeout);

bool send_all(SocketHandle handle, const std::uint8_t* data, std::size_t length);
bool recv_all(SocketHandle handle, std::uint8_t* buffer, std::size_t length);
// Bytes read, 0 on orderly close, negative on error or timeout.
long recv_some(SocketHandle handle, std::uint8_t* buffer, std::size_t length);
// Reads up to and excluding '\n'. nullopt on error, close, or a line longer than max_length.
std::optional<std::string> recv_line(SocketHandle handle, std::size_t max_length);

// Peer still connected and has not sent an orderly close.
bool is_connection_alive(SocketHandle handle);

// Datagram helpers for the announcement channel.
bool send_datagram(SocketHandle handle, const std::string& host, std::uint16_t port, std::string_view payload);
// Bytes received (sender IP in `sender`), negative on error or timeout.
long recv_datagram(SocketHandle handle, std::uint8_t* buffer, std::size_t length, std::string& sender);

// Address of the interface that routes to the outside world; nullopt when there is none.
std::optional<std::string> local_ipv4_address();

std::string peer_address(SocketHandle handle);
void shutdown_socket(SocketHandle handle);
void close_socket(SocketHandle handle);

}  // namespace chunknet::network
