#include "chunknet/network/Socket.hpp"

#include <charconv>
#include <limits>
#include <stdexcept>
#ifndef _WIN32
#include <cerrno>
#endif

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <winsock2.h>
#include <ws2tcpip.h>
#else
#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>
#endif

namespace {

#ifdef _WIN32
using NativeSocket = SOCKET;
constexpr NativeSocket kInvalidNativeSocket = INVALID_SOCKET;

class WinsockRuntime {
public:
    WinsockRuntime() {
        WSADATA data{};
        const auto result = WSAStartup(MAKEWORD(2, 2), &data);
        if (result != 0) {
            throw std::runtime_error("WSAStartup failed");
        }
    }

    ~WinsockRuntime() {
        WSACleanup();
    }
};

WinsockRuntime& winsock_runtime() {
    static WinsockRuntime runtime;
    return runtime;
}

#else
using NativeSocket = int;
constexpr NativeSocket kInvalidNativeSocket = -1;

inline void winsock_runtime() {}
#endif

NativeSocket to_native(chunknet::network::SocketHandle handle) {
    return static_cast<NativeSocket>(handle);
}

chunknet::network::SocketHandle from_native(NativeSocket socket) {
    return static_cast<chunknet::network::SocketHandle>(socket);
}

bool set_non_blocking(NativeSocket socket, bool enable) {
#ifdef _WIN32
    u_long mode = enable ? 1 : 0;
    return ioctlsocket(socket, FIONBIO, &mode) == 0;
#else
    int flags = fcntl(socket, F_GETFL, 0);
    if (flags < 0) {
        return false;
    }
    if (enable) {
        flags |= O_NONBLOCK;
    } else {
        flags &= ~O_NONBLOCK;
    }
    return fcntl(socket, F_SETFL, flags) == 0;
#endif
}

bool set_timeout_option(NativeSocket socket, int option, std::chrono::milliseconds timeout) {
#ifdef _WIN32
    DWORD value = static_cast<DWORD>(timeout.count());
    return ::setsockopt(socket, SOL_SOCKET, option, reinterpret_cast<const char*>(&value), sizeof(value)) == 0;
#else
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    return ::setsockopt(socket, SOL_SOCKET, option, reinterpret_cast<const char*>(&tv), sizeof(tv)) == 0;
#endif
}

std::optional<in_addr> resolve_ipv4(const std::string& host) {
    addrinfo hints{};
    hints.ai_family = AF_INET;

    addrinfo* result = nullptr;
    if (const auto err = ::getaddrinfo(host.c_str(), nullptr, &hints, &result); err != 0 || result == nullptr) {
        if (result) {
            ::freeaddrinfo(result);
        }
        return std::nullopt;
    }
    const auto address = reinterpret_cast<sockaddr_in*>(result->ai_addr)->sin_addr;
    ::freeaddrinfo(result);
    return address;
}

sockaddr_in bind_address(const std::string& host, std::uint16_t port) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (host.empty() || host == "0.0.0.0") {
        addr.sin_addr.s_addr = htonl(INADDR_ANY);
    } else if (const auto resolved = resolve_ipv4(host)) {
        addr.sin_addr = *resolved;
    } else {
        throw std::runtime_error("Failed to resolve bind address " + host);
    }
    return addr;
}

}  // namespace

namespace chunknet::network {

std::optional<Endpoint> parse_endpoint(std::string_view peer, std::uint16_t default_port) {
    if (peer.empty()) {
        return std::nullopt;
    }
    const auto colon = peer.rfind(':');
    if (colon == std::string_view::npos) {
        return Endpoint{std::string(peer), default_port};
    }

    const auto host = peer.substr(0, colon);
    const auto port_text = peer.substr(colon + 1);
    unsigned int port = 0;
    const auto result = std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
    if (host.empty() || result.ec != std::errc{} || result.ptr != port_text.data() + port_text.size() ||
        port == 0 || port > std::numeric_limits<std::uint16_t>::max()) {
        return std::nullopt;
    }
    return Endpoint{std::string(host), static_cast<std::uint16_t>(port)};
}

int last_network_error() {
#ifdef _WIN32
    return WSAGetLastError();
#else
    return errno;
#endif
}

SocketHandle open_tcp_listener(const std::string& host, std::uint16_t port, std::uint16_t& bound_port) {
    winsock_runtime();

    NativeSocket server_socket = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (server_socket == kInvalidNativeSocket) {
        throw std::runtime_error("Failed to create listen socket: error " + std::to_string(last_network_error()));
    }

    if (!configure_socket(from_native(server_socket), true)) {
        close_socket(from_native(server_socket));
        throw std::runtime_error("Failed to configure listen socket");
    }

    sockaddr_in addr{};
    try {
        addr = bind_address(host, port);
    } catch (const std::runtime_error&) {
        close_socket(from_native(server_socket));
        throw;
    }

    if (::bind(server_socket, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
        const auto error = last_network_error();
        close_socket(from_native(server_socket));
        throw std::runtime_error("Failed to bind listen socket: error " + std::to_string(error));
    }

    if (::listen(server_socket, SOMAXCONN) < 0) {
        const auto error = last_network_error();
        close_socket(from_native(server_socket));
        throw std::runtime_error("Failed to listen on socket: error " + std::to_string(error));
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (::getsockname(server_socket, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
        bound_port = ntohs(bound.sin_port);
    } else {
        bound_port = port;
    }
    return from_native(server_socket);
}

SocketHandle open_udp_socket(const std::string& host, std::uint16_t port, bool broadcast) {
    winsock_runtime();

    NativeSocket udp_socket = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (udp_socket == kInvalidNativeSocket) {
        throw std::runtime_error("Failed to create UDP socket: error " + std::to_string(last_network_error()));
    }

    if (!configure_socket(from_native(udp_socket), true)) {
        close_socket(from_native(udp_socket));
        throw std::runtime_error("Failed to configure UDP socket");
    }

    if (broadcast) {
        int opt = 1;
        if (::setsockopt(udp_socket, SOL_SOCKET, SO_BROADCAST, reinterpret_cast<const char*>(&opt), sizeof(opt)) < 0) {
            const auto error = last_network_error();
            close_socket(from_native(udp_socket));
            throw std::runtime_error("Failed to enable broadcast: error " + std::to_string(error));
        }
    }

    sockaddr_in addr{};
    try {
        addr = bind_address(host, port);
    } catch (const std::runtime_error&) {
        close_socket(from_native(udp_socket));
        throw;
    }

    if (::bind(udp_socket, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
        const auto error = last_network_error();
        close_socket(from_native(udp_socket));
        throw std::runtime_error("Failed to bind UDP socket on port " + std::to_string(port) +
                                 ": error " + std::to_string(error));
    }
    return from_native(udp_socket);
}

SocketHandle connect_with_timeout(const Endpoint& endpoint, std::chrono::milliseconds timeout) {
    winsock_runtime();

    const auto resolved = resolve_ipv4(endpoint.host);
    if (!resolved) {
        return INVALID_SOCKET_HANDLE;
    }

    NativeSocket socket = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (socket == kInvalidNativeSocket) {
        return INVALID_SOCKET_HANDLE;
    }

    sockaddr_in address{};
    address.sin_family = AF_INET;
    address.sin_addr = *resolved;
    address.sin_port = htons(endpoint.port);

    if (!set_non_blocking(socket, true)) {
        close_socket(from_native(socket));
        return INVALID_SOCKET_HANDLE;
    }

    if (::connect(socket, reinterpret_cast<const sockaddr*>(&address), sizeof(address)) < 0) {
        const auto error = last_network_error();
#ifdef _WIN32
        const bool in_progress = error == WSAEWOULDBLOCK;
#else
        const bool in_progress = error == EINPROGRESS;
#endif
        if (!in_progress) {
            close_socket(from_native(socket));
            return INVALID_SOCKET_HANDLE;
        }

#ifdef _WIN32
        WSAPOLLFD descriptor{};
        descriptor.fd = socket;
        descriptor.events = POLLOUT;
        const int ready = WSAPoll(&descriptor, 1, static_cast<INT>(timeout.count()));
#else
        pollfd descriptor{};
        descriptor.fd = socket;
        descriptor.events = POLLOUT;
        int ready = 0;
        do {
            ready = ::poll(&descriptor, 1, static_cast<int>(timeout.count()));
        } while (ready < 0 && errno == EINTR);
#endif
        if (ready <= 0) {
            close_socket(from_native(socket));
            return INVALID_SOCKET_HANDLE;
        }

        int socket_error = 0;
        socklen_t length = sizeof(socket_error);
        if (::getsockopt(socket, SOL_SOCKET, SO_ERROR, reinterpret_cast<char*>(&socket_error), &length) < 0 ||
            socket_error != 0) {
            close_socket(from_native(socket));
            return INVALID_SOCKET_HANDLE;
        }
    }

    if (!configure_socket(from_native(socket), false)) {
        close_socket(from_native(socket));
        return INVALID_SOCKET_HANDLE;
    }
    return from_native(socket);
}

bool configure_socket(SocketHandle handle, bool server_mode) {
    auto socket = to_native(handle);

    int opt = 1;
    if (::setsockopt(socket, SOL_SOCKET, SO_REUSEADDR, reinterpret_cast<const char*>(&opt), sizeof(opt)) < 0) {
        return false;
    }

    if (!server_mode) {
        return set_non_blocking(socket, false);
    }
    return true;
}

bool set_recv_timeout(SocketHandle handle, std::chrono::milliseconds timeout) {
    return set_timeout_option(to_native(handle), SO_RCVTIMEO, timeout);
}

bool set_send_timeout(SocketHandle handle, std::chrono::milliseconds timeout) {
    return set_timeout_option(to_native(handle), SO_SNDTIMEO, timeout);
}

bool send_all(SocketHandle handle, const std::uint8_t* data, std::size_t length) {
    auto socket = to_native(handle);
#ifdef MSG_NOSIGNAL
    constexpr int kFlags = MSG_NOSIGNAL;
#else
    constexpr int kFlags = 0;
#endif
    std::size_t sent_total = 0;
    while (sent_total < length) {
#ifdef _WIN32
        const auto sent = ::send(socket, reinterpret_cast<const char*>(data + sent_total), static_cast<int>(length - sent_total), kFlags);
#else
        const auto sent = ::send(socket, reinterpret_cast<const char*>(data + sent_total), length - sent_total, kFlags);
#endif
        if (sent <= 0) {
            return false;
        }
        sent_total += static_cast<std::size_t>(sent);
    }
    return true;
}

bool recv_all(SocketHandle handle, std::uint8_t* buffer, std::size_t length) {
    std::size_t received_total = 0;
    while (received_total < length) {
        const auto received = recv_some(handle, buffer + received_total, length - received_total);
        if (received <= 0) {
            return false;
        }
        received_total += static_cast<std::size_t>(received);
    }
    return true;
}

long recv_some(SocketHandle handle, std::uint8_t* buffer, std::size_t length) {
    auto socket = to_native(handle);
#ifdef _WIN32
    return ::recv(socket, reinterpret_cast<char*>(buffer), static_cast<int>(length), 0);
#else
    while (true) {
        const auto received = ::recv(socket, reinterpret_cast<char*>(buffer), length, 0);
        if (received < 0 && errno == EINTR) {
            continue;
        }
        return static_cast<long>(received);
    }
#endif
}

std::optional<std::string> recv_line(SocketHandle handle, std::size_t max_length) {
    std::string line;
    while (true) {
        std::uint8_t byte = 0;
        if (recv_some(handle, &byte, 1) != 1) {
            return std::nullopt;
        }
        if (byte == '\n') {
            return line;
        }
        if (line.size() >= max_length) {
            return std::nullopt;
        }
        line.push_back(static_cast<char>(byte));
    }
}

bool is_connection_alive(SocketHandle handle) {
    if (handle == INVALID_SOCKET_HANDLE) {
        return false;
    }
    auto socket = to_native(handle);

    sockaddr_in remote{};
    socklen_t len = sizeof(remote);
    if (::getpeername(socket, reinterpret_cast<sockaddr*>(&remote), &len) != 0) {
        return false;
    }

    char probe = 0;
#ifdef _WIN32
    if (!set_non_blocking(socket, true)) {
        return false;
    }
    const int peeked = ::recv(socket, &probe, 1, MSG_PEEK);
    const int error = WSAGetLastError();
    set_non_blocking(socket, false);
    if (peeked == 0) {
        return false;
    }
    return peeked > 0 || error == WSAEWOULDBLOCK;
#else
    const auto peeked = ::recv(socket, &probe, 1, MSG_PEEK | MSG_DONTWAIT);
    if (peeked == 0) {
        return false;
    }
    // Unsolicited bytes on an idle request/response connection mean the stream is out of sync.
    if (peeked > 0) {
        return false;
    }
    return errno == EAGAIN || errno == EWOULDBLOCK;
#endif
}

bool send_datagram(SocketHandle handle, const std::string& host, std::uint16_t port, std::string_view payload) {
    sockaddr_in address{};
    address.sin_family = AF_INET;
    address.sin_port = htons(port);
    if (::inet_pton(AF_INET, host.c_str(), &address.sin_addr) != 1) {
        const auto resolved = resolve_ipv4(host);
        if (!resolved) {
            return false;
        }
        address.sin_addr = *resolved;
    }
#ifdef _WIN32
    const auto sent = ::sendto(to_native(handle), payload.data(), static_cast<int>(payload.size()), 0,
                               reinterpret_cast<const sockaddr*>(&address), sizeof(address));
#else
    const auto sent = ::sendto(to_native(handle), payload.data(), payload.size(), 0,
                               reinterpret_cast<const sockaddr*>(&address), sizeof(address));
#endif
    return sent >= 0 && static_cast<std::size_t>(sent) == payload.size();
}

long recv_datagram(SocketHandle handle, std::uint8_t* buffer, std::size_t length, std::string& sender) {
    sockaddr_in remote{};
    socklen_t len = sizeof(remote);
#ifdef _WIN32
    const auto received = ::recvfrom(to_native(handle), reinterpret_cast<char*>(buffer), static_cast<int>(length), 0,
                                     reinterpret_cast<sockaddr*>(&remote), &len);
#else
    const auto received = ::recvfrom(to_native(handle), reinterpret_cast<char*>(buffer), length, 0,
                                     reinterpret_cast<sockaddr*>(&remote), &len);
#endif
    if (received >= 0) {
        char text[INET_ADDRSTRLEN]{};
        sender = ::inet_ntop(AF_INET, &remote.sin_addr, text, sizeof(text)) ? text : "";
    }
    return static_cast<long>(received);
}

std::optional<std::string> local_ipv4_address() {
    winsock_runtime();

    NativeSocket probe = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (probe == kInvalidNativeSocket) {
        return std::nullopt;
    }

    // Connecting a UDP socket only selects a route; nothing is sent.
    sockaddr_in remote{};
    remote.sin_family = AF_INET;
    remote.sin_port = htons(80);
    ::inet_pton(AF_INET, "8.8.8.8", &remote.sin_addr);
    if (::connect(probe, reinterpret_cast<const sockaddr*>(&remote), sizeof(remote)) < 0) {
        close_socket(from_native(probe));
        return std::nullopt;
    }

    sockaddr_in local{};
    socklen_t len = sizeof(local);
    std::optional<std::string> result;
    if (::getsockname(probe, reinterpret_cast<sockaddr*>(&local), &len) == 0) {
        char text[INET_ADDRSTRLEN]{};
        if (::inet_ntop(AF_INET, &local.sin_addr, text, sizeof(text))) {
            result = std::string(text);
        }
    }
    close_socket(from_native(probe));
    return result;
}

std::string peer_address(SocketHandle handle) {
    auto socket = to_native(handle);
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (::getpeername(socket, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
        char buffer[INET_ADDRSTRLEN]{};
        const char* text = ::inet_ntop(AF_INET, &addr.sin_addr, buffer, sizeof(buffer));
        if (text) {
            return std::string(text) + ":" + std::to_string(ntohs(addr.sin_port));
        }
    }
    return "unknown";
}

void shutdown_socket(SocketHandle handle) {
    if (handle == INVALID_SOCKET_HANDLE) {
        return;
    }
#ifdef _WIN32
    ::shutdown(to_native(handle), SD_BOTH);
#else
    ::shutdown(to_native(handle), SHUT_RDWR);
#endif
}

void close_socket(SocketHandle handle) {
    if (handle == INVALID_SOCKET_HANDLE) {
        return;
    }
    auto socket = to_native(handle);
#ifdef _WIN32
    ::shutdown(socket, SD_BOTH);
    ::closesocket(socket);
#else
    ::shutdown(socket, SHUT_RDWR);
    ::close(socket);
#endif
}

}  // namespace chunknet::network
