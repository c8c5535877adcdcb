#include "chunknet/network/ChunkServer.hpp"

#include "chunknet/logging/StructuredLogger.hpp"
#include "chunknet/protocol/ChunkTransfer.hpp"

#include <algorithm>
#include <array>
#include <functional>
#include <fstream>
#include <system_error>
#include <vector>

#ifdef _WIN32
#include <winsock2.h>
#include <ws2tcpip.h>
#else
#include <netinet/in.h>
#include <sys/socket.h>
#endif

namespace chunknet::network {

namespace {

const logging::ComponentLogger kLog{"chunk_server"};

}  // namespace

ChunkServer::ChunkServer(storage::ChunkStore& store, std::chrono::milliseconds idle_timeout)
    : store_(store), idle_timeout_(idle_timeout) {}

ChunkServer::~ChunkServer() {
    stop();
}

void ChunkServer::start(const std::string& host, std::uint16_t port) {
    if (running_) {
        return;
    }

    listen_socket_ = open_tcp_listener(host, port, bound_port_);
    running_ = true;
    accept_thread_ = std::thread(&ChunkServer::accept_loop, this);
    kLog.info("server.listening", {{"host", host}, {"port", std::to_string(bound_port_)}});
}

void ChunkServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    close_socket(listen_socket_);
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    listen_socket_ = INVALID_SOCKET_HANDLE;

    std::list<std::unique_ptr<Connection>> connections;
    {
        std::scoped_lock lock(connections_mutex_);
        for (auto& connection : connections_) {
            if (!connection->done.load()) {
                shutdown_socket(connection->socket);
            }
        }
        connections.swap(connections_);
    }
    for (auto& connection : connections) {
        if (connection->thread.joinable()) {
            connection->thread.join();
        }
    }
    kLog.info("server.stopped", {{"port", std::to_string(bound_port_)}});
}

std::size_t ChunkServer::active_connections() const {
    std::scoped_lock lock(connections_mutex_);
    std::size_t active = 0;
    for (const auto& connection : connections_) {
        if (!connection->done.load()) {
            ++active;
        }
    }
    return active;
}

void ChunkServer::accept_loop() {
    while (running_) {
        sockaddr_in remote{};
        socklen_t len = sizeof(remote);
#ifdef _WIN32
        const auto accepted = ::accept(static_cast<SOCKET>(listen_socket_), reinterpret_cast<sockaddr*>(&remote), &len);
        if (accepted == INVALID_SOCKET) {
#else
        const auto accepted = ::accept(static_cast<int>(listen_socket_), reinterpret_cast<sockaddr*>(&remote), &len);
        if (accepted < 0) {
#endif
            if (running_) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
            continue;
        }

        const auto socket = static_cast<SocketHandle>(accepted);
        if (!running_) {
            close_socket(socket);
            break;
        }

        auto connection = std::make_unique<Connection>();
        connection->socket = socket;
        connection->remote = peer_address(socket);
        auto* raw = connection.get();

        std::scoped_lock lock(connections_mutex_);
        reap_finished_locked();
        connections_.push_back(std::move(connection));
        raw->thread = std::thread(&ChunkServer::serve_connection, this, std::ref(*raw));
    }
}

void ChunkServer::serve_connection(Connection& connection) {
    const auto socket = connection.socket;
    kLog.info("server.connection_opened", {{"remote", connection.remote}});

    set_recv_timeout(socket, idle_timeout_);
    set_send_timeout(socket, idle_timeout_);

    std::vector<std::uint8_t> body;
    while (running_) {
        std::array<std::uint8_t, protocol::kLengthFieldSize> length_bytes{};
        if (!recv_all(socket, length_bytes.data(), length_bytes.size())) {
            break;
        }

        const auto length = protocol::decode_length(length_bytes);
        if (length == 0 || length > protocol::kMaxRequestBody) {
            kLog.warn("server.bad_frame", {{"remote", connection.remote}, {"length", std::to_string(length)}});
            break;
        }

        body.resize(length);
        if (!recv_all(socket, body.data(), body.size())) {
            break;
        }
        requests_handled_.fetch_add(1);

        const auto request = protocol::decode_request_body(
            std::string_view(reinterpret_cast<const char*>(body.data()), body.size()));
        if (request.error != protocol::RequestError::None) {
            kLog.error("server.malformed_request",
                       {{"remote", connection.remote},
                        {"reason", request.error == protocol::RequestError::MissingChunk ? "missing chunk" : "invalid json"}});
            continue;
        }

        if (!serve_chunk(socket, request.chunk)) {
            break;
        }
    }

    kLog.info("server.connection_closed", {{"remote", connection.remote}});
    // Closed under the lock so stop() never shuts down a descriptor that was already reused.
    std::scoped_lock lock(connections_mutex_);
    close_socket(socket);
    connection.done = true;
}

bool ChunkServer::serve_chunk(SocketHandle socket, const std::string& chunk_name) {
    kLog.info("server.chunk_requested", {{"chunk", chunk_name}});

    std::ifstream input;
    std::uintmax_t size = 0;
    if (const auto path = store_.chunk_path(chunk_name)) {
        std::error_code ec;
        if (std::filesystem::is_regular_file(*path, ec)) {
            size = std::filesystem::file_size(*path, ec);
            if (!ec) {
                input.open(*path, std::ios::binary);
            }
        }
    }

    if (!input.is_open()) {
        kLog.warn("server.chunk_not_found", {{"chunk", chunk_name}});
        const auto header = protocol::not_found_header();
        return send_all(socket, reinterpret_cast<const std::uint8_t*>(header.data()), header.size());
    }

    const auto header = protocol::size_header(size);
    if (!send_all(socket, reinterpret_cast<const std::uint8_t*>(header.data()), header.size())) {
        return false;
    }

    std::array<char, protocol::kStreamBlockSize> buffer{};
    std::uintmax_t sent = 0;
    while (sent < size) {
        input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto read = static_cast<std::size_t>(input.gcount());
        if (read == 0) {
            break;
        }
        const auto to_send = static_cast<std::size_t>(std::min<std::uintmax_t>(read, size - sent));
        if (!send_all(socket, reinterpret_cast<const std::uint8_t*>(buffer.data()), to_send)) {
            kLog.warn("server.send_failed", {{"chunk", chunk_name}});
            return false;
        }
        sent += to_send;
    }

    if (sent != size) {
        // The header promised more bytes than the file now holds; the stream cannot be resynchronized.
        kLog.error("server.chunk_truncated", {{"chunk", chunk_name}, {"sent", std::to_string(sent)}});
        return false;
    }

    kLog.info("server.chunk_sent", {{"chunk", chunk_name}, {"size", std::to_string(size)}});
    return true;
}

void ChunkServer::reap_finished_locked() {
    for (auto it = connections_.begin(); it != connections_.end();) {
        if ((*it)->done.load()) {
            if ((*it)->thread.joinable()) {
                (*it)->thread.join();
            }
            it = connections_.erase(it);
        } else {
            ++it;
        }
    }
}

}  // namespace chunknet::network
