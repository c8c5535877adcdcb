#pragma once

#include "chunknet/network/Socket.hpp"
#include "chunknet/storage/ChunkStore.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace chunknet::network {

// Serves chunk files over persistent TCP connections, one handler thread per connection.
// Each connection loops AWAIT_REQUEST -> SERVE_CHUNK until the client closes or stays idle
// longer than the idle timeout.
class ChunkServer {
public:
    ChunkServer(storage::ChunkStore& store, std::chrono::milliseconds idle_timeout);
    ~ChunkServer();

    ChunkServer(const ChunkServer&) = delete;
    ChunkServer& operator=(const ChunkServer&) = delete;

    // Throws std::runtime_error when the listen socket cannot be set up. Port 0 picks a free port.
    void start(const std::string& host, std::uint16_t port);
    void stop();

    bool running() const noexcept { return running_.load(); }
    std::uint16_t port() const noexcept { return bound_port_; }

    // Framed requests processed since start, including malformed and not-found ones.
    std::uint64_t requests_handled() const noexcept { return requests_handled_.load(); }
    std::size_t active_connections() const;

private:
    struct Connection {
        SocketHandle socket{INVALID_SOCKET_HANDLE};
        std::string remote;
        std::thread thread;
        std::atomic<bool> done{false};
    };

    void accept_loop();
    void serve_connection(Connection& connection);
    bool serve_chunk(SocketHandle socket, const std::string& chunk_name);
    void reap_finished_locked();

    storage::ChunkStore& store_;
    std::chrono::milliseconds idle_timeout_;

    std::atomic<bool> running_{false};
    SocketHandle listen_socket_{INVALID_SOCKET_HANDLE};
    std::uint16_t bound_port_{0};
    std::thread accept_thread_;

    mutable std::mutex connections_mutex_;
    std::list<std::unique_ptr<Connection>> connections_;

    std::atomic<std::uint64_t> requests_handled_{0};
};

}  // namespace chunknet::network
