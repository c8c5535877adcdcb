#pragma once

#include "chunknet/core/BackgroundTask.hpp"
#include "chunknet/network/Socket.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace chunknet::network {

// Cache of outbound connections to chunk servers, at most one per peer. A Lease gives exclusive
// use of one connection for one request/response exchange. At most max_connections sockets are
// open at once, counting evicted connections whose lease is still outstanding.
class ConnectionPool {
    struct Entry;

public:
    using Clock = std::chrono::steady_clock;

    struct Options {
        std::size_t max_connections{10};
        std::chrono::milliseconds connect_timeout{std::chrono::seconds(10)};
        std::chrono::milliseconds io_timeout{std::chrono::seconds(10)};
        std::chrono::seconds idle_timeout{std::chrono::seconds(300)};
        std::uint16_t default_port{5000};
    };

    class Lease {
    public:
        Lease() = default;
        ~Lease();

        Lease(Lease&& other) noexcept;
        Lease& operator=(Lease&& other) noexcept;
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        SocketHandle socket() const noexcept;
        const std::string& peer() const noexcept { return peer_; }
        // True when the connection was taken from the cache rather than opened for this lease.
        bool reused() const noexcept { return reused_; }

        // Closes and evicts this connection; the lease becomes empty.
        void discard();
        // Returns the connection to the pool; the lease becomes empty.
        void release();

        explicit operator bool() const noexcept { return entry_ != nullptr; }

    private:
        friend class ConnectionPool;
        Lease(ConnectionPool* pool, std::string peer, std::shared_ptr<Entry> entry, bool reused);

        ConnectionPool* pool_{nullptr};
        std::string peer_;
        std::shared_ptr<Entry> entry_;
        bool reused_{false};
    };

    explicit ConnectionPool(Options options);
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    // `peer` is "host" (default port) or "host:port". Blocks while another caller holds the
    // connection, or while every slot is leased. nullopt when no connection could be established.
    std::optional<Lease> acquire(const std::string& peer);

    // Force-closes and evicts the peer's connection.
    void remove(const std::string& peer);
    void close_all();

    std::size_t size() const;
    bool contains(const std::string& peer) const;

    // Evicts idle entries unused for longer than the idle timeout; returns the evicted peers.
    std::vector<std::string> evict_idle(Clock::time_point now = Clock::now());

    void start_reaper(std::chrono::milliseconds interval);
    void stop_reaper();

private:
    // `mutex` serializes lease holders. The remaining fields are guarded by the pool mutex,
    // except `socket`, which belongs to the lease holder while `in_use` is set.
    struct Entry {
        std::mutex mutex;
        SocketHandle socket{INVALID_SOCKET_HANDLE};
        bool in_use{false};
        bool retired{false};
        // Retired while leased; the socket still counts against max_connections.
        bool pending_close{false};
        Clock::time_point last_used{};
        std::uint64_t use_serial{0};
    };

    void retire_locked(const std::string& peer, const std::shared_ptr<Entry>& entry);
    // Evicts the least recently used idle entry; false when every entry is leased.
    bool evict_lru_locked();
    void return_entry(const std::string& peer, const std::shared_ptr<Entry>& entry, bool discard);

    Options options_;
    mutable std::mutex mutex_;
    std::condition_variable slot_cv_;
    std::map<std::string, std::shared_ptr<Entry>> entries_;
    std::size_t pending_close_{0};
    std::uint64_t use_counter_{0};
    std::unique_ptr<core::BackgroundTask> reaper_;
};

}  // namespace chunknet::network
