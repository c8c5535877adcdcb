#include "chunknet/network/ConnectionPool.hpp"

#include "test_support.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

#ifndef _WIN32
#include <sys/socket.h>
#endif

using chunknet::network::ConnectionPool;
using chunknet::network::INVALID_SOCKET_HANDLE;
using chunknet::network::SocketHandle;

using namespace std::chrono_literals;

namespace {

struct TestListener {
    SocketHandle socket{INVALID_SOCKET_HANDLE};
    std::uint16_t port{0};

    TestListener() {
        socket = chunknet::network::open_tcp_listener("127.0.0.1", 0, port);
    }

    ~TestListener() {
        chunknet::network::close_socket(socket);
    }

    std::string peer() const {
        return "127.0.0.1:" + std::to_string(port);
    }
};

ConnectionPool::Options small_pool() {
    ConnectionPool::Options options{};
    options.max_connections = 2;
    options.connect_timeout = 2s;
    options.io_timeout = 2s;
    options.idle_timeout = 60s;
    return options;
}

}  // namespace

int main() {
    chunknet::test::quiet_logs();

    TestListener a;
    TestListener b;
    TestListener c;

    // Never more than max_connections entries; the least recently used one is evicted.
    {
        ConnectionPool pool(small_pool());
        auto first = pool.acquire(a.peer());
        assert(first.has_value());
        assert(!first->reused());
        assert(first->socket() != INVALID_SOCKET_HANDLE);
        first->release();

        auto second = pool.acquire(b.peer());
        assert(second.has_value());
        second->release();
        assert(pool.size() == 2);

        auto again = pool.acquire(a.peer());
        assert(again.has_value());
        assert(again->reused());
        again->release();

        auto third = pool.acquire(c.peer());
        assert(third.has_value());
        third->release();

        assert(pool.size() == 2);
        assert(pool.contains(a.peer()));
        assert(pool.contains(c.peer()));
        assert(!pool.contains(b.peer()));

        pool.remove(a.peer());
        assert(!pool.contains(a.peer()));
        assert(pool.size() == 1);

        assert(pool.evict_idle().empty());
        const auto evicted = pool.evict_idle(ConnectionPool::Clock::now() + 61s);
        assert((evicted == std::vector<std::string>{c.peer()}));
        assert(pool.size() == 0);
    }

    // An unreachable peer yields no lease and no entry.
    {
        std::uint16_t closed_port = 0;
        {
            TestListener closed;
            closed_port = closed.port;
        }
        ConnectionPool pool(small_pool());
        const auto lease = pool.acquire("127.0.0.1:" + std::to_string(closed_port));
        assert(!lease.has_value());
        assert(pool.size() == 0);
        assert(!pool.acquire("").has_value());
    }

    // A discarded lease drops its entry.
    {
        ConnectionPool pool(small_pool());
        auto lease = pool.acquire(a.peer());
        assert(lease.has_value());
        lease->discard();
        assert(!*lease);
        assert(pool.size() == 0);
    }

#ifndef _WIN32
    // A cached connection closed by the server is replaced with a fresh one.
    {
        TestListener server;
        ConnectionPool pool(small_pool());
        auto lease = pool.acquire(server.peer());
        assert(lease.has_value());
        const auto accepted = static_cast<SocketHandle>(::accept(static_cast<int>(server.socket), nullptr, nullptr));
        assert(accepted != INVALID_SOCKET_HANDLE);
        lease->release();

        chunknet::network::close_socket(accepted);
        std::this_thread::sleep_for(100ms);

        auto replacement = pool.acquire(server.peer());
        assert(replacement.has_value());
        assert(!replacement->reused());
        replacement->release();
        assert(pool.size() == 1);
    }
#endif

    // With every slot leased, a new peer waits; an evicted but still leased socket keeps its slot.
    {
        auto options = small_pool();
        options.max_connections = 1;
        ConnectionPool pool(options);
        auto held = pool.acquire(a.peer());
        assert(held.has_value());

        std::atomic<bool> acquired{false};
        std::thread waiter([&] {
            auto lease = pool.acquire(b.peer());
            assert(lease.has_value());
            acquired = true;
            lease->release();
        });

        std::this_thread::sleep_for(200ms);
        assert(!acquired.load());
        assert(pool.size() == 1);
        assert(pool.contains(a.peer()));

        pool.remove(a.peer());
        std::this_thread::sleep_for(200ms);
        assert(!acquired.load());
        assert(held->socket() != INVALID_SOCKET_HANDLE);

        held->release();
        waiter.join();
        assert(acquired.load());
        assert(pool.size() == 1);
        assert(pool.contains(b.peer()));
        assert(!pool.contains(a.peer()));
    }

    // More workers than slots: each finishes, and the pool never exceeds its bound.
    {
        auto options = small_pool();
        options.max_connections = 1;
        ConnectionPool pool(options);
        std::vector<std::thread> workers;
        std::atomic<int> leases{0};
        for (int i = 0; i < 3; ++i) {
            workers.emplace_back([&, i] {
                const auto& target = (i % 2 == 0) ? a : b;
                for (int round = 0; round < 5; ++round) {
                    auto lease = pool.acquire(target.peer());
                    if (lease) {
                        assert(pool.size() <= 1);
                        ++leases;
                        lease->release();
                    }
                }
            });
        }
        for (auto& worker : workers) {
            worker.join();
        }
        assert(leases.load() == 15);
        assert(pool.size() == 1);
    }

    // Concurrent callers for the same peer are serialized on one connection.
    {
        ConnectionPool pool(small_pool());
        std::vector<std::thread> workers;
        std::atomic<int> leases{0};
        for (int i = 0; i < 4; ++i) {
            workers.emplace_back([&] {
                for (int round = 0; round < 10; ++round) {
                    auto lease = pool.acquire(a.peer());
                    if (lease) {
                        ++leases;
                        lease->release();
                    }
                }
            });
        }
        for (auto& worker : workers) {
            worker.join();
        }
        assert(leases.load() == 40);
        assert(pool.size() == 1);
    }

    return 0;
}
