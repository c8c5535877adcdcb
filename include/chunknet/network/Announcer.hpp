#pragma once

#include "chunknet/core/BackgroundTask.hpp"
#include "chunknet/network/Socket.hpp"
#include "chunknet/storage/ChunkStore.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace chunknet::network {

// Periodically broadcasts the local chunk inventory in batched UDP datagrams.
class Announcer {
public:
    enum class Delivery {
        SubnetBroadcast,
        GlobalBroadcast,
        Loopback
    };

    struct Options {
        std::vector<std::uint16_t> target_ports{5001, 5002};
        std::chrono::milliseconds interval{std::chrono::seconds(10)};
        std::size_t batch_size{8};
        std::size_t max_datagram{60000};
        // Tried in order per port and datagram, stopping at the first successful send.
        std::vector<Delivery> delivery{Delivery::SubnetBroadcast, Delivery::GlobalBroadcast, Delivery::Loopback};
        // Advertised when the chunk server does not listen on the shared default port.
        std::optional<std::uint16_t> peer_port;
        // Overrides the detected interface address in the peer_ip field.
        std::optional<std::string> advertised_ip;
    };

    Announcer(const storage::ChunkStore& store, Options options);
    ~Announcer();

    Announcer(const Announcer&) = delete;
    Announcer& operator=(const Announcer&) = delete;

    // Opens the broadcast socket (throws std::runtime_error), announces once, then every interval.
    void start();
    void stop();

    // One cycle: scan, batch and send. Returns the number of datagrams delivered to at least one
    // port. Opens the socket on demand.
    std::size_t announce_once();

    // Directed broadcast address of the /24 around `local_ip`; 255.255.255.255 for loopback.
    static std::string subnet_broadcast_address(const std::string& local_ip);

private:
    bool ensure_socket();
    bool deliver(const std::string& datagram, std::uint16_t port, const std::string& local_ip, const std::string& label);

    const storage::ChunkStore& store_;
    Options options_;
    SocketHandle socket_{INVALID_SOCKET_HANDLE};
    std::unique_ptr<core::BackgroundTask> task_;
};

}  // namespace chunknet::network
