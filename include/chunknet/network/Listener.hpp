#pragma once

#include "chunknet/Types.hpp"
#include "chunknet/directory/PeerDirectory.hpp"
#include "chunknet/network/Socket.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <thread>

namespace chunknet::network {

// Receives announcement datagrams, folds them into the peer directory and persists the
// derived content directory after every change.
class Listener {
public:
    struct Options {
        std::string host{"0.0.0.0"};
        std::uint16_t port{5001};
        std::filesystem::path content_dict_path{"./content_dict.json"};
        std::chrono::milliseconds reaper_interval{std::chrono::seconds(60)};
        std::chrono::milliseconds poll_interval{std::chrono::milliseconds(250)};
    };

    Listener(directory::PeerDirectory& directory, Options options);
    ~Listener();

    Listener(const Listener&) = delete;
    Listener& operator=(const Listener&) = delete;

    // Seeds the directory from the persisted file, binds the UDP socket (throws
    // std::runtime_error) and starts the receive loop and the stale-peer reaper.
    void start();
    void stop();

    std::uint16_t port() const noexcept { return bound_port_; }

    // Applies one announcement. Returns true when the directory changed.
    bool handle_datagram(std::string_view datagram);

    // Reloads the persisted content directory into the peer table.
    void load_persisted();
    bool persist();

    std::uint64_t datagrams_received() const noexcept { return datagrams_received_.load(); }

private:
    struct Assembly {
        std::string timestamp;
        std::uint32_t total{0};
        std::set<std::uint32_t> received;
        PeerChunkMap chunks;
    };

    void receive_loop();

    directory::PeerDirectory& directory_;
    Options options_;

    std::atomic<bool> running_{false};
    SocketHandle socket_{INVALID_SOCKET_HANDLE};
    std::uint16_t bound_port_{0};
    std::thread receive_thread_;

    std::mutex assembly_mutex_;
    std::map<std::string, Assembly> assemblies_;

    std::mutex persist_mutex_;
    std::atomic<std::uint64_t> datagrams_received_{0};
};

}  // namespace chunknet::network
