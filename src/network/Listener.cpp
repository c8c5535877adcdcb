#include "chunknet/network/Listener.hpp"

#include "chunknet/directory/ContentDirectoryFile.hpp"
#include "chunknet/logging/StructuredLogger.hpp"
#include "chunknet/protocol/Announcement.hpp"

#include <optional>
#include <stdexcept>
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

const logging::ComponentLogger kLog{"listener"};

constexpr std::size_t kMaxDatagram = 65535;

std::string peer_key(const protocol::Announcement& announcement) {
    if (announcement.peer_port) {
        return announcement.peer_ip + ":" + std::to_string(*announcement.peer_port);
    }
    return announcement.peer_ip;
}

PeerChunkMap checksums_of(const ChunkInventory& inventory) {
    PeerChunkMap chunks;
    for (const auto& [name, metadata] : inventory) {
        chunks.emplace(name, metadata.checksum);
    }
    return chunks;
}

std::uint16_t bound_port_of(SocketHandle handle, std::uint16_t fallback) {
    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
#ifdef _WIN32
    const auto native = static_cast<SOCKET>(handle);
#else
    const auto native = static_cast<int>(handle);
#endif
    if (::getsockname(native, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
        return ntohs(bound.sin_port);
    }
    return fallback;
}

}  // namespace

Listener::Listener(directory::PeerDirectory& directory, Options options)
    : directory_(directory), options_(std::move(options)) {}

Listener::~Listener() {
    stop();
}

void Listener::start() {
    if (running_) {
        return;
    }

    load_persisted();

    socket_ = open_udp_socket(options_.host, options_.port, false);
    bound_port_ = bound_port_of(socket_, options_.port);
    if (!set_recv_timeout(socket_, options_.poll_interval)) {
        close_socket(socket_);
        socket_ = INVALID_SOCKET_HANDLE;
        throw std::runtime_error("Failed to configure announcement socket");
    }

    running_ = true;
    receive_thread_ = std::thread(&Listener::receive_loop, this);
    directory_.start_reaper(options_.reaper_interval, [this](const std::vector<std::string>&) { persist(); });
    kLog.info("listener.started", {{"port", std::to_string(bound_port_)}});
}

void Listener::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    directory_.stop_reaper();
    if (receive_thread_.joinable()) {
        receive_thread_.join();
    }
    close_socket(socket_);
    socket_ = INVALID_SOCKET_HANDLE;
    kLog.info("listener.stopped", {{"port", std::to_string(bound_port_)}});
}

void Listener::load_persisted() {
    const auto persisted = directory::load_content_directory(options_.content_dict_path);
    if (!persisted) {
        return;
    }
    if (persisted->empty()) {
        kLog.info("listener.no_persisted_directory", {{"path", options_.content_dict_path.string()}});
        return;
    }
    directory_.seed(*persisted);
    kLog.info("listener.directory_loaded", {{"path", options_.content_dict_path.string()},
                                            {"chunks", std::to_string(persisted->size())}});
}

bool Listener::persist() {
    std::scoped_lock lock(persist_mutex_);
    const auto content = directory_.content_directory();
    if (!directory::save_content_directory(content, options_.content_dict_path)) {
        return false;
    }
    kLog.debug("listener.directory_saved", {{"chunks", std::to_string(content.size())}});
    return true;
}

bool Listener::handle_datagram(std::string_view datagram) {
    const auto announcement = protocol::decode_announcement(datagram);
    if (!announcement) {
        kLog.error("listener.malformed_datagram", {{"bytes", std::to_string(datagram.size())}});
        return false;
    }
    if (announcement->chunks.empty()) {
        kLog.debug("listener.empty_announcement", {{"peer", announcement->peer_ip}});
        return false;
    }

    const auto key = peer_key(*announcement);
    auto chunks = checksums_of(announcement->chunks);

    const bool single = !announcement->batch_info || announcement->batch_info->total == 1;
    std::optional<PeerChunkMap> replacement;
    if (single) {
        std::scoped_lock lock(assembly_mutex_);
        assemblies_.erase(key);
        replacement = std::move(chunks);
    } else {
        const auto& batch = *announcement->batch_info;
        std::scoped_lock lock(assembly_mutex_);
        auto& assembly = assemblies_[key];
        if (!assembly.timestamp.empty() && announcement->timestamp < assembly.timestamp) {
            kLog.debug("listener.stale_batch", {{"peer", key}, {"timestamp", announcement->timestamp}});
            return false;
        }
        if (assembly.timestamp != announcement->timestamp || assembly.total != batch.total) {
            assembly = Assembly{};
            assembly.timestamp = announcement->timestamp;
            assembly.total = batch.total;
        }
        assembly.received.insert(batch.current);
        for (const auto& [name, checksum] : chunks) {
            assembly.chunks.insert_or_assign(name, checksum);
        }
        if (assembly.received.size() == assembly.total) {
            replacement = std::move(assembly.chunks);
            assemblies_.erase(key);
        }
    }

    bool changed = false;
    if (replacement) {
        changed = directory_.update_peer(key, std::move(*replacement));
    } else {
        changed = directory_.merge_peer(key, chunks);
    }

    if (changed) {
        kLog.info("listener.peer_updated", {{"peer", key}, {"chunks", std::to_string(announcement->chunks.size())}});
        persist();
    }
    return changed;
}

void Listener::receive_loop() {
    std::vector<std::uint8_t> buffer(kMaxDatagram);
    while (running_) {
        std::string sender;
        const auto received = recv_datagram(socket_, buffer.data(), buffer.size(), sender);
        if (received < 0) {
            continue;
        }
        datagrams_received_.fetch_add(1);
        kLog.debug("listener.datagram", {{"sender", sender}, {"bytes", std::to_string(received)}});
        handle_datagram(std::string_view(reinterpret_cast<const char*>(buffer.data()),
                                         static_cast<std::size_t>(received)));
    }
}

}  // namespace chunknet::network
