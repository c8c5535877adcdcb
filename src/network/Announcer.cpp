#include "chunknet/network/Announcer.hpp"

#include "chunknet/Types.hpp"
#include "chunknet/logging/StructuredLogger.hpp"
#include "chunknet/protocol/Announcement.hpp"

#include <stdexcept>

namespace chunknet::network {

namespace {

const logging::ComponentLogger kLog{"announcer"};

constexpr const char* kGlobalBroadcast = "255.255.255.255";
constexpr const char* kLoopback = "127.0.0.1";

}  // namespace

Announcer::Announcer(const storage::ChunkStore& store, Options options)
    : store_(store), options_(std::move(options)) {}

Announcer::~Announcer() {
    stop();
    close_socket(socket_);
}

void Announcer::start() {
    if (task_) {
        return;
    }
    if (!ensure_socket()) {
        throw std::runtime_error("Failed to open announcement socket");
    }
    kLog.info("announce.start", {{"ports", std::to_string(options_.target_ports.size())},
                                 {"interval_ms", std::to_string(options_.interval.count())}});
    announce_once();
    task_ = std::make_unique<core::BackgroundTask>("announcer", options_.interval, [this] { announce_once(); });
    task_->start();
}

void Announcer::stop() {
    if (task_) {
        task_->stop();
        task_.reset();
        kLog.info("announce.stop");
    }
}

std::size_t Announcer::announce_once() {
    if (!ensure_socket()) {
        return 0;
    }

    const auto inventory = store_.scan_inventory();
    if (inventory.empty()) {
        kLog.info("announce.no_chunks");
        return 0;
    }

    const auto detected_ip = local_ipv4_address();
    const auto local_ip = detected_ip.value_or(kLoopback);
    const auto peer_ip = options_.advertised_ip.value_or(local_ip);

    const auto plan = protocol::plan_batches(peer_ip,
                                             options_.peer_port,
                                             inventory,
                                             format_local_timestamp(),
                                             options_.batch_size,
                                             options_.max_datagram);
    if (plan.batch_size < options_.batch_size) {
        kLog.warn("announce.batch_reduced", {{"batch_size", std::to_string(plan.batch_size)}});
    }
    for (const auto& chunk : plan.oversized) {
        kLog.error("announce.entry_too_large", {{"chunk", chunk}});
    }

    std::size_t delivered = 0;
    for (std::size_t index = 0; index < plan.datagrams.size(); ++index) {
        const auto label = std::to_string(index + 1) + "/" + std::to_string(plan.datagrams.size());
        bool any = false;
        for (const auto port : options_.target_ports) {
            any = deliver(plan.datagrams[index], port, local_ip, label) || any;
        }
        if (any) {
            ++delivered;
        }
    }

    kLog.info("announce.cycle", {{"chunks", std::to_string(inventory.size())},
                                 {"batches", std::to_string(plan.datagrams.size())},
                                 {"delivered", std::to_string(delivered)}});
    return delivered;
}

std::string Announcer::subnet_broadcast_address(const std::string& local_ip) {
    if (local_ip.starts_with("127.")) {
        return kGlobalBroadcast;
    }
    const auto last_dot = local_ip.rfind('.');
    if (last_dot == std::string::npos) {
        return kGlobalBroadcast;
    }
    return local_ip.substr(0, last_dot) + ".255";
}

bool Announcer::ensure_socket() {
    if (socket_ != INVALID_SOCKET_HANDLE) {
        return true;
    }
    try {
        socket_ = open_udp_socket("0.0.0.0", 0, true);
    } catch (const std::runtime_error& ex) {
        kLog.error("announce.socket_failed", {{"error", ex.what()}});
        return false;
    }
    return true;
}

bool Announcer::deliver(const std::string& datagram,
                        std::uint16_t port,
                        const std::string& local_ip,
                        const std::string& label) {
    for (const auto strategy : options_.delivery) {
        std::string destination;
        const char* name = "";
        switch (strategy) {
            case Delivery::SubnetBroadcast:
                destination = subnet_broadcast_address(local_ip);
                name = "subnet";
                break;
            case Delivery::GlobalBroadcast:
                destination = kGlobalBroadcast;
                name = "global";
                break;
            case Delivery::Loopback:
                destination = kLoopback;
                name = "loopback";
                break;
        }

        if (send_datagram(socket_, destination, port, datagram)) {
            kLog.debug("announce.batch_sent", {{"batch", label},
                                               {"strategy", name},
                                               {"destination", destination + ":" + std::to_string(port)},
                                               {"bytes", std::to_string(datagram.size())}});
            return true;
        }
        kLog.warn("announce.send_failed", {{"batch", label},
                                           {"strategy", name},
                                           {"destination", destination + ":" + std::to_string(port)},
                                           {"error", std::to_string(last_network_error())}});
    }
    kLog.error("announce.port_unreachable", {{"batch", label}, {"port", std::to_string(port)}});
    return false;
}

}  // namespace chunknet::network
