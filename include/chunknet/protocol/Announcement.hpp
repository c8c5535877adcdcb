#pragma once

#include "chunknet/Types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chunknet::protocol {

struct BatchInfo {
    std::uint32_t current{1};
    std::uint32_t total{1};
};

// One inventory datagram. peer_port is only present when the sender's chunk server
// does not listen on the shared default port.
struct Announcement {
    std::string peer_ip;
    std::optional<std::uint16_t> peer_port;
    ChunkInventory chunks;
    std::string timestamp;
    std::optional<BatchInfo> batch_info;
};

std::string encode_announcement(const Announcement& announcement);

// nullopt for malformed JSON or a document missing peer_ip/chunks.
std::optional<Announcement> decode_announcement(std::string_view datagram);

struct BatchPlan {
    std::vector<std::string> datagrams;
    std::size_t batch_size{0};
    // Entries that exceed max_datagram even alone; they are never announced.
    std::vector<std::string> oversized;
};

// Splits the inventory into datagrams of at most batch_size entries. When an encoded batch is
// larger than max_datagram the batch size is halved and the whole split redone.
BatchPlan plan_batches(const std::string& peer_ip,
                       std::optional<std::uint16_t> peer_port,
                       const ChunkInventory& inventory,
                       const std::string& timestamp,
                       std::size_t batch_size,
                       std::size_t max_datagram);

}  // namespace chunknet::protocol
