#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chunknet {

struct Config {
    std::size_t chunk_size{100 * 1024};
    std::string broadcast_ip{"0.0.0.0"};
    std::uint16_t broadcast_port{5001};
    std::uint16_t peer_port{5000};
    std::vector<std::uint16_t> target_ports{5001, 5002};
    std::size_t max_connections{10};
    std::chrono::seconds connection_timeout{std::chrono::seconds(300)};
    std::chrono::seconds announce_interval{std::chrono::seconds(10)};
    std::chrono::seconds peer_timeout{std::chrono::seconds(300)};
    std::chrono::seconds reaper_interval{std::chrono::seconds(60)};
    std::chrono::milliseconds connect_timeout{std::chrono::seconds(10)};
    std::chrono::milliseconds io_timeout{std::chrono::seconds(10)};
    std::chrono::milliseconds server_idle_timeout{std::chrono::seconds(30)};
    std::chrono::seconds download_timeout{std::chrono::seconds(300)};
    std::size_t download_workers{5};
    std::chrono::milliseconds queue_poll_interval{std::chrono::seconds(1)};
    std::size_t announce_batch_size{8};
    std::size_t announce_max_datagram{60000};
    std::string chunk_dir{"./chunks/"};
    std::string log_dir{"./logs/"};
    std::string downloads_dir{"./downloads/"};
    std::string content_dict_path{"./content_dict.json"};
    std::optional<std::uint16_t> peer_id{};
    std::string log_level{"info"};
};

}  // namespace chunknet
