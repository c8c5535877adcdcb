#pragma once

#include "chunknet/crypto/Sha256.hpp"
#include "chunknet/logging/StructuredLogger.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace chunknet::test {

// Fresh directory under the system temp dir, removed on destruction.
class ScratchDir {
public:
    explicit ScratchDir(std::string_view label) {
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path() /
                ("chunknet_" + std::string(label) + "_" + std::to_string(stamp));
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }

    ~ScratchDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::filesystem::path operator/(std::string_view name) const { return path_ / std::string(name); }

private:
    std::filesystem::path path_;
};

inline std::vector<std::uint8_t> make_payload(std::size_t size, std::uint32_t seed) {
    std::vector<std::uint8_t> data(size);
    auto state = seed * 2654435761u + 1u;
    for (auto& byte : data) {
        state = state * 1103515245u + 12345u;
        byte = static_cast<std::uint8_t>(state >> 16);
    }
    return data;
}

inline void write_file(const std::filesystem::path& path, std::span<const std::uint8_t> data) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
}

inline void write_text(const std::filesystem::path& path, std::string_view text) {
    std::ofstream out(path, std::ios::trunc);
    out << text;
}

inline std::vector<std::uint8_t> read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<std::uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline std::string checksum_of(std::span<const std::uint8_t> data) {
    return crypto::Sha256::hex_digest(data);
}

inline void quiet_logs() {
    logging::StructuredLogger::instance().set_min_level(logging::StructuredLogger::Level::Error);
}

}  // namespace chunknet::test
