#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>

namespace chunknet::crypto {

// Incremental SHA-256. Chunk checksums are the lowercase hex form of the digest.
class Sha256 {
public:
    using Digest = std::array<std::uint8_t, 32>;

    Sha256();

    void update(std::span<const std::uint8_t> data);
    void update(const char* data, std::size_t length);
    Digest finalize();
    std::string finalize_hex();

    static Digest digest(std::span<const std::uint8_t> data);
    static std::string hex_digest(std::span<const std::uint8_t> data);

    // Streams the file in 64 KiB reads; nullopt when it cannot be opened or read.
    static std::optional<std::string> file_hex_digest(const std::filesystem::path& path);

private:
    void transform(const std::uint8_t block[64]);
    void reset();

    std::array<std::uint32_t, 8> state_{};
    std::array<std::uint8_t, 64> buffer_{};
    std::size_t buffer_size_{0};
    std::uint64_t bit_len_{0};
};

}  // namespace chunknet::crypto
