#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace chunknet {

// Lowercase hex SHA-256 of a chunk's bytes.
using Checksum = std::string;

struct ChunkMetadata {
    std::uint64_t size{0};
    Checksum checksum;
    std::string timestamp;
};

// Chunk name -> metadata, as carried by one announcement.
using ChunkInventory = std::map<std::string, ChunkMetadata>;

// Chunk name -> checksum, as last reported by one peer.
using PeerChunkMap = std::map<std::string, Checksum>;

struct ContentEntry {
    Checksum checksum;
    std::vector<std::string> peers;

    bool operator==(const ContentEntry&) const = default;
};

using ContentDirectory = std::map<std::string, ContentEntry>;

struct ContentName {
    std::string base;
    std::string extension;
};

// "movie.mp4" -> {"movie", ".mp4"}
ContentName split_content_name(std::string_view content_name);

// {"movie", 3, ".mp4"} -> "movie_3.mp4"
std::string make_chunk_name(std::string_view base, std::uint64_t ordinal, std::string_view extension);

// Ordinal of a chunk belonging to base/extension, or nullopt when the name does not
// have the shape base + "_" + digits [+ extension].
std::optional<std::uint64_t> chunk_ordinal(std::string_view chunk_name,
                                           std::string_view base,
                                           std::string_view extension);

std::string to_hex(std::span<const std::uint8_t> bytes);

// Wall-clock time formatted as "YYYY-MM-DD HH:MM:SS" (local time).
std::string format_local_timestamp();

}  // namespace chunknet
