#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace chunknet::protocol {

// Request frame: 4-byte big-endian body length, then {"chunk": "<name>"}.
constexpr std::size_t kLengthFieldSize = 4;
constexpr std::size_t kMaxRequestBody = 4096;

// Response: one header line ("<size>\n" or the not-found token) followed by the raw bytes.
constexpr std::size_t kMaxHeaderLine = 64;
constexpr std::string_view kNotFoundToken = "ERROR: Chunk not found";
constexpr std::size_t kStreamBlockSize = 4096;

std::array<std::uint8_t, kLengthFieldSize> encode_length(std::uint32_t length);
std::uint32_t decode_length(std::span<const std::uint8_t, kLengthFieldSize> bytes);

std::vector<std::uint8_t> encode_request(std::string_view chunk_name);

enum class RequestError {
    None,
    Malformed,
    MissingChunk
};

struct ChunkRequest {
    RequestError error{RequestError::None};
    std::string chunk;
};

ChunkRequest decode_request_body(std::string_view body);

std::string size_header(std::uint64_t size);
std::string not_found_header();

enum class ResponseKind {
    Size,
    NotFound,
    Invalid
};

struct ResponseHeader {
    ResponseKind kind{ResponseKind::Invalid};
    std::uint64_t size{0};
};

// `line` excludes the terminating newline.
ResponseHeader parse_response_header(std::string_view line);

}  // namespace chunknet::protocol
