#include "chunknet/protocol/ChunkTransfer.hpp"

#include "chunknet/protocol/Json.hpp"

#include <charconv>

namespace chunknet::protocol {

std::array<std::uint8_t, kLengthFieldSize> encode_length(std::uint32_t length) {
    return {static_cast<std::uint8_t>((length >> 24) & 0xFFu),
            static_cast<std::uint8_t>((length >> 16) & 0xFFu),
            static_cast<std::uint8_t>((length >> 8) & 0xFFu),
            static_cast<std::uint8_t>(length & 0xFFu)};
}

std::uint32_t decode_length(std::span<const std::uint8_t, kLengthFieldSize> bytes) {
    return (static_cast<std::uint32_t>(bytes[0]) << 24)
        | (static_cast<std::uint32_t>(bytes[1]) << 16)
        | (static_cast<std::uint32_t>(bytes[2]) << 8)
        | static_cast<std::uint32_t>(bytes[3]);
}

std::vector<std::uint8_t> encode_request(std::string_view chunk_name) {
    auto document = json::Value::make_object();
    document.as_object()["chunk"] = json::Value(std::string(chunk_name));
    const auto body = json::dump(document);

    std::vector<std::uint8_t> frame;
    frame.reserve(kLengthFieldSize + body.size());
    const auto length = encode_length(static_cast<std::uint32_t>(body.size()));
    frame.insert(frame.end(), length.begin(), length.end());
    frame.insert(frame.end(), body.begin(), body.end());
    return frame;
}

ChunkRequest decode_request_body(std::string_view body) {
    ChunkRequest request{};
    const auto document = json::try_parse(body);
    if (!document || !document->is_object()) {
        request.error = RequestError::Malformed;
        return request;
    }
    const auto* chunk = document->find("chunk");
    if (!chunk || !chunk->is_string() || chunk->string_value.empty()) {
        request.error = RequestError::MissingChunk;
        return request;
    }
    request.chunk = chunk->string_value;
    return request;
}

std::string size_header(std::uint64_t size) {
    return std::to_string(size) + "\n";
}

std::string not_found_header() {
    return std::string(kNotFoundToken) + "\n";
}

ResponseHeader parse_response_header(std::string_view line) {
    ResponseHeader header{};
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }
    if (line.starts_with("ERROR:")) {
        header.kind = ResponseKind::NotFound;
        return header;
    }
    if (line.empty()) {
        return header;
    }

    std::uint64_t size = 0;
    const auto result = std::from_chars(line.data(), line.data() + line.size(), size);
    if (result.ec != std::errc{} || result.ptr != line.data() + line.size()) {
        return header;
    }
    header.kind = ResponseKind::Size;
    header.size = size;
    return header;
}

}  // namespace chunknet::protocol
