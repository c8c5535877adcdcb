#pragma once

#include "chunknet/Types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace chunknet::directory {

std::string encode_content_directory(const ContentDirectory& directory);
// nullopt when the text is not a chunk -> {checksum, peers} object.
std::optional<ContentDirectory> decode_content_directory(std::string_view text);

// Missing file -> empty directory; unreadable or malformed file -> nullopt.
std::optional<ContentDirectory> load_content_directory(const std::filesystem::path& path);

// Writes <path>.tmp and renames it over <path>.
bool save_content_directory(const ContentDirectory& directory, const std::filesystem::path& path);

}  // namespace chunknet::directory
