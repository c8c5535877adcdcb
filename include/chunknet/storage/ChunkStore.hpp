#pragma once

#include "chunknet/Types.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chunknet::storage {

// Flat directory of chunk files named <base>_<ordinal><ext>. In-flight downloads live in
// hidden ".<name>.<n>.tmp" files that are never listed or served.
class ChunkStore {
public:
    explicit ChunkStore(std::filesystem::path directory);

    const std::filesystem::path& directory() const noexcept { return directory_; }
    bool ensure_directory() const;

    // Rejects empty names, path separators, "..", and hidden names.
    static bool is_valid_chunk_name(std::string_view name);

    std::optional<std::filesystem::path> chunk_path(std::string_view name) const;
    bool contains(std::string_view name) const;

    // Sorted names of the regular chunk files in the directory.
    std::vector<std::string> list_chunks() const;

    // Size, checksum and observation time for every listed chunk. Unreadable files are skipped.
    ChunkInventory scan_inventory() const;

    std::filesystem::path make_temp_path(std::string_view name);
    // Renames a finished temp file to its chunk name.
    bool commit(const std::filesystem::path& temp, std::string_view name) const;
    bool remove(std::string_view name) const;

private:
    std::filesystem::path directory_;
    std::atomic<std::uint64_t> temp_counter_{0};
};

}  // namespace chunknet::storage
