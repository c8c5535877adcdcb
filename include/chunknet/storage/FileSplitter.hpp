#pragma once

#include "chunknet/storage/ChunkStore.hpp"

#include <cstddef>
#include <filesystem>

namespace chunknet::storage {

class FileSplitter {
public:
    FileSplitter(ChunkStore& store, std::size_t chunk_size);

    // Writes <stem>_<n><ext> for n = 1.. into the store. Returns the chunk count, 0 on failure.
    std::size_t split(const std::filesystem::path& source);

private:
    ChunkStore& store_;
    std::size_t chunk_size_;
};

}  // namespace chunknet::storage
