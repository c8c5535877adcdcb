#pragma once

#include "chunknet/storage/ChunkStore.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace chunknet::storage {

// Sorts names belonging to `content_name` by numeric ordinal (_2 before _11); other names are
// dropped. The sort is stable, so names sharing an ordinal keep their input order.
std::vector<std::string> sort_by_ordinal(std::vector<std::string> names, std::string_view content_name);

// Concatenates `chunks` in the given order into <output>.part, renames it to `output`, then
// deletes the consumed chunk files. On failure nothing is left at `output` and chunks are kept.
bool stitch(const ChunkStore& store, const std::vector<std::string>& chunks, const std::filesystem::path& output);

}  // namespace chunknet::storage
