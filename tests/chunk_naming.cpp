#include "chunknet/Types.hpp"
#include "chunknet/storage/ChunkStore.hpp"
#include "chunknet/storage/Stitcher.hpp"

#include <cassert>
#include <string>
#include <vector>

using chunknet::chunk_ordinal;
using chunknet::make_chunk_name;
using chunknet::split_content_name;
using chunknet::storage::ChunkStore;

int main() {
    const auto movie = split_content_name("movie.mp4");
    assert(movie.base == "movie");
    assert(movie.extension == ".mp4");

    const auto bare = split_content_name("README");
    assert(bare.base == "README");
    assert(bare.extension.empty());

    const auto archive = split_content_name("backup.tar.gz");
    assert(archive.base == "backup.tar");
    assert(archive.extension == ".gz");

    assert(make_chunk_name("movie", 3, ".mp4") == "movie_3.mp4");
    assert(make_chunk_name("README", 12, "") == "README_12");

    assert(chunk_ordinal("movie_3.mp4", "movie", ".mp4") == 3u);
    assert(chunk_ordinal("movie_11.mp4", "movie", ".mp4") == 11u);
    assert(chunk_ordinal("README_7", "README", "") == 7u);
    assert(!chunk_ordinal("movie_x.mp4", "movie", ".mp4"));
    assert(!chunk_ordinal("movie_3.mkv", "movie", ".mp4"));
    assert(!chunk_ordinal("moviefoo_3.mp4", "movie", ".mp4"));
    assert(!chunk_ordinal("movie.mp4", "movie", ".mp4"));
    assert(!chunk_ordinal("movie_", "movie", ".mp4"));

    // Numeric ordering: _2 comes before _11.
    const std::vector<std::string> shuffled{"f_11.txt", "f_2.txt", "f_1.txt", "g_1.txt", "f_10.txt", "notes.txt"};
    const auto ordered = chunknet::storage::sort_by_ordinal(shuffled, "f.txt");
    const std::vector<std::string> expected{"f_1.txt", "f_2.txt", "f_10.txt", "f_11.txt"};
    assert(ordered == expected);

    assert(ChunkStore::is_valid_chunk_name("movie_1.mp4"));
    assert(!ChunkStore::is_valid_chunk_name(""));
    assert(!ChunkStore::is_valid_chunk_name(".hidden_1"));
    assert(!ChunkStore::is_valid_chunk_name("../etc/passwd"));
    assert(!ChunkStore::is_valid_chunk_name("dir/file_1"));
    assert(!ChunkStore::is_valid_chunk_name("dir\\file_1"));

    const auto hex = chunknet::to_hex(std::vector<std::uint8_t>{0x00, 0x0f, 0xa0, 0xff});
    assert(hex == "000fa0ff");

    return 0;
}
