#include "chunknet/storage/FileSplitter.hpp"
#include "chunknet/storage/Stitcher.hpp"

#include "test_support.hpp"

#include <cassert>
#include <string>
#include <vector>

using namespace chunknet;

int main() {
    test::quiet_logs();
    test::ScratchDir scratch("splitter");

    const auto source = scratch / "movie.mp4";
    const auto payload = test::make_payload(250 * 1024, 3);
    test::write_file(source, payload);

    storage::ChunkStore store(scratch / "chunks");
    storage::FileSplitter splitter(store, 100 * 1024);
    assert(splitter.split(source) == 3);

    const std::vector<std::string> expected{"movie_1.mp4", "movie_2.mp4", "movie_3.mp4"};
    assert(store.list_chunks() == expected);
    assert(test::read_file(*store.chunk_path("movie_1.mp4")).size() == 100 * 1024);
    assert(test::read_file(*store.chunk_path("movie_3.mp4")).size() == 50 * 1024);

    // The inventory carries each chunk's size and SHA-256.
    const auto inventory = store.scan_inventory();
    assert(inventory.size() == 3);
    const std::vector<std::uint8_t> first_chunk(payload.begin(), payload.begin() + 100 * 1024);
    assert(inventory.at("movie_1.mp4").checksum == test::checksum_of(first_chunk));
    assert(inventory.at("movie_1.mp4").size == 100 * 1024);
    assert(!inventory.at("movie_3.mp4").timestamp.empty());

    // Exact multiple of the chunk size.
    const auto exact = scratch / "exact.bin";
    test::write_file(exact, test::make_payload(200 * 1024, 4));
    assert(splitter.split(exact) == 2);
    assert(!store.contains("exact_3.bin"));

    // Files without an extension.
    const auto bare = scratch / "README";
    test::write_file(bare, test::make_payload(10, 5));
    assert(splitter.split(bare) == 1);
    assert(store.contains("README_1"));

    assert(splitter.split(scratch / "missing.bin") == 0);

    // Splitting then stitching restores the original bytes.
    const auto chunks = storage::sort_by_ordinal(store.list_chunks(), "movie.mp4");
    assert(chunks == expected);
    const auto rebuilt = scratch / "out" / "movie.mp4";
    assert(storage::stitch(store, chunks, rebuilt));
    assert(test::read_file(rebuilt) == payload);

    return 0;
}
