#include "chunknet/storage/Stitcher.hpp"

#include "test_support.hpp"

#include <cassert>
#include <filesystem>
#include <string>
#include <vector>

using namespace chunknet;

int main() {
    test::quiet_logs();
    test::ScratchDir scratch("stitcher");
    storage::ChunkStore store(scratch / "chunks");
    assert(store.ensure_directory());

    // Eleven single-byte chunks: numeric order puts _2 before _10 and _11.
    std::vector<std::uint8_t> expected;
    for (int i = 1; i <= 11; ++i) {
        const std::vector<std::uint8_t> byte{static_cast<std::uint8_t>(i)};
        test::write_file(*store.chunk_path("f_" + std::to_string(i) + ".txt"), byte);
        expected.push_back(static_cast<std::uint8_t>(i));
    }
    test::write_file(*store.chunk_path("g_1.txt"), std::vector<std::uint8_t>{0xEE});

    const auto chunks = storage::sort_by_ordinal(store.list_chunks(), "f.txt");
    assert(chunks.size() == 11);
    assert(chunks[1] == "f_2.txt");
    assert(chunks[9] == "f_10.txt");
    assert(chunks[10] == "f_11.txt");

    const auto output = scratch / "downloads" / "f.txt";
    assert(storage::stitch(store, chunks, output));
    assert(test::read_file(output) == expected);
    assert(!std::filesystem::exists(output.string() + ".part"));

    // Consumed chunks are deleted; unrelated ones are kept.
    assert(storage::sort_by_ordinal(store.list_chunks(), "f.txt").empty());
    assert(store.contains("g_1.txt"));

    // A missing chunk fails without leaving an output and keeps the chunks it had.
    test::write_file(*store.chunk_path("h_1.bin"), std::vector<std::uint8_t>{1});
    const auto failed = scratch / "downloads" / "h.bin";
    assert(!storage::stitch(store, {"h_1.bin", "h_2.bin"}, failed));
    assert(!std::filesystem::exists(failed));
    assert(!std::filesystem::exists(failed.string() + ".part"));
    assert(store.contains("h_1.bin"));

    assert(!storage::stitch(store, {}, scratch / "downloads" / "none.bin"));

    return 0;
}
