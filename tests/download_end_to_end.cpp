#include "chunknet/core/DownloadCoordinator.hpp"
#include "chunknet/network/ChunkServer.hpp"
#include "chunknet/storage/FileSplitter.hpp"

#include "test_support.hpp"

#include <cassert>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

using namespace chunknet;
using namespace std::chrono_literals;

namespace {

ContentDirectory directory_for(const storage::ChunkStore& store, const std::string& peer) {
    ContentDirectory directory;
    for (const auto& [chunk, metadata] : store.scan_inventory()) {
        directory[chunk] = ContentEntry{metadata.checksum, {peer}};
    }
    return directory;
}

std::size_t count_files(const std::filesystem::path& directory) {
    std::size_t count = 0;
    for (const auto& entry : std::filesystem::directory_iterator(directory)) {
        (void)entry;
        ++count;
    }
    return count;
}

}  // namespace

int main() {
    test::quiet_logs();
    test::ScratchDir scratch("download_e2e");

    // Seeder: a 500 KB file split into five 100 KB chunks, served over TCP.
    const auto original = test::make_payload(500 * 1024, 42);
    test::write_file(scratch / "movie.mp4", original);
    storage::ChunkStore seeder_store(scratch / "seeder");
    storage::FileSplitter splitter(seeder_store, 100 * 1024);
    assert(splitter.split(scratch / "movie.mp4") == 5);

    network::ChunkServer server(seeder_store, 5s);
    server.start("127.0.0.1", 0);
    const auto peer = "127.0.0.1:" + std::to_string(server.port());
    const auto directory = directory_for(seeder_store, peer);
    assert(directory.size() == 5);

    // Leecher.
    storage::ChunkStore leecher_store(scratch / "leecher");
    network::ConnectionPool::Options pool_options{};
    pool_options.connect_timeout = 2s;
    pool_options.io_timeout = 5s;
    network::ConnectionPool pool(pool_options);

    core::DownloadCoordinator::Options options{};
    options.max_workers = 3;
    options.timeout = 30s;
    options.queue_poll = 100ms;
    core::DownloadCoordinator coordinator(pool, leecher_store, options);

    const auto tasks = core::DownloadCoordinator::resolve(directory, "movie.mp4");
    assert(tasks.size() == 5);
    assert(tasks.front().name == "movie_1.mp4");
    assert(tasks.back().name == "movie_5.mp4");
    assert(tasks.front().peers.front() == peer);

    const auto output = scratch / "downloads" / "movie.mp4";
    const auto result = coordinator.download("movie.mp4", directory, output);
    assert(result.ok());
    assert(result.status == core::DownloadStatus::Completed);
    assert(result.missing_chunks.empty());
    assert(result.output == output);
    assert(test::read_file(output) == original);

    // Verified chunks are consumed by reassembly and no temp files remain.
    assert(count_files(leecher_store.directory()) == 0);
    assert(!std::filesystem::exists(output.string() + ".part"));

    // One pooled connection was reused for every chunk from the single peer.
    assert(pool.size() == 1);
    assert(server.requests_handled() == 5);

    // Unknown content resolves to nothing.
    const auto missing = coordinator.download("other.mp4", directory, scratch / "downloads" / "other.mp4");
    assert(missing.status == core::DownloadStatus::NoChunks);
    assert(!std::filesystem::exists(scratch / "downloads" / "other.mp4"));

    // A directory with a hole in the ordinal sequence fails before any transfer.
    {
        auto gapped = directory;
        gapped.erase("movie_3.mp4");
        const auto gapped_output = scratch / "downloads" / "gapped.mp4";
        const auto gapped_result = coordinator.download("movie.mp4", gapped, gapped_output);
        assert(gapped_result.status == core::DownloadStatus::Exhausted);
        assert((gapped_result.missing_chunks == std::vector<std::string>{"movie_3.mp4"}));
        assert(!std::filesystem::exists(gapped_output));
        assert(server.requests_handled() == 5);

        auto leading = directory;
        leading.erase("movie_1.mp4");
        const auto tasks_without_first = core::DownloadCoordinator::resolve(leading, "movie.mp4");
        assert((core::DownloadCoordinator::sequence_gaps(tasks_without_first, "movie.mp4") ==
                std::vector<std::string>{"movie_1.mp4"}));
    }

    // Chunks of the extensionless item "movie" do not leak into "movie.mp4".
    {
        auto mixed = directory;
        mixed["movie_1"] = ContentEntry{std::string(64, '0'), {peer}};
        mixed["movie_6"] = ContentEntry{std::string(64, '0'), {peer}};
        const auto mixed_tasks = core::DownloadCoordinator::resolve(mixed, "movie.mp4");
        assert(mixed_tasks.size() == 5);
        for (const auto& task : mixed_tasks) {
            assert(task.name.ends_with(".mp4"));
        }
        assert(core::DownloadCoordinator::sequence_gaps(mixed_tasks, "movie.mp4").empty());

        const auto bare_tasks = core::DownloadCoordinator::resolve(mixed, "movie");
        assert(bare_tasks.size() == 2);
        assert(bare_tasks.front().name == "movie_1");
        assert((core::DownloadCoordinator::sequence_gaps(bare_tasks, "movie") ==
                std::vector<std::string>{"movie_2", "movie_3", "movie_4", "movie_5"}));

        const auto mixed_output = scratch / "downloads" / "mixed.mp4";
        const auto mixed_result = coordinator.download("movie.mp4", mixed, mixed_output);
        assert(mixed_result.ok());
        assert(test::read_file(mixed_output) == original);
        assert(server.requests_handled() == 10);
    }

    // Two spellings of one ordinal yield a single task.
    {
        auto doubled = directory;
        doubled["movie_01.mp4"] = doubled.at("movie_1.mp4");
        const auto doubled_tasks = core::DownloadCoordinator::resolve(doubled, "movie.mp4");
        assert(doubled_tasks.size() == 5);
        assert(doubled_tasks.front().name == "movie_01.mp4");
        assert(doubled_tasks[1].name == "movie_2.mp4");
    }

    // Uppercase checksums in the directory still verify.
    test::write_file(scratch / "clip.bin", test::make_payload(1500, 7));
    storage::FileSplitter small_splitter(seeder_store, 1000);
    assert(small_splitter.split(scratch / "clip.bin") == 2);
    auto upper = directory_for(seeder_store, peer);
    for (auto& [chunk, entry] : upper) {
        for (auto& ch : entry.checksum) {
            ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
        }
    }
    const auto clip = coordinator.download("clip.bin", upper, scratch / "downloads" / "clip.bin");
    assert(clip.ok());
    assert(test::read_file(scratch / "downloads" / "clip.bin") == test::make_payload(1500, 7));

    pool.close_all();
    server.stop();
    return 0;
}
