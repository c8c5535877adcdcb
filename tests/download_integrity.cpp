#include "chunknet/core/DownloadCoordinator.hpp"
#include "chunknet/network/ChunkServer.hpp"
#include "chunknet/storage/FileSplitter.hpp"

#include "test_support.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

using namespace chunknet;
using namespace std::chrono_literals;

int main() {
    test::quiet_logs();
    test::ScratchDir scratch("download_integrity");

    const auto original = test::make_payload(500 * 1024, 11);
    test::write_file(scratch / "movie.mp4", original);
    storage::ChunkStore seeder_store(scratch / "seeder");
    storage::FileSplitter splitter(seeder_store, 100 * 1024);
    assert(splitter.split(scratch / "movie.mp4") == 5);

    network::ChunkServer server(seeder_store, 5s);
    server.start("127.0.0.1", 0);
    const auto peer = "127.0.0.1:" + std::to_string(server.port());

    ContentDirectory directory;
    for (const auto& [chunk, metadata] : seeder_store.scan_inventory()) {
        directory[chunk] = ContentEntry{metadata.checksum, {peer}};
    }

    // Flip one byte of chunk 3 after its checksum was advertised.
    const auto third = *seeder_store.chunk_path("movie_3.mp4");
    auto bytes = test::read_file(third);
    bytes[1234] ^= 0x40;
    test::write_file(third, bytes);

    std::vector<std::pair<std::string, core::TransferOutcome>> attempts;
    std::mutex attempts_mutex;
    core::DownloadCoordinator::TestHooks hooks{};
    hooks.after_attempt = [&](const std::string&, const std::string& chunk, core::TransferOutcome outcome) {
        std::scoped_lock lock(attempts_mutex);
        attempts.emplace_back(chunk, outcome);
    };
    core::DownloadCoordinator::set_test_hooks(&hooks);

    storage::ChunkStore leecher_store(scratch / "leecher");
    network::ConnectionPool pool(network::ConnectionPool::Options{});
    core::DownloadCoordinator::Options options{};
    options.timeout = 30s;
    options.queue_poll = 100ms;
    core::DownloadCoordinator coordinator(pool, leecher_store, options);

    const auto output = scratch / "downloads" / "movie.mp4";
    const auto result = coordinator.download("movie.mp4", directory, output);
    core::DownloadCoordinator::set_test_hooks(nullptr);

    assert(!result.ok());
    assert(result.status == core::DownloadStatus::Exhausted);
    assert((result.missing_chunks == std::vector<std::string>{"movie_3.mp4"}));
    assert(!std::filesystem::exists(output));
    assert(!std::filesystem::exists(output.string() + ".part"));

    // The corrupt chunk was rejected and never committed; the good ones were kept.
    assert(!leecher_store.contains("movie_3.mp4"));
    assert(leecher_store.contains("movie_1.mp4"));
    assert(leecher_store.list_chunks().size() == 4);

    std::size_t integrity_failures = 0;
    for (const auto& [chunk, outcome] : attempts) {
        if (outcome == core::TransferOutcome::IntegrityError) {
            assert(chunk == "movie_3.mp4");
            ++integrity_failures;
        }
    }
    assert(integrity_failures == 1);
    assert(attempts.size() == 5);

    pool.close_all();
    server.stop();
    return 0;
}
