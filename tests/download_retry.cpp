#include "chunknet/core/DownloadCoordinator.hpp"
#include "chunknet/network/ChunkServer.hpp"
#include "chunknet/storage/FileSplitter.hpp"

#include "test_support.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

using namespace chunknet;
using namespace std::chrono_literals;

namespace {

struct AttemptLog {
    std::mutex mutex;
    std::map<std::pair<std::string, std::string>, std::vector<core::TransferOutcome>> attempts;

    void record(const std::string& peer, const std::string& chunk, core::TransferOutcome outcome) {
        std::scoped_lock lock(mutex);
        attempts[{peer, chunk}].push_back(outcome);
    }

    std::vector<core::TransferOutcome> of(const std::string& peer, const std::string& chunk) {
        std::scoped_lock lock(mutex);
        return attempts[{peer, chunk}];
    }
};

std::uint16_t unused_port() {
    std::uint16_t port = 0;
    const auto socket = network::open_tcp_listener("127.0.0.1", 0, port);
    network::close_socket(socket);
    return port;
}

}  // namespace

int main() {
    test::quiet_logs();
    test::ScratchDir scratch("download_retry");

    const auto original = test::make_payload(300 * 1024, 23);
    test::write_file(scratch / "movie.mp4", original);

    // P1 holds a corrupted copy of chunk 2; P2 holds the genuine chunks.
    storage::ChunkStore good_store(scratch / "good");
    assert(storage::FileSplitter(good_store, 100 * 1024).split(scratch / "movie.mp4") == 3);
    storage::ChunkStore bad_store(scratch / "bad");
    assert(storage::FileSplitter(bad_store, 100 * 1024).split(scratch / "movie.mp4") == 3);
    const auto bad_chunk = *bad_store.chunk_path("movie_2.mp4");
    auto bytes = test::read_file(bad_chunk);
    bytes.front() ^= 0xFF;
    test::write_file(bad_chunk, bytes);

    network::ChunkServer bad_server(bad_store, 5s);
    bad_server.start("127.0.0.1", 0);
    network::ChunkServer good_server(good_store, 5s);
    good_server.start("127.0.0.1", 0);

    const auto refused = "127.0.0.1:" + std::to_string(unused_port());
    const auto p1 = "127.0.0.1:" + std::to_string(bad_server.port());
    const auto p2 = "127.0.0.1:" + std::to_string(good_server.port());

    ContentDirectory directory;
    for (const auto& [chunk, metadata] : good_store.scan_inventory()) {
        directory[chunk] = ContentEntry{metadata.checksum, {refused, p1, p2}};
    }

    AttemptLog log;
    core::DownloadCoordinator::TestHooks hooks{};
    hooks.after_attempt = [&log](const std::string& peer, const std::string& chunk, core::TransferOutcome outcome) {
        log.record(peer, chunk, outcome);
    };
    core::DownloadCoordinator::set_test_hooks(&hooks);

    network::ConnectionPool::Options pool_options{};
    pool_options.connect_timeout = 2s;
    pool_options.io_timeout = 5s;
    network::ConnectionPool pool(pool_options);
    storage::ChunkStore leecher_store(scratch / "leecher");
    core::DownloadCoordinator::Options options{};
    options.timeout = 30s;
    options.queue_poll = 100ms;
    core::DownloadCoordinator coordinator(pool, leecher_store, options);

    const auto output = scratch / "downloads" / "movie.mp4";
    const auto result = coordinator.download("movie.mp4", directory, output);
    assert(result.ok());
    assert(test::read_file(output) == original);

    // Each chunk tried the unreachable peer once, then moved on in listed order.
    for (const auto* chunk : {"movie_1.mp4", "movie_2.mp4", "movie_3.mp4"}) {
        const auto refused_attempts = log.of(refused, chunk);
        assert(refused_attempts.size() == 1);
        assert(refused_attempts.front() == core::TransferOutcome::TransportError);
        assert(log.of(p1, chunk).size() == 1);
    }
    // P1 answered chunks 1 and 3 correctly, so P2 was only needed for chunk 2.
    assert(log.of(p1, "movie_1.mp4").front() == core::TransferOutcome::Success);
    assert(log.of(p1, "movie_2.mp4").front() == core::TransferOutcome::IntegrityError);
    assert(log.of(p2, "movie_2.mp4").size() == 1);
    assert(log.of(p2, "movie_2.mp4").front() == core::TransferOutcome::Success);
    assert(log.of(p2, "movie_1.mp4").empty());

    // A peer that accepts but never answers runs into the overall deadline.
    {
        std::uint16_t silent_port = 0;
        const auto silent = network::open_tcp_listener("127.0.0.1", 0, silent_port);
        ContentDirectory stalled;
        stalled["stall_1.bin"] = ContentEntry{std::string(64, '0'), {"127.0.0.1:" + std::to_string(silent_port)}};

        network::ConnectionPool::Options slow_options{};
        slow_options.connect_timeout = 2s;
        slow_options.io_timeout = 2s;
        network::ConnectionPool slow_pool(slow_options);
        core::DownloadCoordinator::Options short_options{};
        short_options.timeout = 500ms;
        short_options.queue_poll = 100ms;
        core::DownloadCoordinator impatient(slow_pool, leecher_store, short_options);

        const auto timed_out = impatient.download("stall.bin", stalled, scratch / "downloads" / "stall.bin");
        assert(timed_out.status == core::DownloadStatus::TimedOut);
        assert((timed_out.missing_chunks == std::vector<std::string>{"stall_1.bin"}));
        assert(!std::filesystem::exists(scratch / "downloads" / "stall.bin"));

        slow_pool.close_all();
        network::close_socket(silent);
    }

    core::DownloadCoordinator::set_test_hooks(nullptr);
    pool.close_all();
    bad_server.stop();
    good_server.stop();
    return 0;
}
