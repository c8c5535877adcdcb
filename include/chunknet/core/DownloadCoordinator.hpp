#pragma once

#include "chunknet/Types.hpp"
#include "chunknet/network/ConnectionPool.hpp"
#include "chunknet/storage/ChunkStore.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace chunknet::core {

enum class TransferOutcome {
    Success,
    TransportError,
    IntegrityError,
    NotFound,
    ProtocolError,
    StorageError
};

std::string_view to_string(TransferOutcome outcome);

enum class DownloadStatus {
    Completed,
    NoChunks,
    Exhausted,
    TimedOut,
    ReassemblyFailed
};

std::string_view to_string(DownloadStatus status);

struct DownloadResult {
    DownloadStatus status{DownloadStatus::NoChunks};
    // Required chunks that were not obtained, in ordinal order.
    std::vector<std::string> missing_chunks;
    std::filesystem::path output;

    bool ok() const noexcept { return status == DownloadStatus::Completed; }
};

struct ChunkTask {
    std::string name;
    Checksum checksum;
    std::vector<std::string> peers;
};

// Fetches every chunk of one content item from the peers listed in the content directory,
// verifies each against its advertised checksum, and stitches the verified chunks in ordinal
// order. Peers of a chunk are tried in listed order; a chunk whose peers all fail is not retried.
class DownloadCoordinator {
public:
    struct Options {
        std::size_t max_workers{5};
        std::chrono::milliseconds timeout{std::chrono::seconds(300)};
        std::chrono::milliseconds queue_poll{std::chrono::seconds(1)};
    };

    struct TestHooks {
        std::function<void(const std::string& peer, const std::string& chunk, TransferOutcome outcome)> after_attempt;
    };

    DownloadCoordinator(network::ConnectionPool& pool, storage::ChunkStore& store, Options options);

    // Entries named <base>_<ordinal>[<ext>] for `content_name`, in ordinal order, one per ordinal.
    // When any entry carries the extension, entries without it are left out.
    static std::vector<ChunkTask> resolve(const ContentDirectory& directory, std::string_view content_name);

    // Chunk names for the ordinals missing from 1..highest among `tasks`.
    static std::vector<std::string> sequence_gaps(const std::vector<ChunkTask>& tasks, std::string_view content_name);

    DownloadResult download(std::string_view content_name,
                            const ContentDirectory& directory,
                            const std::filesystem::path& output);

    // One attempt against one peer. A cached connection that dies before any response byte is
    // replaced once by a freshly opened one.
    TransferOutcome fetch_chunk(const std::string& peer, const ChunkTask& task);

    static void set_test_hooks(const TestHooks* hooks);

private:
    struct Exchange {
        TransferOutcome outcome{TransferOutcome::TransportError};
        bool response_started{false};
        bool connection_usable{false};
    };

    Exchange exchange(network::ConnectionPool::Lease& lease, const ChunkTask& task);

    network::ConnectionPool& pool_;
    storage::ChunkStore& store_;
    Options options_;
};

}  // namespace chunknet::core
