#include "chunknet/core/DownloadCoordinator.hpp"

#include "chunknet/crypto/Sha256.hpp"
#include "chunknet/logging/StructuredLogger.hpp"
#include "chunknet/protocol/ChunkTransfer.hpp"
#include "chunknet/storage/Stitcher.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <condition_variable>
#include <deque>
#include <fstream>
#include <mutex>
#include <optional>
#include <set>
#include <system_error>
#include <thread>

namespace chunknet::core {

namespace {

const logging::ComponentLogger kLog{"download"};

constexpr std::size_t kReceiveBlock = 64 * 1024;

std::atomic<const DownloadCoordinator::TestHooks*> g_test_hooks{nullptr};

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

// Shared state of one download: the work queue, the success and failure sets, and the
// completion signal.
class DownloadJob {
public:
    explicit DownloadJob(std::vector<ChunkTask> tasks)
        : required_(tasks.size()), queue_(std::make_move_iterator(tasks.begin()), std::make_move_iterator(tasks.end())) {}

    std::optional<ChunkTask> pop(std::chrono::milliseconds timeout) {
        std::unique_lock lock(mutex_);
        if (!queue_cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || cancelled_; })) {
            return std::nullopt;
        }
        if (cancelled_ || queue_.empty()) {
            return std::nullopt;
        }
        auto task = std::move(queue_.front());
        queue_.pop_front();
        return task;
    }

    void mark(const std::string& chunk, bool success) {
        {
            std::scoped_lock lock(mutex_);
            if (success) {
                succeeded_.insert(chunk);
            } else {
                failed_.insert(chunk);
            }
        }
        done_cv_.notify_all();
    }

    // True when every chunk is accounted for; false when the deadline passed first.
    bool wait_until(std::chrono::steady_clock::time_point deadline) {
        std::unique_lock lock(mutex_);
        return done_cv_.wait_until(lock, deadline, [this] { return accounted_locked(); });
    }

    void cancel() {
        {
            std::scoped_lock lock(mutex_);
            cancelled_ = true;
        }
        queue_cv_.notify_all();
        done_cv_.notify_all();
    }

    bool cancelled() const {
        std::scoped_lock lock(mutex_);
        return cancelled_;
    }

    std::set<std::string> succeeded() const {
        std::scoped_lock lock(mutex_);
        return succeeded_;
    }

private:
    bool accounted_locked() const {
        return succeeded_.size() + failed_.size() >= required_;
    }

    const std::size_t required_;
    mutable std::mutex mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable done_cv_;
    std::deque<ChunkTask> queue_;
    std::set<std::string> succeeded_;
    std::set<std::string> failed_;
    bool cancelled_{false};
};

void discard_file(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
}

}  // namespace

std::string_view to_string(TransferOutcome outcome) {
    switch (outcome) {
        case TransferOutcome::Success:
            return "success";
        case TransferOutcome::TransportError:
            return "transport_error";
        case TransferOutcome::IntegrityError:
            return "integrity_error";
        case TransferOutcome::NotFound:
            return "not_found";
        case TransferOutcome::ProtocolError:
            return "protocol_error";
        case TransferOutcome::StorageError:
            return "storage_error";
    }
    return "unknown";
}

std::string_view to_string(DownloadStatus status) {
    switch (status) {
        case DownloadStatus::Completed:
            return "completed";
        case DownloadStatus::NoChunks:
            return "no chunks available";
        case DownloadStatus::Exhausted:
            return "chunks exhausted";
        case DownloadStatus::TimedOut:
            return "timed out";
        case DownloadStatus::ReassemblyFailed:
            return "reassembly failed";
    }
    return "unknown";
}

DownloadCoordinator::DownloadCoordinator(network::ConnectionPool& pool, storage::ChunkStore& store, Options options)
    : pool_(pool), store_(store), options_(options) {
    options_.max_workers = std::max<std::size_t>(options_.max_workers, 1);
}

void DownloadCoordinator::set_test_hooks(const TestHooks* hooks) {
    g_test_hooks.store(hooks, std::memory_order_release);
}

std::vector<ChunkTask> DownloadCoordinator::resolve(const ContentDirectory& directory, std::string_view content_name) {
    const auto name = split_content_name(content_name);
    std::vector<std::string> with_extension;
    std::vector<std::string> bare;
    for (const auto& [chunk, entry] : directory) {
        if (!chunk_ordinal(chunk, name.base, name.extension)) {
            continue;
        }
        if (!storage::ChunkStore::is_valid_chunk_name(chunk)) {
            kLog.warn("download.invalid_chunk_name", {{"chunk", chunk}});
            continue;
        }
        const bool suffixed = !name.extension.empty() && chunk.ends_with(name.extension);
        (suffixed ? with_extension : bare).push_back(chunk);
    }

    // Names carrying the extension belong to this item; bare siblings belong to "<base>" alone.
    auto ordered = storage::sort_by_ordinal(with_extension.empty() ? std::move(bare) : std::move(with_extension),
                                            content_name);

    std::vector<ChunkTask> tasks;
    std::optional<std::uint64_t> previous;
    for (const auto& chunk : ordered) {
        const auto ordinal = chunk_ordinal(chunk, name.base, name.extension);
        if (ordinal == previous) {
            kLog.warn("download.duplicate_ordinal", {{"chunk", chunk}, {"kept", tasks.back().name}});
            continue;
        }
        previous = ordinal;
        const auto& entry = directory.at(chunk);
        tasks.push_back(ChunkTask{chunk, entry.checksum, entry.peers});
    }
    return tasks;
}

std::vector<std::string> DownloadCoordinator::sequence_gaps(const std::vector<ChunkTask>& tasks,
                                                            std::string_view content_name) {
    const auto name = split_content_name(content_name);
    std::set<std::uint64_t> present;
    std::string extension;
    for (const auto& task : tasks) {
        if (const auto ordinal = chunk_ordinal(task.name, name.base, name.extension)) {
            present.insert(*ordinal);
            if (!name.extension.empty() && task.name.ends_with(name.extension)) {
                extension = name.extension;
            }
        }
    }

    std::vector<std::string> gaps;
    if (present.empty()) {
        return gaps;
    }
    const auto last = *present.rbegin();
    for (std::uint64_t ordinal = 1; ordinal < last; ++ordinal) {
        if (!present.contains(ordinal)) {
            gaps.push_back(make_chunk_name(name.base, ordinal, extension));
        }
    }
    return gaps;
}

DownloadResult DownloadCoordinator::download(std::string_view content_name,
                                             const ContentDirectory& directory,
                                             const std::filesystem::path& output) {
    DownloadResult result{};
    result.output = output;

    auto tasks = resolve(directory, content_name);
    if (tasks.empty()) {
        kLog.error("download.no_chunks", {{"content", std::string(content_name)}});
        result.status = DownloadStatus::NoChunks;
        return result;
    }
    if (auto gaps = sequence_gaps(tasks, content_name); !gaps.empty()) {
        std::string missing;
        for (const auto& chunk : gaps) {
            missing += missing.empty() ? chunk : "," + chunk;
        }
        kLog.error("download.incomplete_directory", {{"content", std::string(content_name)}, {"missing", missing}});
        result.status = DownloadStatus::Exhausted;
        result.missing_chunks = std::move(gaps);
        return result;
    }
    if (!store_.ensure_directory()) {
        result.status = DownloadStatus::Exhausted;
        for (const auto& task : tasks) {
            result.missing_chunks.push_back(task.name);
        }
        return result;
    }

    std::vector<std::string> required;
    for (const auto& task : tasks) {
        required.push_back(task.name);
    }

    const auto worker_count = std::min(options_.max_workers, tasks.size());
    kLog.info("download.start", {{"content", std::string(content_name)},
                                 {"chunks", std::to_string(tasks.size())},
                                 {"workers", std::to_string(worker_count)}});

    DownloadJob job(std::move(tasks));
    const auto deadline = std::chrono::steady_clock::now() + options_.timeout;

    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    for (std::size_t i = 0; i < worker_count; ++i) {
        workers.emplace_back([this, &job] {
            while (auto task = job.pop(options_.queue_poll)) {
                bool success = false;
                for (const auto& peer : task->peers) {
                    if (job.cancelled()) {
                        break;
                    }
                    kLog.debug("download.attempt", {{"chunk", task->name}, {"peer", peer}});
                    const auto outcome = fetch_chunk(peer, *task);
                    if (outcome == TransferOutcome::Success) {
                        kLog.info("download.chunk_verified", {{"chunk", task->name}, {"peer", peer}});
                        success = true;
                        break;
                    }
                    kLog.warn("download.attempt_failed", {{"chunk", task->name},
                                                          {"peer", peer},
                                                          {"outcome", std::string(to_string(outcome))}});
                }
                if (!success) {
                    kLog.error("download.chunk_exhausted", {{"chunk", task->name}});
                }
                job.mark(task->name, success);
            }
        });
    }

    const bool accounted = job.wait_until(deadline);
    if (!accounted) {
        job.cancel();
    }
    for (auto& worker : workers) {
        worker.join();
    }

    const auto succeeded = job.succeeded();
    for (const auto& chunk : required) {
        if (!succeeded.contains(chunk)) {
            result.missing_chunks.push_back(chunk);
        }
    }

    if (!result.missing_chunks.empty()) {
        result.status = accounted ? DownloadStatus::Exhausted : DownloadStatus::TimedOut;
        std::string missing;
        for (const auto& chunk : result.missing_chunks) {
            missing += missing.empty() ? chunk : "," + chunk;
        }
        kLog.error("download.failed", {{"content", std::string(content_name)},
                                       {"reason", std::string(to_string(result.status))},
                                       {"missing", missing}});
        return result;
    }

    kLog.info("download.chunks_complete", {{"content", std::string(content_name)}});
    if (!storage::stitch(store_, required, output)) {
        result.status = DownloadStatus::ReassemblyFailed;
        return result;
    }
    result.status = DownloadStatus::Completed;
    kLog.info("download.complete", {{"content", std::string(content_name)}, {"output", output.string()}});
    return result;
}

TransferOutcome DownloadCoordinator::fetch_chunk(const std::string& peer, const ChunkTask& task) {
    TransferOutcome outcome = TransferOutcome::TransportError;
    if (auto lease = pool_.acquire(peer)) {
        auto first = exchange(*lease, task);
        outcome = first.outcome;

        if (!first.connection_usable) {
            const bool recover = lease->reused() && !first.response_started &&
                                 first.outcome == TransferOutcome::TransportError;
            lease->discard();
            if (recover) {
                kLog.debug("download.stale_connection", {{"peer", peer}, {"chunk", task.name}});
                if (auto fresh = pool_.acquire(peer)) {
                    const auto second = exchange(*fresh, task);
                    outcome = second.outcome;
                    if (!second.connection_usable) {
                        fresh->discard();
                    }
                }
            }
        }
    }

    if (const auto* hooks = g_test_hooks.load(std::memory_order_acquire); hooks && hooks->after_attempt) {
        hooks->after_attempt(peer, task.name, outcome);
    }
    return outcome;
}

DownloadCoordinator::Exchange DownloadCoordinator::exchange(network::ConnectionPool::Lease& lease,
                                                           const ChunkTask& task) {
    Exchange result{};
    const auto socket = lease.socket();

    const auto frame = protocol::encode_request(task.name);
    if (!network::send_all(socket, frame.data(), frame.size())) {
        return result;
    }

    std::uint8_t first = 0;
    if (network::recv_some(socket, &first, 1) != 1) {
        return result;
    }
    result.response_started = true;

    std::string line;
    if (first != '\n') {
        const auto rest = network::recv_line(socket, protocol::kMaxHeaderLine - 1);
        if (!rest) {
            result.outcome = TransferOutcome::ProtocolError;
            return result;
        }
        line.push_back(static_cast<char>(first));
        line += *rest;
    }

    const auto header = protocol::parse_response_header(line);
    if (header.kind == protocol::ResponseKind::NotFound) {
        result.outcome = TransferOutcome::NotFound;
        result.connection_usable = true;
        return result;
    }
    if (header.kind != protocol::ResponseKind::Size) {
        kLog.warn("download.bad_header", {{"chunk", task.name}, {"peer", lease.peer()}});
        result.outcome = TransferOutcome::ProtocolError;
        return result;
    }

    const auto temp = store_.make_temp_path(task.name);
    std::ofstream out(temp, std::ios::binary | std::ios::trunc);
    if (!out) {
        kLog.error("download.temp_open_failed", {{"path", temp.string()}});
        result.outcome = TransferOutcome::StorageError;
        return result;
    }

    crypto::Sha256 hasher;
    std::array<std::uint8_t, kReceiveBlock> buffer{};
    std::uint64_t received = 0;
    while (received < header.size) {
        const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(buffer.size(), header.size - received));
        const auto got = network::recv_some(socket, buffer.data(), want);
        if (got <= 0) {
            kLog.warn("download.short_read", {{"chunk", task.name},
                                              {"received", std::to_string(received)},
                                              {"expected", std::to_string(header.size)}});
            out.close();
            discard_file(temp);
            return result;
        }
        hasher.update(std::span<const std::uint8_t>(buffer.data(), static_cast<std::size_t>(got)));
        out.write(reinterpret_cast<const char*>(buffer.data()), got);
        received += static_cast<std::uint64_t>(got);
    }
    result.connection_usable = true;

    out.flush();
    if (!out) {
        out.close();
        discard_file(temp);
        kLog.error("download.temp_write_failed", {{"path", temp.string()}});
        result.outcome = TransferOutcome::StorageError;
        return result;
    }
    out.close();

    const auto actual = hasher.finalize_hex();
    if (received != header.size || actual != lowercase(task.checksum)) {
        kLog.warn("download.checksum_mismatch", {{"chunk", task.name},
                                                 {"peer", lease.peer()},
                                                 {"expected", task.checksum},
                                                 {"actual", actual}});
        discard_file(temp);
        result.outcome = TransferOutcome::IntegrityError;
        return result;
    }

    if (!store_.commit(temp, task.name)) {
        result.outcome = TransferOutcome::StorageError;
        return result;
    }
    result.outcome = TransferOutcome::Success;
    return result;
}

}  // namespace chunknet::core
