#pragma once

#include "chunknet/Types.hpp"
#include "chunknet/core/BackgroundTask.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace chunknet::directory {

// Peer -> {chunk -> checksum} table fed by announcements. All state is guarded by one mutex;
// callbacks are invoked after it is released.
class PeerDirectory {
public:
    using Clock = std::chrono::steady_clock;
    using PruneCallback = std::function<void(const std::vector<std::string>& removed)>;

    struct PeerRecord {
        PeerChunkMap chunks;
        Clock::time_point last_seen{};
    };

    explicit PeerDirectory(std::chrono::seconds peer_timeout);
    ~PeerDirectory();

    PeerDirectory(const PeerDirectory&) = delete;
    PeerDirectory& operator=(const PeerDirectory&) = delete;

    // Replaces the peer's chunk map and refreshes last_seen. Returns true when the map changed.
    bool update_peer(const std::string& peer, PeerChunkMap chunks);

    // Adds or overwrites entries without removing any. Returns true when the map changed.
    bool merge_peer(const std::string& peer, const PeerChunkMap& chunks);

    // Removes peers whose last_seen is older than the timeout at `now`.
    std::vector<std::string> remove_stale(Clock::time_point now = Clock::now());

    // Seeds peers from a persisted directory with last_seen = now.
    void seed(const ContentDirectory& directory);

    ContentDirectory content_directory() const;
    std::map<std::string, PeerRecord> snapshot_peers() const;
    std::size_t peer_count() const;

    // Returns and clears the "modified since last call" flag.
    bool take_modified();

    void start_reaper(std::chrono::milliseconds interval, PruneCallback on_pruned = {});
    void stop_reaper();
    // One reaper iteration; used by the background task and by tests.
    void reap_once();

private:
    std::chrono::seconds peer_timeout_;

    mutable std::mutex mutex_;
    std::map<std::string, PeerRecord> peers_;
    bool modified_{false};

    PruneCallback on_pruned_;
    std::unique_ptr<core::BackgroundTask> reaper_;
};

}  // namespace chunknet::directory
