#include "chunknet/directory/PeerDirectory.hpp"

#include "chunknet/logging/StructuredLogger.hpp"

#include <algorithm>
#include <utility>

namespace chunknet::directory {

namespace {

const logging::ComponentLogger kLog{"peer_directory"};

}  // namespace

PeerDirectory::PeerDirectory(std::chrono::seconds peer_timeout)
    : peer_timeout_(peer_timeout) {}

PeerDirectory::~PeerDirectory() {
    stop_reaper();
}

bool PeerDirectory::update_peer(const std::string& peer, PeerChunkMap chunks) {
    std::scoped_lock lock(mutex_);
    auto& record = peers_[peer];
    record.last_seen = Clock::now();
    if (record.chunks == chunks) {
        return false;
    }

    kLog.debug("directory.peer_replaced",
               {{"peer", peer}, {"chunks", std::to_string(chunks.size())}});
    record.chunks = std::move(chunks);
    modified_ = true;
    return true;
}

bool PeerDirectory::merge_peer(const std::string& peer, const PeerChunkMap& chunks) {
    std::scoped_lock lock(mutex_);
    auto& record = peers_[peer];
    record.last_seen = Clock::now();

    bool changed = false;
    for (const auto& [name, checksum] : chunks) {
        auto [it, inserted] = record.chunks.try_emplace(name, checksum);
        if (inserted) {
            changed = true;
        } else if (it->second != checksum) {
            it->second = checksum;
            changed = true;
        }
    }
    if (changed) {
        kLog.debug("directory.peer_merged", {{"peer", peer}, {"chunks", std::to_string(chunks.size())}});
        modified_ = true;
    }
    return changed;
}

std::vector<std::string> PeerDirectory::remove_stale(Clock::time_point now) {
    std::vector<std::string> removed;
    std::scoped_lock lock(mutex_);
    for (auto it = peers_.begin(); it != peers_.end();) {
        if (now - it->second.last_seen > peer_timeout_) {
            kLog.info("directory.peer_stale", {{"peer", it->first}});
            removed.push_back(it->first);
            it = peers_.erase(it);
        } else {
            ++it;
        }
    }
    if (!removed.empty()) {
        modified_ = true;
    }
    return removed;
}

void PeerDirectory::seed(const ContentDirectory& directory) {
    std::scoped_lock lock(mutex_);
    const auto now = Clock::now();
    for (const auto& [chunk, entry] : directory) {
        for (const auto& peer : entry.peers) {
            auto& record = peers_[peer];
            record.chunks.insert_or_assign(chunk, entry.checksum);
            record.last_seen = now;
        }
    }
}

ContentDirectory PeerDirectory::content_directory() const {
    ContentDirectory content;
    std::vector<std::pair<std::string, std::string>> conflicts;
    {
        std::scoped_lock lock(mutex_);
        for (const auto& [peer, record] : peers_) {
            for (const auto& [chunk, checksum] : record.chunks) {
                auto [it, inserted] = content.try_emplace(chunk, ContentEntry{checksum, {peer}});
                if (inserted) {
                    continue;
                }
                if (it->second.checksum != checksum) {
                    conflicts.emplace_back(chunk, peer);
                    continue;
                }
                auto& peers = it->second.peers;
                if (std::find(peers.begin(), peers.end(), peer) == peers.end()) {
                    peers.push_back(peer);
                }
            }
        }
    }

    for (const auto& [chunk, peer] : conflicts) {
        kLog.warn("directory.checksum_conflict", {{"chunk", chunk}, {"peer", peer}});
    }
    return content;
}

std::map<std::string, PeerDirectory::PeerRecord> PeerDirectory::snapshot_peers() const {
    std::scoped_lock lock(mutex_);
    return peers_;
}

std::size_t PeerDirectory::peer_count() const {
    std::scoped_lock lock(mutex_);
    return peers_.size();
}

bool PeerDirectory::take_modified() {
    std::scoped_lock lock(mutex_);
    return std::exchange(modified_, false);
}

void PeerDirectory::start_reaper(std::chrono::milliseconds interval, PruneCallback on_pruned) {
    stop_reaper();
    on_pruned_ = std::move(on_pruned);
    reaper_ = std::make_unique<core::BackgroundTask>("peer_directory", interval, [this] { reap_once(); });
    reaper_->start();
}

void PeerDirectory::stop_reaper() {
    if (reaper_) {
        reaper_->stop();
        reaper_.reset();
    }
}

void PeerDirectory::reap_once() {
    const auto removed = remove_stale();
    if (!removed.empty() && on_pruned_) {
        on_pruned_(removed);
    }
}

}  // namespace chunknet::directory
