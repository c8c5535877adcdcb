#include "chunknet/network/ConnectionPool.hpp"

#include "chunknet/logging/StructuredLogger.hpp"

#include <algorithm>
#include <utility>

namespace chunknet::network {

namespace {

const logging::ComponentLogger kLog{"connection_pool"};

}  // namespace

ConnectionPool::Lease::Lease(ConnectionPool* pool, std::string peer, std::shared_ptr<Entry> entry, bool reused)
    : pool_(pool), peer_(std::move(peer)), entry_(std::move(entry)), reused_(reused) {}

ConnectionPool::Lease::~Lease() {
    release();
}

ConnectionPool::Lease::Lease(Lease&& other) noexcept
    : pool_(std::exchange(other.pool_, nullptr)),
      peer_(std::move(other.peer_)),
      entry_(std::move(other.entry_)),
      reused_(other.reused_) {}

ConnectionPool::Lease& ConnectionPool::Lease::operator=(Lease&& other) noexcept {
    if (this != &other) {
        release();
        pool_ = std::exchange(other.pool_, nullptr);
        peer_ = std::move(other.peer_);
        entry_ = std::move(other.entry_);
        reused_ = other.reused_;
    }
    return *this;
}

SocketHandle ConnectionPool::Lease::socket() const noexcept {
    return entry_ ? entry_->socket : INVALID_SOCKET_HANDLE;
}

void ConnectionPool::Lease::discard() {
    if (!entry_) {
        return;
    }
    auto entry = std::move(entry_);
    entry_.reset();
    pool_->return_entry(peer_, entry, true);
    entry->mutex.unlock();
}

void ConnectionPool::Lease::release() {
    if (!entry_) {
        return;
    }
    auto entry = std::move(entry_);
    entry_.reset();
    pool_->return_entry(peer_, entry, false);
    entry->mutex.unlock();
}

ConnectionPool::ConnectionPool(Options options)
    : options_(options) {
    options_.max_connections = std::max<std::size_t>(options_.max_connections, 1);
}

ConnectionPool::~ConnectionPool() {
    stop_reaper();
    close_all();
}

std::optional<ConnectionPool::Lease> ConnectionPool::acquire(const std::string& peer) {
    const auto endpoint = parse_endpoint(peer, options_.default_port);
    if (!endpoint) {
        kLog.warn("pool.invalid_peer", {{"peer", peer}});
        return std::nullopt;
    }

    while (true) {
        std::shared_ptr<Entry> entry;
        bool fresh = false;
        {
            std::unique_lock lock(mutex_);
            while (true) {
                const auto it = entries_.find(peer);
                if (it != entries_.end()) {
                    entry = it->second;
                    break;
                }
                if (entries_.size() + pending_close_ < options_.max_connections) {
                    entry = std::make_shared<Entry>();
                    // Uncontended: the entry is not yet visible to other threads.
                    entry->mutex.lock();
                    entry->in_use = true;
                    entries_.emplace(peer, entry);
                    fresh = true;
                    break;
                }
                if (!evict_lru_locked()) {
                    kLog.debug("pool.wait_slot", {{"peer", peer}});
                    slot_cv_.wait(lock);
                }
            }
            entry->use_serial = ++use_counter_;
            entry->last_used = Clock::now();
        }

        if (fresh) {
            const auto socket = connect_with_timeout(*endpoint, options_.connect_timeout);
            if (socket == INVALID_SOCKET_HANDLE) {
                kLog.warn("pool.connect_failed", {{"peer", peer}});
                return_entry(peer, entry, true);
                entry->mutex.unlock();
                return std::nullopt;
            }
            if (!set_recv_timeout(socket, options_.io_timeout) || !set_send_timeout(socket, options_.io_timeout)) {
                kLog.warn("pool.configure_failed", {{"peer", peer}});
                close_socket(socket);
                return_entry(peer, entry, true);
                entry->mutex.unlock();
                return std::nullopt;
            }
            entry->socket = socket;
            kLog.debug("pool.connected", {{"peer", peer}});
            return Lease(this, peer, entry, false);
        }

        entry->mutex.lock();
        {
            std::scoped_lock lock(mutex_);
            if (entry->retired) {
                entry->mutex.unlock();
                continue;
            }
            entry->in_use = true;
        }

        if (!is_connection_alive(entry->socket)) {
            kLog.debug("pool.stale_connection", {{"peer", peer}});
            return_entry(peer, entry, true);
            entry->mutex.unlock();
            continue;
        }
        return Lease(this, peer, entry, true);
    }
}

void ConnectionPool::remove(const std::string& peer) {
    std::scoped_lock lock(mutex_);
    const auto it = entries_.find(peer);
    if (it != entries_.end()) {
        auto entry = it->second;
        retire_locked(peer, entry);
        kLog.debug("pool.removed", {{"peer", peer}});
    }
}

void ConnectionPool::close_all() {
    std::scoped_lock lock(mutex_);
    while (!entries_.empty()) {
        auto it = entries_.begin();
        const auto peer = it->first;
        auto entry = it->second;
        retire_locked(peer, entry);
    }
}

std::size_t ConnectionPool::size() const {
    std::scoped_lock lock(mutex_);
    return entries_.size();
}

bool ConnectionPool::contains(const std::string& peer) const {
    std::scoped_lock lock(mutex_);
    return entries_.contains(peer);
}

std::vector<std::string> ConnectionPool::evict_idle(Clock::time_point now) {
    std::vector<std::string> evicted;
    std::scoped_lock lock(mutex_);
    std::vector<std::pair<std::string, std::shared_ptr<Entry>>> idle;
    for (const auto& [peer, entry] : entries_) {
        if (!entry->in_use && now - entry->last_used > options_.idle_timeout) {
            idle.emplace_back(peer, entry);
        }
    }
    for (const auto& [peer, entry] : idle) {
        retire_locked(peer, entry);
        kLog.debug("pool.evict_idle", {{"peer", peer}});
        evicted.push_back(peer);
    }
    return evicted;
}

void ConnectionPool::start_reaper(std::chrono::milliseconds interval) {
    stop_reaper();
    reaper_ = std::make_unique<core::BackgroundTask>("connection_pool", interval, [this] {
        const auto evicted = evict_idle();
        if (!evicted.empty()) {
            kLog.info("pool.reaped", {{"count", std::to_string(evicted.size())}});
        }
    });
    reaper_->start();
}

void ConnectionPool::stop_reaper() {
    if (reaper_) {
        reaper_->stop();
        reaper_.reset();
    }
}

void ConnectionPool::retire_locked(const std::string& peer, const std::shared_ptr<Entry>& entry) {
    entry->retired = true;
    const auto it = entries_.find(peer);
    if (it != entries_.end() && it->second == entry) {
        entries_.erase(it);
    }
    if (entry->in_use) {
        if (!entry->pending_close) {
            entry->pending_close = true;
            ++pending_close_;
        }
        return;
    }
    close_socket(entry->socket);
    entry->socket = INVALID_SOCKET_HANDLE;
    slot_cv_.notify_all();
}

bool ConnectionPool::evict_lru_locked() {
    auto victim = entries_.end();
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
        if (it->second->in_use) {
            continue;
        }
        if (victim == entries_.end() || it->second->use_serial < victim->second->use_serial) {
            victim = it;
        }
    }
    if (victim == entries_.end()) {
        return false;
    }
    const auto peer = victim->first;
    auto entry = victim->second;
    kLog.debug("pool.evict_lru", {{"peer", peer}});
    retire_locked(peer, entry);
    return true;
}

void ConnectionPool::return_entry(const std::string& peer, const std::shared_ptr<Entry>& entry, bool discard) {
    std::scoped_lock lock(mutex_);
    entry->in_use = false;
    entry->last_used = Clock::now();
    if (discard && !entry->retired) {
        retire_locked(peer, entry);
        return;
    }
    if (entry->retired) {
        close_socket(entry->socket);
        entry->socket = INVALID_SOCKET_HANDLE;
        if (entry->pending_close) {
            entry->pending_close = false;
            --pending_close_;
        }
    }
    slot_cv_.notify_all();
}

}  // namespace chunknet::network
