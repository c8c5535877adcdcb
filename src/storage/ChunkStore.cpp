#include "chunknet/storage/ChunkStore.hpp"

#include "chunknet/crypto/Sha256.hpp"
#include "chunknet/logging/StructuredLogger.hpp"

#include <algorithm>
#include <system_error>

namespace chunknet::storage {

namespace {

const logging::ComponentLogger kLog{"chunk_store"};

}  // namespace

ChunkStore::ChunkStore(std::filesystem::path directory)
    : directory_(std::move(directory)) {}

bool ChunkStore::ensure_directory() const {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        kLog.error("store.mkdir_failed", {{"path", directory_.string()}, {"error", ec.message()}});
        return false;
    }
    return true;
}

bool ChunkStore::is_valid_chunk_name(std::string_view name) {
    if (name.empty() || name.front() == '.') {
        return false;
    }
    if (name.find('/') != std::string_view::npos || name.find('\\') != std::string_view::npos) {
        return false;
    }
    return name.find('\0') == std::string_view::npos;
}

std::optional<std::filesystem::path> ChunkStore::chunk_path(std::string_view name) const {
    if (!is_valid_chunk_name(name)) {
        return std::nullopt;
    }
    return directory_ / std::string(name);
}

bool ChunkStore::contains(std::string_view name) const {
    const auto path = chunk_path(name);
    std::error_code ec;
    return path && std::filesystem::is_regular_file(*path, ec);
}

std::vector<std::string> ChunkStore::list_chunks() const {
    std::vector<std::string> names;
    std::error_code ec;
    std::filesystem::directory_iterator it(directory_, ec);
    if (ec) {
        kLog.warn("store.list_failed", {{"path", directory_.string()}, {"error", ec.message()}});
        return names;
    }
    for (const auto& entry : it) {
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec)) {
            continue;
        }
        auto name = entry.path().filename().string();
        if (is_valid_chunk_name(name)) {
            names.push_back(std::move(name));
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

ChunkInventory ChunkStore::scan_inventory() const {
    ChunkInventory inventory;
    for (const auto& name : list_chunks()) {
        const auto path = directory_ / name;
        auto checksum = crypto::Sha256::file_hex_digest(path);
        std::error_code ec;
        const auto size = std::filesystem::file_size(path, ec);
        if (!checksum || ec) {
            kLog.warn("store.checksum_failed", {{"chunk", name}});
            continue;
        }
        inventory.emplace(name, ChunkMetadata{static_cast<std::uint64_t>(size), std::move(*checksum),
                                              format_local_timestamp()});
    }
    return inventory;
}

std::filesystem::path ChunkStore::make_temp_path(std::string_view name) {
    const auto serial = temp_counter_.fetch_add(1, std::memory_order_relaxed);
    return directory_ / ("." + std::string(name) + "." + std::to_string(serial) + ".tmp");
}

bool ChunkStore::commit(const std::filesystem::path& temp, std::string_view name) const {
    const auto target = chunk_path(name);
    if (!target) {
        return false;
    }
    std::error_code ec;
    std::filesystem::rename(temp, *target, ec);
    if (ec) {
        kLog.error("store.commit_failed", {{"chunk", std::string(name)}, {"error", ec.message()}});
        std::filesystem::remove(temp, ec);
        return false;
    }
    return true;
}

bool ChunkStore::remove(std::string_view name) const {
    const auto path = chunk_path(name);
    if (!path) {
        return false;
    }
    std::error_code ec;
    return std::filesystem::remove(*path, ec) && !ec;
}

}  // namespace chunknet::storage
