#include "chunknet/protocol/Announcement.hpp"

#include "chunknet/protocol/Json.hpp"

#include <algorithm>
#include <limits>

namespace chunknet::protocol {

namespace {

json::Value encode_inventory(const ChunkInventory& chunks) {
    auto object = json::Value::make_object();
    auto& fields = object.as_object();
    for (const auto& [name, metadata] : chunks) {
        auto entry = json::Value::make_object();
        auto& entry_fields = entry.as_object();
        entry_fields["size"] = json::Value(static_cast<std::int64_t>(metadata.size));
        entry_fields["checksum"] = json::Value(metadata.checksum);
        entry_fields["timestamp"] = json::Value(metadata.timestamp);
        fields.emplace(name, std::move(entry));
    }
    return object;
}

std::optional<ChunkMetadata> decode_metadata(const json::Value& value) {
    if (!value.is_object()) {
        return std::nullopt;
    }
    const auto* checksum = value.find("checksum");
    if (!checksum || !checksum->is_string() || checksum->string_value.empty()) {
        return std::nullopt;
    }

    ChunkMetadata metadata{};
    metadata.checksum = checksum->string_value;
    if (const auto* size = value.find("size")) {
        const auto parsed = size->as_int64();
        if (!parsed || *parsed < 0) {
            return std::nullopt;
        }
        metadata.size = static_cast<std::uint64_t>(*parsed);
    }
    if (const auto* timestamp = value.find("timestamp"); timestamp && timestamp->is_string()) {
        metadata.timestamp = timestamp->string_value;
    }
    return metadata;
}

std::optional<BatchInfo> decode_batch_info(const json::Value& value) {
    if (!value.is_object()) {
        return std::nullopt;
    }
    const auto* current = value.find("current");
    const auto* total = value.find("total");
    if (!current || !total || !current->is_integer() || !total->is_integer()) {
        return std::nullopt;
    }
    const auto max = static_cast<std::int64_t>(std::numeric_limits<std::uint32_t>::max());
    if (current->integer_value < 1 || total->integer_value < current->integer_value || total->integer_value > max) {
        return std::nullopt;
    }
    return BatchInfo{static_cast<std::uint32_t>(current->integer_value),
                     static_cast<std::uint32_t>(total->integer_value)};
}

}  // namespace

std::string encode_announcement(const Announcement& announcement) {
    auto document = json::Value::make_object();
    auto& fields = document.as_object();
    fields["peer_ip"] = json::Value(announcement.peer_ip);
    if (announcement.peer_port) {
        fields["peer_port"] = json::Value(static_cast<std::int64_t>(*announcement.peer_port));
    }
    fields["chunks"] = encode_inventory(announcement.chunks);
    fields["timestamp"] = json::Value(announcement.timestamp);
    if (announcement.batch_info) {
        auto batch = json::Value::make_object();
        batch.as_object()["current"] = json::Value(static_cast<std::int64_t>(announcement.batch_info->current));
        batch.as_object()["total"] = json::Value(static_cast<std::int64_t>(announcement.batch_info->total));
        fields["batch_info"] = std::move(batch);
    }
    return json::dump(document);
}

std::optional<Announcement> decode_announcement(std::string_view datagram) {
    const auto document = json::try_parse(datagram);
    if (!document || !document->is_object()) {
        return std::nullopt;
    }

    const auto* peer_ip = document->find("peer_ip");
    const auto* chunks = document->find("chunks");
    if (!peer_ip || !peer_ip->is_string() || peer_ip->string_value.empty() || !chunks || !chunks->is_object()) {
        return std::nullopt;
    }

    Announcement announcement{};
    announcement.peer_ip = peer_ip->string_value;

    if (const auto* port = document->find("peer_port")) {
        if (!port->is_integer() || port->integer_value <= 0 ||
            port->integer_value > std::numeric_limits<std::uint16_t>::max()) {
            return std::nullopt;
        }
        announcement.peer_port = static_cast<std::uint16_t>(port->integer_value);
    }

    for (const auto& [name, entry] : chunks->as_object()) {
        auto metadata = decode_metadata(entry);
        if (!metadata) {
            return std::nullopt;
        }
        announcement.chunks.emplace(name, std::move(*metadata));
    }

    if (const auto* timestamp = document->find("timestamp"); timestamp && timestamp->is_string()) {
        announcement.timestamp = timestamp->string_value;
    }

    if (const auto* batch = document->find("batch_info"); batch && !batch->is_null()) {
        auto info = decode_batch_info(*batch);
        if (!info) {
            return std::nullopt;
        }
        announcement.batch_info = *info;
    }

    return announcement;
}

BatchPlan plan_batches(const std::string& peer_ip,
                       std::optional<std::uint16_t> peer_port,
                       const ChunkInventory& inventory,
                       const std::string& timestamp,
                       std::size_t batch_size,
                       std::size_t max_datagram) {
    BatchPlan plan{};
    std::vector<const ChunkInventory::value_type*> entries;
    for (const auto& entry : inventory) {
        entries.push_back(&entry);
    }

    auto size = std::max<std::size_t>(1, batch_size);
    while (true) {
        plan.datagrams.clear();
        plan.batch_size = size;

        const auto total = (entries.size() + size - 1) / size;
        bool redo = false;
        for (std::size_t batch = 0; batch < total; ++batch) {
            Announcement announcement{};
            announcement.peer_ip = peer_ip;
            announcement.peer_port = peer_port;
            announcement.timestamp = timestamp;
            announcement.batch_info = BatchInfo{static_cast<std::uint32_t>(batch + 1),
                                                static_cast<std::uint32_t>(total)};
            const auto end = std::min(entries.size(), (batch + 1) * size);
            for (auto index = batch * size; index < end; ++index) {
                announcement.chunks.insert(*entries[index]);
            }

            auto datagram = encode_announcement(announcement);
            if (datagram.size() <= max_datagram) {
                plan.datagrams.push_back(std::move(datagram));
                continue;
            }

            if (size > 1) {
                size /= 2;
            } else {
                // A single entry that cannot fit is dropped; batch totals must only count sent batches.
                plan.oversized.push_back(entries[batch]->first);
                entries.erase(entries.begin() + static_cast<std::ptrdiff_t>(batch));
            }
            redo = true;
            break;
        }

        if (!redo) {
            break;
        }
    }

    return plan;
}

}  // namespace chunknet::protocol
