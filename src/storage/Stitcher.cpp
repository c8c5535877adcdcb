#include "chunknet/storage/Stitcher.hpp"

#include "chunknet/Types.hpp"
#include "chunknet/logging/StructuredLogger.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <system_error>
#include <utility>

namespace chunknet::storage {

namespace {

const logging::ComponentLogger kLog{"stitcher"};

constexpr std::size_t kCopyBlock = 64 * 1024;

void discard(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
}

}  // namespace

std::vector<std::string> sort_by_ordinal(std::vector<std::string> names, std::string_view content_name) {
    const auto name = split_content_name(content_name);
    std::vector<std::pair<std::uint64_t, std::string>> keyed;
    keyed.reserve(names.size());
    for (auto& chunk : names) {
        if (const auto ordinal = chunk_ordinal(chunk, name.base, name.extension)) {
            keyed.emplace_back(*ordinal, std::move(chunk));
        }
    }
    std::stable_sort(keyed.begin(), keyed.end(), [](const auto& left, const auto& right) {
        return left.first < right.first;
    });

    std::vector<std::string> ordered;
    ordered.reserve(keyed.size());
    for (auto& [ordinal, chunk] : keyed) {
        ordered.push_back(std::move(chunk));
    }
    return ordered;
}

bool stitch(const ChunkStore& store, const std::vector<std::string>& chunks, const std::filesystem::path& output) {
    if (chunks.empty()) {
        kLog.error("stitch.no_chunks", {{"output", output.string()}});
        return false;
    }

    std::error_code ec;
    if (output.has_parent_path()) {
        std::filesystem::create_directories(output.parent_path(), ec);
        if (ec) {
            kLog.error("stitch.mkdir_failed", {{"path", output.parent_path().string()}, {"error", ec.message()}});
            return false;
        }
    }

    auto partial = output;
    partial += ".part";
    {
        std::ofstream out(partial, std::ios::binary | std::ios::trunc);
        if (!out) {
            kLog.error("stitch.open_failed", {{"path", partial.string()}});
            return false;
        }

        std::array<char, kCopyBlock> buffer{};
        for (const auto& chunk : chunks) {
            const auto path = store.chunk_path(chunk);
            std::ifstream in;
            if (path) {
                in.open(*path, std::ios::binary);
            }
            if (!in) {
                kLog.error("stitch.chunk_missing", {{"chunk", chunk}});
                out.close();
                discard(partial);
                return false;
            }
            while (in) {
                in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                const auto read = in.gcount();
                if (read > 0) {
                    out.write(buffer.data(), read);
                }
            }
            if (in.bad() || !out) {
                kLog.error("stitch.copy_failed", {{"chunk", chunk}});
                out.close();
                discard(partial);
                return false;
            }
        }
        out.flush();
        if (!out) {
            kLog.error("stitch.write_failed", {{"path", partial.string()}});
            out.close();
            discard(partial);
            return false;
        }
    }

    std::filesystem::rename(partial, output, ec);
    if (ec) {
        kLog.error("stitch.rename_failed", {{"path", output.string()}, {"error", ec.message()}});
        discard(partial);
        return false;
    }

    for (const auto& chunk : chunks) {
        if (!store.remove(chunk)) {
            kLog.warn("stitch.cleanup_failed", {{"chunk", chunk}});
        }
    }
    kLog.info("stitch.complete", {{"output", output.string()}, {"chunks", std::to_string(chunks.size())}});
    return true;
}

}  // namespace chunknet::storage
