#include "chunknet/storage/FileSplitter.hpp"

#include "chunknet/Types.hpp"
#include "chunknet/logging/StructuredLogger.hpp"

#include <fstream>
#include <system_error>
#include <vector>

namespace chunknet::storage {

namespace {

const logging::ComponentLogger kLog{"splitter"};

}  // namespace

FileSplitter::FileSplitter(ChunkStore& store, std::size_t chunk_size)
    : store_(store), chunk_size_(chunk_size == 0 ? 1 : chunk_size) {}

std::size_t FileSplitter::split(const std::filesystem::path& source) {
    std::error_code ec;
    const auto file_size = std::filesystem::file_size(source, ec);
    if (ec) {
        kLog.error("split.stat_failed", {{"path", source.string()}, {"error", ec.message()}});
        return 0;
    }
    if (!store_.ensure_directory()) {
        return 0;
    }

    std::ifstream input(source, std::ios::binary);
    if (!input) {
        kLog.error("split.open_failed", {{"path", source.string()}});
        return 0;
    }

    const auto name = split_content_name(source.filename().string());
    const auto expected = (file_size + chunk_size_ - 1) / chunk_size_;
    kLog.info("split.start",
              {{"path", source.string()},
               {"size", std::to_string(file_size)},
               {"chunk_size", std::to_string(chunk_size_)},
               {"chunks", std::to_string(expected)}});

    std::vector<char> buffer(chunk_size_);
    std::size_t ordinal = 0;
    while (input) {
        input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto read = static_cast<std::size_t>(input.gcount());
        if (read == 0) {
            break;
        }

        ++ordinal;
        const auto chunk_name = make_chunk_name(name.base, ordinal, name.extension);
        const auto path = store_.chunk_path(chunk_name);
        if (!path) {
            kLog.error("split.invalid_name", {{"chunk", chunk_name}});
            return 0;
        }

        std::ofstream output(*path, std::ios::binary | std::ios::trunc);
        output.write(buffer.data(), static_cast<std::streamsize>(read));
        if (!output) {
            kLog.error("split.write_failed", {{"chunk", chunk_name}});
            return 0;
        }
        kLog.debug("split.chunk_written", {{"chunk", chunk_name}, {"size", std::to_string(read)}});
    }

    if (input.bad()) {
        kLog.error("split.read_failed", {{"path", source.string()}});
        return 0;
    }

    kLog.info("split.complete", {{"path", source.string()}, {"chunks", std::to_string(ordinal)}});
    return ordinal;
}

}  // namespace chunknet::storage
