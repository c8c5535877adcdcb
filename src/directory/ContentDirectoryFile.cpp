#include "chunknet/directory/ContentDirectoryFile.hpp"

#include "chunknet/logging/StructuredLogger.hpp"
#include "chunknet/protocol/Json.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

namespace chunknet::directory {

namespace {

const logging::ComponentLogger kLog{"peer_directory"};

}  // namespace

std::string encode_content_directory(const ContentDirectory& directory) {
    auto document = json::Value::make_object();
    auto& fields = document.as_object();
    for (const auto& [chunk, entry] : directory) {
        auto value = json::Value::make_object();
        value.as_object()["checksum"] = json::Value(entry.checksum);
        auto peers = json::Value::make_array();
        for (const auto& peer : entry.peers) {
            peers.as_array().emplace_back(peer);
        }
        value.as_object()["peers"] = std::move(peers);
        fields.emplace(chunk, std::move(value));
    }
    return json::dump(document, 4);
}

std::optional<ContentDirectory> decode_content_directory(std::string_view text) {
    const auto document = json::try_parse(text);
    if (!document || !document->is_object()) {
        return std::nullopt;
    }

    ContentDirectory directory;
    for (const auto& [chunk, value] : document->as_object()) {
        const auto* checksum = value.find("checksum");
        const auto* peers = value.find("peers");
        if (!checksum || !checksum->is_string() || !peers || !peers->is_array()) {
            return std::nullopt;
        }
        ContentEntry entry{};
        entry.checksum = checksum->string_value;
        for (const auto& peer : peers->as_array()) {
            if (!peer.is_string()) {
                return std::nullopt;
            }
            entry.peers.push_back(peer.string_value);
        }
        directory.emplace(chunk, std::move(entry));
    }
    return directory;
}

std::optional<ContentDirectory> load_content_directory(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return ContentDirectory{};
    }

    std::ifstream input(path);
    if (!input) {
        kLog.error("directory.load_failed", {{"path", path.string()}, {"reason", "unreadable"}});
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << input.rdbuf();

    auto directory = decode_content_directory(buffer.str());
    if (!directory) {
        kLog.error("directory.load_failed", {{"path", path.string()}, {"reason", "malformed"}});
    }
    return directory;
}

bool save_content_directory(const ContentDirectory& directory, const std::filesystem::path& path) {
    auto temp = path;
    temp += ".tmp";

    {
        std::ofstream output(temp, std::ios::binary | std::ios::trunc);
        if (!output) {
            kLog.error("directory.save_failed", {{"path", temp.string()}, {"reason", "open"}});
            return false;
        }
        output << encode_content_directory(directory) << '\n';
        output.flush();
        if (!output) {
            kLog.error("directory.save_failed", {{"path", temp.string()}, {"reason", "write"}});
            std::error_code ignored;
            std::filesystem::remove(temp, ignored);
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp, path, ec);
    if (ec) {
        kLog.error("directory.save_failed", {{"path", path.string()}, {"error", ec.message()}});
        std::error_code ignored;
        std::filesystem::remove(temp, ignored);
        return false;
    }
    return true;
}

}  // namespace chunknet::directory
