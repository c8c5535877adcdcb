#pragma once

#include "chunknet/Config.hpp"

#include <exception>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>

namespace chunknet::config {

struct ConfigError : public std::exception {
    std::string code;
    std::string message;
    std::string hint;
    std::string formatted;

    ConfigError(std::string c, std::string m, std::string h = {})
        : code(std::move(c)), message(std::move(m)), hint(std::move(h)) {
        if (!code.empty()) {
            formatted = "[" + code + "] " + message;
        } else {
            formatted = message;
        }
    }

    const char* what() const noexcept override { return formatted.c_str(); }
};

// Defaults overlaid with the JSON object at `path` (missing file -> defaults). When a peer id
// is given, broadcast_port and peer_port are offset by it. Throws ConfigError.
Config load_config(const std::optional<std::filesystem::path>& path,
                   std::optional<std::uint16_t> peer_id = std::nullopt);

// Throws ConfigError(E_CONFIG_VALUE) on the first invalid option.
void validate(const Config& config);

void save_config(const Config& config, const std::filesystem::path& path);

// Creates chunk, log and download directories; returns false if any could not be created.
bool ensure_directories(const Config& config);

}  // namespace chunknet::config
