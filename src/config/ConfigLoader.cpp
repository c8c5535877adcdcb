#include "chunknet/config/ConfigLoader.hpp"

#include "chunknet/logging/StructuredLogger.hpp"
#include "chunknet/protocol/Json.hpp"

#include <fstream>
#include <limits>
#include <set>
#include <sstream>
#include <system_error>

namespace chunknet::config {

namespace {

const logging::ComponentLogger kLog{"config"};

const std::set<std::string> kKnownKeys = {
    "CHUNK_SIZE",      "BROADCAST_IP",   "BROADCAST_PORT",     "PEER_PORT",   "TARGET_PORTS",
    "MAX_CONNECTIONS", "CONNECTION_TIMEOUT", "ANNOUNCE_INTERVAL", "PEER_TIMEOUT", "DOWNLOAD_TIMEOUT",
    "CHUNK_DIR",       "LOG_DIR",        "DOWNLOADS_DIR",      "CONTENT_DICT", "LOG_LEVEL"};

std::int64_t require_integer(const json::Value& value, const std::string& key) {
    if (!value.is_integer()) {
        throw ConfigError("E_CONFIG_TYPE", key + " must be an integer");
    }
    return value.integer_value;
}

std::string require_string(const json::Value& value, const std::string& key) {
    if (!value.is_string()) {
        throw ConfigError("E_CONFIG_TYPE", key + " must be a string");
    }
    return value.string_value;
}

std::uint16_t to_port(std::int64_t value, const std::string& key) {
    if (value <= 0 || value > std::numeric_limits<std::uint16_t>::max()) {
        throw ConfigError("E_CONFIG_VALUE", key + " must be between 1 and 65535");
    }
    return static_cast<std::uint16_t>(value);
}

std::int64_t to_positive(std::int64_t value, const std::string& key) {
    if (value <= 0) {
        throw ConfigError("E_CONFIG_VALUE", key + " must be positive");
    }
    return value;
}

json::Value load_document(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        throw ConfigError("E_CONFIG_NOT_FOUND", "Configuration file could not be read: " + path.string(),
                          "Verify the path and its permissions");
    }
    std::stringstream buffer;
    buffer << input.rdbuf();

    json::Value document;
    try {
        document = json::parse(buffer.str());
    } catch (const json::ParseError& error) {
        throw ConfigError("E_CONFIG_PARSE", std::string("Invalid JSON in configuration: ") + error.what(),
                          "Fix or remove " + path.string());
    }
    if (!document.is_object()) {
        throw ConfigError("E_CONFIG_STRUCTURE", "Configuration root must be an object");
    }
    return document;
}

void apply_document(const json::Value& document, Config& config) {
    for (const auto& [key, value] : document.as_object()) {
        if (!kKnownKeys.contains(key)) {
            kLog.warn("config.unknown_key", {{"key", key}});
            continue;
        }

        if (key == "CHUNK_SIZE") {
            config.chunk_size = static_cast<std::size_t>(to_positive(require_integer(value, key), key));
        } else if (key == "BROADCAST_IP") {
            config.broadcast_ip = require_string(value, key);
        } else if (key == "BROADCAST_PORT") {
            config.broadcast_port = to_port(require_integer(value, key), key);
        } else if (key == "PEER_PORT") {
            config.peer_port = to_port(require_integer(value, key), key);
        } else if (key == "TARGET_PORTS") {
            if (!value.is_array()) {
                throw ConfigError("E_CONFIG_TYPE", "TARGET_PORTS must be an array of ports");
            }
            std::vector<std::uint16_t> ports;
            for (const auto& element : value.as_array()) {
                ports.push_back(to_port(require_integer(element, key), key));
            }
            config.target_ports = std::move(ports);
        } else if (key == "MAX_CONNECTIONS") {
            config.max_connections = static_cast<std::size_t>(to_positive(require_integer(value, key), key));
        } else if (key == "CONNECTION_TIMEOUT") {
            config.connection_timeout = std::chrono::seconds(to_positive(require_integer(value, key), key));
        } else if (key == "ANNOUNCE_INTERVAL") {
            config.announce_interval = std::chrono::seconds(to_positive(require_integer(value, key), key));
        } else if (key == "PEER_TIMEOUT") {
            config.peer_timeout = std::chrono::seconds(to_positive(require_integer(value, key), key));
        } else if (key == "DOWNLOAD_TIMEOUT") {
            config.download_timeout = std::chrono::seconds(to_positive(require_integer(value, key), key));
        } else if (key == "CHUNK_DIR") {
            config.chunk_dir = require_string(value, key);
        } else if (key == "LOG_DIR") {
            config.log_dir = require_string(value, key);
        } else if (key == "DOWNLOADS_DIR") {
            config.downloads_dir = require_string(value, key);
        } else if (key == "CONTENT_DICT") {
            config.content_dict_path = require_string(value, key);
        } else if (key == "LOG_LEVEL") {
            config.log_level = require_string(value, key);
        }
    }
}

}  // namespace

Config load_config(const std::optional<std::filesystem::path>& path, std::optional<std::uint16_t> peer_id) {
    Config config{};

    if (path) {
        std::error_code ec;
        if (std::filesystem::exists(*path, ec)) {
            apply_document(load_document(*path), config);
            kLog.info("config.loaded", {{"path", path->string()}});
        } else {
            kLog.info("config.defaults", {{"path", path->string()}});
        }
    }

    if (peer_id) {
        const auto broadcast = static_cast<std::int64_t>(config.broadcast_port) + *peer_id;
        const auto peer = static_cast<std::int64_t>(config.peer_port) + *peer_id;
        config.broadcast_port = to_port(broadcast, "BROADCAST_PORT + peer id");
        config.peer_port = to_port(peer, "PEER_PORT + peer id");
        config.peer_id = peer_id;
    }

    validate(config);
    return config;
}

void validate(const Config& config) {
    if (config.chunk_size == 0) {
        throw ConfigError("E_CONFIG_VALUE", "CHUNK_SIZE must be positive");
    }
    if (config.broadcast_port == 0 || config.peer_port == 0) {
        throw ConfigError("E_CONFIG_VALUE", "Ports must be between 1 and 65535");
    }
    if (config.target_ports.empty()) {
        throw ConfigError("E_CONFIG_VALUE", "TARGET_PORTS must list at least one port");
    }
    for (const auto port : config.target_ports) {
        if (port == 0) {
            throw ConfigError("E_CONFIG_VALUE", "TARGET_PORTS entries must be between 1 and 65535");
        }
    }
    if (config.max_connections == 0) {
        throw ConfigError("E_CONFIG_VALUE", "MAX_CONNECTIONS must be positive");
    }
    if (config.download_workers == 0 || config.announce_batch_size == 0 || config.announce_max_datagram == 0) {
        throw ConfigError("E_CONFIG_VALUE", "Worker and batch limits must be positive");
    }
    if (config.connection_timeout.count() <= 0 || config.announce_interval.count() <= 0 ||
        config.peer_timeout.count() <= 0 || config.reaper_interval.count() <= 0 ||
        config.download_timeout.count() <= 0) {
        throw ConfigError("E_CONFIG_VALUE", "Durations must be positive");
    }
    if (config.connect_timeout.count() <= 0 || config.io_timeout.count() <= 0 ||
        config.server_idle_timeout.count() <= 0 || config.queue_poll_interval.count() <= 0) {
        throw ConfigError("E_CONFIG_VALUE", "Socket and queue timeouts must be positive");
    }
    if (config.chunk_dir.empty() || config.log_dir.empty() || config.downloads_dir.empty() ||
        config.content_dict_path.empty()) {
        throw ConfigError("E_CONFIG_VALUE", "Directory and file paths must not be empty");
    }
    if (!logging::StructuredLogger::level_from_string(config.log_level)) {
        throw ConfigError("E_CONFIG_VALUE", "Unknown LOG_LEVEL: " + config.log_level,
                          "Use one of debug, info, warning, error");
    }
}

void save_config(const Config& config, const std::filesystem::path& path) {
    auto document = json::Value::make_object();
    auto& fields = document.as_object();

    // Ports are written without the peer id offset so the file can be shared between peers.
    const std::uint16_t offset = config.peer_id.value_or(0);
    fields["CHUNK_SIZE"] = json::Value(static_cast<std::int64_t>(config.chunk_size));
    fields["BROADCAST_IP"] = json::Value(config.broadcast_ip);
    fields["BROADCAST_PORT"] = json::Value(static_cast<std::int64_t>(config.broadcast_port - offset));
    fields["PEER_PORT"] = json::Value(static_cast<std::int64_t>(config.peer_port - offset));
    auto ports = json::Value::make_array();
    for (const auto port : config.target_ports) {
        ports.as_array().emplace_back(static_cast<std::int64_t>(port));
    }
    fields["TARGET_PORTS"] = std::move(ports);
    fields["MAX_CONNECTIONS"] = json::Value(static_cast<std::int64_t>(config.max_connections));
    fields["CONNECTION_TIMEOUT"] = json::Value(static_cast<std::int64_t>(config.connection_timeout.count()));
    fields["ANNOUNCE_INTERVAL"] = json::Value(static_cast<std::int64_t>(config.announce_interval.count()));
    fields["PEER_TIMEOUT"] = json::Value(static_cast<std::int64_t>(config.peer_timeout.count()));
    fields["DOWNLOAD_TIMEOUT"] = json::Value(static_cast<std::int64_t>(config.download_timeout.count()));
    fields["CHUNK_DIR"] = json::Value(config.chunk_dir);
    fields["LOG_DIR"] = json::Value(config.log_dir);
    fields["DOWNLOADS_DIR"] = json::Value(config.downloads_dir);
    fields["CONTENT_DICT"] = json::Value(config.content_dict_path);
    fields["LOG_LEVEL"] = json::Value(config.log_level);

    std::ofstream output(path, std::ios::trunc);
    if (!output) {
        throw ConfigError("E_CONFIG_WRITE", "Failed to save configuration: " + path.string());
    }
    output << json::dump(document, 4) << '\n';
    if (!output) {
        throw ConfigError("E_CONFIG_WRITE", "Failed to save configuration: " + path.string());
    }
}

bool ensure_directories(const Config& config) {
    bool ok = true;
    for (const auto& directory : {config.chunk_dir, config.log_dir, config.downloads_dir}) {
        std::error_code ec;
        std::filesystem::create_directories(directory, ec);
        if (ec) {
            kLog.error("config.mkdir_failed", {{"path", directory}, {"error", ec.message()}});
            ok = false;
        }
    }
    return ok;
}

}  // namespace chunknet::config
