#include "chunknet/Config.hpp"
#include "chunknet/config/ConfigLoader.hpp"
#include "chunknet/core/DownloadCoordinator.hpp"
#include "chunknet/directory/ContentDirectoryFile.hpp"
#include "chunknet/directory/PeerDirectory.hpp"
#include "chunknet/logging/StructuredLogger.hpp"
#include "chunknet/network/Announcer.hpp"
#include "chunknet/network/ChunkServer.hpp"
#include "chunknet/network/ConnectionPool.hpp"
#include "chunknet/network/Listener.hpp"
#include "chunknet/storage/ChunkStore.hpp"
#include "chunknet/storage/FileSplitter.hpp"

#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <iostream>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif

namespace {

using namespace std::chrono_literals;

constexpr const char* kChunknetVersion = "0.1.0";

const chunknet::logging::ComponentLogger kLog{"cli"};

class CliException : public std::exception {
public:
    CliException(std::string code, std::string message, std::string hint = {})
        : code_(std::move(code)), message_(std::move(message)), hint_(std::move(hint)) {
        formatted_ = code_.empty() ? message_ : ("[" + code_ + "] " + message_);
    }

    const char* what() const noexcept override {
        return formatted_.c_str();
    }

    const std::string& code() const& {
        return code_;
    }

    const std::string& message() const& {
        return message_;
    }

    const std::string& hint() const& {
        return hint_;
    }

private:
    std::string code_;
    std::string message_;
    std::string hint_;
    std::string formatted_;
};

[[noreturn]] void throw_cli_error(std::string code, std::string message, std::string hint = {}) {
    throw CliException(std::move(code), std::move(message), std::move(hint));
}

void print_cli_error(const CliException& ex) {
    std::cerr << ex.what() << std::endl;
    if (!ex.hint().empty()) {
        std::cerr << "Hint: " << ex.hint() << std::endl;
    }
}

struct GlobalOptions {
    std::optional<std::filesystem::path> config_path;
    std::optional<std::uint16_t> peer_id;
    std::optional<std::string> log_level;
};

bool parse_uint16(std::string_view text, std::uint16_t& value) {
    unsigned int parsed = 0;
    const auto result = std::from_chars(text.data(), text.data() + text.size(), parsed);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size() ||
        parsed > std::numeric_limits<std::uint16_t>::max()) {
        return false;
    }
    value = static_cast<std::uint16_t>(parsed);
    return true;
}

std::atomic<bool> g_run_loop{false};

extern "C" void signal_handler(int signal_code) {
    switch (signal_code) {
    case SIGINT:
    case SIGTERM:
#ifdef SIGQUIT
    case SIGQUIT:
#endif
        g_run_loop.store(false, std::memory_order_release);
        break;
    default:
        break;
    }
}

#ifdef _WIN32
BOOL WINAPI windows_console_ctrl_handler(DWORD control_type) {
    switch (control_type) {
    case CTRL_C_EVENT:
    case CTRL_BREAK_EVENT:
    case CTRL_CLOSE_EVENT:
        g_run_loop.store(false, std::memory_order_release);
        return TRUE;
    default:
        return FALSE;
    }
}
#endif

void install_termination_handlers() {
#ifdef _WIN32
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    SetConsoleCtrlHandler(windows_console_ctrl_handler, TRUE);
#else
    auto install = [](int sig) {
        struct sigaction action{};
        action.sa_handler = signal_handler;
        sigemptyset(&action.sa_mask);
        action.sa_flags = 0;
        sigaction(sig, &action, nullptr);
    };
    install(SIGINT);
    install(SIGTERM);
#ifdef SIGQUIT
    install(SIGQUIT);
#endif
#endif
}

void uninstall_termination_handlers() {
#ifdef _WIN32
    SetConsoleCtrlHandler(windows_console_ctrl_handler, FALSE);
#endif
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
#ifdef SIGQUIT
    std::signal(SIGQUIT, SIG_DFL);
#endif
}

// Blocks until SIGINT/SIGTERM.
void run_until_interrupted() {
    g_run_loop.store(true, std::memory_order_release);
    install_termination_handlers();
    while (g_run_loop.load(std::memory_order_acquire)) {
        std::this_thread::sleep_for(200ms);
    }
    uninstall_termination_handlers();
    kLog.info("cli.shutdown");
    std::cout << "\nInterrupt received, shutting down..." << std::endl;
}

void print_usage() {
    std::cout << "chunknet " << kChunknetVersion << "\n";
    std::cout << "Usage: chunknet [options] <command> [args]\n\n";
    std::cout << "Options:\n"
              << "  --config <file>           JSON configuration (default ./peer_config.json)\n"
              << "  --peer-id <n>             Offset broadcast and peer ports by n\n"
              << "  --log-level <level>       debug, info, warning or error\n"
              << "  --version                 Print the version and exit\n"
              << "  --help                    Print this help message\n\n";
    std::cout << "Commands:\n"
              << "  split <file>              Split a file into chunks in the chunk directory\n"
              << "  announce                  Broadcast the local chunk inventory periodically\n"
              << "  listen                    Collect announcements into the content directory\n"
              << "  serve                     Serve local chunks to downloading peers\n"
              << "  download <name> [--out <path>]\n"
              << "                            Fetch, verify and reassemble a content item\n"
              << "  peers                     Print the persisted content directory\n"
              << "  help                      Alias for --help\n";
}

chunknet::Config build_config(const GlobalOptions& options) {
    chunknet::Config config{};
    try {
        config = chunknet::config::load_config(options.config_path.value_or("peer_config.json"), options.peer_id);
        if (options.log_level) {
            config.log_level = *options.log_level;
            chunknet::config::validate(config);
        }
    } catch (const chunknet::config::ConfigError& ex) {
        throw_cli_error(ex.code, ex.message, ex.hint);
    }
    return config;
}

void configure_logging(const chunknet::Config& config) {
    auto& logger = chunknet::logging::StructuredLogger::instance();
    if (const auto level = chunknet::logging::StructuredLogger::level_from_string(config.log_level)) {
        logger.set_min_level(*level);
    }
    logger.open_log_directory(config.log_dir);
}

chunknet::network::ConnectionPool::Options pool_options(const chunknet::Config& config) {
    chunknet::network::ConnectionPool::Options options{};
    options.max_connections = config.max_connections;
    options.connect_timeout = config.connect_timeout;
    options.io_timeout = config.io_timeout;
    options.idle_timeout = config.connection_timeout;
    options.default_port = config.peer_port;
    return options;
}

int run_split(const chunknet::Config& config, const std::vector<std::string_view>& args, std::size_t index) {
    if (index >= args.size()) {
        throw_cli_error("E_MISSING_ARGUMENT", "split requires a file path", "Usage: chunknet split <file>");
    }
    const std::filesystem::path source{std::string(args[index])};
    chunknet::storage::ChunkStore store(config.chunk_dir);
    chunknet::storage::FileSplitter splitter(store, config.chunk_size);
    const auto count = splitter.split(source);
    if (count == 0) {
        throw_cli_error("E_SPLIT_FAILED", "Failed to split " + source.string(), "Check that the file exists and is readable");
    }
    std::cout << "File successfully split into " << count << " chunks" << std::endl;
    return 0;
}

int run_announce(const chunknet::Config& config) {
    chunknet::storage::ChunkStore store(config.chunk_dir);
    chunknet::network::Announcer::Options options{};
    options.target_ports = config.target_ports;
    options.interval = config.announce_interval;
    options.batch_size = config.announce_batch_size;
    options.max_datagram = config.announce_max_datagram;
    if (config.peer_id) {
        options.peer_port = config.peer_port;
    }

    chunknet::network::Announcer announcer(store, options);
    try {
        announcer.start();
    } catch (const std::runtime_error& ex) {
        throw_cli_error("E_ANNOUNCE_START", ex.what());
    }
    std::cout << "Announcing chunks from " << config.chunk_dir << ". Press Ctrl+C to exit." << std::endl;
    run_until_interrupted();
    announcer.stop();
    return 0;
}

int run_listen(const chunknet::Config& config) {
    chunknet::directory::PeerDirectory directory(config.peer_timeout);
    chunknet::network::Listener::Options options{};
    options.host = config.broadcast_ip;
    options.port = config.broadcast_port;
    options.content_dict_path = config.content_dict_path;
    options.reaper_interval = config.reaper_interval;

    chunknet::network::Listener listener(directory, options);
    try {
        listener.start();
    } catch (const std::runtime_error& ex) {
        throw_cli_error("E_LISTEN_START", ex.what(), "Is another listener already bound to this port?");
    }
    std::cout << "Listening for announcements on port " << listener.port() << ". Press Ctrl+C to exit." << std::endl;
    run_until_interrupted();
    listener.stop();
    return 0;
}

int run_serve(const chunknet::Config& config) {
    chunknet::storage::ChunkStore store(config.chunk_dir);
    chunknet::network::ChunkServer server(store, config.server_idle_timeout);
    try {
        server.start("0.0.0.0", config.peer_port);
    } catch (const std::runtime_error& ex) {
        throw_cli_error("E_SERVE_START", ex.what(), "Use --peer-id to pick a different port");
    }
    std::cout << "Serving chunks on port " << server.port() << ". Press Ctrl+C to exit." << std::endl;
    run_until_interrupted();
    server.stop();
    return 0;
}

int run_download(const chunknet::Config& config, const std::vector<std::string_view>& args, std::size_t index) {
    std::optional<std::string> content_name;
    std::optional<std::filesystem::path> output;
    while (index < args.size()) {
        const auto arg = args[index++];
        if (arg == "--out") {
            if (index >= args.size()) {
                throw_cli_error("E_MISSING_VALUE", "--out requires a value", "Provide the output path after --out");
            }
            output = std::filesystem::path(std::string(args[index++]));
            continue;
        }
        if (arg.starts_with("-")) {
            throw_cli_error("E_DOWNLOAD_UNKNOWN_OPTION", "Unknown option for download: " + std::string(arg));
        }
        if (content_name) {
            throw_cli_error("E_DOWNLOAD_ARGS", "download accepts a single content name");
        }
        content_name = std::string(arg);
    }
    if (!content_name) {
        throw_cli_error("E_MISSING_ARGUMENT", "download requires a content name",
                        "Usage: chunknet download <name> [--out <path>]");
    }

    const auto directory = chunknet::directory::load_content_directory(config.content_dict_path);
    if (!directory) {
        throw_cli_error("E_CONTENT_DICT", "Content directory could not be read: " + config.content_dict_path,
                        "Run 'chunknet listen' to rebuild it");
    }

    chunknet::storage::ChunkStore store(config.chunk_dir);
    chunknet::network::ConnectionPool pool(pool_options(config));
    pool.start_reaper(config.reaper_interval);

    chunknet::core::DownloadCoordinator::Options options{};
    options.max_workers = config.download_workers;
    options.timeout = config.download_timeout;
    options.queue_poll = config.queue_poll_interval;
    chunknet::core::DownloadCoordinator coordinator(pool, store, options);

    const auto destination = output.value_or(std::filesystem::path(config.downloads_dir) / *content_name);
    const auto result = coordinator.download(*content_name, *directory, destination);
    pool.stop_reaper();
    pool.close_all();

    if (!result.ok()) {
        std::string hint;
        if (!result.missing_chunks.empty()) {
            hint = "Missing chunks:";
            for (const auto& chunk : result.missing_chunks) {
                hint += " " + chunk;
            }
        }
        throw_cli_error("E_DOWNLOAD_FAILED",
                        "Download of " + *content_name + " failed: " + std::string(chunknet::core::to_string(result.status)),
                        hint);
    }
    std::cout << "Successfully downloaded and reconstructed: " << result.output.string() << std::endl;
    return 0;
}

int run_peers(const chunknet::Config& config) {
    const auto directory = chunknet::directory::load_content_directory(config.content_dict_path);
    if (!directory) {
        throw_cli_error("E_CONTENT_DICT", "Content directory could not be read: " + config.content_dict_path);
    }
    if (directory->empty()) {
        std::cout << "No chunks known." << std::endl;
        return 0;
    }
    for (const auto& [chunk, entry] : *directory) {
        std::cout << chunk << "  " << entry.checksum.substr(0, 16) << "  ";
        for (std::size_t i = 0; i < entry.peers.size(); ++i) {
            std::cout << (i == 0 ? "" : ",") << entry.peers[i];
        }
        std::cout << '\n';
    }
    std::cout.flush();
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    try {
        std::vector<std::string_view> args;
        args.reserve(static_cast<std::size_t>(argc));
        for (int i = 1; i < argc; ++i) {
            args.emplace_back(argv[i]);
        }

        GlobalOptions options{};
        std::size_t index = 0;

        auto require_value = [&](std::string_view option) -> std::string {
            if (index >= args.size()) {
                throw_cli_error("E_MISSING_VALUE",
                                std::string(option) + " requires a value",
                                "Provide an argument immediately after " + std::string(option));
            }
            return std::string(args[index++]);
        };

        std::optional<std::string> command;
        while (index < args.size()) {
            if (!args[index].starts_with("-")) {
                command = std::string(args[index++]);
                break;
            }

            const auto opt = args[index++];
            if (opt == "--help" || opt == "-h") {
                print_usage();
                return 0;
            }
            if (opt == "--version") {
                std::cout << "chunknet " << kChunknetVersion << std::endl;
                return 0;
            }
            if (opt == "--config") {
                if (options.config_path) {
                    throw_cli_error("E_DUPLICATE_OPTION",
                                    "Option --config specified multiple times",
                                    "Provide the configuration file only once");
                }
                options.config_path = require_value(opt);
                continue;
            }
            if (opt == "--peer-id") {
                const auto value = require_value(opt);
                std::uint16_t peer_id{};
                if (!parse_uint16(value, peer_id)) {
                    throw_cli_error("E_INVALID_PEER_ID",
                                    "--peer-id must be an unsigned integer",
                                    "For example: --peer-id 1");
                }
                options.peer_id = peer_id;
                continue;
            }
            if (opt == "--log-level") {
                options.log_level = require_value(opt);
                continue;
            }
            throw_cli_error("E_UNKNOWN_OPTION",
                            "Unknown option: " + std::string(opt),
                            "Run 'chunknet --help' to view usage");
        }

        if (!command || *command == "help") {
            print_usage();
            return command ? 0 : 1;
        }

        const auto config = build_config(options);
        configure_logging(config);
        kLog.debug("cli.command", {{"command", *command},
                                   {"peer_port", std::to_string(config.peer_port)},
                                   {"broadcast_port", std::to_string(config.broadcast_port)}});
        if (!chunknet::config::ensure_directories(config)) {
            throw_cli_error("E_DIRECTORIES", "Failed to create the chunk, log or download directory");
        }

        if (*command == "split") {
            return run_split(config, args, index);
        }
        if (*command == "announce") {
            return run_announce(config);
        }
        if (*command == "listen") {
            return run_listen(config);
        }
        if (*command == "serve") {
            return run_serve(config);
        }
        if (*command == "download") {
            return run_download(config, args, index);
        }
        if (*command == "peers") {
            return run_peers(config);
        }
        throw_cli_error("E_UNKNOWN_COMMAND",
                        "Unknown command: " + *command,
                        "Run 'chunknet --help' to view usage");
    } catch (const CliException& ex) {
        print_cli_error(ex);
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error [E_UNEXPECTED]: " << ex.what() << std::endl;
        return 1;
    }
}
