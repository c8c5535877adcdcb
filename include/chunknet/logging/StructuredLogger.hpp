#pragma once

#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace chunknet::logging {

// One JSON object per line on std::clog, optionally mirrored to <log_dir>/chunknet.log.
class StructuredLogger {
public:
    enum class Level {
        Debug,
        Info,
        Warning,
        Error
    };

    using Field = std::pair<std::string, std::string>;
    using FieldList = std::vector<Field>;

    static StructuredLogger& instance();

    void log(Level level, std::string_view component, std::string_view event, FieldList fields = {});

    void set_enabled(bool enabled);
    [[nodiscard]] bool enabled() const noexcept;

    void set_min_level(Level level);
    [[nodiscard]] Level min_level() const noexcept;

    // Returns false (and keeps logging to the console only) if the file cannot be opened.
    bool open_log_directory(const std::filesystem::path& directory);
    void close_log_file();

    static std::optional<Level> level_from_string(std::string_view text);
    static std::string level_to_string(Level level);

private:
    StructuredLogger() = default;

    StructuredLogger(const StructuredLogger&) = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    static std::string escape_json(std::string_view value);
    static std::string format_timestamp();

    bool enabled_{true};
    Level min_level_{Level::Info};
    std::ofstream file_;
    mutable std::mutex mutex_;
};

// Per-component handle so call sites read log.info("event", {...}).
class ComponentLogger {
public:
    explicit ComponentLogger(std::string component) : component_(std::move(component)) {}

    void debug(std::string_view event, StructuredLogger::FieldList fields = {}) const {
        StructuredLogger::instance().log(StructuredLogger::Level::Debug, component_, event, std::move(fields));
    }
    void info(std::string_view event, StructuredLogger::FieldList fields = {}) const {
        StructuredLogger::instance().log(StructuredLogger::Level::Info, component_, event, std::move(fields));
    }
    void warn(std::string_view event, StructuredLogger::FieldList fields = {}) const {
        StructuredLogger::instance().log(StructuredLogger::Level::Warning, component_, event, std::move(fields));
    }
    void error(std::string_view event, StructuredLogger::FieldList fields = {}) const {
        StructuredLogger::instance().log(StructuredLogger::Level::Error, component_, event, std::move(fields));
    }

private:
    std::string component_;
};

}  // namespace chunknet::logging
