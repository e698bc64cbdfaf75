/**
 * @file Logger.hpp
 * @brief Process-wide log file with component tags and size-based rotation
 *
 * Lines look like:
 *   2026-10-17T09:12:45.123Z [INFO ] [SnapshotPoller] Cycle 42 published 3 drive(s)
 *
 * The poller, its probe tasks and every HTTP connection thread log through
 * the same instance.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace util {

enum class LogLevel {
    DEBUG,    ///< Per-probe details (access mode skips, exit statuses)
    INFO,     ///< Cycle summaries, startup and shutdown
    WARNING,  ///< Degraded results (scan failed, device unreadable)
    ERROR     ///< Cycle-level failures, server errors
};

/**
 * @brief Parse a level name ("debug", "info", "warning"/"warn", "error")
 * @param name Level name, case-insensitive
 * @return Level, or nullopt if the name is not recognized
 */
[[nodiscard]] auto parse_log_level(std::string_view name) -> std::optional<LogLevel>;

/**
 * @struct LogRotationPolicy
 * @brief When the active file is rotated and how many old files are kept
 */
struct LogRotationPolicy {
    size_t max_file_size_bytes = 5 * 1024 * 1024;
    int max_files = 5;  ///< {app}.1.log (newest) .. {app}.N.log
};

/**
 * @class Logger
 * @brief Writes to {log_dir}/{app_name}.log, optionally mirrored to stderr
 *
 * Usage:
 * @code
 * util::Logger::instance().initialize("/var/log/drivewatch", "drivewatchd");
 * LOG_INFO("HttpServer", std::format("Listening on port {}", port));
 * @endcode
 *
 * Before initialize() (and after shutdown()) lines only reach stderr, and
 * only when console output is enabled.
 */
class Logger {
public:
    static auto instance() -> Logger&;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    /**
     * @brief Open the log file, creating the directory if needed
     * @return true if the log file is open; a previous file is closed either way
     */
    auto initialize(const std::filesystem::path& log_dir, const std::string& app_name,
                    LogLevel min_level = LogLevel::INFO,
                    LogRotationPolicy policy = {}) -> bool;

    [[nodiscard]] auto is_initialized() const -> bool;

    /**
     * @brief Whether a line at this level would be written
     *
     * Lock-free. The LOG_* macros check it before building the message.
     */
    [[nodiscard]] auto enabled(LogLevel level) const noexcept -> bool {
        return level >= min_level_.load(std::memory_order_relaxed);
    }

    void log(LogLevel level, std::string_view component, std::string_view message);

    void set_min_level(LogLevel level);
    [[nodiscard]] auto get_min_level() const -> LogLevel;

    void set_console_output(bool enable);

    /**
     * @brief Path of the active file, empty when not initialized
     */
    [[nodiscard]] auto get_log_file_path() const -> std::filesystem::path;

    /**
     * @brief Write a closing line and close the file
     */
    void shutdown();

    [[nodiscard]] static auto level_to_string(LogLevel level) -> std::string_view;

    /**
     * @brief One complete line, newline included
     */
    [[nodiscard]] static auto format_line(std::chrono::system_clock::time_point time,
                                          LogLevel level, std::string_view component,
                                          std::string_view message) -> std::string;

private:
    Logger() = default;
    ~Logger();

    // All of these expect mutex_ to be held
    void append(const std::string& line);
    void rotate();
    auto open_active_file() -> bool;
    [[nodiscard]] auto active_path() const -> std::filesystem::path;
    [[nodiscard]] auto rotated_path(int index) const -> std::filesystem::path;

    std::atomic<LogLevel> min_level_{LogLevel::INFO};

    mutable std::mutex mutex_;
    std::ofstream file_;
    std::filesystem::path log_dir_;
    std::string app_name_;
    LogRotationPolicy policy_;
    size_t file_size_ = 0;
    bool console_output_ = false;
};

}  // namespace util

#define DRIVEWATCH_LOG(level, component, msg)                         \
    do {                                                              \
        auto& drivewatch_logger_ = ::util::Logger::instance();        \
        if (drivewatch_logger_.enabled(level)) {                      \
            drivewatch_logger_.log(level, component, msg);            \
        }                                                             \
    } while (0)

#define LOG_DEBUG(component, msg) DRIVEWATCH_LOG(::util::LogLevel::DEBUG, component, msg)
#define LOG_INFO(component, msg) DRIVEWATCH_LOG(::util::LogLevel::INFO, component, msg)
#define LOG_WARNING(component, msg) DRIVEWATCH_LOG(::util::LogLevel::WARNING, component, msg)
#define LOG_ERROR(component, msg) DRIVEWATCH_LOG(::util::LogLevel::ERROR, component, msg)
