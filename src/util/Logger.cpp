/**
 * @file Logger.cpp
 * @brief Process-wide log file with component tags and size-based rotation
 */

#include "util/Logger.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <iostream>

namespace util {

namespace {

struct LevelName {
    std::string_view name;
    LogLevel level;
};

constexpr std::array LEVEL_NAMES{
    LevelName{.name = "debug", .level = LogLevel::DEBUG},
    LevelName{.name = "info", .level = LogLevel::INFO},
    LevelName{.name = "warning", .level = LogLevel::WARNING},
    LevelName{.name = "warn", .level = LogLevel::WARNING},
    LevelName{.name = "error", .level = LogLevel::ERROR},
};

auto equals_ignore_case(std::string_view a, std::string_view b) -> bool {
    return std::ranges::equal(a, b, [](unsigned char x, unsigned char y) {
        return std::tolower(x) == std::tolower(y);
    });
}

}  // namespace

auto parse_log_level(std::string_view name) -> std::optional<LogLevel> {
    const auto it = std::ranges::find_if(LEVEL_NAMES, [name](const LevelName& entry) {
        return equals_ignore_case(entry.name, name);
    });
    if (it == LEVEL_NAMES.end()) {
        return std::nullopt;
    }
    return it->level;
}

auto Logger::instance() -> Logger& {
    static Logger logger;
    return logger;
}

Logger::~Logger() {
    shutdown();
}

auto Logger::initialize(const std::filesystem::path& log_dir, const std::string& app_name,
                        LogLevel min_level, LogRotationPolicy policy) -> bool {
    min_level_.store(min_level, std::memory_order_relaxed);

    std::lock_guard lock(mutex_);
    if (file_.is_open()) {
        file_.close();
    }
    log_dir_ = log_dir;
    app_name_ = app_name;
    policy_ = policy;
    file_size_ = 0;

    std::error_code ec;
    std::filesystem::create_directories(log_dir_, ec);
    if (ec) {
        std::cerr << std::format("Logger: cannot create {}: {}\n", log_dir_.string(),
                                 ec.message());
        return false;
    }
    if (!open_active_file()) {
        return false;
    }

    append(format_line(std::chrono::system_clock::now(), LogLevel::INFO, "Logger",
                       std::format("Logging to {} (level {}, rotate at {} bytes, keep {})",
                                   active_path().string(), level_to_string(min_level),
                                   policy_.max_file_size_bytes, policy_.max_files)));
    return true;
}

auto Logger::is_initialized() const -> bool {
    std::lock_guard lock(mutex_);
    return file_.is_open();
}

void Logger::log(LogLevel level, std::string_view component, std::string_view message) {
    if (!enabled(level)) {
        return;
    }
    const auto line = format_line(std::chrono::system_clock::now(), level, component, message);

    std::lock_guard lock(mutex_);
    if (file_.is_open()) {
        if (file_size_ >= policy_.max_file_size_bytes) {
            rotate();
        }
        if (file_.is_open()) {
            append(line);
        }
    }
    if (console_output_) {
        std::cerr << line;
    }
}

void Logger::set_min_level(LogLevel level) {
    min_level_.store(level, std::memory_order_relaxed);
}

auto Logger::get_min_level() const -> LogLevel {
    return min_level_.load(std::memory_order_relaxed);
}

void Logger::set_console_output(bool enable) {
    std::lock_guard lock(mutex_);
    console_output_ = enable;
}

auto Logger::get_log_file_path() const -> std::filesystem::path {
    std::lock_guard lock(mutex_);
    return file_.is_open() ? active_path() : std::filesystem::path{};
}

void Logger::shutdown() {
    std::lock_guard lock(mutex_);
    if (!file_.is_open()) {
        return;
    }
    append(format_line(std::chrono::system_clock::now(), LogLevel::INFO, "Logger",
                       "Closing log"));
    file_.close();
}

auto Logger::level_to_string(LogLevel level) -> std::string_view {
    // Padded to five characters so messages line up
    switch (level) {
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::INFO:
            return "INFO ";
        case LogLevel::WARNING:
            return "WARN ";
        case LogLevel::ERROR:
            return "ERROR";
    }
    return "?????";
}

auto Logger::format_line(std::chrono::system_clock::time_point time, LogLevel level,
                         std::string_view component, std::string_view message) -> std::string {
    return std::format("{:%FT%T}Z [{}] [{}] {}\n",
                       std::chrono::floor<std::chrono::milliseconds>(time),
                       level_to_string(level), component, message);
}

void Logger::append(const std::string& line) {
    file_ << line;
    file_.flush();
    file_size_ += line.size();
}

auto Logger::open_active_file() -> bool {
    const auto path = active_path();
    file_.open(path, std::ios::app);
    if (!file_.is_open()) {
        std::cerr << std::format("Logger: cannot open {}\n", path.string());
        return false;
    }

    std::error_code ec;
    const auto existing = std::filesystem::file_size(path, ec);
    file_size_ = ec ? 0 : static_cast<size_t>(existing);
    return true;
}

auto Logger::active_path() const -> std::filesystem::path {
    return log_dir_ / std::format("{}.log", app_name_);
}

auto Logger::rotated_path(int index) const -> std::filesystem::path {
    return log_dir_ / std::format("{}.{}.log", app_name_, index);
}

void Logger::rotate() {
    file_.close();

    // Drop the oldest, shift the rest up by one, then the active file becomes .1
    std::error_code ec;
    std::filesystem::remove(rotated_path(policy_.max_files), ec);
    for (int index = policy_.max_files - 1; index >= 1; --index) {
        std::filesystem::rename(rotated_path(index), rotated_path(index + 1), ec);
    }
    std::filesystem::rename(active_path(), rotated_path(1), ec);

    if (open_active_file()) {
        append(format_line(std::chrono::system_clock::now(), LogLevel::INFO, "Logger",
                           "Rotated log file"));
    }
}

}  // namespace util
