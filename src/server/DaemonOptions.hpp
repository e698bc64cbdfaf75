/**
 * @file DaemonOptions.hpp
 * @brief Command line and environment configuration of drivewatchd
 */

#pragma once

#include "server/HttpServer.hpp"
#include "util/Error.hpp"
#include "util/Logger.hpp"

#include <chrono>
#include <expected>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace server {

/**
 * @struct DaemonOptions
 * @brief Everything drivewatchd needs to start
 */
struct DaemonOptions {
    bool show_help = false;
    bool show_version = false;

    ServerOptions server;
    std::chrono::seconds poll_interval{30};
    std::string smartctl_path = "smartctl";
    std::chrono::seconds probe_timeout{20};
    bool parallel_probes = true;
    bool collect_volumes = true;

    std::filesystem::path log_dir;  ///< Empty until resolved by parse_daemon_options
    util::LogLevel log_level = util::LogLevel::INFO;
    bool verbose = false;

    /// Ignored environment values, reported once logging is up
    std::vector<std::string> warnings;
};

/**
 * @brief Environment lookup, returns nullopt for unset variables
 */
using EnvLookup = std::function<std::optional<std::string>(std::string_view)>;

/**
 * @brief Lookup backed by the process environment
 */
[[nodiscard]] auto process_environment() -> EnvLookup;

/**
 * @brief Parse options; the command line overrides the environment
 *
 * Environment: DRIVEWATCH_PORT (then PORT), DRIVEWATCH_BIND,
 * DRIVEWATCH_INTERVAL, DRIVEWATCH_SMARTCTL, DRIVEWATCH_TIMEOUT,
 * DRIVEWATCH_LOG_DIR, DRIVEWATCH_LOG_LEVEL. Invalid environment values are
 * skipped with a warning; invalid arguments are an error.
 */
[[nodiscard]] auto parse_daemon_options(int argc, char* argv[],
                                        const EnvLookup& env = process_environment())
    -> std::expected<DaemonOptions, util::Error>;

/**
 * @brief /var/log/drivewatch for root, the user data directory otherwise
 */
[[nodiscard]] auto default_log_dir() -> std::filesystem::path;

/**
 * @brief Parse a decimal integer within [min, max]
 */
[[nodiscard]] auto parse_bounded(std::string_view text, long min, long max) -> std::optional<long>;

void print_daemon_help();
void print_daemon_version();

}  // namespace server
