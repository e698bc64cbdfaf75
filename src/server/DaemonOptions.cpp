/**
 * @file DaemonOptions.cpp
 * @brief Command line and environment configuration of drivewatchd
 */

#include "server/DaemonOptions.hpp"

#include "config.h"

#include <glib.h>

#include <unistd.h>

#include <charconv>
#include <format>
#include <iostream>

#include <getopt.h>

namespace server {

namespace {

constexpr auto APP_NAME = "drivewatchd";

constexpr long MAX_PORT = 65535;
constexpr long MAX_INTERVAL_SECONDS = 24 * 60 * 60;
constexpr long MAX_TIMEOUT_SECONDS = 60 * 60;

// Command line options
const struct option long_options[] = {
    {      "help",       no_argument, nullptr, 'h'},
    {   "version",       no_argument, nullptr, 'V'},
    {      "port", required_argument, nullptr, 'p'},
    {      "bind", required_argument, nullptr, 'b'},
    {  "interval", required_argument, nullptr, 'i'},
    {  "smartctl", required_argument, nullptr, 's'},
    {   "timeout", required_argument, nullptr, 't'},
    {"sequential",       no_argument, nullptr, 'S'},
    {"no-volumes",       no_argument, nullptr, 'n'},
    {   "log-dir", required_argument, nullptr, 'l'},
    { "log-level", required_argument, nullptr, 'L'},
    {   "verbose",       no_argument, nullptr, 'v'},
    {     nullptr,                 0, nullptr,   0}
};

/**
 * Setters shared by the environment and the command line
 */
auto apply_port(DaemonOptions& options, std::string_view value) -> bool {
    auto port = parse_bounded(value, 1, MAX_PORT);
    if (port) {
        options.server.port = static_cast<uint16_t>(*port);
    }
    return port.has_value();
}

auto apply_interval(DaemonOptions& options, std::string_view value) -> bool {
    auto seconds = parse_bounded(value, 1, MAX_INTERVAL_SECONDS);
    if (seconds) {
        options.poll_interval = std::chrono::seconds{*seconds};
    }
    return seconds.has_value();
}

auto apply_timeout(DaemonOptions& options, std::string_view value) -> bool {
    auto seconds = parse_bounded(value, 1, MAX_TIMEOUT_SECONDS);
    if (seconds) {
        options.probe_timeout = std::chrono::seconds{*seconds};
    }
    return seconds.has_value();
}

auto apply_log_level(DaemonOptions& options, std::string_view value) -> bool {
    auto level = util::parse_log_level(value);
    if (level) {
        options.log_level = *level;
    }
    return level.has_value();
}

auto apply_non_empty(std::string& target, std::string_view value) -> bool {
    if (value.empty()) {
        return false;
    }
    target = std::string(value);
    return true;
}

void apply_environment(DaemonOptions& options, const EnvLookup& env) {
    auto check = [&](std::string_view name, auto&& apply) {
        if (auto value = env(name)) {
            if (!apply(*value)) {
                options.warnings.push_back(
                    std::format("Ignoring invalid {}='{}'", name, *value));
            }
            return true;
        }
        return false;
    };

    auto port = [&](std::string_view v) { return apply_port(options, v); };
    if (!check("DRIVEWATCH_PORT", port)) {
        check("PORT", port);
    }
    check("DRIVEWATCH_BIND",
          [&](std::string_view v) { return apply_non_empty(options.server.bind_address, v); });
    check("DRIVEWATCH_INTERVAL", [&](std::string_view v) { return apply_interval(options, v); });
    check("DRIVEWATCH_SMARTCTL",
          [&](std::string_view v) { return apply_non_empty(options.smartctl_path, v); });
    check("DRIVEWATCH_TIMEOUT", [&](std::string_view v) { return apply_timeout(options, v); });
    check("DRIVEWATCH_LOG_DIR", [&](std::string_view v) {
        if (v.empty()) {
            return false;
        }
        options.log_dir = std::filesystem::path(v);
        return true;
    });
    check("DRIVEWATCH_LOG_LEVEL", [&](std::string_view v) { return apply_log_level(options, v); });
}

auto invalid_argument(char opt, std::string_view value) -> util::Error {
    return util::Error{std::format("Invalid value '{}' for -{}", value, opt)};
}

}  // namespace

auto process_environment() -> EnvLookup {
    return [](std::string_view name) -> std::optional<std::string> {
        const std::string key(name);
        if (const gchar* value = g_getenv(key.c_str())) {
            return std::string(value);
        }
        return std::nullopt;
    };
}

auto parse_daemon_options(int argc, char* argv[], const EnvLookup& env)
    -> std::expected<DaemonOptions, util::Error> {
    DaemonOptions options;
    apply_environment(options, env);

    // Full rescan, so repeated calls (tests) start from argv[1]
    optind = 0;
    opterr = 0;

    int opt;
    while ((opt = getopt_long(argc, argv, ":hVp:b:i:s:t:Snl:L:v", long_options, nullptr)) != -1) {
        const std::string_view value = optarg ? optarg : "";
        bool valid = true;

        switch (opt) {
            case 'h':
                options.show_help = true;
                break;
            case 'V':
                options.show_version = true;
                break;
            case 'p':
                valid = apply_port(options, value);
                break;
            case 'b':
                valid = apply_non_empty(options.server.bind_address, value);
                break;
            case 'i':
                valid = apply_interval(options, value);
                break;
            case 's':
                valid = apply_non_empty(options.smartctl_path, value);
                break;
            case 't':
                valid = apply_timeout(options, value);
                break;
            case 'S':
                options.parallel_probes = false;
                break;
            case 'n':
                options.collect_volumes = false;
                break;
            case 'l':
                valid = !value.empty();
                options.log_dir = std::filesystem::path(value);
                break;
            case 'L':
                valid = apply_log_level(options, value);
                break;
            case 'v':
                options.verbose = true;
                break;
            case ':':
                return std::unexpected(util::Error{
                    std::format("Option {} requires an argument", argv[optind - 1])});
            default:
                return std::unexpected(
                    util::Error{std::format("Unknown option {}", argv[optind - 1])});
        }

        if (!valid) {
            return std::unexpected(invalid_argument(static_cast<char>(opt), value));
        }
    }

    if (optind < argc) {
        return std::unexpected(util::Error{std::format("Unexpected argument '{}'", argv[optind])});
    }

    if (options.log_dir.empty()) {
        options.log_dir = default_log_dir();
    }
    return options;
}

auto default_log_dir() -> std::filesystem::path {
    if (geteuid() == 0) {
        return "/var/log/drivewatch";
    }
    return std::filesystem::path(g_get_user_data_dir()) / "drivewatch" / "logs";
}

auto parse_bounded(std::string_view text, long min, long max) -> std::optional<long> {
    long value = 0;
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (text.empty() || ec != std::errc{} || ptr != end || value < min || value > max) {
        return std::nullopt;
    }
    return value;
}

void print_daemon_help() {
    std::cout << "Usage: " << APP_NAME << " [OPTIONS]\n\n"
              << "Storage health telemetry service (smartctl -> HTTP/JSON)\n\n"
              << "Options:\n"
              << "  -p, --port <n>          Listening port (default: 3000)\n"
              << "  -b, --bind <addr>       Listening address (default: 0.0.0.0)\n"
              << "  -i, --interval <s>      Poll interval in seconds (default: 30)\n"
              << "  -s, --smartctl <path>   smartctl executable (default: smartctl)\n"
              << "  -t, --timeout <s>       Per-invocation timeout in seconds (default: 20)\n"
              << "  -S, --sequential        Probe devices one at a time\n"
              << "  -n, --no-volumes        Do not report mounted volumes\n"
              << "  -l, --log-dir <dir>     Log directory\n"
              << "  -L, --log-level <lvl>   debug, info, warning or error (default: info)\n"
              << "  -v, --verbose           Also log to stderr\n"
              << "  -h, --help              Show this help message\n"
              << "  -V, --version           Show version information\n\n"
              << "Environment:\n"
              << "  DRIVEWATCH_PORT (or PORT), DRIVEWATCH_BIND, DRIVEWATCH_INTERVAL,\n"
              << "  DRIVEWATCH_SMARTCTL, DRIVEWATCH_TIMEOUT, DRIVEWATCH_LOG_DIR,\n"
              << "  DRIVEWATCH_LOG_LEVEL\n\n"
              << "Endpoints:\n"
              << "  GET  /api/drives            Drive telemetry\n"
              << "  GET  /api/drives/volumes    Mounted volumes\n"
              << "  GET  /api/drives/all        Drives and volumes\n"
              << "  GET  /api/drives/stream     Server-Sent Events (?interval=<s>, at most "
              << ServerOptions{}.max_streams << "\n"
              << "                              open at once, 503 past that)\n"
              << "  GET  /api/status            Poller status\n"
              << "  POST /api/drives/refresh    Poll now\n"
              << std::endl;
}

void print_daemon_version() {
    std::cout << APP_NAME << " version " << PROJECT_VERSION << "\n"
              << "Part of " << PROJECT_NAME << " - storage health telemetry\n";
}

}  // namespace server
