/**
 * @file CliApplication.cpp
 * @brief CLI application implementation
 */

#include "cli/CliApplication.hpp"

#include "config.h"
#include "serialization/SnapshotJson.hpp"
#include "server/DaemonOptions.hpp"
#include "services/AttributeNormalizer.hpp"
#include "services/DeviceEnumerator.hpp"
#include "services/DeviceReader.hpp"
#include "services/ProbeExecutor.hpp"
#include "services/SnapshotPoller.hpp"
#include "services/SnapshotStore.hpp"
#include "services/VolumeCollector.hpp"
#include "util/JsonFields.hpp"
#include "util/Logger.hpp"

#include <glib.h>

#include <filesystem>
#include <format>
#include <iostream>
#include <variant>

#include <getopt.h>

namespace cli {

namespace {

// Application name
constexpr auto APP_NAME = "drivewatch-cli";

constexpr long MAX_TIMEOUT_SECONDS = 60 * 60;

// Command line options
const struct option long_options[] = {
    {    "help",       no_argument, nullptr, 'h'},
    { "version",       no_argument, nullptr, 'V'},
    {    "list",       no_argument, nullptr, 'l'},
    { "volumes",       no_argument, nullptr, 'm'},
    {    "json",       no_argument, nullptr, 'j'},
    {  "device", required_argument, nullptr, 'd'},
    {"smartctl", required_argument, nullptr, 's'},
    { "timeout", required_argument, nullptr, 't'},
    {   nullptr,                 0, nullptr,   0}
};

auto optional_number(const std::optional<int>& value, std::string_view suffix) -> std::string {
    return value ? std::format("{}{}", *value, suffix) : std::string("-");
}

}  // namespace

CliApplication::CliApplication(std::shared_ptr<IProbeExecutor> executor)
    : executor_(std::move(executor)) {}

CliApplication::~CliApplication() = default;

auto CliApplication::run(int argc, char* argv[]) -> int {
    // Initialize logger for CLI application
    auto log_dir = std::filesystem::path(g_get_user_data_dir()) / "drivewatch" / "logs";
    util::Logger::instance().initialize(log_dir, APP_NAME);

    auto options = parse_args(argc, argv);

    if (!options.error.empty()) {
        std::cerr << "Error: " << options.error << "\n"
                  << "Run with --help for usage.\n";
        return 1;
    }

    if (options.show_help) {
        print_help();
        return 0;
    }

    if (options.show_version) {
        print_version();
        return 0;
    }

    if (!executor_) {
        executor_ = std::make_shared<ProbeExecutor>(options.smartctl_path, options.timeout);
    }

    if (!options.device_path.empty()) {
        return cmd_device(options);
    }

    if (options.list_drives) {
        return cmd_list(options);
    }

    if (options.list_volumes) {
        return cmd_volumes(options);
    }

    // No command specified
    print_help();
    return 1;
}

auto CliApplication::parse_args(int argc, char* argv[]) -> CliOptions {
    CliOptions options;

    optind = 0;
    opterr = 0;

    int opt;
    while ((opt = getopt_long(argc, argv, ":hVlmjd:s:t:", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'h':
                options.show_help = true;
                break;
            case 'V':
                options.show_version = true;
                break;
            case 'l':
                options.list_drives = true;
                break;
            case 'm':
                options.list_volumes = true;
                break;
            case 'j':
                options.json_output = true;
                break;
            case 'd':
                options.device_path = optarg;
                break;
            case 's':
                options.smartctl_path = optarg;
                break;
            case 't':
                if (auto seconds = server::parse_bounded(optarg, 1, MAX_TIMEOUT_SECONDS)) {
                    options.timeout = std::chrono::seconds{*seconds};
                } else {
                    options.error = std::format("Invalid timeout '{}'", optarg);
                }
                break;
            case ':':
                options.error = std::format("Option {} requires an argument", argv[optind - 1]);
                break;
            default:
                options.error = std::format("Unknown option {}", argv[optind - 1]);
                break;
        }
    }

    return options;
}

void CliApplication::print_help() {
    std::cout << "Usage: " << APP_NAME << " [OPTIONS]\n\n"
              << "Storage health telemetry from smartctl\n\n"
              << "Commands:\n"
              << "  -l, --list              List all drives (add --volumes for volumes too)\n"
              << "  -d, --device <dev>      Read a single device\n"
              << "  -m, --volumes           List mounted volumes\n\n"
              << "Options:\n"
              << "  -h, --help              Show this help message\n"
              << "  -V, --version           Show version information\n"
              << "  -j, --json              Output in JSON format\n"
              << "  -s, --smartctl <path>   smartctl executable (default: smartctl)\n"
              << "  -t, --timeout <s>       Per-invocation timeout (default: 20)\n\n"
              << "Examples:\n"
              << "  " << APP_NAME << " --list\n"
              << "  " << APP_NAME << " --list --volumes --json\n"
              << "  " << APP_NAME << " --device /dev/nvme0\n"
              << std::endl;
}

void CliApplication::print_version() {
    std::cout << APP_NAME << " version " << PROJECT_VERSION << "\n"
              << "Part of " << PROJECT_NAME << " - storage health telemetry\n";
}

auto CliApplication::cmd_list(const CliOptions& options) -> int {
    auto store = std::make_shared<SnapshotStore>();
    SnapshotPoller poller(std::make_shared<DeviceEnumerator>(executor_),
                          std::make_shared<DeviceReader>(executor_),
                          options.list_volumes ? std::make_shared<VolumeCollector>() : nullptr,
                          store);

    if (auto cycle = poller.run_cycle(); !cycle) {
        LOG_ERROR("CLI", cycle.error().message);
        std::cerr << "Error: " << cycle.error().message << "\n";
        return 1;
    }

    const auto snapshot = store->current();
    if (options.json_output) {
        const auto document = options.list_volumes ? SnapshotJson::full_document(*snapshot)
                                                   : SnapshotJson::drives_document(*snapshot);
        std::cout << util::json::write_pretty(document) << "\n";
        return 0;
    }

    if (snapshot->scan_status == ScanStatus::SCAN_FAILED) {
        std::cerr << "Warning: device scan failed, see the log for details.\n";
    }
    if (snapshot->drives.empty()) {
        std::cout << "No drives found.\n";
    } else {
        std::cout << format_drive_table(snapshot->drives);
    }
    if (options.list_volumes) {
        std::cout << "\n" << format_volume_table(snapshot->volumes);
    }
    return 0;
}

auto CliApplication::cmd_device(const CliOptions& options) -> int {
    DeviceReader reader(executor_);
    auto telemetry = reader.read(options.device_path);
    if (!telemetry) {
        LOG_ERROR("CLI", telemetry.error().message);
        std::cerr << "Error: " << telemetry.error().message << "\n";
        return 1;
    }

    const DriveEntry entry = AttributeNormalizer::normalize(options.device_path, *telemetry);
    if (options.json_output) {
        std::cout << util::json::write_pretty(SnapshotJson::drive_entry(entry)) << "\n";
    } else {
        std::cout << format_drive_table({entry});
    }
    return 0;
}

auto CliApplication::cmd_volumes(const CliOptions& options) -> int {
    Snapshot snapshot;
    snapshot.volumes = VolumeCollector().collect();

    if (options.json_output) {
        std::cout << util::json::write_pretty(SnapshotJson::volumes_document(snapshot)) << "\n";
    } else if (snapshot.volumes.empty()) {
        std::cout << "No volumes found.\n";
    } else {
        std::cout << format_volume_table(snapshot.volumes);
    }
    return 0;
}

auto CliApplication::format_drive_table(const std::vector<DriveEntry>& drives) -> std::string {
    std::string out = std::format("{:<16} {:<8} {:<28} {:>7} {:>6} {:>12} {:>8}\n", "DEVICE",
                                  "TYPE", "MODEL", "HEALTH", "TEMP", "WRITTEN", "HOURS");

    for (const auto& entry : drives) {
        if (const auto* error = std::get_if<DriveError>(&entry)) {
            out += std::format("{:<16} {}\n", error->device, error->message);
            continue;
        }
        const auto& drive = std::get<DriveRecord>(entry);
        out += std::format("{:<16} {:<8} {:<28.28} {:>7} {:>6} {:>9.2f} GB {:>8}\n",
                           drive.device, drive_type_name(drive.type), drive.model,
                           optional_number(drive.health_percent, "%"),
                           optional_number(drive.live_temperature_c, "C"), drive.written_gb,
                           drive.power_on_hours);
    }
    return out;
}

auto CliApplication::format_volume_table(const std::vector<VolumeInfo>& volumes) -> std::string {
    std::string out = std::format("{:<24} {:<24} {:>10} {:>10} {:>6}\n", "MOUNT", "SOURCE",
                                  "FREE", "USED", "USE%");
    for (const auto& volume : volumes) {
        out += std::format("{:<24} {:<24} {:>7.2f} GB {:>7.2f} GB {:>5.1f}%\n",
                           volume.drive_letter, volume.volume_name, volume.free_gb,
                           volume.used_gb, volume.usage_percent);
    }
    return out;
}

}  // namespace cli
