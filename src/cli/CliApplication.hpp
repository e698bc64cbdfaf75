/**
 * @file CliApplication.hpp
 * @brief One-shot command line front end: poll once and print
 */

#pragma once

#include "models/Snapshot.hpp"
#include "services/IProbeExecutor.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace cli {

/**
 * @struct CliOptions
 * @brief Parsed command line options
 */
struct CliOptions {
    bool show_help = false;
    bool show_version = false;
    bool list_drives = false;
    bool list_volumes = false;
    bool json_output = false;
    std::string device_path;  ///< --device, read a single device
    std::string smartctl_path = "smartctl";
    std::chrono::seconds timeout{20};
    std::string error;  ///< Set when the arguments are invalid
};

/**
 * @class CliApplication
 * @brief Command-line access to the telemetry pipeline
 *
 * Provides:
 * - Listing all drives (one poll cycle)
 * - Reading a single device
 * - Listing mounted volumes
 * as a table or as the same JSON the HTTP API serves.
 */
class CliApplication {
public:
    /**
     * @param executor Probe executor to use; created from the options when null
     */
    explicit CliApplication(std::shared_ptr<IProbeExecutor> executor = nullptr);
    ~CliApplication();

    // Non-copyable
    CliApplication(const CliApplication&) = delete;
    CliApplication& operator=(const CliApplication&) = delete;

    /**
     * @brief Run the CLI application
     * @return Exit code (0 = success)
     */
    auto run(int argc, char* argv[]) -> int;

    [[nodiscard]] static auto parse_args(int argc, char* argv[]) -> CliOptions;

    static void print_help();
    static void print_version();

    /**
     * @brief Fixed-width table of drive entries
     */
    [[nodiscard]] static auto format_drive_table(const std::vector<DriveEntry>& drives)
        -> std::string;

    /**
     * @brief Fixed-width table of volumes
     */
    [[nodiscard]] static auto format_volume_table(const std::vector<VolumeInfo>& volumes)
        -> std::string;

private:
    auto cmd_list(const CliOptions& options) -> int;
    auto cmd_device(const CliOptions& options) -> int;
    auto cmd_volumes(const CliOptions& options) -> int;

    std::shared_ptr<IProbeExecutor> executor_;
};

}  // namespace cli
