/**
 * @file SmartctlCommands.hpp
 * @brief Argument sets and exit-status rules for smartctl
 */

#pragma once

#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace smartctl {

// smartctl exit status is a bit mask (see smartctl(8), "RETURN VALUES")
constexpr int EXIT_COMMAND_LINE_ERROR = 1 << 0;
constexpr int EXIT_DEVICE_OPEN_FAILED = 1 << 1;
constexpr int EXIT_SMART_COMMAND_FAILED = 1 << 2;
constexpr int EXIT_DISK_FAILING = 1 << 3;
constexpr int EXIT_PREFAIL_THRESHOLD = 1 << 4;
constexpr int EXIT_PAST_THRESHOLD = 1 << 5;
constexpr int EXIT_ERROR_LOG_ENTRIES = 1 << 6;
constexpr int EXIT_SELF_TEST_ERRORS = 1 << 7;

/**
 * @brief Whether a report from a non-zero exit may still stand in for a drive
 *
 * Bits 0 and 1 mean smartctl never talked to the device. With only bits
 * 2..7 set the report describes the device, possibly through the wrong
 * access mode.
 */
[[nodiscard]] constexpr auto report_survives_exit_status(int status) -> bool {
    return status >= 0 && (status & (EXIT_COMMAND_LINE_ERROR | EXIT_DEVICE_OPEN_FAILED)) == 0;
}

/**
 * @brief Comma-separated names of the bits set in an exit status, for logs
 */
[[nodiscard]] inline auto describe_exit_status(int status) -> std::string {
    struct ExitBit {
        int bit;
        std::string_view name;
    };
    static constexpr std::array EXIT_BITS{
        ExitBit{.bit = EXIT_COMMAND_LINE_ERROR, .name = "command line error"},
        ExitBit{.bit = EXIT_DEVICE_OPEN_FAILED, .name = "device open failed"},
        ExitBit{.bit = EXIT_SMART_COMMAND_FAILED, .name = "SMART command failed"},
        ExitBit{.bit = EXIT_DISK_FAILING, .name = "disk failing"},
        ExitBit{.bit = EXIT_PREFAIL_THRESHOLD, .name = "prefail attribute at threshold"},
        ExitBit{.bit = EXIT_PAST_THRESHOLD, .name = "attribute past threshold"},
        ExitBit{.bit = EXIT_ERROR_LOG_ENTRIES, .name = "error log has entries"},
        ExitBit{.bit = EXIT_SELF_TEST_ERRORS, .name = "self-test errors"},
    };

    std::string names;
    for (const auto& entry : EXIT_BITS) {
        if ((status & entry.bit) == 0) {
            continue;
        }
        if (!names.empty()) {
            names += ", ";
        }
        names += entry.name;
    }
    return names.empty() ? std::string{"unknown"} : names;
}

/**
 * @struct AccessMode
 * @brief One way of addressing a device (the -d option)
 */
struct AccessMode {
    std::string_view name;
    std::string_view device_type;  ///< Value for -d, empty to let smartctl decide
};

/**
 * Tried in this order for every device. The SAT variants reach ATA drives
 * behind USB bridges that do not announce themselves.
 */
inline constexpr std::array ACCESS_MODES{
    AccessMode{.name = "auto", .device_type = ""},
    AccessMode{.name = "sat", .device_type = "sat"},
    AccessMode{.name = "sat,12", .device_type = "sat,12"},
    AccessMode{.name = "scsi", .device_type = "scsi"},
};

[[nodiscard]] inline auto scan_args() -> std::vector<std::string> {
    return {"--scan", "-j"};
}

[[nodiscard]] inline auto read_args(std::string_view device, const AccessMode& mode)
    -> std::vector<std::string> {
    std::vector<std::string> args{"-a", "-j"};
    if (!mode.device_type.empty()) {
        args.emplace_back("-d");
        args.emplace_back(mode.device_type);
    }
    args.emplace_back(device);
    return args;
}

}  // namespace smartctl
