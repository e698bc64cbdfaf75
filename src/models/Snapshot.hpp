/**
 * @file Snapshot.hpp
 * @brief Result of one poll cycle: drives, volumes and cycle metadata
 */

#pragma once

#include "models/DriveRecord.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

/**
 * @struct VolumeInfo
 * @brief Free/used space of one mounted file system
 */
struct VolumeInfo {
    std::string drive_letter;  ///< Mount point (e.g. /home)
    std::string volume_name;   ///< Mount source (e.g. /dev/nvme0n1p2)
    double free_gb = 0.0;
    double used_gb = 0.0;
    double usage_percent = 0.0;

    auto operator==(const VolumeInfo&) const -> bool = default;
};

/**
 * @enum ScanStatus
 * @brief Outcome of device enumeration for a cycle
 */
enum class ScanStatus {
    OK,          ///< At least one device enumerated
    NO_DRIVES,   ///< Scan succeeded and reported no devices
    SCAN_FAILED  ///< Scan output unusable; drive list is empty
};

[[nodiscard]] constexpr auto scan_status_name(ScanStatus status) -> std::string_view {
    switch (status) {
        case ScanStatus::OK:
            return "ok";
        case ScanStatus::NO_DRIVES:
            return "no_drives";
        case ScanStatus::SCAN_FAILED:
            return "scan_failed";
    }
    return "scan_failed";
}

/**
 * @struct Snapshot
 * @brief Complete, internally consistent result of one cycle
 *
 * Drives are sorted by device identifier. A published snapshot is never
 * modified; the next cycle publishes a new one.
 */
struct Snapshot {
    uint64_t sequence = 0;  ///< Assigned by SnapshotStore::publish
    std::chrono::system_clock::time_point generated_at{};
    ScanStatus scan_status = ScanStatus::OK;
    std::vector<DriveEntry> drives;
    std::vector<VolumeInfo> volumes;
};
