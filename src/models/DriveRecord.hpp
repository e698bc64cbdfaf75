/**
 * @file DriveRecord.hpp
 * @brief Canonical, device-type-agnostic drive telemetry
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

/**
 * @enum DriveType
 * @brief Device family, selects the conversion rules applied by the normalizer
 */
enum class DriveType {
    NVME,
    ATA,
    SCSI,
    UNKNOWN
};

/**
 * @brief Wire name of a drive type ("nvme", "ata", "scsi", "unknown")
 */
[[nodiscard]] constexpr auto drive_type_name(DriveType type) -> std::string_view {
    switch (type) {
        case DriveType::NVME:
            return "nvme";
        case DriveType::ATA:
            return "ata";
        case DriveType::SCSI:
            return "scsi";
        case DriveType::UNKNOWN:
            return "unknown";
    }
    return "unknown";
}

/**
 * @struct DriveRecord
 * @brief One normalized drive, immutable once produced
 *
 * NVMe counters are always present (0 for other families) so every record
 * has the same shape on the wire.
 */
struct DriveRecord {
    std::string device;                    ///< Identifier from enumeration (e.g. /dev/nvme0)
    DriveType type = DriveType::UNKNOWN;
    std::string model;
    std::string serial;
    std::optional<int> health_percent;     ///< 0..100, absent when no usable signal
    double written_gb = 0.0;               ///< Rounded to 2 decimals
    uint64_t power_on_hours = 0;
    uint64_t power_cycles = 0;
    uint64_t unsafe_shutdowns = 0;

    uint64_t data_units_read = 0;
    uint64_t data_units_written = 0;
    uint64_t host_read_commands = 0;
    uint64_t host_write_commands = 0;
    uint64_t controller_busy_time_minutes = 0;
    uint64_t media_data_integrity_errors = 0;
    uint64_t error_log_entries = 0;
    uint64_t composite_temperature_k = 0;
    uint64_t critical_warning = 0;
    uint64_t available_spare_percent = 0;
    uint64_t available_spare_threshold = 0;
    uint64_t percentage_used = 0;
    uint64_t warning_temp_time_minutes = 0;
    uint64_t critical_temp_time_minutes = 0;

    std::optional<int> live_temperature_c;

    auto operator==(const DriveRecord&) const -> bool = default;
};

/**
 * @struct DriveError
 * @brief Placeholder for a device that yielded no usable telemetry
 */
struct DriveError {
    std::string device;
    std::string message;

    auto operator==(const DriveError&) const -> bool = default;
};

/**
 * @brief One snapshot entry: full telemetry or a per-device failure
 */
using DriveEntry = std::variant<DriveRecord, DriveError>;

[[nodiscard]] inline auto entry_device(const DriveEntry& entry) -> const std::string& {
    return std::visit([](const auto& e) -> const std::string& { return e.device; }, entry);
}

[[nodiscard]] inline auto is_error_entry(const DriveEntry& entry) -> bool {
    return std::holds_alternative<DriveError>(entry);
}
