/**
 * @file RawTelemetry.hpp
 * @brief Typed view of one smartctl JSON report
 *
 * Filled by TelemetryParser. Every field is optional: std::nullopt means the
 * report did not contain a usable value, which the normalizer resolves to a
 * documented default.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

/**
 * @struct NvmeHealthLog
 * @brief nvme_smart_health_information_log (NVMe log page 02h)
 */
struct NvmeHealthLog {
    std::optional<double> critical_warning;
    std::optional<double> composite_temperature_k;  ///< composite_temperature, Kelvin
    std::optional<double> first_sensor_temperature_k;  ///< temperature_sensors[0], Kelvin
    std::optional<double> available_spare;
    std::optional<double> available_spare_threshold;
    std::optional<double> percentage_used;
    std::optional<double> data_units_read;
    std::optional<double> data_units_written;
    std::optional<double> host_reads;
    std::optional<double> host_writes;
    std::optional<double> controller_busy_time;
    std::optional<double> power_cycles;
    std::optional<double> power_on_hours;
    std::optional<double> unsafe_shutdowns;
    std::optional<double> media_errors;
    std::optional<double> num_err_log_entries;
    std::optional<double> warning_temp_time;
    std::optional<double> critical_comp_time;
};

/**
 * @struct AtaAttribute
 * @brief One row of ata_smart_attributes.table
 */
struct AtaAttribute {
    int id = 0;
    std::string name;
    std::optional<double> value;      ///< Normalized value (typically 1..253)
    std::optional<double> raw_value;  ///< raw.value
    std::string raw_string;           ///< raw.string, e.g. "38 (Min/Max 21/45)"
};

/**
 * @struct RawTelemetry
 * @brief Fields the normalizer consumes, extracted from one device report
 */
struct RawTelemetry {
    std::optional<std::string> device_type;  ///< device.type, e.g. "nvme", "sat"
    std::optional<std::string> protocol;     ///< device.protocol, e.g. "ATA"
    std::optional<std::string> model_name;
    std::optional<std::string> model_family;
    std::optional<std::string> scsi_model_name;
    std::optional<std::string> product;
    std::optional<std::string> serial_number;

    std::optional<double> current_temperature;  ///< temperature.current, Celsius
    std::optional<bool> smart_passed;           ///< smart_status.passed

    std::optional<double> power_on_hours;  ///< power_on_time.hours
    std::optional<double> power_cycle_count;
    std::optional<double> unsafe_shutdowns;
    std::optional<double> media_errors;
    std::optional<double> error_log_entries;

    std::optional<NvmeHealthLog> nvme_log;
    std::vector<AtaAttribute> ata_attributes;
};
