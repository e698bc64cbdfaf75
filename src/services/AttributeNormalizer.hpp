/**
 * @file AttributeNormalizer.hpp
 * @brief RawTelemetry -> canonical DriveRecord
 *
 * All rules are pure functions of the input. Precedence for each derived
 * field is a single ordered list (see the tables in AttributeNormalizer.cpp):
 *
 * - HealthPercent: wear/life attribute, then smart_status.passed, then absent;
 *   always clamped to [0, 100].
 * - LiveTemperatureC: temperature.current, then the NVMe composite/sensor
 *   temperature (Kelvin - 273), then ATA attributes 194/190, then absent.
 * - WrittenGB: NVMe data units (512000 bytes each) or ATA LBAs written
 *   (512 bytes each), in GiB rounded to 2 decimals.
 */

#pragma once

#include "models/DriveRecord.hpp"
#include "models/RawTelemetry.hpp"

#include <optional>
#include <string>
#include <string_view>

class AttributeNormalizer {
public:
    static constexpr double BYTES_PER_NVME_DATA_UNIT = 512'000.0;
    static constexpr double BYTES_PER_LBA = 512.0;
    static constexpr double BYTES_PER_GIB = 1024.0 * 1024.0 * 1024.0;
    static constexpr double KELVIN_OFFSET = 273.0;

    /**
     * @brief Build the canonical record for one device; never fails
     * @param device Device identifier, copied into the record
     * @param telemetry Extracted report
     */
    [[nodiscard]] static auto normalize(const std::string& device, const RawTelemetry& telemetry)
        -> DriveRecord;

    [[nodiscard]] static auto classify(const RawTelemetry& telemetry) -> DriveType;

    [[nodiscard]] static auto written_gb(const RawTelemetry& telemetry, DriveType type) -> double;

    [[nodiscard]] static auto health_percent(const RawTelemetry& telemetry, DriveType type)
        -> std::optional<int>;

    [[nodiscard]] static auto live_temperature_c(const RawTelemetry& telemetry, DriveType type)
        -> std::optional<int>;

    /**
     * @brief Round to 2 decimal places (half away from zero)
     */
    [[nodiscard]] static auto round2(double value) -> double;

    /**
     * @brief First (optionally signed) integer in a string, e.g. "38 (Min/Max 21/45)" -> 38
     */
    [[nodiscard]] static auto first_integer(std::string_view text) -> std::optional<int>;
};
