/**
 * @file IDeviceEnumerator.hpp
 * @brief Interface for discovering attached storage devices
 */

#pragma once

#include "models/Snapshot.hpp"
#include "util/Error.hpp"

#include <expected>
#include <string>
#include <vector>

/**
 * @struct ScanResult
 * @brief Devices found by one scan, in discovery order, without duplicates
 */
struct ScanResult {
    std::vector<std::string> devices;
    ScanStatus status = ScanStatus::OK;
};

/**
 * @class IDeviceEnumerator
 * @brief Lists device identifiers once per poll cycle
 */
class IDeviceEnumerator {
public:
    virtual ~IDeviceEnumerator() = default;

    /**
     * @brief Discover devices
     * @return Scan result, or an error only when the tool itself is not installed
     *
     * Unusable scan output is not an error: it yields an empty list with
     * status SCAN_FAILED.
     */
    [[nodiscard]] virtual auto enumerate() -> std::expected<ScanResult, util::Error> = 0;
};
