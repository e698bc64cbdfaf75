/**
 * @file IDeviceReader.hpp
 * @brief Interface for reading raw telemetry from one device
 */

#pragma once

#include "models/RawTelemetry.hpp"
#include "util/Error.hpp"

#include <expected>
#include <string>

/**
 * @class IDeviceReader
 * @brief Obtains a usable telemetry report for a device, or explains why not
 */
class IDeviceReader {
public:
    virtual ~IDeviceReader() = default;

    /**
     * @brief Read one device
     * @param device Device identifier from enumeration
     * @return Extracted telemetry, or an error once every access mode failed
     */
    [[nodiscard]] virtual auto read(const std::string& device)
        -> std::expected<RawTelemetry, util::Error> = 0;
};
