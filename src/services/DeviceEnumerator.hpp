/**
 * @file DeviceEnumerator.hpp
 * @brief IDeviceEnumerator backed by `smartctl --scan -j`
 */

#pragma once

#include "services/IDeviceEnumerator.hpp"
#include "services/IProbeExecutor.hpp"

#include <memory>
#include <string_view>

class DeviceEnumerator : public IDeviceEnumerator {
public:
    explicit DeviceEnumerator(std::shared_ptr<IProbeExecutor> executor);
    ~DeviceEnumerator() override = default;

    [[nodiscard]] auto enumerate() -> std::expected<ScanResult, util::Error> override;

    /**
     * @brief Extract device names from scan output
     * @param text stdout of the scan command
     * @return Result with status OK / NO_DRIVES, or SCAN_FAILED if the text
     *         is not a JSON object carrying a "devices" array
     */
    [[nodiscard]] static auto parse_scan_output(std::string_view text) -> ScanResult;

private:
    std::shared_ptr<IProbeExecutor> executor_;
};
