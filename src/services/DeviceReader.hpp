/**
 * @file DeviceReader.hpp
 * @brief IDeviceReader trying smartctl access modes in order
 */

#pragma once

#include "services/IDeviceReader.hpp"
#include "services/IProbeExecutor.hpp"
#include "services/SmartctlCommands.hpp"

#include <memory>

class DeviceReader : public IDeviceReader {
public:
    explicit DeviceReader(std::shared_ptr<IProbeExecutor> executor);
    ~DeviceReader() override = default;

    /**
     * @brief Try each entry of smartctl::ACCESS_MODES until one exits cleanly with a usable report
     *
     * Launch failures, timeouts, signal deaths, non-zero exit statuses,
     * malformed JSON and reports failing TelemetryParser::is_usable() move on
     * to the next mode. When no mode exits with status 0, the first usable
     * report whose exit status only carries bits 2..7 is returned instead, so
     * a failing disk is still published.
     */
    [[nodiscard]] auto read(const std::string& device)
        -> std::expected<RawTelemetry, util::Error> override;

private:
    struct ModeAttempt {
        RawTelemetry telemetry;
        int exit_status = 0;
    };

    [[nodiscard]] auto try_mode(const std::string& device, const smartctl::AccessMode& mode)
        -> std::expected<ModeAttempt, util::Error>;

    std::shared_ptr<IProbeExecutor> executor_;
};
