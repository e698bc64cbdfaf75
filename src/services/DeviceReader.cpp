/**
 * @file DeviceReader.cpp
 * @brief IDeviceReader trying smartctl access modes in order
 */

#include "services/DeviceReader.hpp"

#include "services/TelemetryParser.hpp"
#include "util/Logger.hpp"

#include <format>
#include <optional>
#include <utility>

DeviceReader::DeviceReader(std::shared_ptr<IProbeExecutor> executor)
    : executor_(std::move(executor)) {}

auto DeviceReader::read(const std::string& device) -> std::expected<RawTelemetry, util::Error> {
    std::string last_failure = "no access mode attempted";
    std::optional<RawTelemetry> fallback;
    std::string_view fallback_mode;

    for (const auto& mode : smartctl::ACCESS_MODES) {
        auto attempt = try_mode(device, mode);
        if (!attempt) {
            last_failure = std::format("{}: {}", mode.name, attempt.error().message);
            LOG_DEBUG("DeviceReader", std::format("{} skipped mode {}", device, last_failure));
            continue;
        }

        if (attempt->exit_status == 0) {
            if (mode.name != smartctl::ACCESS_MODES.front().name) {
                LOG_DEBUG("DeviceReader", std::format("{} readable with -d {}", device, mode.name));
            }
            return std::move(attempt->telemetry);
        }

        last_failure = std::format("{}: exited with status {} ({})", mode.name,
                                   attempt->exit_status,
                                   smartctl::describe_exit_status(attempt->exit_status));
        LOG_DEBUG("DeviceReader", std::format("{} kept report from mode {} as fallback", device,
                                              last_failure));
        if (!fallback) {
            fallback = std::move(attempt->telemetry);
            fallback_mode = mode.name;
        }
    }

    if (fallback) {
        LOG_DEBUG("DeviceReader", std::format("{}: no mode exited cleanly, using report from {}",
                                              device, fallback_mode));
        return std::move(*fallback);
    }

    return std::unexpected(util::Error{
        std::format("No usable SMART data for {} after {} access modes (last: {})", device,
                    smartctl::ACCESS_MODES.size(), last_failure)});
}

auto DeviceReader::try_mode(const std::string& device, const smartctl::AccessMode& mode)
    -> std::expected<ModeAttempt, util::Error> {
    auto output = executor_->run(smartctl::read_args(device, mode));
    if (!output) {
        return std::unexpected(output.error());
    }

    if (!smartctl::report_survives_exit_status(output->exit_status)) {
        return std::unexpected(util::Error{
            std::format("smartctl exited with status {} ({})", output->exit_status,
                        smartctl::describe_exit_status(output->exit_status))});
    }

    auto report = TelemetryParser::parse_report(output->stdout_text);
    if (!report) {
        return std::unexpected(report.error());
    }

    auto telemetry = TelemetryParser::extract(*report);
    if (!TelemetryParser::is_usable(telemetry)) {
        return std::unexpected(util::Error{"Report names no model, serial or device type"});
    }
    return ModeAttempt{.telemetry = std::move(telemetry), .exit_status = output->exit_status};
}
