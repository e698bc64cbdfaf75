/**
 * @file DeviceEnumerator.cpp
 * @brief IDeviceEnumerator backed by `smartctl --scan -j`
 */

#include "services/DeviceEnumerator.hpp"

#include "services/SmartctlCommands.hpp"
#include "util/JsonFields.hpp"
#include "util/Logger.hpp"

#include <algorithm>
#include <format>
#include <utility>

namespace {

auto failed_scan() -> ScanResult {
    return ScanResult{.devices = {}, .status = ScanStatus::SCAN_FAILED};
}

}  // namespace

DeviceEnumerator::DeviceEnumerator(std::shared_ptr<IProbeExecutor> executor)
    : executor_(std::move(executor)) {}

auto DeviceEnumerator::enumerate() -> std::expected<ScanResult, util::Error> {
    auto output = executor_->run(smartctl::scan_args());
    if (!output) {
        if (has_probe_code(output.error(), ProbeErrorCode::TOOL_NOT_FOUND)) {
            LOG_ERROR("DeviceEnumerator", output.error().message);
            return std::unexpected(output.error());
        }
        LOG_WARNING("DeviceEnumerator",
                    std::format("Device scan failed: {}", output.error().message));
        return failed_scan();
    }

    if (output->exit_status != 0) {
        LOG_WARNING("DeviceEnumerator",
                    std::format("Device scan exited with status {} ({})", output->exit_status,
                                smartctl::describe_exit_status(output->exit_status)));
        return failed_scan();
    }

    auto result = parse_scan_output(output->stdout_text);
    if (result.status == ScanStatus::SCAN_FAILED) {
        LOG_WARNING("DeviceEnumerator", "Device scan produced unusable output");
    } else {
        LOG_DEBUG("DeviceEnumerator", std::format("Scan found {} device(s)", result.devices.size()));
    }
    return result;
}

auto DeviceEnumerator::parse_scan_output(std::string_view text) -> ScanResult {
    auto document = util::json::parse_document(text);
    if (!document) {
        return failed_scan();
    }

    const auto* devices = util::json::member(*document, "devices");
    if (devices == nullptr || !devices->isArray()) {
        return failed_scan();
    }

    ScanResult result;
    for (const auto& entry : *devices) {
        auto name = util::json::to_string(util::json::member(entry, "name"));
        if (!name || name->empty()) {
            continue;
        }
        if (std::ranges::find(result.devices, *name) == result.devices.end()) {
            result.devices.push_back(std::move(*name));
        }
    }
    result.status = result.devices.empty() ? ScanStatus::NO_DRIVES : ScanStatus::OK;
    return result;
}
