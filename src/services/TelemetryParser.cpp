/**
 * @file TelemetryParser.cpp
 * @brief smartctl JSON report -> RawTelemetry
 */

#include "services/TelemetryParser.hpp"

#include "util/JsonFields.hpp"

#include <format>
#include <initializer_list>
#include <utility>

namespace jf = util::json;

namespace {

/**
 * First present numeric member out of a list of aliases
 */
auto first_number(const Json::Value& object, std::initializer_list<std::string_view> keys)
    -> std::optional<double> {
    for (const auto key : keys) {
        if (auto number = jf::to_number(jf::member(object, key))) {
            return number;
        }
    }
    return std::nullopt;
}

auto non_empty(const std::optional<std::string>& text) -> bool {
    return text && !text->empty();
}

}  // namespace

auto TelemetryParser::parse_report(std::string_view text)
    -> std::expected<Json::Value, util::Error> {
    std::string errors;
    auto document = jf::parse_document(text, &errors);
    if (!document) {
        return std::unexpected(util::Error{std::format("Malformed JSON: {}", errors)});
    }
    if (!document->isObject()) {
        return std::unexpected(util::Error{"Report is not a JSON object"});
    }
    return std::move(*document);
}

auto TelemetryParser::extract(const Json::Value& report) -> RawTelemetry {
    RawTelemetry raw;

    raw.device_type = jf::to_string(jf::path(report, {"device", "type"}));
    raw.protocol = jf::to_string(jf::path(report, {"device", "protocol"}));
    raw.model_name = jf::to_string(jf::member(report, "model_name"));
    raw.model_family = jf::to_string(jf::member(report, "model_family"));
    raw.scsi_model_name = jf::to_string(jf::member(report, "scsi_model_name"));
    raw.product = jf::to_string(jf::member(report, "product"));
    raw.serial_number = jf::to_string(jf::member(report, "serial_number"));

    raw.current_temperature = jf::to_number(jf::path(report, {"temperature", "current"}));
    raw.smart_passed = jf::to_bool(jf::path(report, {"smart_status", "passed"}));

    raw.power_on_hours = jf::to_number(jf::path(report, {"power_on_time", "hours"}));
    raw.power_cycle_count = jf::to_number(jf::member(report, "power_cycle_count"));
    raw.unsafe_shutdowns = jf::to_number(jf::member(report, "unsafe_shutdowns"));
    raw.media_errors = jf::to_number(jf::member(report, "media_and_data_integrity_errors"));
    raw.error_log_entries =
        jf::to_number(jf::member(report, "number_of_error_information_log_entries"));

    if (const auto* log = jf::member(report, "nvme_smart_health_information_log");
        log != nullptr && log->isObject()) {
        raw.nvme_log = extract_nvme_log(*log);
    }
    raw.ata_attributes = extract_ata_attributes(report);

    return raw;
}

auto TelemetryParser::extract_nvme_log(const Json::Value& log) -> NvmeHealthLog {
    NvmeHealthLog nvme;

    nvme.critical_warning = first_number(log, {"critical_warning"});
    nvme.composite_temperature_k = first_number(log, {"composite_temperature"});
    if (const auto* sensors = jf::member(log, "temperature_sensors");
        sensors != nullptr && sensors->isArray() && !sensors->empty()) {
        nvme.first_sensor_temperature_k = jf::to_number(&(*sensors)[0]);
    }
    nvme.available_spare = first_number(log, {"available_spare"});
    nvme.available_spare_threshold = first_number(log, {"available_spare_threshold"});
    nvme.percentage_used = first_number(log, {"percentage_used"});
    nvme.data_units_read = first_number(log, {"data_units_read"});
    nvme.data_units_written = first_number(log, {"data_units_written"});
    nvme.host_reads = first_number(log, {"host_reads"});
    nvme.host_writes = first_number(log, {"host_writes"});
    nvme.controller_busy_time = first_number(log, {"controller_busy_time"});
    nvme.power_cycles = first_number(log, {"power_cycles"});
    nvme.power_on_hours = first_number(log, {"power_on_hours"});
    nvme.unsafe_shutdowns = first_number(log, {"unsafe_shutdowns"});
    nvme.media_errors = first_number(log, {"media_errors", "media_and_data_integrity_errors"});
    nvme.num_err_log_entries = first_number(log, {"num_err_log_entries"});
    nvme.warning_temp_time =
        first_number(log, {"warning_composite_temperature_time", "warning_temp_time"});
    nvme.critical_comp_time =
        first_number(log, {"critical_composite_temperature_time", "critical_comp_time"});

    return nvme;
}

auto TelemetryParser::extract_ata_attributes(const Json::Value& report)
    -> std::vector<AtaAttribute> {
    std::vector<AtaAttribute> attributes;

    const auto* table = jf::path(report, {"ata_smart_attributes", "table"});
    if (table == nullptr || !table->isArray()) {
        return attributes;
    }

    for (const auto& row : *table) {
        const auto id = jf::to_number(jf::member(row, "id"));
        if (!id || *id < 0 || *id > 255) {
            continue;
        }

        AtaAttribute attribute;
        attribute.id = static_cast<int>(*id);
        attribute.name = jf::to_string(jf::member(row, "name")).value_or("");
        attribute.value = jf::to_number(jf::member(row, "value"));
        attribute.raw_value = jf::to_number(jf::path(row, {"raw", "value"}));
        attribute.raw_string = jf::to_string(jf::path(row, {"raw", "string"})).value_or("");
        attributes.push_back(std::move(attribute));
    }
    return attributes;
}

auto TelemetryParser::is_usable(const RawTelemetry& telemetry) -> bool {
    return non_empty(telemetry.model_name) || non_empty(telemetry.serial_number) ||
           non_empty(telemetry.device_type);
}
