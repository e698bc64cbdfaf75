/**
 * @file SnapshotJson.cpp
 * @brief Wire representation of snapshots
 */

#include "serialization/SnapshotJson.hpp"

#include <format>
#include <type_traits>
#include <variant>

namespace {

auto counter(uint64_t value) -> Json::Value {
    return Json::Value(static_cast<Json::UInt64>(value));
}

auto array_of_drives(const Snapshot& snapshot) -> Json::Value {
    Json::Value drives(Json::arrayValue);
    for (const auto& entry : snapshot.drives) {
        drives.append(SnapshotJson::drive_entry(entry));
    }
    return drives;
}

auto array_of_volumes(const Snapshot& snapshot) -> Json::Value {
    Json::Value volumes(Json::arrayValue);
    for (const auto& volume : snapshot.volumes) {
        volumes.append(SnapshotJson::volume(volume));
    }
    return volumes;
}

}  // namespace

auto SnapshotJson::drive_entry(const DriveEntry& entry) -> Json::Value {
    return std::visit(
        [](const auto& value) -> Json::Value {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, DriveRecord>) {
                return drive_record(value);
            } else {
                Json::Value error(Json::objectValue);
                error["Device"] = value.device;
                error["error"] = true;
                error["message"] = value.message;
                return error;
            }
        },
        entry);
}

auto SnapshotJson::drive_record(const DriveRecord& record) -> Json::Value {
    Json::Value json(Json::objectValue);
    json["Device"] = record.device;
    json["Type"] = std::string(drive_type_name(record.type));
    json["Model"] = record.model;
    json["Serial"] = record.serial;
    if (record.health_percent) {
        json["HealthPercent"] = *record.health_percent;
    }
    json["WrittenGB"] = record.written_gb;
    json["PowerCycles"] = counter(record.power_cycles);
    json["PowerOnHours"] = counter(record.power_on_hours);
    json["UnsafeShutdowns"] = counter(record.unsafe_shutdowns);
    json["DataUnitsRead"] = counter(record.data_units_read);
    json["DataUnitsWritten"] = counter(record.data_units_written);
    json["HostReadCommands"] = counter(record.host_read_commands);
    json["HostWriteCommands"] = counter(record.host_write_commands);
    json["ControllerBusyTimeMinutes"] = counter(record.controller_busy_time_minutes);
    json["MediaDataIntegrityErrors"] = counter(record.media_data_integrity_errors);
    json["ErrorLogEntries"] = counter(record.error_log_entries);
    json["CompositeTemperatureK"] = counter(record.composite_temperature_k);
    if (record.live_temperature_c) {
        json["LiveTemperatureC"] = *record.live_temperature_c;
    }
    json["CriticalWarning"] = counter(record.critical_warning);
    json["AvailableSparePercent"] = counter(record.available_spare_percent);
    json["AvailableSpareThreshold"] = counter(record.available_spare_threshold);
    json["PercentageUsed"] = counter(record.percentage_used);
    json["WarningTempTimeMinutes"] = counter(record.warning_temp_time_minutes);
    json["CriticalTempTimeMinutes"] = counter(record.critical_temp_time_minutes);
    return json;
}

auto SnapshotJson::volume(const VolumeInfo& volume) -> Json::Value {
    Json::Value json(Json::objectValue);
    json["DriveLetter"] = volume.drive_letter;
    json["VolumeName"] = volume.volume_name;
    json["FreeGB"] = volume.free_gb;
    json["UsedGB"] = volume.used_gb;
    json["UsagePercent"] = volume.usage_percent;
    return json;
}

auto SnapshotJson::drives_document(const Snapshot& snapshot) -> Json::Value {
    Json::Value document(Json::objectValue);
    document["Drives"] = array_of_drives(snapshot);
    return document;
}

auto SnapshotJson::volumes_document(const Snapshot& snapshot) -> Json::Value {
    Json::Value document(Json::objectValue);
    document["Volumes"] = array_of_volumes(snapshot);
    return document;
}

auto SnapshotJson::full_document(const Snapshot& snapshot) -> Json::Value {
    Json::Value document(Json::objectValue);
    document["Drives"] = array_of_drives(snapshot);
    document["Volumes"] = array_of_volumes(snapshot);
    return document;
}

auto SnapshotJson::status_document(const PollerStatus& status, const Snapshot* snapshot)
    -> Json::Value {
    Json::Value document(Json::objectValue);
    document["State"] = std::string(poller_state_name(status.state));
    document["CyclesCompleted"] = counter(status.cycles_completed);
    document["CyclesFailed"] = counter(status.cycles_failed);
    document["TriggersCoalesced"] = counter(status.triggers_coalesced);
    document["LastError"] =
        status.last_error.empty() ? Json::Value(Json::nullValue) : Json::Value(status.last_error);

    if (snapshot != nullptr) {
        document["Sequence"] = counter(snapshot->sequence);
        document["GeneratedAt"] = format_timestamp(snapshot->generated_at);
        document["ScanStatus"] = std::string(scan_status_name(snapshot->scan_status));
    } else {
        document["Sequence"] = counter(0);
        document["GeneratedAt"] = Json::Value(Json::nullValue);
        document["ScanStatus"] = Json::Value(Json::nullValue);
    }
    return document;
}

auto SnapshotJson::error_document(std::string_view message) -> Json::Value {
    Json::Value document(Json::objectValue);
    document["error"] = true;
    document["message"] = std::string(message);
    return document;
}

auto SnapshotJson::format_timestamp(std::chrono::system_clock::time_point time) -> std::string {
    const auto millis = std::chrono::floor<std::chrono::milliseconds>(time);
    return std::format("{:%FT%T}Z", millis);
}
