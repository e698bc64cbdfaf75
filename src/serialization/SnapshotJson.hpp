/**
 * @file SnapshotJson.hpp
 * @brief Wire representation of snapshots (field names are part of the API)
 */

#pragma once

#include "models/Snapshot.hpp"
#include "services/SnapshotPoller.hpp"

#include <json/json.h>

#include <chrono>
#include <string>
#include <string_view>

class SnapshotJson {
public:
    /**
     * @brief Drive record, or {Device, error: true, message} for an error entry
     */
    [[nodiscard]] static auto drive_entry(const DriveEntry& entry) -> Json::Value;

    [[nodiscard]] static auto volume(const VolumeInfo& volume) -> Json::Value;

    /**
     * @brief {"Drives": [...]}
     */
    [[nodiscard]] static auto drives_document(const Snapshot& snapshot) -> Json::Value;

    /**
     * @brief {"Volumes": [...]}
     */
    [[nodiscard]] static auto volumes_document(const Snapshot& snapshot) -> Json::Value;

    /**
     * @brief {"Drives": [...], "Volumes": [...]}
     */
    [[nodiscard]] static auto full_document(const Snapshot& snapshot) -> Json::Value;

    /**
     * @brief Poller state plus metadata of the current snapshot
     * @param snapshot Current snapshot, nullptr if none was published yet
     */
    [[nodiscard]] static auto status_document(const PollerStatus& status, const Snapshot* snapshot)
        -> Json::Value;

    /**
     * @brief {"error": true, "message": ...}
     */
    [[nodiscard]] static auto error_document(std::string_view message) -> Json::Value;

    /**
     * @brief ISO-8601 UTC with millisecond precision, e.g. 2026-10-17T09:12:45.123Z
     */
    [[nodiscard]] static auto format_timestamp(std::chrono::system_clock::time_point time)
        -> std::string;

private:
    [[nodiscard]] static auto drive_record(const DriveRecord& record) -> Json::Value;
};
