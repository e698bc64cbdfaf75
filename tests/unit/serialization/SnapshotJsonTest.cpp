/**
 * @file SnapshotJsonTest.cpp
 * @brief Unit tests for the wire representation of snapshots
 */

#include "serialization/SnapshotJson.hpp"

#include "fixtures/TelemetryFixtures.hpp"
#include "services/AttributeNormalizer.hpp"
#include "util/JsonFields.hpp"

#include <gtest/gtest.h>

namespace {

auto sample_snapshot() -> Snapshot {
    Snapshot snapshot;
    snapshot.sequence = 7;
    snapshot.generated_at = std::chrono::system_clock::time_point{} +
                            std::chrono::seconds{1'760'695'965} + std::chrono::milliseconds{123};
    snapshot.drives.emplace_back(
        AttributeNormalizer::normalize("/dev/nvme0", fixtures::telemetry_from(fixtures::NVME_REPORT)));
    snapshot.drives.emplace_back(DriveError{.device = "/dev/sdz", .message = "No usable SMART data"});
    snapshot.volumes.push_back(MockVolumeCollector::CreateTestVolume());
    return snapshot;
}

}  // namespace

// ========== Drive Tests ==========

TEST(SnapshotJsonTest, DriveEntry_RecordHasEveryWireField) {
    const auto snapshot = sample_snapshot();

    const auto json = SnapshotJson::drive_entry(snapshot.drives[0]);

    for (const char* key :
         {"Device", "Type", "Model", "Serial", "HealthPercent", "WrittenGB", "PowerCycles",
          "PowerOnHours", "UnsafeShutdowns", "DataUnitsRead", "DataUnitsWritten",
          "HostReadCommands", "HostWriteCommands", "ControllerBusyTimeMinutes",
          "MediaDataIntegrityErrors", "ErrorLogEntries", "CompositeTemperatureK",
          "LiveTemperatureC", "CriticalWarning", "AvailableSparePercent",
          "AvailableSpareThreshold", "PercentageUsed", "WarningTempTimeMinutes",
          "CriticalTempTimeMinutes"}) {
        EXPECT_TRUE(json.isMember(key)) << key;
    }
    EXPECT_EQ(json["Device"].asString(), "/dev/nvme0");
    EXPECT_EQ(json["Type"].asString(), "nvme");
    EXPECT_EQ(json["HealthPercent"].asInt(), 97);
    EXPECT_EQ(json["LiveTemperatureC"].asInt(), 38);
    EXPECT_EQ(json["CompositeTemperatureK"].asUInt64(), 311u);
    EXPECT_FALSE(json.isMember("error"));
}

TEST(SnapshotJsonTest, DriveEntry_AbsentOptionalsAreOmitted) {
    DriveRecord record{.device = "/dev/sdq", .type = DriveType::UNKNOWN};

    const auto json = SnapshotJson::drive_entry(record);

    EXPECT_FALSE(json.isMember("HealthPercent"));
    EXPECT_FALSE(json.isMember("LiveTemperatureC"));
    EXPECT_EQ(json["Type"].asString(), "unknown");
    EXPECT_EQ(json["PowerOnHours"].asUInt64(), 0u);
}

TEST(SnapshotJsonTest, DriveEntry_ErrorEntryCarriesDeviceAndMessage) {
    const auto json =
        SnapshotJson::drive_entry(DriveError{.device = "/dev/sdz", .message = "unreadable"});

    EXPECT_EQ(json["Device"].asString(), "/dev/sdz");
    EXPECT_TRUE(json["error"].asBool());
    EXPECT_EQ(json["message"].asString(), "unreadable");
    EXPECT_FALSE(json.isMember("Model"));
}

TEST(SnapshotJsonTest, DriveEntry_LargeCountersStayExact) {
    DriveRecord record{.device = "/dev/nvme1", .type = DriveType::NVME};
    record.data_units_written = 18'000'000'000'000'000'001ULL;

    const auto text = util::json::write_compact(SnapshotJson::drive_entry(record));

    EXPECT_NE(text.find("\"DataUnitsWritten\":18000000000000000001"), std::string::npos);
}

// ========== Document Tests ==========

TEST(SnapshotJsonTest, DrivesDocument_OnlyDrives) {
    const auto document = SnapshotJson::drives_document(sample_snapshot());

    ASSERT_TRUE(document["Drives"].isArray());
    EXPECT_EQ(document["Drives"].size(), 2u);
    EXPECT_FALSE(document.isMember("Volumes"));
}

TEST(SnapshotJsonTest, VolumesDocument_UsesVolumeWireNames) {
    const auto document = SnapshotJson::volumes_document(sample_snapshot());

    ASSERT_EQ(document["Volumes"].size(), 1u);
    const auto& volume = document["Volumes"][0];
    EXPECT_EQ(volume["DriveLetter"].asString(), "/");
    EXPECT_EQ(volume["VolumeName"].asString(), "/dev/nvme0n1p2");
    EXPECT_DOUBLE_EQ(volume["FreeGB"].asDouble(), 100.5);
    EXPECT_DOUBLE_EQ(volume["UsedGB"].asDouble(), 50.25);
    EXPECT_DOUBLE_EQ(volume["UsagePercent"].asDouble(), 33.3);
    EXPECT_FALSE(document.isMember("Drives"));
}

TEST(SnapshotJsonTest, FullDocument_DrivesAndVolumesFromSameSnapshot) {
    const auto document = SnapshotJson::full_document(sample_snapshot());

    EXPECT_EQ(document["Drives"].size(), 2u);
    EXPECT_EQ(document["Volumes"].size(), 1u);
}

TEST(SnapshotJsonTest, FullDocument_EmptySnapshot_HasEmptyArrays) {
    const auto text = util::json::write_compact(SnapshotJson::full_document(Snapshot{}));

    EXPECT_EQ(text, R"({"Drives":[],"Volumes":[]})");
}

// ========== Status Tests ==========

TEST(SnapshotJsonTest, StatusDocument_WithSnapshot) {
    const auto snapshot = sample_snapshot();
    PollerStatus status{.state = PollerState::POLLING,
                        .cycles_completed = 7,
                        .cycles_failed = 1,
                        .triggers_coalesced = 2,
                        .last_error = ""};

    const auto document = SnapshotJson::status_document(status, &snapshot);

    EXPECT_EQ(document["State"].asString(), "polling");
    EXPECT_EQ(document["CyclesCompleted"].asUInt64(), 7u);
    EXPECT_EQ(document["CyclesFailed"].asUInt64(), 1u);
    EXPECT_EQ(document["TriggersCoalesced"].asUInt64(), 2u);
    EXPECT_TRUE(document["LastError"].isNull());
    EXPECT_EQ(document["Sequence"].asUInt64(), 7u);
    EXPECT_EQ(document["GeneratedAt"].asString(), "2025-10-17T10:12:45.123Z");
    EXPECT_EQ(document["ScanStatus"].asString(), "ok");
}

TEST(SnapshotJsonTest, StatusDocument_BeforeFirstSnapshot) {
    PollerStatus status{.last_error = "smartctl: not found"};

    const auto document = SnapshotJson::status_document(status, nullptr);

    EXPECT_EQ(document["State"].asString(), "idle");
    EXPECT_EQ(document["LastError"].asString(), "smartctl: not found");
    EXPECT_EQ(document["Sequence"].asUInt64(), 0u);
    EXPECT_TRUE(document["GeneratedAt"].isNull());
    EXPECT_TRUE(document["ScanStatus"].isNull());
}

TEST(SnapshotJsonTest, ErrorDocument_Shape) {
    const auto text = util::json::write_compact(SnapshotJson::error_document("Not ready"));

    EXPECT_EQ(text, R"({"error":true,"message":"Not ready"})");
}

TEST(SnapshotJsonTest, FormatTimestamp_MillisecondPrecisionUtc) {
    const auto epoch = std::chrono::system_clock::time_point{};

    EXPECT_EQ(SnapshotJson::format_timestamp(epoch), "1970-01-01T00:00:00.000Z");
    EXPECT_EQ(SnapshotJson::format_timestamp(epoch + std::chrono::microseconds{1'999}),
              "1970-01-01T00:00:00.001Z");
}
