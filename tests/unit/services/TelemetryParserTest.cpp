/**
 * @file TelemetryParserTest.cpp
 * @brief Unit tests for TelemetryParser
 */

#include "services/TelemetryParser.hpp"

#include "fixtures/TelemetryFixtures.hpp"

#include <gtest/gtest.h>

// ========== parse_report Tests ==========

TEST(TelemetryParserTest, ParseReport_Object_Succeeds) {
    auto report = TelemetryParser::parse_report(fixtures::NVME_REPORT);

    ASSERT_TRUE(report.has_value());
    EXPECT_TRUE(report->isObject());
}

TEST(TelemetryParserTest, ParseReport_MalformedJson_ReturnsError) {
    EXPECT_FALSE(TelemetryParser::parse_report("{\"device\": ").has_value());
    EXPECT_FALSE(TelemetryParser::parse_report("").has_value());
    EXPECT_FALSE(TelemetryParser::parse_report("smartctl 7.4 (build date)").has_value());
}

TEST(TelemetryParserTest, ParseReport_NonObjectRoot_ReturnsError) {
    EXPECT_FALSE(TelemetryParser::parse_report("[1, 2, 3]").has_value());
    EXPECT_FALSE(TelemetryParser::parse_report("42").has_value());
}

// ========== extract Tests ==========

TEST(TelemetryParserTest, Extract_NvmeReport_ReadsIdentityAndLog) {
    const auto raw = fixtures::telemetry_from(fixtures::NVME_REPORT);

    EXPECT_EQ(raw.device_type, "nvme");
    EXPECT_EQ(raw.protocol, "NVMe");
    EXPECT_EQ(raw.model_name, "Samsung SSD 980 PRO 1TB");
    EXPECT_EQ(raw.serial_number, "S5GXNX0T123456");
    EXPECT_EQ(raw.smart_passed, true);
    EXPECT_EQ(raw.current_temperature, 38.0);
    EXPECT_EQ(raw.power_on_hours, 4021.0);

    ASSERT_TRUE(raw.nvme_log.has_value());
    EXPECT_EQ(raw.nvme_log->composite_temperature_k, 311.0);
    EXPECT_EQ(raw.nvme_log->first_sensor_temperature_k, 311.0);
    EXPECT_EQ(raw.nvme_log->data_units_written, 3100000.0);
    EXPECT_EQ(raw.nvme_log->num_err_log_entries, 12.0);
    EXPECT_TRUE(raw.ata_attributes.empty());
}

TEST(TelemetryParserTest, Extract_AtaReport_ReadsAttributeTable) {
    const auto raw = fixtures::telemetry_from(fixtures::ATA_REPORT);

    EXPECT_FALSE(raw.nvme_log.has_value());
    ASSERT_EQ(raw.ata_attributes.size(), 5U);

    const auto& temperature = raw.ata_attributes[2];
    EXPECT_EQ(temperature.id, 194);
    EXPECT_EQ(temperature.name, "Temperature_Celsius");
    EXPECT_EQ(temperature.value, 64.0);
    EXPECT_EQ(temperature.raw_value, 193273528356.0);
    EXPECT_EQ(temperature.raw_string, "36 (Min/Max 21/45)");
}

TEST(TelemetryParserTest, Extract_NumericStrings_AreCoerced) {
    const auto raw = fixtures::telemetry_from(
        R"JSON({"power_cycle_count": " 17 ", "power_on_time": {"hours": "12.5"}})JSON");

    EXPECT_EQ(raw.power_cycle_count, 17.0);
    EXPECT_EQ(raw.power_on_hours, 12.5);
}

TEST(TelemetryParserTest, Extract_AlternateNvmeFieldNames_AreAccepted) {
    const auto raw = fixtures::telemetry_from(R"JSON({
        "nvme_smart_health_information_log": {
            "media_and_data_integrity_errors": 3,
            "warning_composite_temperature_time": 5,
            "critical_composite_temperature_time": 1
        }
    })JSON");

    ASSERT_TRUE(raw.nvme_log.has_value());
    EXPECT_EQ(raw.nvme_log->media_errors, 3.0);
    EXPECT_EQ(raw.nvme_log->warning_temp_time, 5.0);
    EXPECT_EQ(raw.nvme_log->critical_comp_time, 1.0);
}

TEST(TelemetryParserTest, Extract_WrongTypes_LeaveFieldsAbsent) {
    const auto raw = fixtures::telemetry_from(R"JSON({
        "device": ["nvme"],
        "model_name": 7,
        "smart_status": {"passed": 1},
        "temperature": "hot",
        "nvme_smart_health_information_log": "n/a",
        "ata_smart_attributes": {"table": {"id": 5}}
    })JSON");

    EXPECT_FALSE(raw.device_type.has_value());
    EXPECT_FALSE(raw.model_name.has_value());
    EXPECT_FALSE(raw.smart_passed.has_value());
    EXPECT_FALSE(raw.current_temperature.has_value());
    EXPECT_FALSE(raw.nvme_log.has_value());
    EXPECT_TRUE(raw.ata_attributes.empty());
}

TEST(TelemetryParserTest, Extract_AttributeRowsWithoutValidId_AreSkipped) {
    const auto raw = fixtures::telemetry_from(R"JSON({"ata_smart_attributes": {"table": [
        {"name": "no id"}, {"id": 300}, {"id": -1}, {"id": 9, "name": "Power_On_Hours"}
    ]}})JSON");

    ASSERT_EQ(raw.ata_attributes.size(), 1U);
    EXPECT_EQ(raw.ata_attributes[0].id, 9);
    EXPECT_FALSE(raw.ata_attributes[0].value.has_value());
}

// ========== is_usable Tests ==========

TEST(TelemetryParserTest, IsUsable_RequiresModelSerialOrType) {
    RawTelemetry raw;
    EXPECT_FALSE(TelemetryParser::is_usable(raw));

    raw.model_name = "";
    EXPECT_FALSE(TelemetryParser::is_usable(raw));

    raw.serial_number = "ABC";
    EXPECT_TRUE(TelemetryParser::is_usable(raw));

    RawTelemetry typed;
    typed.device_type = "scsi";
    EXPECT_TRUE(TelemetryParser::is_usable(typed));
}

TEST(TelemetryParserTest, IsUsable_OpenFailedReport_IsFalse) {
    EXPECT_FALSE(TelemetryParser::is_usable(fixtures::telemetry_from(fixtures::OPEN_FAILED_REPORT)));
}
