/**
 * @file DeviceEnumeratorTest.cpp
 * @brief Unit tests for DeviceEnumerator
 */

#include "services/DeviceEnumerator.hpp"
#include "services/SmartctlCommands.hpp"

#include "fixtures/TelemetryFixtures.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using ::testing::ElementsAre;
using ::testing::Return;

class DeviceEnumeratorTest : public ::testing::Test {
protected:
    std::shared_ptr<MockProbeExecutor> mock_executor = MockProbeExecutor::CreateNiceMock();
    DeviceEnumerator enumerator{mock_executor};
};

// ========== enumerate Tests ==========

TEST_F(DeviceEnumeratorTest, Enumerate_RunsScanCommand) {
    EXPECT_CALL(*mock_executor, run(ElementsAre("--scan", "-j")))
        .WillOnce(Return(MockProbeExecutor::Output(std::string(fixtures::EMPTY_SCAN_OUTPUT))));

    auto result = enumerator.enumerate();

    ASSERT_TRUE(result.has_value());
}

TEST_F(DeviceEnumeratorTest, Enumerate_DeduplicatesKeepingFirstOccurrence) {
    ON_CALL(*mock_executor, run(testing::_))
        .WillByDefault(Return(MockProbeExecutor::Output(std::string(fixtures::SCAN_OUTPUT))));

    auto result = enumerator.enumerate();

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->status, ScanStatus::OK);
    EXPECT_THAT(result->devices, ElementsAre("/dev/sda", "/dev/nvme0"));
}

TEST_F(DeviceEnumeratorTest, Enumerate_NoDevices_ReportsNoDrives) {
    ON_CALL(*mock_executor, run(testing::_))
        .WillByDefault(Return(MockProbeExecutor::Output(std::string(fixtures::EMPTY_SCAN_OUTPUT))));

    auto result = enumerator.enumerate();

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->status, ScanStatus::NO_DRIVES);
    EXPECT_TRUE(result->devices.empty());
}

TEST_F(DeviceEnumeratorTest, Enumerate_ToolNotFound_IsCycleLevelError) {
    auto result = enumerator.enumerate();

    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(has_probe_code(result.error(), ProbeErrorCode::TOOL_NOT_FOUND));
}

TEST_F(DeviceEnumeratorTest, Enumerate_Timeout_DegradesToScanFailed) {
    ON_CALL(*mock_executor, run(testing::_))
        .WillByDefault(Return(MockProbeExecutor::Failure(ProbeErrorCode::TIMED_OUT)));

    auto result = enumerator.enumerate();

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->status, ScanStatus::SCAN_FAILED);
    EXPECT_TRUE(result->devices.empty());
}

TEST_F(DeviceEnumeratorTest, Enumerate_FatalExitStatus_DegradesToScanFailed) {
    ON_CALL(*mock_executor, run(testing::_))
        .WillByDefault(Return(MockProbeExecutor::Output(std::string(fixtures::SCAN_OUTPUT), 1)));

    auto result = enumerator.enumerate();

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->status, ScanStatus::SCAN_FAILED);
}

TEST_F(DeviceEnumeratorTest, Enumerate_AnyNonZeroExit_DegradesToScanFailed) {
    ON_CALL(*mock_executor, run(testing::_))
        .WillByDefault(Return(MockProbeExecutor::Output(std::string(fixtures::SCAN_OUTPUT),
                                                        smartctl::EXIT_SMART_COMMAND_FAILED)));

    auto result = enumerator.enumerate();

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->status, ScanStatus::SCAN_FAILED);
}

TEST_F(DeviceEnumeratorTest, Enumerate_GarbageOutput_DegradesToScanFailed) {
    ON_CALL(*mock_executor, run(testing::_))
        .WillByDefault(Return(MockProbeExecutor::Output("/dev/sda -d sat # /dev/sda [SAT]\n")));

    auto result = enumerator.enumerate();

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->status, ScanStatus::SCAN_FAILED);
}

// ========== parse_scan_output Tests ==========

TEST(DeviceEnumeratorParseTest, ParseScanOutput_MissingDevicesArray_IsScanFailed) {
    EXPECT_EQ(DeviceEnumerator::parse_scan_output("{}").status, ScanStatus::SCAN_FAILED);
    EXPECT_EQ(DeviceEnumerator::parse_scan_output(R"({"devices": {}})").status,
              ScanStatus::SCAN_FAILED);
    EXPECT_EQ(DeviceEnumerator::parse_scan_output("[]").status, ScanStatus::SCAN_FAILED);
}

TEST(DeviceEnumeratorParseTest, ParseScanOutput_OnlyNamelessEntries_IsNoDrives) {
    auto result = DeviceEnumerator::parse_scan_output(R"({"devices": [{"type": "sat"}, 5, null]})");

    EXPECT_EQ(result.status, ScanStatus::NO_DRIVES);
    EXPECT_TRUE(result.devices.empty());
}
