/**
 * @file MockDeviceReader.hpp
 * @brief Google Mock implementation of IDeviceReader
 */

#pragma once

#include "services/IDeviceReader.hpp"

#include <gmock/gmock.h>

#include <memory>

class MockDeviceReader : public IDeviceReader {
public:
    MOCK_METHOD((std::expected<RawTelemetry, util::Error>), read, (const std::string& device),
                (override));

    // Helper: Create a nice mock that reads a generic ATA drive for any device
    static std::shared_ptr<MockDeviceReader> CreateNiceMock() {
        auto mock = std::make_shared<testing::NiceMock<MockDeviceReader>>();

        ON_CALL(*mock, read(testing::_)).WillByDefault(testing::Return(CreateAtaTelemetry()));

        return mock;
    }

    static RawTelemetry CreateAtaTelemetry(const std::string& model = "Test Disk",
                                           const std::string& serial = "TEST123") {
        RawTelemetry raw;
        raw.device_type = "sat";
        raw.model_name = model;
        raw.serial_number = serial;
        raw.smart_passed = true;
        raw.power_on_hours = 1234;
        return raw;
    }
};
