/**
 * @file MockDeviceEnumerator.hpp
 * @brief Google Mock implementation of IDeviceEnumerator
 */

#pragma once

#include "services/IDeviceEnumerator.hpp"

#include <gmock/gmock.h>

#include <memory>

class MockDeviceEnumerator : public IDeviceEnumerator {
public:
    MOCK_METHOD((std::expected<ScanResult, util::Error>), enumerate, (), (override));

    // Helper: Create a nice mock reporting no drives
    static std::shared_ptr<MockDeviceEnumerator> CreateNiceMock() {
        auto mock = std::make_shared<testing::NiceMock<MockDeviceEnumerator>>();

        ON_CALL(*mock, enumerate())
            .WillByDefault(testing::Return(
                ScanResult{.devices = {}, .status = ScanStatus::NO_DRIVES}));

        return mock;
    }

    static ScanResult Devices(std::vector<std::string> devices) {
        return ScanResult{.devices = std::move(devices), .status = ScanStatus::OK};
    }
};
