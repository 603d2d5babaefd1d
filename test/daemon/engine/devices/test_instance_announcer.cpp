//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "devices/instance_announcer.hpp"

#include "daemon/engine/bus/message_bus_mock.hpp"
#include "devices/device_types.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cerrno>

namespace
{

using namespace mqdevd::daemon::engine;           // NOLINT This our main concern here in the unit tests.
using namespace mqdevd::daemon::engine::devices;  // NOLINT This our main concern here in the unit tests.

using testing::Return;
using testing::StrictMock;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestInstanceAnnouncer : public testing::Test
{
protected:
    // NOLINTBEGIN
    StrictMock<bus::MessageBusMock> message_bus_mock_;
    // NOLINTEND
};

// MARK: - Tests:

TEST_F(TestInstanceAnnouncer, formatPayload)
{
    EXPECT_THAT(InstanceAnnouncer::formatPayload({}), "{}");
    EXPECT_THAT(InstanceAnnouncer::formatPayload({{"t1", 0}, {"t2", 1}}), R"({"t1":0,"t2":1})");
    EXPECT_THAT(InstanceAnnouncer::formatPayload({{"level", 4294967295U}}), R"({"level":4294967295})");
}

TEST_F(TestInstanceAnnouncer, announce)
{
    InstanceAnnouncer announcer{message_bus_mock_};

    EXPECT_CALL(message_bus_mock_, publish("device/fe001/DeviceInstance", R"({"k":7,"t1":0})"))  //
        .WillOnce(Return(0));
    EXPECT_THAT(announcer.announce("fe001", {{"t1", 0}, {"k", 7}}), 0);
}

TEST_F(TestInstanceAnnouncer, announce_failure)
{
    InstanceAnnouncer announcer{message_bus_mock_};

    EXPECT_CALL(message_bus_mock_, publish("device/fe001/DeviceInstance", R"({"t1":0})"))  //
        .WillOnce(Return(ENOTCONN));
    EXPECT_THAT(announcer.announce("fe001", {{"t1", 0}}), ENOTCONN);
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
