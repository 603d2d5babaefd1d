//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "devices/service_exposer.hpp"

#include "bus/ipc_bus.hpp"
#include "daemon/engine/bus/ipc_bus_mock.hpp"
#include "devices/device_types.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cerrno>
#include <cstdint>
#include <string>
#include <vector>

namespace
{

using namespace mqdevd::daemon::engine;           // NOLINT This our main concern here in the unit tests.
using namespace mqdevd::daemon::engine::devices;  // NOLINT This our main concern here in the unit tests.

using testing::_;
using testing::Return;
using testing::IsEmpty;
using testing::NotNull;
using testing::NiceMock;
using testing::ElementsAre;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestServiceExposer : public testing::Test
{
protected:
    using Value = bus::IpcBus::Value;

    void SetUp() override
    {
        ipc_bus_mock_.delegateToFake();
    }

    static ServiceInstance makeService(const std::string&   client_id,
                                       const std::string&   service_key,
                                       const std::string&   service_type,
                                       const DeviceInstance device_instance)
    {
        return ServiceInstance{{client_id, service_key}, service_type, device_instance, true};
    }

    static std::vector<std::string> namesOf(const bus::IpcBus::Schema& schema)
    {
        std::vector<std::string> names;
        for (const auto& attribute : schema)
        {
            names.push_back(attribute.name);
        }
        return names;
    }

    static bool isUnknown(const Value* const value)
    {
        return (value != nullptr) && cetl::holds_alternative<bus::IpcBus::Unknown>(*value);
    }

    static cetl::optional<std::int64_t> intOf(const Value* const value)
    {
        if ((value == nullptr) || !cetl::holds_alternative<std::int64_t>(*value))
        {
            return cetl::nullopt;
        }
        return cetl::get<std::int64_t>(*value);
    }

    static cetl::optional<std::string> strOf(const Value* const value)
    {
        if ((value == nullptr) || !cetl::holds_alternative<std::string>(*value))
        {
            return cetl::nullopt;
        }
        return cetl::get<std::string>(*value);
    }

    // NOLINTBEGIN
    NiceMock<bus::IpcBusMock> ipc_bus_mock_;
    // NOLINTEND
};

// MARK: - Tests:

TEST_F(TestServiceExposer, expose_known_type)
{
    ServiceExposer exposer{ipc_bus_mock_};

    EXPECT_THAT(exposer.expose(makeService("fe001", "t1", "temperature", 5)), 0);
    EXPECT_TRUE(exposer.isExposed({"fe001", "t1"}));

    const auto* const object = ipc_bus_mock_.findObject("/temperature/5");
    ASSERT_THAT(object, NotNull());
    EXPECT_THAT(namesOf(object->attributes),
                ElementsAre("Temperature",
                            "Pressure",
                            "Humidity",
                            "TemperatureType",
                            "DeviceInstance",
                            "ProductName",
                            "Connection",
                            "ClientId",
                            "ServiceKey",
                            "Connected"));

    // Readings are unknown until the device reports them.
    for (const auto* const name : {"Temperature", "Pressure", "Humidity", "TemperatureType"})
    {
        EXPECT_TRUE(isUnknown(object->find(name))) << name;
    }

    EXPECT_THAT(intOf(object->find("DeviceInstance")), 5);
    EXPECT_THAT(strOf(object->find("ProductName")), std::string{"MQTT temperature sensor"});
    EXPECT_THAT(strOf(object->find("Connection")), std::string{"MQTT fe001"});
    EXPECT_THAT(strOf(object->find("ClientId")), std::string{"fe001"});
    EXPECT_THAT(strOf(object->find("ServiceKey")), std::string{"t1"});
    EXPECT_THAT(intOf(object->find("Connected")), 1);
}

TEST_F(TestServiceExposer, expose_unknown_type_as_generic)
{
    ServiceExposer exposer{ipc_bus_mock_};

    EXPECT_THAT(exposer.expose(makeService("fe001", "x", "flux", 0)), 0);

    const auto* const object = ipc_bus_mock_.findObject("/flux/0");
    ASSERT_THAT(object, NotNull());
    EXPECT_THAT(namesOf(object->attributes),
                ElementsAre("DeviceInstance", "ProductName", "Connection", "ClientId", "ServiceKey", "Connected"));
    EXPECT_THAT(strOf(object->find("ProductName")), std::string{"MQTT generic device"});
}

TEST_F(TestServiceExposer, expose_registration_failure)
{
    ServiceExposer exposer{ipc_bus_mock_};

    EXPECT_CALL(ipc_bus_mock_, registerObject(bus::IpcBus::ObjectId{"tank", 0}, _))  //
        .WillOnce(Return(bus::IpcBus::RegisterResult::Var{EACCES}));
    EXPECT_CALL(ipc_bus_mock_, update(_, _, _)).Times(0);

    EXPECT_THAT(exposer.expose(makeService("fe001", "k1", "tank", 0)), EACCES);
    EXPECT_FALSE(exposer.isExposed({"fe001", "k1"}));
    EXPECT_THAT(ipc_bus_mock_.objects_, IsEmpty());
}

TEST_F(TestServiceExposer, expose_again_rebuilds_object)
{
    ServiceExposer exposer{ipc_bus_mock_};

    EXPECT_THAT(exposer.expose(makeService("fe001", "t1", "temperature", 0)), 0);
    ASSERT_THAT(ipc_bus_mock_.objects_.size(), 1);
    const auto first_handle = ipc_bus_mock_.objects_.begin()->first;
    EXPECT_THAT(ipc_bus_mock_.update(first_handle, "Temperature", Value{21.5}), 0);

    EXPECT_CALL(ipc_bus_mock_, unregisterObject(_)).Times(testing::AnyNumber());
    EXPECT_CALL(ipc_bus_mock_, unregisterObject(first_handle));
    EXPECT_THAT(exposer.expose(makeService("fe001", "t1", "temperature", 0)), 0);

    ASSERT_THAT(ipc_bus_mock_.objects_.size(), 1);
    EXPECT_THAT(ipc_bus_mock_.objects_.begin()->first, testing::Ne(first_handle));
    EXPECT_TRUE(isUnknown(ipc_bus_mock_.findObject("/temperature/0")->find("Temperature")));
}

TEST_F(TestServiceExposer, expose_registers_object_per_type_and_instance)
{
    ServiceExposer exposer{ipc_bus_mock_};

    EXPECT_CALL(ipc_bus_mock_, registerObject(_, _)).Times(testing::AnyNumber());
    EXPECT_CALL(ipc_bus_mock_, registerObject(bus::IpcBus::ObjectId{"temp-a", 0}, _));
    EXPECT_CALL(ipc_bus_mock_, registerObject(bus::IpcBus::ObjectId{"temp.a", 0}, _));

    // Types differing only in punctuation are still distinct objects.
    EXPECT_THAT(exposer.expose(makeService("fe001", "k1", "temp-a", 0)), 0);
    EXPECT_THAT(exposer.expose(makeService("fe001", "k2", "temp.a", 0)), 0);
    EXPECT_TRUE(exposer.isExposed({"fe001", "k1"}));
    EXPECT_TRUE(exposer.isExposed({"fe001", "k2"}));
    EXPECT_THAT(ipc_bus_mock_.objectPaths(), ElementsAre("/temp-a/0", "/temp.a/0"));
}

TEST_F(TestServiceExposer, expose_already_registered_object_id)
{
    ServiceExposer exposer{ipc_bus_mock_};

    EXPECT_THAT(exposer.expose(makeService("fe001", "t1", "temperature", 7)), 0);
    EXPECT_THAT(exposer.expose(makeService("fe002", "t1", "temperature", 7)), EEXIST);
    EXPECT_TRUE(exposer.isExposed({"fe001", "t1"}));
    EXPECT_FALSE(exposer.isExposed({"fe002", "t1"}));
    EXPECT_THAT(ipc_bus_mock_.objectPaths(), ElementsAre("/temperature/7"));
}

TEST_F(TestServiceExposer, retract_and_retractAll)
{
    ServiceExposer exposer{ipc_bus_mock_};

    EXPECT_THAT(exposer.expose(makeService("fe001", "t1", "temperature", 0)), 0);
    EXPECT_THAT(exposer.expose(makeService("fe001", "t2", "temperature", 1)), 0);
    EXPECT_THAT(exposer.expose(makeService("fe001", "k1", "tank", 0)), 0);
    EXPECT_THAT(exposer.expose(makeService("fe002", "t1", "temperature", 2)), 0);
    EXPECT_THAT(ipc_bus_mock_.objectPaths(), ElementsAre("/tank/0", "/temperature/0", "/temperature/1", "/temperature/2"));

    exposer.retract({"fe001", "k1"});
    exposer.retract({"fe001", "k1"});
    EXPECT_FALSE(exposer.isExposed({"fe001", "k1"}));
    EXPECT_THAT(ipc_bus_mock_.objectPaths(), ElementsAre("/temperature/0", "/temperature/1", "/temperature/2"));

    EXPECT_THAT(exposer.retractAll("fe001"), 2);
    EXPECT_THAT(exposer.retractAll("fe001"), 0);
    EXPECT_THAT(ipc_bus_mock_.objectPaths(), ElementsAre("/temperature/2"));
    EXPECT_TRUE(exposer.isExposed({"fe002", "t1"}));
}

TEST_F(TestServiceExposer, destruction_unregisters_objects)
{
    {
        ServiceExposer exposer{ipc_bus_mock_};
        EXPECT_THAT(exposer.expose(makeService("fe001", "t1", "temperature", 0)), 0);
        EXPECT_THAT(exposer.expose(makeService("fe001", "h1", "humidity", 0)), 0);
        EXPECT_THAT(ipc_bus_mock_.objects_.size(), 2);
    }
    EXPECT_THAT(ipc_bus_mock_.objects_, IsEmpty());
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
