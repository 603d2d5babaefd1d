//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef MQDEVD_DAEMON_ENGINE_DEVICES_INSTANCE_ANNOUNCER_HPP_INCLUDED
#define MQDEVD_DAEMON_ENGINE_DEVICES_INSTANCE_ANNOUNCER_HPP_INCLUDED

#include "bus/message_bus.hpp"
#include "device_types.hpp"
#include "logging.hpp"

#include <cetl/cetl.hpp>

#include <string>

namespace mqdevd
{
namespace daemon
{
namespace engine
{
namespace devices
{

/// Replies to a device with the device instances of all services of its announcement.
///
class InstanceAnnouncer final
{
public:
    explicit InstanceAnnouncer(bus::MessageBus& message_bus);

    /// Publishes `{"<service key>": <instance>, ...}` on `device/<client id>/DeviceInstance`.
    ///
    /// @return Zero on success, otherwise `errno`-style code of the failed publish.
    ///
    CETL_NODISCARD int announce(const std::string& client_id, const InstanceMap& instances);

    static std::string formatPayload(const InstanceMap& instances);

private:
    bus::MessageBus&  message_bus_;
    common::LoggerPtr logger_{common::getLogger("devices")};

};  // InstanceAnnouncer

}  // namespace devices
}  // namespace engine
}  // namespace daemon
}  // namespace mqdevd

#endif  // MQDEVD_DAEMON_ENGINE_DEVICES_INSTANCE_ANNOUNCER_HPP_INCLUDED
