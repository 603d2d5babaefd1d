//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef MQDEVD_DAEMON_ENGINE_DEVICES_ANNOUNCEMENT_LISTENER_HPP_INCLUDED
#define MQDEVD_DAEMON_ENGINE_DEVICES_ANNOUNCEMENT_LISTENER_HPP_INCLUDED

#include "bus/message_bus.hpp"
#include "device_types.hpp"
#include "event_channel.hpp"
#include "logging.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <string>

namespace mqdevd
{
namespace daemon
{
namespace engine
{
namespace devices
{

/// Decodes device status messages into Connect/Disconnect events.
///
/// Each accepted message produces exactly one event on the channel;
/// malformed messages are logged and dropped.
///
class AnnouncementListener final
{
public:
    struct MalformedAnnouncement final
    {
        std::string reason;
    };

    struct DecodeResult
    {
        using Success = Event::Var;
        using Failure = MalformedAnnouncement;
        using Var     = cetl::variant<Success, Failure>;
    };

    AnnouncementListener(bus::MessageBus& message_bus, EventChannel& channel);

    /// Subscribes to the status topics of all devices.
    ///
    CETL_NODISCARD int start();

    void onMessage(const std::string& topic, const std::string& payload);

    static DecodeResult::Var decode(const std::string& topic, const std::string& payload);

private:
    bus::MessageBus&  message_bus_;
    EventChannel&     channel_;
    common::LoggerPtr logger_{common::getLogger("devices")};

};  // AnnouncementListener

}  // namespace devices
}  // namespace engine
}  // namespace daemon
}  // namespace mqdevd

#endif  // MQDEVD_DAEMON_ENGINE_DEVICES_ANNOUNCEMENT_LISTENER_HPP_INCLUDED
