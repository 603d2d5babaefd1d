//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef MQDEVD_DAEMON_ENGINE_DEVICES_DEVICE_MANAGER_HPP_INCLUDED
#define MQDEVD_DAEMON_ENGINE_DEVICES_DEVICE_MANAGER_HPP_INCLUDED

#include "announcement_listener.hpp"
#include "bus/ipc_bus.hpp"
#include "bus/message_bus.hpp"
#include "device_types.hpp"
#include "event_channel.hpp"
#include "identity_registry.hpp"
#include "instance_announcer.hpp"
#include "logging.hpp"
#include "service_exposer.hpp"
#include "storage/settings_store.hpp"

#include <cetl/cetl.hpp>

#include <cstddef>

namespace mqdevd
{
namespace daemon
{
namespace engine
{
namespace devices
{

/// Runs the device registration protocol.
///
/// Owns all mutable registration state. Decoded announcements are queued on a single ordered
/// channel and processed one by one to completion by `processPendingEvents`, so state transitions
/// of different devices never interleave.
///
class DeviceManager final
{
public:
    DeviceManager(storage::SettingsStore& store, bus::MessageBus& message_bus, bus::IpcBus& ipc_bus);

    DeviceManager(const DeviceManager&)                = delete;
    DeviceManager(DeviceManager&&) noexcept            = delete;
    DeviceManager& operator=(const DeviceManager&)     = delete;
    DeviceManager& operator=(DeviceManager&&) noexcept = delete;

    ~DeviceManager() = default;

    /// Starts listening for device announcements.
    ///
    CETL_NODISCARD int start();

    /// Queues an event for processing (in addition to the ones decoded by the listener).
    ///
    void post(Event::Var event);

    /// Processes all queued events in order.
    ///
    /// @return Number of processed events.
    ///
    std::size_t processPendingEvents();

    const IdentityRegistry& registry() const noexcept
    {
        return registry_;
    }

    const ServiceExposer& exposer() const noexcept
    {
        return exposer_;
    }

private:
    void handleEvent(const Event::Connect& connect);
    void handleEvent(const Event::Disconnect& disconnect);

    EventChannel         channel_;
    IdentityRegistry     registry_;
    ServiceExposer       exposer_;
    InstanceAnnouncer    announcer_;
    AnnouncementListener listener_;
    common::LoggerPtr    logger_{common::getLogger("devices")};

};  // DeviceManager

}  // namespace devices
}  // namespace engine
}  // namespace daemon
}  // namespace mqdevd

#endif  // MQDEVD_DAEMON_ENGINE_DEVICES_DEVICE_MANAGER_HPP_INCLUDED
