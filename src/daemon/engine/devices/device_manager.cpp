//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "device_manager.hpp"

#include "bus/ipc_bus.hpp"
#include "bus/message_bus.hpp"
#include "device_types.hpp"
#include "identity_registry.hpp"
#include "logging.hpp"
#include "storage/settings_store.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <cstring>
#include <utility>

namespace mqdevd
{
namespace daemon
{
namespace engine
{
namespace devices
{

DeviceManager::DeviceManager(storage::SettingsStore& store, bus::MessageBus& message_bus, bus::IpcBus& ipc_bus)
    : registry_{store}
    , exposer_{ipc_bus}
    , announcer_{message_bus}
    , listener_{message_bus, channel_}
{
}

int DeviceManager::start()
{
    return listener_.start();
}

void DeviceManager::post(Event::Var event)
{
    channel_.push(std::move(event));
}

std::size_t DeviceManager::processPendingEvents()
{
    std::size_t count = 0;
    while (auto event = channel_.pop())
    {
        cetl::visit([this](const auto& ev) { handleEvent(ev); }, event.value());
        ++count;
    }
    return count;
}

void DeviceManager::handleEvent(const Event::Connect& connect)
{
    using AllocateResult = IdentityRegistry::AllocateResult;

    const auto& client_id = connect.client_id;
    logger_->debug("Connect of '{}' with {} service(s).", client_id, connect.services.size());

    // 1. Resolve instances of all declared services.
    //    A single failure fails the whole event - nothing is exposed, and no reply is sent.
    //
    InstanceMap instances;
    for (const auto& key_and_type : connect.services)
    {
        const ServiceId id{client_id, key_and_type.first};

        auto result = registry_.allocate(id, key_and_type.second);
        if (const auto* const failure = cetl::get_if<AllocateResult::Failure>(&result))
        {
            logger_->error("Dropping connect of '{}': no instance for '{}' (err={}).",
                           client_id,
                           id,
                           std::strerror(failure->error_code));
            return;
        }
        instances[id.service_key] = cetl::get<AllocateResult::Success>(result);
    }

    // 2. Tear down previously active services which are not declared anymore (or changed their type).
    //
    for (const auto& service : registry_.activeServicesOf(client_id))
    {
        const auto it = connect.services.find(service.id.service_key);
        if ((it == connect.services.end()) || (it->second != service.service_type))
        {
            exposer_.retract(service.id);
            registry_.release(service.id);
        }
    }

    // 3. Expose the new services. Still active ones are left untouched.
    //
    for (const auto& key_and_type : connect.services)
    {
        const ServiceId id{client_id, key_and_type.first};

        const auto existing = registry_.find(id);
        if (existing && existing->active && exposer_.isExposed(id))
        {
            continue;
        }

        const auto device_instance = instances[id.service_key];
        if (0 != exposer_.expose({id, key_and_type.second, device_instance, true}))
        {
            // Already logged by the exposer. The service stays inactive until the next announcement.
            continue;
        }
        registry_.activate(id, key_and_type.second, device_instance);
    }

    // 4. Reply with the complete instance map.
    //    On failure everything above stays committed; the device re-announces if it gets no reply.
    //
    if (0 != announcer_.announce(client_id, instances))
    {
        logger_->debug("No device instances reply to '{}' this time.", client_id);
    }
}

void DeviceManager::handleEvent(const Event::Disconnect& disconnect)
{
    const auto& client_id = disconnect.client_id;

    const auto released = registry_.releaseAll(client_id);
    for (const auto& service : released)
    {
        exposer_.retract(service.id);
    }
    // Catch objects left without an active service (if any).
    const auto retracted = exposer_.retractAll(client_id);

    logger_->info("Disconnect of '{}' ({} service(s) released, {} extra object(s) retracted).",
                  client_id,
                  released.size(),
                  retracted);
}

}  // namespace devices
}  // namespace engine
}  // namespace daemon
}  // namespace mqdevd
