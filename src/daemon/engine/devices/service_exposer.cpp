//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "service_exposer.hpp"

#include "bus/ipc_bus.hpp"
#include "device_types.hpp"
#include "logging.hpp"
#include "mqdevd/protocol.hpp"
#include "service_catalog.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <utility>

namespace mqdevd
{
namespace daemon
{
namespace engine
{
namespace devices
{

ServiceExposer::ServiceExposer(bus::IpcBus& ipc_bus)
    : ipc_bus_{ipc_bus}
{
}

ServiceExposer::~ServiceExposer()
{
    for (const auto& id_and_exposed : exposed_)
    {
        ipc_bus_.unregisterObject(id_and_exposed.second.handle);
    }
}

int ServiceExposer::expose(const ServiceInstance& service)
{
    // Always start from a fresh object - no stale values of a previous connection.
    retract(service.id);

    const auto& schema = ServiceCatalog::schemaOf(service.service_type);
    if (schema.kind == ServiceKind::Generic)
    {
        logger_->warn("Unknown service type '{}' of '{}', exposing generic placeholder.",
                      service.service_type,
                      service.id);
    }

    bus::IpcBus::Schema ipc_schema;
    for (const auto& attribute : schema.attributes)
    {
        ipc_schema.push_back({attribute, bus::IpcBus::Unknown{}});
    }
    for (const auto* const attribute : {metadata::DeviceInstance,
                                        metadata::ProductName,
                                        metadata::Connection,
                                        metadata::ClientId,
                                        metadata::ServiceKey,
                                        metadata::Connected})
    {
        ipc_schema.push_back({attribute, bus::IpcBus::Unknown{}});
    }

    bus::IpcBus::ObjectId object_id{service.service_type, service.device_instance};
    auto                  result = ipc_bus_.registerObject(object_id, ipc_schema);
    if (const auto* const failure = cetl::get_if<bus::IpcBus::RegisterResult::Failure>(&result))
    {
        logger_->error("Failed to register '{}/{}' of '{}' (err={}).",
                       service.service_type,
                       service.device_instance,
                       service.id,
                       std::strerror(*failure));
        return *failure;
    }
    const auto handle    = cetl::get<bus::IpcBus::RegisterResult::Success>(result);
    exposed_[service.id] = Exposed{handle, std::move(object_id)};

    setMetadata(handle, service, schema.product_name);

    logger_->info("Exposed '{}/{}' of '{}'.", service.service_type, service.device_instance, service.id);
    if (logger_->should_log(spdlog::level::debug))
    {
        const auto portal_id = ipc_bus_.portalId();
        for (const auto& attribute : schema.attributes)
        {
            logger_->debug("Telemetry of '{}': '{}'.",
                           service.id,
                           protocol::telemetryTopic(portal_id,
                                                    service.service_type,
                                                    service.device_instance,
                                                    attribute));
        }
    }
    return 0;
}

void ServiceExposer::retract(const ServiceId& id)
{
    const auto it = exposed_.find(id);
    if (it == exposed_.end())
    {
        return;
    }

    ipc_bus_.unregisterObject(it->second.handle);
    logger_->info("Retracted '{}/{}' of '{}'.",
                  it->second.object_id.service_type,
                  it->second.object_id.device_instance,
                  id);
    exposed_.erase(it);
}

std::size_t ServiceExposer::retractAll(const std::string& client_id)
{
    std::size_t count = 0;
    for (auto it = exposed_.begin(); it != exposed_.end();)
    {
        if (it->first.client_id == client_id)
        {
            ipc_bus_.unregisterObject(it->second.handle);
            logger_->info("Retracted '{}/{}' of '{}'.",
                          it->second.object_id.service_type,
                          it->second.object_id.device_instance,
                          it->first);
            it = exposed_.erase(it);
            ++count;
        }
        else
        {
            ++it;
        }
    }
    return count;
}

bool ServiceExposer::isExposed(const ServiceId& id) const
{
    return exposed_.find(id) != exposed_.end();
}

void ServiceExposer::setMetadata(const bus::IpcBus::Handle handle,
                                 const ServiceInstance&    service,
                                 const std::string&        product_name)
{
    using Value = bus::IpcBus::Value;

    const std::pair<const char*, Value> values[] = {  // NOLINT(*-avoid-c-arrays)
        {metadata::DeviceInstance, Value{static_cast<std::int64_t>(service.device_instance)}},
        {metadata::ProductName, Value{product_name}},
        {metadata::Connection, Value{"MQTT " + service.id.client_id}},
        {metadata::ClientId, Value{service.id.client_id}},
        {metadata::ServiceKey, Value{service.id.service_key}},
        {metadata::Connected, Value{std::int64_t{1}}},
    };
    for (const auto& name_and_value : values)
    {
        if (const auto err = ipc_bus_.update(handle, name_and_value.first, name_and_value.second))
        {
            logger_->warn("Failed to set '{}' of '{}' (err={}).", name_and_value.first, service.id, std::strerror(err));
        }
    }
}

}  // namespace devices
}  // namespace engine
}  // namespace daemon
}  // namespace mqdevd
