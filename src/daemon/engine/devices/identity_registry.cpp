//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "identity_registry.hpp"

#include "device_types.hpp"
#include "logging.hpp"
#include "storage/settings_store.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace mqdevd
{
namespace daemon
{
namespace engine
{
namespace devices
{

IdentityRegistry::IdentityRegistry(storage::SettingsStore& store)
    : store_{store}
{
}

IdentityRegistry::AllocateResult::Var IdentityRegistry::allocate(const ServiceId&   id,
                                                                 const std::string& service_type)
{
    const auto mapping_key = mappingKey(id, service_type);

    // 1. Reuse the persisted mapping (if any).
    //
    if (const auto persisted = store_.get(mapping_key))
    {
        if (const auto device_instance = parseInstance(persisted.value()))
        {
            logger_->trace("Reusing instance {} of '{}' service '{}'.", device_instance.value(), service_type, id);
            return device_instance.value();
        }

        logger_->error("Corrupted instance mapping (key='{}', value='{}').", mapping_key, persisted.value());
        return StorageUnavailable{EIO};
    }

    // 2. Reserve a new number first, and only then bind it to the service.
    //    If binding fails the number is leaked, but never handed out twice.
    //
    auto reserved = loadReserved(service_type);
    if (!reserved)
    {
        return StorageUnavailable{EIO};
    }
    const auto device_instance = findSmallestFree(service_type, reserved.value());
    reserved->insert(device_instance);

    if (const auto err = store_.set(reservedKey(service_type), formatReserved(reserved.value())))
    {
        logger_->error("Failed to reserve instance {} of '{}' for '{}' (err={}).",
                       device_instance,
                       service_type,
                       id,
                       std::strerror(err));
        return StorageUnavailable{err};
    }
    if (const auto err = store_.set(mapping_key, std::to_string(device_instance)))
    {
        logger_->error("Failed to persist instance {} of '{}' for '{}' (err={}).",
                       device_instance,
                       service_type,
                       id,
                       std::strerror(err));
        return StorageUnavailable{err};
    }

    logger_->info("Allocated instance {} of '{}' for '{}'.", device_instance, service_type, id);
    return device_instance;
}

void IdentityRegistry::activate(const ServiceId&     id,
                                const std::string&   service_type,
                                const DeviceInstance device_instance)
{
    services_[id] = ServiceInstance{id, service_type, device_instance, true};
}

void IdentityRegistry::release(const ServiceId& id)
{
    const auto it = services_.find(id);
    if (it != services_.end())
    {
        it->second.active = false;
    }
}

std::vector<ServiceInstance> IdentityRegistry::releaseAll(const std::string& client_id)
{
    std::vector<ServiceInstance> released;
    for (auto& id_and_service : services_)
    {
        auto& service = id_and_service.second;
        if ((service.id.client_id == client_id) && service.active)
        {
            released.push_back(service);
            service.active = false;
        }
    }
    return released;
}

cetl::optional<ServiceInstance> IdentityRegistry::find(const ServiceId& id) const
{
    const auto it = services_.find(id);
    if (it == services_.end())
    {
        return cetl::nullopt;
    }
    return it->second;
}

std::vector<ServiceInstance> IdentityRegistry::activeServicesOf(const std::string& client_id) const
{
    std::vector<ServiceInstance> result;
    for (const auto& id_and_service : services_)
    {
        const auto& service = id_and_service.second;
        if ((service.id.client_id == client_id) && service.active)
        {
            result.push_back(service);
        }
    }
    return result;
}

std::string IdentityRegistry::mappingKey(const ServiceId& id, const std::string& service_type)
{
    return "instance/" + service_type + '/' + id.client_id + '/' + id.service_key;
}

std::string IdentityRegistry::reservedKey(const std::string& service_type)
{
    return "reserved/" + service_type;
}

cetl::optional<DeviceInstance> IdentityRegistry::parseInstance(const std::string& str)
{
    if (str.empty() || (str.find_first_not_of("0123456789") != std::string::npos))
    {
        return cetl::nullopt;
    }

    errno            = 0;
    char*      end   = nullptr;
    const auto value = std::strtoull(str.c_str(), &end, 10);  // NOLINT(*-magic-numbers)
    if ((errno != 0) || (end == nullptr) || (*end != '\0') ||
        (value > std::numeric_limits<DeviceInstance>::max()))
    {
        return cetl::nullopt;
    }
    return static_cast<DeviceInstance>(value);
}

std::string IdentityRegistry::formatReserved(const InstanceSet& reserved)
{
    std::ostringstream oss;
    bool               is_first = true;
    for (const auto device_instance : reserved)
    {
        if (!is_first)
        {
            oss << ',';
        }
        oss << device_instance;
        is_first = false;
    }
    return oss.str();
}

cetl::optional<IdentityRegistry::InstanceSet> IdentityRegistry::loadReserved(const std::string& service_type) const
{
    InstanceSet reserved;

    const auto key            = reservedKey(service_type);
    const auto maybe_reserved = store_.get(key);
    if (!maybe_reserved || maybe_reserved->empty())
    {
        return reserved;
    }

    std::istringstream iss{maybe_reserved.value()};
    std::string        item;
    while (std::getline(iss, item, ','))
    {
        const auto device_instance = parseInstance(item);
        if (!device_instance)
        {
            logger_->error("Corrupted reservation list (key='{}', value='{}').", key, maybe_reserved.value());
            return cetl::nullopt;
        }
        reserved.insert(device_instance.value());
    }
    return reserved;
}

DeviceInstance IdentityRegistry::findSmallestFree(const std::string& service_type, const InstanceSet& reserved) const
{
    // Active instances of the type are taken even if they are missing from the reservation list.
    InstanceSet taken{reserved};
    for (const auto& id_and_service : services_)
    {
        const auto& service = id_and_service.second;
        if (service.active && (service.service_type == service_type))
        {
            taken.insert(service.device_instance);
        }
    }

    DeviceInstance candidate = 0;
    for (const auto device_instance : taken)
    {
        if (device_instance != candidate)
        {
            break;
        }
        ++candidate;
    }
    return candidate;
}

}  // namespace devices
}  // namespace engine
}  // namespace daemon
}  // namespace mqdevd
