//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef MQDEVD_DAEMON_ENGINE_DEVICES_DEVICE_TYPES_HPP_INCLUDED
#define MQDEVD_DAEMON_ENGINE_DEVICES_DEVICE_TYPES_HPP_INCLUDED

#include "mqdevd/protocol.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/fmt/fmt.h>

#include <map>
#include <string>
#include <tuple>

namespace mqdevd
{
namespace daemon
{
namespace engine
{
namespace devices
{

using DeviceInstance = protocol::DeviceInstance;

/// Service key -> service type name, as declared by a device.
using ServiceMap = std::map<std::string, std::string>;

/// Service key -> allocated device instance.
using InstanceMap = std::map<std::string, DeviceInstance>;

struct ServiceId final
{
    std::string client_id;
    std::string service_key;

    friend bool operator<(const ServiceId& lhs, const ServiceId& rhs)
    {
        return std::tie(lhs.client_id, lhs.service_key) < std::tie(rhs.client_id, rhs.service_key);
    }

    friend bool operator==(const ServiceId& lhs, const ServiceId& rhs)
    {
        return (lhs.client_id == rhs.client_id) && (lhs.service_key == rhs.service_key);
    }

};  // ServiceId

struct ServiceInstance final
{
    ServiceId      id;
    std::string    service_type;
    DeviceInstance device_instance;
    bool           active;

};  // ServiceInstance

/// Internal events decoded from the device status messages.
///
struct Event
{
    struct Connect final
    {
        std::string client_id;
        ServiceMap  services;
    };

    struct Disconnect final
    {
        std::string client_id;
    };

    using Var = cetl::variant<Connect, Disconnect>;

};  // Event

}  // namespace devices
}  // namespace engine
}  // namespace daemon
}  // namespace mqdevd

// MARK: - Formatting

// NOLINTBEGIN
template <>
struct fmt::formatter<mqdevd::daemon::engine::devices::ServiceId> : formatter<std::string>
{
    auto format(const mqdevd::daemon::engine::devices::ServiceId& id, format_context& ctx) const
    {
        return format_to(ctx.out(), "{}/{}", id.client_id, id.service_key);
    }
};
// NOLINTEND

#endif  // MQDEVD_DAEMON_ENGINE_DEVICES_DEVICE_TYPES_HPP_INCLUDED
