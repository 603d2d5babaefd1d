//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef MQDEVD_DAEMON_ENGINE_BUS_IPC_BUS_HPP_INCLUDED
#define MQDEVD_DAEMON_ENGINE_BUS_IPC_BUS_HPP_INCLUDED

#include "mqdevd/protocol.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>
#include <string>
#include <tuple>
#include <vector>

namespace mqdevd
{
namespace daemon
{
namespace engine
{
namespace bus
{

/// Local inter-process data bus observed by the monitoring software.
///
/// Objects are registered per service type and device instance with a set of typed attributes,
/// and their attribute values are updated later through the returned handle.
/// The bus derives the object location (f.e. D-Bus object path) from the object id,
/// so that distinct ids never share a location.
///
class IpcBus
{
public:
    using Handle = std::uint64_t;

    struct ObjectId final
    {
        std::string              service_type;
        protocol::DeviceInstance device_instance;

        friend bool operator<(const ObjectId& lhs, const ObjectId& rhs)
        {
            return std::tie(lhs.service_type, lhs.device_instance) < std::tie(rhs.service_type, rhs.device_instance);
        }

        friend bool operator==(const ObjectId& lhs, const ObjectId& rhs)
        {
            return (lhs.service_type == rhs.service_type) && (lhs.device_instance == rhs.device_instance);
        }

    };  // ObjectId

    /// Value of an attribute which has never been reported.
    struct Unknown final
    {};

    using Value = cetl::variant<Unknown, std::int64_t, double, std::string>;

    struct Attribute final
    {
        std::string name;
        Value       value;
    };
    using Schema = std::vector<Attribute>;

    struct RegisterResult
    {
        using Success = Handle;
        using Failure = int;  // aka errno
        using Var     = cetl::variant<Success, Failure>;
    };

    IpcBus(const IpcBus&)                = delete;
    IpcBus(IpcBus&&) noexcept            = delete;
    IpcBus& operator=(const IpcBus&)     = delete;
    IpcBus& operator=(IpcBus&&) noexcept = delete;

    virtual ~IpcBus() = default;

    /// @return Handle of the new object, or `errno`-style code (f.e. `EEXIST` if the id is already registered).
    ///
    CETL_NODISCARD virtual RegisterResult::Var registerObject(const ObjectId& id, const Schema& schema) = 0;

    /// @return Zero on success, otherwise `errno`-style code (f.e. `ENOENT` for unknown handle or attribute).
    ///
    CETL_NODISCARD virtual int update(const Handle handle, const std::string& attribute, const Value& value) = 0;

    /// Unregisters the object. Unknown handles are ignored.
    ///
    virtual void unregisterObject(const Handle handle) = 0;

    /// Stable identifier of the host gateway, used in telemetry topics.
    ///
    CETL_NODISCARD virtual std::string portalId() const = 0;

protected:
    IpcBus() = default;

};  // IpcBus

}  // namespace bus
}  // namespace engine
}  // namespace daemon
}  // namespace mqdevd

#endif  // MQDEVD_DAEMON_ENGINE_BUS_IPC_BUS_HPP_INCLUDED
