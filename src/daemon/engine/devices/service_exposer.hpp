//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef MQDEVD_DAEMON_ENGINE_DEVICES_SERVICE_EXPOSER_HPP_INCLUDED
#define MQDEVD_DAEMON_ENGINE_DEVICES_SERVICE_EXPOSER_HPP_INCLUDED

#include "bus/ipc_bus.hpp"
#include "device_types.hpp"
#include "logging.hpp"

#include <cetl/cetl.hpp>

#include <cstddef>
#include <map>
#include <string>

namespace mqdevd
{
namespace daemon
{
namespace engine
{
namespace devices
{

/// Descriptive attributes every exposed object carries besides its service type schema.
///
namespace metadata
{

constexpr const char* DeviceInstance = "DeviceInstance";
constexpr const char* ProductName    = "ProductName";
constexpr const char* Connection     = "Connection";
constexpr const char* ClientId       = "ClientId";
constexpr const char* ServiceKey     = "ServiceKey";
constexpr const char* Connected      = "Connected";

}  // namespace metadata

/// Owns the IPC bus objects of the active services.
///
/// An object is registered under its service type and device instance with all attributes of its
/// service type schema (initially unknown), plus a few descriptive attributes of the device.
///
class ServiceExposer final
{
public:
    explicit ServiceExposer(bus::IpcBus& ipc_bus);

    ServiceExposer(const ServiceExposer&)                = delete;
    ServiceExposer(ServiceExposer&&) noexcept            = delete;
    ServiceExposer& operator=(const ServiceExposer&)     = delete;
    ServiceExposer& operator=(ServiceExposer&&) noexcept = delete;

    ~ServiceExposer();

    /// Registers a fresh object for the service. An already exposed object of the service is replaced.
    ///
    /// @return Zero on success, otherwise `errno`-style code of the failed registration.
    ///
    CETL_NODISCARD int expose(const ServiceInstance& service);

    void retract(const ServiceId& id);

    /// Retracts all objects of the client (if any).
    ///
    /// @return Number of retracted objects.
    ///
    std::size_t retractAll(const std::string& client_id);

    bool isExposed(const ServiceId& id) const;

private:
    struct Exposed final
    {
        bus::IpcBus::Handle   handle;
        bus::IpcBus::ObjectId object_id;
    };

    void setMetadata(const bus::IpcBus::Handle handle,
                     const ServiceInstance&    service,
                     const std::string&        product_name);

    bus::IpcBus&                 ipc_bus_;
    std::map<ServiceId, Exposed> exposed_;
    common::LoggerPtr            logger_{common::getLogger("devices")};

};  // ServiceExposer

}  // namespace devices
}  // namespace engine
}  // namespace daemon
}  // namespace mqdevd

#endif  // MQDEVD_DAEMON_ENGINE_DEVICES_SERVICE_EXPOSER_HPP_INCLUDED
