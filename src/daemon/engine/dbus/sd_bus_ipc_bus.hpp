//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef MQDEVD_DAEMON_ENGINE_DBUS_SD_BUS_IPC_BUS_HPP_INCLUDED
#define MQDEVD_DAEMON_ENGINE_DBUS_SD_BUS_IPC_BUS_HPP_INCLUDED

#include "bus/ipc_bus.hpp"
#include "logging.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <systemd/sd-bus.h>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace mqdevd
{
namespace daemon
{
namespace engine
{
namespace dbus
{

/// IPC bus on top of a D-Bus connection (sd-bus of libsystemd).
///
/// Every registered object implements the read-only `com.mqdevd.Service` interface,
/// whose properties are the object attributes (all of them typed as variants).
/// Not-yet-known values are presented as an empty integer array.
/// The object path is `/<service type>/<device instance>`, where the service type is
/// escaped by `sd_bus_path_encode_many` (so distinct types never share a path).
///
class SdBusIpcBus final : public bus::IpcBus
{
public:
    using Ptr = std::unique_ptr<SdBusIpcBus>;

    static constexpr const char* ServiceInterface = "com.mqdevd.Service";

    struct Params
    {
        bool                        is_session_bus;
        std::string                 service_name;
        cetl::optional<std::string> portal_id;
        std::string                 network_interface;
    };

    /// Connects to the bus and acquires the well-known service name.
    ///
    /// @return `nullptr` on failure (the reason is logged).
    ///
    CETL_NODISCARD static Ptr make(const Params& params);

    SdBusIpcBus(const SdBusIpcBus&)                = delete;
    SdBusIpcBus(SdBusIpcBus&&) noexcept            = delete;
    SdBusIpcBus& operator=(const SdBusIpcBus&)     = delete;
    SdBusIpcBus& operator=(SdBusIpcBus&&) noexcept = delete;

    ~SdBusIpcBus() override;

    // IpcBus

    CETL_NODISCARD RegisterResult::Var registerObject(const ObjectId& id, const Schema& schema) override;
    CETL_NODISCARD int  update(const Handle handle, const std::string& attribute, const Value& value) override;
    void                unregisterObject(const Handle handle) override;
    CETL_NODISCARD std::string portalId() const override;

    int  fd() const;
    int  events() const;
    void process();

    /// @return D-Bus object path of the object id, or `nullopt` if it can't be encoded.
    ///
    static cetl::optional<std::string> objectPath(const ObjectId& id);

    /// Reads MAC address of the network interface (from sysfs) as lowercase hex digits without separators.
    ///
    static cetl::optional<std::string> readMacAddress(const std::string& network_interface);

private:
    struct BusDeleter
    {
        void operator()(sd_bus* bus) const;
    };
    using BusPtr = std::unique_ptr<sd_bus, BusDeleter>;

    struct SlotDeleter
    {
        void operator()(sd_bus_slot* slot) const;
    };
    using SlotPtr = std::unique_ptr<sd_bus_slot, SlotDeleter>;

    /// The vtable refers to the attribute names, so neither of them may change once the slot is added.
    ///
    struct Object
    {
        std::string                path;
        Schema                     attributes;
        std::vector<sd_bus_vtable> vtable;
        SlotPtr                    slot;
    };

    SdBusIpcBus(BusPtr bus, std::string portal_id);

    static int getProperty(sd_bus*         bus,
                           const char*     path,
                           const char*     interface,
                           const char*     property,
                           sd_bus_message* reply,
                           void*           userdata,
                           sd_bus_error*   ret_error);

    static std::vector<sd_bus_vtable> makeVtable(const Schema& attributes);

    BusPtr                                    bus_;
    std::string                               portal_id_;
    Handle                                    next_handle_;
    std::map<Handle, std::unique_ptr<Object>> objects_;
    common::LoggerPtr                         logger_{common::getLogger("dbus")};

};  // SdBusIpcBus

}  // namespace dbus
}  // namespace engine
}  // namespace daemon
}  // namespace mqdevd

#endif  // MQDEVD_DAEMON_ENGINE_DBUS_SD_BUS_IPC_BUS_HPP_INCLUDED
