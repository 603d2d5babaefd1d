//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "sd_bus_ipc_bus.hpp"

#include "bus/ipc_bus.hpp"
#include "logging.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <systemd/sd-bus.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace mqdevd
{
namespace daemon
{
namespace engine
{
namespace dbus
{
namespace
{

constexpr const char* UnknownPortalId = "unknown";

/// Appends the value as a variant.
///
class VariantAppender final
{
public:
    explicit VariantAppender(sd_bus_message* const msg)
        : msg_{msg}
    {
    }

    int operator()(const bus::IpcBus::Unknown&) const
    {
        return ::sd_bus_message_append(msg_, "v", "ai", 0);
    }

    int operator()(const std::int64_t value) const
    {
        return ::sd_bus_message_append(msg_, "v", "x", value);
    }

    int operator()(const double value) const
    {
        return ::sd_bus_message_append(msg_, "v", "d", value);
    }

    int operator()(const std::string& value) const
    {
        return ::sd_bus_message_append(msg_, "v", "s", value.c_str());
    }

private:
    sd_bus_message* msg_;

};  // VariantAppender

}  // namespace

constexpr const char* SdBusIpcBus::ServiceInterface;

void SdBusIpcBus::BusDeleter::operator()(sd_bus* const bus) const
{
    ::sd_bus_flush_close_unref(bus);
}

void SdBusIpcBus::SlotDeleter::operator()(sd_bus_slot* const slot) const
{
    ::sd_bus_slot_unref(slot);
}

SdBusIpcBus::Ptr SdBusIpcBus::make(const Params& params)
{
    auto logger = common::getLogger("dbus");

    sd_bus* raw_bus = nullptr;
    int     result  = params.is_session_bus ? ::sd_bus_open_user(&raw_bus) : ::sd_bus_open_system(&raw_bus);
    if (result < 0)
    {
        logger->error("Failed to connect to {} bus: {}.",
                      params.is_session_bus ? "session" : "system",
                      std::strerror(-result));
        return nullptr;
    }
    BusPtr bus{raw_bus};

    result = ::sd_bus_request_name(bus.get(), params.service_name.c_str(), 0);
    if (result < 0)
    {
        logger->error("Failed to acquire D-Bus name '{}': {}.", params.service_name, std::strerror(-result));
        return nullptr;
    }

    std::string portal_id;
    if (params.portal_id)
    {
        portal_id = params.portal_id.value();
    }
    else if (const auto mac_address = readMacAddress(params.network_interface))
    {
        portal_id = mac_address.value();
    }
    else
    {
        logger->warn("Can't read MAC address of '{}' network interface - using '{}' portal id.",
                     params.network_interface,
                     UnknownPortalId);
        portal_id = UnknownPortalId;
    }

    logger->info("Acquired D-Bus name '{}' (portal_id='{}').", params.service_name, portal_id);

    // Private constructor - hence `new` instead of `std::make_unique`.
    return Ptr{new SdBusIpcBus{std::move(bus), std::move(portal_id)}};  // NOLINT(cppcoreguidelines-owning-memory)
}

SdBusIpcBus::SdBusIpcBus(BusPtr bus, std::string portal_id)
    : bus_{std::move(bus)}
    , portal_id_{std::move(portal_id)}
    , next_handle_{1}
{
}

SdBusIpcBus::~SdBusIpcBus()
{
    // Slots go first - they refer to the bus.
    objects_.clear();
}

SdBusIpcBus::RegisterResult::Var SdBusIpcBus::registerObject(const ObjectId& id, const Schema& schema)
{
    auto path = objectPath(id);
    if (!path)
    {
        logger_->error("Failed to encode D-Bus object path of '{}/{}'.", id.service_type, id.device_instance);
        return EINVAL;
    }

    const auto same_path_it = std::find_if(objects_.begin(), objects_.end(), [&path](const auto& handle_and_object) {
        return handle_and_object.second->path == path.value();
    });
    if (same_path_it != objects_.end())
    {
        logger_->error("D-Bus object '{}' is already registered.", path.value());
        return EEXIST;
    }

    auto object        = std::make_unique<Object>();
    object->path       = std::move(path.value());
    object->attributes = schema;
    object->vtable     = makeVtable(object->attributes);

    sd_bus_slot* raw_slot = nullptr;
    const int    result   = ::sd_bus_add_object_vtable(bus_.get(),
                                                  &raw_slot,
                                                  object->path.c_str(),
                                                  ServiceInterface,
                                                  object->vtable.data(),
                                                  object.get());
    if (result < 0)
    {
        logger_->error("Failed to add D-Bus object '{}': {}.", object->path, std::strerror(-result));
        return -result;
    }
    object->slot.reset(raw_slot);

    const auto handle = next_handle_++;
    logger_->debug("Registered D-Bus object '{}' (handle={}, attributes={}).", object->path, handle, schema.size());
    objects_.emplace(handle, std::move(object));
    return handle;
}

int SdBusIpcBus::update(const Handle handle, const std::string& attribute, const Value& value)
{
    const auto it = objects_.find(handle);
    if (it == objects_.end())
    {
        return ENOENT;
    }
    auto& object = *it->second;

    const auto attr_it = std::find_if(object.attributes.begin(),
                                      object.attributes.end(),
                                      [&attribute](const Attribute& attr) { return attr.name == attribute; });
    if (attr_it == object.attributes.end())
    {
        return ENOENT;
    }

    attr_it->value = value;

    const int result = ::sd_bus_emit_properties_changed(bus_.get(),
                                                        object.path.c_str(),
                                                        ServiceInterface,
                                                        attr_it->name.c_str(),
                                                        static_cast<const char*>(nullptr));
    if (result < 0)
    {
        logger_->warn("Failed to emit PropertiesChanged of '{}' (attribute='{}'): {}.",
                      object.path,
                      attribute,
                      std::strerror(-result));
        return -result;
    }
    return 0;
}

void SdBusIpcBus::unregisterObject(const Handle handle)
{
    const auto it = objects_.find(handle);
    if (it == objects_.end())
    {
        return;
    }

    logger_->debug("Unregistering D-Bus object '{}' (handle={}).", it->second->path, handle);
    objects_.erase(it);
}

std::string SdBusIpcBus::portalId() const
{
    return portal_id_;
}

int SdBusIpcBus::fd() const
{
    return ::sd_bus_get_fd(bus_.get());
}

int SdBusIpcBus::events() const
{
    const int result = ::sd_bus_get_events(bus_.get());
    return (result < 0) ? 0 : result;
}

void SdBusIpcBus::process()
{
    int result = 0;
    while ((result = ::sd_bus_process(bus_.get(), nullptr)) > 0)
    {
        // Keep processing while there is something to process.
    }
    if (result < 0)
    {
        logger_->error("Failed to process D-Bus messages: {}.", std::strerror(-result));
    }
}

cetl::optional<std::string> SdBusIpcBus::readMacAddress(const std::string& network_interface)
{
    std::ifstream file{"/sys/class/net/" + network_interface + "/address"};
    std::string   line;
    if (!file || !std::getline(file, line))
    {
        return cetl::nullopt;
    }

    std::string mac_address;
    for (const char ch : line)
    {
        if (std::isxdigit(static_cast<unsigned char>(ch)) != 0)
        {
            mac_address.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
        }
    }
    if (mac_address.empty() || (mac_address.find_first_not_of('0') == std::string::npos))
    {
        return cetl::nullopt;
    }
    return mac_address;
}

cetl::optional<std::string> SdBusIpcBus::objectPath(const ObjectId& id)
{
    char*     raw_path = nullptr;
    const int result   = ::sd_bus_path_encode_many(&raw_path, "/%", id.service_type.c_str());
    if (result < 0)
    {
        return cetl::nullopt;
    }
    std::string path{raw_path};
    std::free(raw_path);  // NOLINT(cppcoreguidelines-no-malloc)

    return path + '/' + std::to_string(id.device_instance);
}

int SdBusIpcBus::getProperty(sd_bus* const,
                             const char* const,
                             const char* const,
                             const char* const     property,
                             sd_bus_message* const reply,
                             void* const           userdata,
                             sd_bus_error* const)
{
    const auto& object  = *static_cast<const Object*>(userdata);
    const auto  attr_it = std::find_if(object.attributes.begin(),
                                      object.attributes.end(),
                                      [property](const Attribute& attr) { return attr.name == property; });
    if (attr_it == object.attributes.end())
    {
        return -ENOENT;
    }
    return cetl::visit(VariantAppender{reply}, attr_it->value);
}

std::vector<sd_bus_vtable> SdBusIpcBus::makeVtable(const Schema& attributes)
{
    std::vector<sd_bus_vtable> vtable;
    vtable.reserve(attributes.size() + 2);

    vtable.push_back(SD_BUS_VTABLE_START(0));
    for (const auto& attribute : attributes)
    {
        vtable.push_back(
            SD_BUS_PROPERTY(attribute.name.c_str(), "v", getProperty, 0, SD_BUS_VTABLE_PROPERTY_EMITS_CHANGE));
    }
    vtable.push_back(SD_BUS_VTABLE_END);
    return vtable;
}

}  // namespace dbus
}  // namespace engine
}  // namespace daemon
}  // namespace mqdevd
