//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef MQDEVD_DAEMON_ENGINE_DEVICES_IDENTITY_REGISTRY_HPP_INCLUDED
#define MQDEVD_DAEMON_ENGINE_DEVICES_IDENTITY_REGISTRY_HPP_INCLUDED

#include "device_types.hpp"
#include "logging.hpp"
#include "storage/settings_store.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <map>
#include <set>
#include <string>
#include <vector>

namespace mqdevd
{
namespace daemon
{
namespace engine
{
namespace devices
{

/// Owns the stable mapping from `(client id, service key, service type)` to a device instance.
///
/// Mappings are persisted in the settings store and are never removed, so a device which
/// reconnects gets back the very same instance numbers. Instances are allocated per service type
/// as the smallest non-negative number which has never been reserved for the type.
///
/// Persisted layout:
/// - `instance/<type>/<client id>/<service key>` -> decimal instance
/// - `reserved/<type>` -> ascending comma separated list of all instances ever reserved for the type
///
class IdentityRegistry final
{
public:
    /// The settings store could not commit (or could not read back) a mapping.
    struct StorageUnavailable final
    {
        int error_code;
    };

    struct AllocateResult
    {
        using Success = DeviceInstance;
        using Failure = StorageUnavailable;
        using Var     = cetl::variant<Success, Failure>;
    };

    explicit IdentityRegistry(storage::SettingsStore& store);

    IdentityRegistry(const IdentityRegistry&)                = delete;
    IdentityRegistry(IdentityRegistry&&) noexcept            = delete;
    IdentityRegistry& operator=(const IdentityRegistry&)     = delete;
    IdentityRegistry& operator=(IdentityRegistry&&) noexcept = delete;

    ~IdentityRegistry() = default;

    /// Resolves the persisted device instance of a service, or allocates and persists a new one.
    ///
    /// Idempotent: repeated calls with the same arguments return the same instance.
    /// Does not change the active state of the service.
    ///
    CETL_NODISCARD AllocateResult::Var allocate(const ServiceId& id, const std::string& service_type);

    /// Marks the service as active with the given (previously allocated) instance.
    ///
    void activate(const ServiceId& id, const std::string& service_type, const DeviceInstance device_instance);

    /// Marks the service as inactive. Its persisted mapping is retained.
    ///
    void release(const ServiceId& id);

    /// Marks all active services of the client as inactive.
    ///
    /// @return The services which were active before the call.
    ///
    std::vector<ServiceInstance> releaseAll(const std::string& client_id);

    CETL_NODISCARD cetl::optional<ServiceInstance> find(const ServiceId& id) const;

    CETL_NODISCARD std::vector<ServiceInstance> activeServicesOf(const std::string& client_id) const;

private:
    using InstanceSet = std::set<DeviceInstance>;

    static std::string mappingKey(const ServiceId& id, const std::string& service_type);
    static std::string reservedKey(const std::string& service_type);
    static cetl::optional<DeviceInstance> parseInstance(const std::string& str);
    static std::string                    formatReserved(const InstanceSet& reserved);

    cetl::optional<InstanceSet> loadReserved(const std::string& service_type) const;
    DeviceInstance              findSmallestFree(const std::string& service_type, const InstanceSet& reserved) const;

    storage::SettingsStore&              store_;
    std::map<ServiceId, ServiceInstance> services_;
    common::LoggerPtr                    logger_{common::getLogger("devices")};

};  // IdentityRegistry

}  // namespace devices
}  // namespace engine
}  // namespace daemon
}  // namespace mqdevd

#endif  // MQDEVD_DAEMON_ENGINE_DEVICES_IDENTITY_REGISTRY_HPP_INCLUDED
