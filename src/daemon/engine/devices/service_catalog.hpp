//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef MQDEVD_DAEMON_ENGINE_DEVICES_SERVICE_CATALOG_HPP_INCLUDED
#define MQDEVD_DAEMON_ENGINE_DEVICES_SERVICE_CATALOG_HPP_INCLUDED

#include <cstdint>
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

/// Closed set of service kinds the daemon knows how to expose.
///
/// To support a new kind of service add an enumerator here, and a row to the table in `service_catalog.cpp`.
/// Everything not in the table is exposed as `Generic`.
///
enum class ServiceKind : std::uint8_t
{
    Generic,
    Temperature,
    Tank,
    Humidity,

};  // ServiceKind

struct ServiceSchema final
{
    ServiceKind              kind;
    std::string              type_name;
    std::string              product_name;
    std::vector<std::string> attributes;

};  // ServiceSchema

class ServiceCatalog final
{
public:
    ServiceCatalog() = delete;

    static ServiceKind kindOf(const std::string& type_name);

    /// Gets schema of a known service type, or the generic placeholder schema.
    ///
    static const ServiceSchema& schemaOf(const std::string& type_name);

    static const ServiceSchema& schemaOf(const ServiceKind kind);

};  // ServiceCatalog

}  // namespace devices
}  // namespace engine
}  // namespace daemon
}  // namespace mqdevd

#endif  // MQDEVD_DAEMON_ENGINE_DEVICES_SERVICE_CATALOG_HPP_INCLUDED
