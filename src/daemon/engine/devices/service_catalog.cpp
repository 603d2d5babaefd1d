//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "service_catalog.hpp"

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
namespace
{

const std::vector<ServiceSchema>& catalogTable()
{
    static const std::vector<ServiceSchema> table{
        {ServiceKind::Generic, "", "MQTT generic device", {}},
        {ServiceKind::Temperature,
         "temperature",
         "MQTT temperature sensor",
         {"Temperature", "Pressure", "Humidity", "TemperatureType"}},
        {ServiceKind::Tank, "tank", "MQTT tank sensor", {"Level", "Remaining", "Capacity", "FluidType"}},
        {ServiceKind::Humidity, "humidity", "MQTT humidity sensor", {"Humidity", "Temperature"}},
    };
    return table;
}

}  // namespace

ServiceKind ServiceCatalog::kindOf(const std::string& type_name)
{
    return schemaOf(type_name).kind;
}

const ServiceSchema& ServiceCatalog::schemaOf(const std::string& type_name)
{
    const auto& table = catalogTable();
    for (const auto& schema : table)
    {
        if ((schema.kind != ServiceKind::Generic) && (schema.type_name == type_name))
        {
            return schema;
        }
    }
    return table.front();
}

const ServiceSchema& ServiceCatalog::schemaOf(const ServiceKind kind)
{
    const auto& table = catalogTable();
    for (const auto& schema : table)
    {
        if (schema.kind == kind)
        {
            return schema;
        }
    }
    return table.front();
}

}  // namespace devices
}  // namespace engine
}  // namespace daemon
}  // namespace mqdevd
