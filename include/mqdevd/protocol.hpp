//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef MQDEVD_PROTOCOL_HPP_INCLUDED
#define MQDEVD_PROTOCOL_HPP_INCLUDED

#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>
#include <string>

namespace mqdevd
{

/// MQTT topic layout of the device registration protocol.
///
/// A device publishes its status on `device/<client id>/Status`, receives its device instances
/// on `device/<client id>/DeviceInstance`, and then publishes readings on the telemetry topics
/// `W/<portal id>/<service type>/<device instance>/<attribute>`.
///
namespace protocol
{

using DeviceInstance = std::uint32_t;

constexpr const char* DeviceTopicRoot      = "device";
constexpr const char* StatusTopicLeaf      = "Status";
constexpr const char* InstanceTopicLeaf    = "DeviceInstance";
constexpr const char* StatusTopicFilter    = "device/+/Status";
constexpr const char* TelemetryTopicPrefix = "W";

/// JSON field names of a status message.
constexpr const char* ClientIdField  = "clientid";
constexpr const char* ConnectedField = "connected";
constexpr const char* ServicesField  = "services";

/// Characters which may not appear inside client ids, service keys and service type names.
/// They are MQTT topic level separators or wildcards.
constexpr const char* ReservedIdChars = "/+#";

inline bool isValidIdentifier(const std::string& id)
{
    return !id.empty() && (id.find_first_of(ReservedIdChars) == std::string::npos);
}

inline std::string statusTopic(const std::string& client_id)
{
    return std::string{DeviceTopicRoot} + '/' + client_id + '/' + StatusTopicLeaf;
}

inline std::string instanceTopic(const std::string& client_id)
{
    return std::string{DeviceTopicRoot} + '/' + client_id + '/' + InstanceTopicLeaf;
}

inline std::string telemetryTopic(const std::string&   portal_id,
                                  const std::string&   service_type,
                                  const DeviceInstance device_instance,
                                  const std::string&   attribute)
{
    return std::string{TelemetryTopicPrefix} + '/' + portal_id + '/' + service_type + '/' +
           std::to_string(device_instance) + '/' + attribute;
}

/// Extracts the client id level of a `device/<client id>/Status` topic.
///
inline cetl::optional<std::string> clientIdFromStatusTopic(const std::string& topic)
{
    const std::string prefix = std::string{DeviceTopicRoot} + '/';
    const std::string suffix = std::string{"/"} + StatusTopicLeaf;
    if ((topic.size() <= prefix.size() + suffix.size()) || (topic.compare(0, prefix.size(), prefix) != 0) ||
        (topic.compare(topic.size() - suffix.size(), suffix.size(), suffix) != 0))
    {
        return cetl::nullopt;
    }

    auto client_id = topic.substr(prefix.size(), topic.size() - prefix.size() - suffix.size());
    if (!isValidIdentifier(client_id))
    {
        return cetl::nullopt;
    }
    return client_id;
}

}  // namespace protocol
}  // namespace mqdevd

#endif  // MQDEVD_PROTOCOL_HPP_INCLUDED
