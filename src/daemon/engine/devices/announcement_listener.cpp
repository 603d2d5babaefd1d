//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "announcement_listener.hpp"

#include "bus/message_bus.hpp"
#include "device_types.hpp"
#include "event_channel.hpp"
#include "logging.hpp"
#include "mqdevd/protocol.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <cstring>
#include <string>
#include <utility>

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

using Json      = nlohmann::json;
using Malformed = AnnouncementListener::MalformedAnnouncement;

/// Accepts `0|1` integers and booleans.
///
cetl::optional<bool> decodeConnected(const Json& connected)
{
    if (connected.is_boolean())
    {
        return connected.get<bool>();
    }
    if (connected.is_number_integer() || connected.is_number_unsigned())
    {
        const auto value = connected.get<std::int64_t>();
        if ((value == 0) || (value == 1))
        {
            return value == 1;
        }
    }
    return cetl::nullopt;
}

}  // namespace

AnnouncementListener::AnnouncementListener(bus::MessageBus& message_bus, EventChannel& channel)
    : message_bus_{message_bus}
    , channel_{channel}
{
}

int AnnouncementListener::start()
{
    const int err = message_bus_.subscribe(protocol::StatusTopicFilter,
                                           [this](const std::string& topic, const std::string& payload) {
                                               //
                                               onMessage(topic, payload);
                                           });
    if (err != 0)
    {
        logger_->error("Failed to subscribe to '{}' (err={}).", protocol::StatusTopicFilter, std::strerror(err));
        return err;
    }

    logger_->debug("Listening for device announcements on '{}'.", protocol::StatusTopicFilter);
    return 0;
}

void AnnouncementListener::onMessage(const std::string& topic, const std::string& payload)
{
    auto decoded = decode(topic, payload);
    if (const auto* const malformed = cetl::get_if<DecodeResult::Failure>(&decoded))
    {
        logger_->warn("Dropping malformed announcement on '{}': {} (payload='{}').", topic, malformed->reason, payload);
        return;
    }

    channel_.push(cetl::get<DecodeResult::Success>(std::move(decoded)));
}

AnnouncementListener::DecodeResult::Var AnnouncementListener::decode(const std::string& topic,
                                                                     const std::string& payload)
{
    const auto topic_client_id = protocol::clientIdFromStatusTopic(topic);
    if (!topic_client_id)
    {
        return Malformed{"not a device status topic"};
    }

    const auto root = Json::parse(payload, nullptr, false);
    if (root.is_discarded() || !root.is_object())
    {
        return Malformed{"payload is not a JSON object"};
    }

    // 1. Client id.
    //
    const auto client_id_it = root.find(protocol::ClientIdField);
    if ((client_id_it == root.end()) || !client_id_it->is_string())
    {
        return Malformed{"missing or non-string 'clientid'"};
    }
    auto client_id = client_id_it->get<std::string>();
    if (!protocol::isValidIdentifier(client_id))
    {
        return Malformed{"invalid 'clientid'"};
    }
    if (client_id != topic_client_id.value())
    {
        return Malformed{"'clientid' does not match the topic"};
    }

    // 2. Connection state. Services of a disconnect message are irrelevant.
    //
    const auto connected_it = root.find(protocol::ConnectedField);
    if (connected_it == root.end())
    {
        return Malformed{"missing 'connected'"};
    }
    const auto connected = decodeConnected(*connected_it);
    if (!connected)
    {
        return Malformed{"'connected' is neither 0 nor 1"};
    }
    if (!connected.value())
    {
        return Event::Var{Event::Disconnect{std::move(client_id)}};
    }

    // 3. Declared services.
    //
    const auto services_it = root.find(protocol::ServicesField);
    if ((services_it == root.end()) || !services_it->is_object() || services_it->empty())
    {
        return Malformed{"missing or empty 'services'"};
    }
    ServiceMap services;
    for (const auto& item : services_it->items())
    {
        if (!protocol::isValidIdentifier(item.key()))
        {
            return Malformed{"invalid service key '" + item.key() + "'"};
        }
        if (!item.value().is_string())
        {
            return Malformed{"service type of '" + item.key() + "' is not a string"};
        }
        auto service_type = item.value().get<std::string>();
        if (!protocol::isValidIdentifier(service_type))
        {
            return Malformed{"invalid service type of '" + item.key() + "'"};
        }
        services.emplace(item.key(), std::move(service_type));
    }

    return Event::Var{Event::Connect{std::move(client_id), std::move(services)}};
}

}  // namespace devices
}  // namespace engine
}  // namespace daemon
}  // namespace mqdevd
