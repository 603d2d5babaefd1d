//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "instance_announcer.hpp"

#include "bus/message_bus.hpp"
#include "device_types.hpp"
#include "logging.hpp"
#include "mqdevd/protocol.hpp"

#include <nlohmann/json.hpp>

#include <cstring>
#include <string>

namespace mqdevd
{
namespace daemon
{
namespace engine
{
namespace devices
{

InstanceAnnouncer::InstanceAnnouncer(bus::MessageBus& message_bus)
    : message_bus_{message_bus}
{
}

int InstanceAnnouncer::announce(const std::string& client_id, const InstanceMap& instances)
{
    const auto topic   = protocol::instanceTopic(client_id);
    const auto payload = formatPayload(instances);

    if (const auto err = message_bus_.publish(topic, payload))
    {
        logger_->warn("Failed to publish device instances to '{}' (err={}, payload='{}').",
                      topic,
                      std::strerror(err),
                      payload);
        return err;
    }

    logger_->debug("Published device instances to '{}' (payload='{}').", topic, payload);
    return 0;
}

std::string InstanceAnnouncer::formatPayload(const InstanceMap& instances)
{
    nlohmann::json root = nlohmann::json::object();
    for (const auto& key_and_instance : instances)
    {
        root[key_and_instance.first] = key_and_instance.second;
    }
    return root.dump();
}

}  // namespace devices
}  // namespace engine
}  // namespace daemon
}  // namespace mqdevd
