//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef MQDEVD_DAEMON_ENGINE_BUS_MESSAGE_BUS_HPP_INCLUDED
#define MQDEVD_DAEMON_ENGINE_BUS_MESSAGE_BUS_HPP_INCLUDED

#include <cetl/cetl.hpp>

#include <functional>
#include <string>

namespace mqdevd
{
namespace daemon
{
namespace engine
{
namespace bus
{

/// Publish/subscribe message bus the devices announce themselves on.
///
/// Subscriptions are kept by the bus across reconnects.
///
class MessageBus
{
public:
    using MessageHandler = std::function<void(const std::string& topic, const std::string& payload)>;

    MessageBus(const MessageBus&)                = delete;
    MessageBus(MessageBus&&) noexcept            = delete;
    MessageBus& operator=(const MessageBus&)     = delete;
    MessageBus& operator=(MessageBus&&) noexcept = delete;

    virtual ~MessageBus() = default;

    /// @return Zero on success, otherwise `errno`-style code.
    ///
    CETL_NODISCARD virtual int subscribe(const std::string& topic_filter, MessageHandler handler) = 0;

    /// @return Zero if the message was handed over to the bus, otherwise `errno`-style code.
    ///
    CETL_NODISCARD virtual int publish(const std::string& topic, const std::string& payload) = 0;

protected:
    MessageBus() = default;

};  // MessageBus

}  // namespace bus
}  // namespace engine
}  // namespace daemon
}  // namespace mqdevd

#endif  // MQDEVD_DAEMON_ENGINE_BUS_MESSAGE_BUS_HPP_INCLUDED
