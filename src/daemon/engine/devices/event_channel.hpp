//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef MQDEVD_DAEMON_ENGINE_DEVICES_EVENT_CHANNEL_HPP_INCLUDED
#define MQDEVD_DAEMON_ENGINE_DEVICES_EVENT_CHANNEL_HPP_INCLUDED

#include "device_types.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <deque>
#include <utility>

namespace mqdevd
{
namespace daemon
{
namespace engine
{
namespace devices
{

/// Ordered FIFO of decoded device events.
///
/// Fed by the announcement listener and drained by the single consumer (the device manager),
/// so that two events are never processed interleaved.
///
class EventChannel final
{
public:
    void push(Event::Var event)
    {
        events_.push_back(std::move(event));
    }

    cetl::optional<Event::Var> pop()
    {
        if (events_.empty())
        {
            return cetl::nullopt;
        }
        auto event = std::move(events_.front());
        events_.pop_front();
        return event;
    }

    bool empty() const noexcept
    {
        return events_.empty();
    }

    std::size_t size() const noexcept
    {
        return events_.size();
    }

private:
    std::deque<Event::Var> events_;

};  // EventChannel

}  // namespace devices
}  // namespace engine
}  // namespace daemon
}  // namespace mqdevd

#endif  // MQDEVD_DAEMON_ENGINE_DEVICES_EVENT_CHANNEL_HPP_INCLUDED
