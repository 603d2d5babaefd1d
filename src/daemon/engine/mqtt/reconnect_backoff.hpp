//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef MQDEVD_DAEMON_ENGINE_MQTT_RECONNECT_BACKOFF_HPP_INCLUDED
#define MQDEVD_DAEMON_ENGINE_MQTT_RECONNECT_BACKOFF_HPP_INCLUDED

#include <cetl/pf17/cetlpf.hpp>

#include <algorithm>
#include <chrono>

namespace mqdevd
{
namespace daemon
{
namespace engine
{
namespace mqtt
{

/// Schedule of reconnection attempts with an exponentially growing delay.
///
/// The delay starts at the minimum, doubles after every failed attempt (up to the maximum),
/// and goes back to the minimum once connected.
///
class ReconnectBackoff final
{
public:
    using Clock    = std::chrono::steady_clock;
    using Duration = std::chrono::seconds;

    ReconnectBackoff(const Duration min_delay, const Duration max_delay)
        : min_delay_{min_delay}
        , max_delay_{std::max(min_delay, max_delay)}
        , delay_{min_delay}
    {
    }

    Duration delay() const noexcept
    {
        return delay_;
    }

    bool isScheduled() const noexcept
    {
        return static_cast<bool>(attempt_at_);
    }

    /// Schedules the next attempt (unless one is already scheduled).
    ///
    void schedule(const Clock::time_point now)
    {
        if (!attempt_at_)
        {
            attempt_at_ = now + delay_;
        }
    }

    /// Takes the scheduled attempt if it is due.
    ///
    /// @return `true` once per scheduled attempt.
    ///
    bool takeDue(const Clock::time_point now)
    {
        if (!attempt_at_ || (now < attempt_at_.value()))
        {
            return false;
        }
        attempt_at_.reset();
        return true;
    }

    /// Doubles the delay, and schedules the next attempt.
    ///
    void onAttemptFailed(const Clock::time_point now)
    {
        delay_ = std::min(delay_ * 2, max_delay_);
        attempt_at_.reset();
        schedule(now);
    }

    void reset()
    {
        delay_ = min_delay_;
        attempt_at_.reset();
    }

private:
    Duration                          min_delay_;
    Duration                          max_delay_;
    Duration                          delay_;
    cetl::optional<Clock::time_point> attempt_at_;

};  // ReconnectBackoff

}  // namespace mqtt
}  // namespace engine
}  // namespace daemon
}  // namespace mqdevd

#endif  // MQDEVD_DAEMON_ENGINE_MQTT_RECONNECT_BACKOFF_HPP_INCLUDED
