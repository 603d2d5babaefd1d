//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "engine.hpp"

#include "config.hpp"
#include "dbus/sd_bus_ipc_bus.hpp"
#include "devices/device_manager.hpp"
#include "mqtt/mosquitto_message_bus.hpp"
#include "storage/toml_settings_store.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <array>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstring>
#include <functional>
#include <memory>
#include <poll.h>
#include <string>
#include <utility>

namespace mqdevd
{
namespace daemon
{
namespace engine
{

Engine::Engine(Config::Ptr config)
    : config_{std::move(config)}
{
}

cetl::optional<std::string> Engine::init()
{
    logger_->trace("Initializing engine...");

    // 1. Open the persistent settings store.
    //
    settings_store_ = storage::TomlSettingsStore::make(config_->getSettingsFile());
    if (settings_store_ == nullptr)
    {
        std::string msg = "Failed to open settings store.";
        logger_->error(msg);
        return msg;
    }

    // 2. Connect to the local D-Bus.
    //
    const dbus::SdBusIpcBus::Params dbus_params{config_->isDbusSessionBus(),
                                                config_->getDbusServiceName(),
                                                config_->getDbusPortalId(),
                                                config_->getDbusNetworkInterface()};
    ipc_bus_ = dbus::SdBusIpcBus::make(dbus_params);
    if (ipc_bus_ == nullptr)
    {
        std::string msg = "Failed to connect to D-Bus.";
        logger_->error(msg);
        return msg;
    }

    // 3. Create the MQTT client. Broker availability is not required here -
    //    the client keeps reconnecting in the background.
    //
    const mqtt::MosquittoMessageBus::Params mqtt_params{config_->getMqttHost(),
                                                        config_->getMqttPort(),
                                                        config_->getMqttClientId(),
                                                        config_->getMqttKeepalive(),
                                                        config_->getMqttUsername(),
                                                        config_->getMqttPassword(),
                                                        config_->getMqttCaFile()};
    message_bus_ = mqtt::MosquittoMessageBus::make(mqtt_params);
    if (message_bus_ == nullptr)
    {
        std::string msg = "Failed to create MQTT client.";
        logger_->error(msg);
        return msg;
    }

    // 4. Bring up the device manager.
    //
    device_manager_ = std::make_unique<devices::DeviceManager>(*settings_store_, *message_bus_, *ipc_bus_);
    if (const auto err = device_manager_->start())
    {
        std::string msg = "Failed to start device manager: ";
        msg += std::strerror(err);
        logger_->error(msg);
        return msg;
    }

    logger_->debug("Engine is initialized.");
    return cetl::nullopt;
}

void Engine::runWhile(const std::function<bool()>& loop_predicate)
{
    std::size_t total_events = 0;
    while (loop_predicate())
    {
        pollOnce();

        message_bus_->handlePeriodic();
        ipc_bus_->process();
        total_events += device_manager_->processPendingEvents();
    }
    logger_->debug("Run loop predicate is fulfilled (total_events={}).", total_events);
}

void Engine::pollOnce()
{
    using std::chrono_literals::operator""s;

    // Poll awaitable resources but awake at least once per second.
    constexpr auto max_timeout = std::chrono::duration_cast<std::chrono::milliseconds>(1s);

    std::array<pollfd, 2> poll_fds{};
    auto&                 mqtt_pfd = poll_fds[0];
    auto&                 dbus_pfd = poll_fds[1];

    mqtt_pfd.fd     = message_bus_->socketFd();
    mqtt_pfd.events = static_cast<short>(POLLIN | (message_bus_->wantsWrite() ? POLLOUT : 0));
    dbus_pfd.fd     = ipc_bus_->fd();
    dbus_pfd.events = static_cast<short>(ipc_bus_->events());

    // Negative descriptors (f.e. MQTT while disconnected) are ignored by `poll`.
    const int result = ::poll(poll_fds.data(), poll_fds.size(), static_cast<int>(max_timeout.count()));
    if (result < 0)
    {
        const int err = errno;
        if (err != EINTR)
        {
            logger_->warn("Failed to poll awaitable resources (err={}).", err);
        }
        return;
    }

    if ((mqtt_pfd.fd >= 0) && ((mqtt_pfd.revents & (POLLIN | POLLERR | POLLHUP)) != 0))
    {
        message_bus_->handleReadable();
    }
    // Reading might have dropped the connection.
    if ((message_bus_->socketFd() >= 0) && ((mqtt_pfd.revents & POLLOUT) != 0))
    {
        message_bus_->handleWritable();
    }
}

}  // namespace engine
}  // namespace daemon
}  // namespace mqdevd
