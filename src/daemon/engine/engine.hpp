//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef MQDEVD_DAEMON_ENGINE_HPP_INCLUDED
#define MQDEVD_DAEMON_ENGINE_HPP_INCLUDED

#include "config.hpp"
#include "dbus/sd_bus_ipc_bus.hpp"
#include "devices/device_manager.hpp"
#include "logging.hpp"
#include "mqtt/mosquitto_message_bus.hpp"
#include "storage/toml_settings_store.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <functional>
#include <memory>
#include <string>

namespace mqdevd
{
namespace daemon
{
namespace engine
{

class Engine
{
public:
    explicit Engine(Config::Ptr config);

    CETL_NODISCARD cetl::optional<std::string> init();
    void                                       runWhile(const std::function<bool()>& loop_predicate);

private:
    void pollOnce();

    Config::Ptr                             config_;
    common::LoggerPtr                       logger_{common::getLogger("engine")};
    storage::TomlSettingsStore::Ptr         settings_store_;
    mqtt::MosquittoMessageBus::Ptr          message_bus_;
    dbus::SdBusIpcBus::Ptr                  ipc_bus_;
    std::unique_ptr<devices::DeviceManager> device_manager_;

};  // Engine

}  // namespace engine
}  // namespace daemon
}  // namespace mqdevd

#endif  // MQDEVD_DAEMON_ENGINE_HPP_INCLUDED
