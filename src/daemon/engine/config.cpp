//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "config.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <toml.hpp>

#include <cstdint>
#include <exception>
#include <memory>
#include <string>
#include <utility>

namespace mqdevd
{
namespace daemon
{
namespace engine
{
namespace
{

class ConfigImpl final : public Config
{
public:
    using TomlConf  = toml::ordered_type_config;
    using TomlValue = toml::basic_value<TomlConf>;

    explicit ConfigImpl(TomlValue&& root)
        : root_{std::move(root)}
    {
    }

    // Config

    auto getMqttHost() const -> std::string override
    {
        return find_or(root_, "mqtt", "host", std::string{"localhost"});
    }

    auto getMqttPort() const -> Mqtt::Port override
    {
        return find_or(root_, "mqtt", "port", Mqtt::Port{Mqtt::DefaultPort});
    }

    auto getMqttClientId() const -> std::string override
    {
        return find_or(root_, "mqtt", "client_id", std::string{"mqdevd"});
    }

    auto getMqttKeepalive() const -> std::uint16_t override
    {
        return find_or(root_, "mqtt", "keepalive", std::uint16_t{Mqtt::DefaultKeepalive});
    }

    auto getMqttUsername() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("mqtt", "username");
    }

    auto getMqttPassword() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("mqtt", "password");
    }

    auto getMqttCaFile() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("mqtt", "ca_file");
    }

    auto isDbusSessionBus() const -> bool override
    {
        return find_or(root_, "dbus", "bus", std::string{"system"}) == "session";
    }

    auto getDbusServiceName() const -> std::string override
    {
        return find_or(root_, "dbus", "service_name", std::string{"com.mqdevd"});
    }

    auto getDbusPortalId() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("dbus", "portal_id");
    }

    auto getDbusNetworkInterface() const -> std::string override
    {
        return find_or(root_, "dbus", "network_interface", std::string{"eth0"});
    }

    auto getSettingsFile() const -> std::string override
    {
        return find_or(root_, "settings", "file", std::string{"/var/lib/mqdevd/settings.toml"});
    }

    auto getLoggingFile() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("logging", "file");
    }

    auto getLoggingLevel() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("logging", "level");
    }

    auto getLoggingFlushLevel() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("logging", "flush_level");
    }

    auto getDaemonUser() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("daemon", "user");
    }

private:
    template <typename T, typename... Keys>
    cetl::optional<T> findImpl(Keys&&... keys) const
    {
        try
        {
            return cetl::make_optional(toml::find<T>(root_, std::forward<Keys>(keys)...));

        } catch (const std::exception&)
        {
            return cetl::nullopt;
        }
    }

    TomlValue root_;

};  // ConfigImpl

}  // namespace

Config::Ptr Config::make(std::string file_path)
{
    auto root = toml::parse<ConfigImpl::TomlConf>(std::move(file_path));
    return std::make_shared<ConfigImpl>(std::move(root));
}

}  // namespace engine
}  // namespace daemon
}  // namespace mqdevd
