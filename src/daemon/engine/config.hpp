//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef MQDEVD_DAEMON_ENGINE_CONFIG_HPP_INCLUDED
#define MQDEVD_DAEMON_ENGINE_CONFIG_HPP_INCLUDED

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>
#include <memory>
#include <string>

namespace mqdevd
{
namespace daemon
{
namespace engine
{

class Config
{
public:
    using Ptr = std::shared_ptr<Config>;

    struct Mqtt
    {
        using Port = std::uint16_t;

        static constexpr Port          DefaultPort      = 1883;
        static constexpr std::uint16_t DefaultKeepalive = 60;
    };

    /// Loads configuration from the given TOML file.
    ///
    /// @throws std::exception if the file can't be read or parsed.
    ///
    CETL_NODISCARD static Ptr make(std::string file_path);

    Config(const Config&)                = delete;
    Config(Config&&) noexcept            = delete;
    Config& operator=(const Config&)     = delete;
    Config& operator=(Config&&) noexcept = delete;

    virtual ~Config() = default;

    CETL_NODISCARD virtual auto getMqttHost() const -> std::string                          = 0;
    CETL_NODISCARD virtual auto getMqttPort() const -> Mqtt::Port                           = 0;
    CETL_NODISCARD virtual auto getMqttClientId() const -> std::string                      = 0;
    CETL_NODISCARD virtual auto getMqttKeepalive() const -> std::uint16_t                   = 0;
    CETL_NODISCARD virtual auto getMqttUsername() const -> cetl::optional<std::string>      = 0;
    CETL_NODISCARD virtual auto getMqttPassword() const -> cetl::optional<std::string>      = 0;
    CETL_NODISCARD virtual auto getMqttCaFile() const -> cetl::optional<std::string>        = 0;
    CETL_NODISCARD virtual auto isDbusSessionBus() const -> bool                            = 0;
    CETL_NODISCARD virtual auto getDbusServiceName() const -> std::string                   = 0;
    CETL_NODISCARD virtual auto getDbusPortalId() const -> cetl::optional<std::string>      = 0;
    CETL_NODISCARD virtual auto getDbusNetworkInterface() const -> std::string              = 0;
    CETL_NODISCARD virtual auto getSettingsFile() const -> std::string                      = 0;
    CETL_NODISCARD virtual auto getLoggingFile() const -> cetl::optional<std::string>       = 0;
    CETL_NODISCARD virtual auto getLoggingLevel() const -> cetl::optional<std::string>      = 0;
    CETL_NODISCARD virtual auto getLoggingFlushLevel() const -> cetl::optional<std::string> = 0;
    CETL_NODISCARD virtual auto getDaemonUser() const -> cetl::optional<std::string>        = 0;

protected:
    Config() = default;

};  // Config

}  // namespace engine
}  // namespace daemon
}  // namespace mqdevd

#endif  // MQDEVD_DAEMON_ENGINE_CONFIG_HPP_INCLUDED
