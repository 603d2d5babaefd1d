//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef MQDEVD_DAEMON_ENGINE_STORAGE_SETTINGS_STORE_HPP_INCLUDED
#define MQDEVD_DAEMON_ENGINE_STORAGE_SETTINGS_STORE_HPP_INCLUDED

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <string>

namespace mqdevd
{
namespace daemon
{
namespace engine
{
namespace storage
{

/// Durable key/value storage which survives daemon restarts.
///
/// Every `set` is atomic per key: after it returns success the new value is committed,
/// otherwise the previous value (or its absence) is preserved.
///
class SettingsStore
{
public:
    SettingsStore(const SettingsStore&)                = delete;
    SettingsStore(SettingsStore&&) noexcept            = delete;
    SettingsStore& operator=(const SettingsStore&)     = delete;
    SettingsStore& operator=(SettingsStore&&) noexcept = delete;

    virtual ~SettingsStore() = default;

    CETL_NODISCARD virtual cetl::optional<std::string> get(const std::string& key) const = 0;

    /// @return Zero on success, otherwise `errno`-style code of the failed commit.
    ///
    CETL_NODISCARD virtual int set(const std::string& key, const std::string& value) = 0;

protected:
    SettingsStore() = default;

};  // SettingsStore

}  // namespace storage
}  // namespace engine
}  // namespace daemon
}  // namespace mqdevd

#endif  // MQDEVD_DAEMON_ENGINE_STORAGE_SETTINGS_STORE_HPP_INCLUDED
