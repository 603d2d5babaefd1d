//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef MQDEVD_DAEMON_ENGINE_STORAGE_SETTINGS_STORE_MOCK_HPP_INCLUDED
#define MQDEVD_DAEMON_ENGINE_STORAGE_SETTINGS_STORE_MOCK_HPP_INCLUDED

#include "storage/settings_store.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>

#include <map>
#include <string>

namespace mqdevd
{
namespace daemon
{
namespace engine
{
namespace storage
{

class SettingsStoreMock : public SettingsStore
{
public:
    MOCK_METHOD(cetl::optional<std::string>, get, (const std::string& key), (const, override));
    MOCK_METHOD(int, set, (const std::string& key, const std::string& value), (override));

    /// Makes all calls (not covered by explicit expectations) work against the `values_` map.
    ///
    void delegateToMap()
    {
        using testing::_;
        using testing::Invoke;

        ON_CALL(*this, get(_)).WillByDefault(Invoke([this](const std::string& key) -> cetl::optional<std::string> {
            //
            const auto it = values_.find(key);
            if (it == values_.end())
            {
                return cetl::nullopt;
            }
            return it->second;
        }));
        ON_CALL(*this, set(_, _)).WillByDefault(Invoke([this](const std::string& key, const std::string& value) {
            //
            values_[key] = value;
            return 0;
        }));
    }

    // NOLINTBEGIN
    std::map<std::string, std::string> values_;
    // NOLINTEND

};  // SettingsStoreMock

}  // namespace storage
}  // namespace engine
}  // namespace daemon
}  // namespace mqdevd

#endif  // MQDEVD_DAEMON_ENGINE_STORAGE_SETTINGS_STORE_MOCK_HPP_INCLUDED
