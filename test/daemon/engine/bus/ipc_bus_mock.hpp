//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef MQDEVD_DAEMON_ENGINE_BUS_IPC_BUS_MOCK_HPP_INCLUDED
#define MQDEVD_DAEMON_ENGINE_BUS_IPC_BUS_MOCK_HPP_INCLUDED

#include "bus/ipc_bus.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>

#include <cerrno>
#include <map>
#include <set>
#include <string>

namespace mqdevd
{
namespace daemon
{
namespace engine
{
namespace bus
{

class IpcBusMock : public IpcBus
{
public:
    struct Object
    {
        ObjectId    id;
        std::string path;
        Schema      attributes;

        const Value* find(const std::string& name) const
        {
            for (const auto& attribute : attributes)
            {
                if (attribute.name == name)
                {
                    return &attribute.value;
                }
            }
            return nullptr;
        }
    };

    MOCK_METHOD(RegisterResult::Var, registerObject, (const ObjectId& id, const Schema& schema), (override));
    MOCK_METHOD(int, update, (const Handle handle, const std::string& attribute, const Value& value), (override));
    MOCK_METHOD(void, unregisterObject, (const Handle handle), (override));
    MOCK_METHOD(std::string, portalId, (), (const, override));

    /// Makes all calls (not covered by explicit expectations) work against an in-memory set of objects.
    ///
    /// Like the real bus, registration of an already registered object id fails with `EEXIST`.
    /// Objects are listed under readable `/<service type>/<device instance>` paths.
    ///
    void delegateToFake()
    {
        using testing::_;
        using testing::Invoke;
        using testing::Return;

        ON_CALL(*this, registerObject(_, _))
            .WillByDefault(Invoke([this](const ObjectId& id, const Schema& schema) -> RegisterResult::Var {
                //
                for (const auto& handle_and_object : objects_)
                {
                    if (handle_and_object.second.id == id)
                    {
                        return EEXIST;
                    }
                }
                const Handle handle = next_handle_++;
                objects_[handle]    = Object{id, '/' + id.service_type + '/' + std::to_string(id.device_instance), schema};
                return handle;
            }));
        ON_CALL(*this, update(_, _, _))
            .WillByDefault(Invoke([this](const Handle handle, const std::string& name, const Value& value) {
                //
                const auto it = objects_.find(handle);
                if (it == objects_.end())
                {
                    return ENOENT;
                }
                for (auto& attribute : it->second.attributes)
                {
                    if (attribute.name == name)
                    {
                        attribute.value = value;
                        return 0;
                    }
                }
                return ENOENT;
            }));
        ON_CALL(*this, unregisterObject(_)).WillByDefault(Invoke([this](const Handle handle) {
            //
            objects_.erase(handle);
        }));
        ON_CALL(*this, portalId()).WillByDefault(Return(std::string{"c0ffee"}));
    }

    std::set<std::string> objectPaths() const
    {
        std::set<std::string> paths;
        for (const auto& handle_and_object : objects_)
        {
            paths.insert(handle_and_object.second.path);
        }
        return paths;
    }

    const Object* findObject(const std::string& path) const
    {
        for (const auto& handle_and_object : objects_)
        {
            if (handle_and_object.second.path == path)
            {
                return &handle_and_object.second;
            }
        }
        return nullptr;
    }

    // NOLINTBEGIN
    Handle                   next_handle_{1};
    std::map<Handle, Object> objects_;
    // NOLINTEND

};  // IpcBusMock

}  // namespace bus
}  // namespace engine
}  // namespace daemon
}  // namespace mqdevd

#endif  // MQDEVD_DAEMON_ENGINE_BUS_IPC_BUS_MOCK_HPP_INCLUDED
