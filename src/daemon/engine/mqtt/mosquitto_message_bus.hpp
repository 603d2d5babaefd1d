//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef MQDEVD_DAEMON_ENGINE_MQTT_MOSQUITTO_MESSAGE_BUS_HPP_INCLUDED
#define MQDEVD_DAEMON_ENGINE_MQTT_MOSQUITTO_MESSAGE_BUS_HPP_INCLUDED

#include "bus/message_bus.hpp"
#include "logging.hpp"
#include "reconnect_backoff.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

struct mosquitto;
struct mosquitto_message;

namespace mqdevd
{
namespace daemon
{
namespace engine
{
namespace mqtt
{

/// MQTT message bus on top of a non-blocking libmosquitto client.
///
/// The client does no I/O on its own - the owner polls `socketFd` and calls the `handle*` methods.
/// Lost connections are re-established with an exponential back-off, and all subscriptions are
/// renewed on every successful connect.
///
class MosquittoMessageBus final : public bus::MessageBus
{
public:
    using Ptr   = std::unique_ptr<MosquittoMessageBus>;
    using Clock = ReconnectBackoff::Clock;

    struct Params
    {
        std::string                 host;
        std::uint16_t               port;
        std::string                 client_id;
        std::uint16_t               keepalive_s;
        cetl::optional<std::string> username;
        cetl::optional<std::string> password;
        cetl::optional<std::string> ca_file;
    };

    /// Creates the client and starts connecting to the broker.
    ///
    /// An unreachable broker is not a failure - connection is retried later by `handlePeriodic`.
    ///
    /// @return `nullptr` if the client can't be created or configured.
    ///
    CETL_NODISCARD static Ptr make(const Params& params);

    MosquittoMessageBus(const MosquittoMessageBus&)                = delete;
    MosquittoMessageBus(MosquittoMessageBus&&) noexcept            = delete;
    MosquittoMessageBus& operator=(const MosquittoMessageBus&)     = delete;
    MosquittoMessageBus& operator=(MosquittoMessageBus&&) noexcept = delete;

    ~MosquittoMessageBus() override;

    // MessageBus

    CETL_NODISCARD int subscribe(const std::string& topic_filter, MessageHandler handler) override;
    CETL_NODISCARD int publish(const std::string& topic, const std::string& payload) override;

    bool isConnected() const noexcept
    {
        return is_connected_;
    }

    /// Socket of the current connection, or `-1` if there is none.
    int  socketFd() const;
    bool wantsWrite() const;

    void handleReadable();
    void handleWritable();

    /// Performs keep-alive and reconnection duties. Should be called at least once per second.
    ///
    void handlePeriodic();

private:
    struct MosquittoDeleter
    {
        void operator()(mosquitto* mosq) const;
    };
    using MosquittoPtr = std::unique_ptr<mosquitto, MosquittoDeleter>;

    struct Subscription
    {
        std::string    topic_filter;
        MessageHandler handler;
    };

    static constexpr int QoS = 1;

    static constexpr std::chrono::seconds MinReconnectDelay{1};
    static constexpr std::chrono::seconds MaxReconnectDelay{30};

    MosquittoMessageBus(MosquittoPtr mosq, Params params);

    static void onConnect(mosquitto* mosq, void* self, int result);
    static void onDisconnect(mosquitto* mosq, void* self, int reason);
    static void onMessage(mosquitto* mosq, void* self, const mosquitto_message* message);

    void connect();
    void renewSubscriptions();
    void handleLoopResult(const int mosq_result, const char* const operation);
    void scheduleReconnect();

    MosquittoPtr              mosq_;
    Params                    params_;
    std::vector<Subscription> subscriptions_;
    bool                      is_connected_;
    ReconnectBackoff          reconnect_backoff_;
    common::LoggerPtr         logger_{common::getLogger("mqtt")};

};  // MosquittoMessageBus

}  // namespace mqtt
}  // namespace engine
}  // namespace daemon
}  // namespace mqdevd

#endif  // MQDEVD_DAEMON_ENGINE_MQTT_MOSQUITTO_MESSAGE_BUS_HPP_INCLUDED
