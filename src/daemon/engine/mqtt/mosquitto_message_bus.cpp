//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "mosquitto_message_bus.hpp"

#include "logging.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <mosquitto.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstring>
#include <memory>
#include <string>
#include <utility>

namespace mqdevd
{
namespace daemon
{
namespace engine
{
namespace mqtt
{
namespace
{

/// Maps libmosquitto result codes to `errno`-style codes.
///
int toErrorCode(const int mosq_result)
{
    switch (mosq_result)
    {
    case MOSQ_ERR_SUCCESS:
        return 0;
    case MOSQ_ERR_NOMEM:
        return ENOMEM;
    case MOSQ_ERR_INVAL:
    case MOSQ_ERR_MALFORMED_UTF8:
        return EINVAL;
    case MOSQ_ERR_NO_CONN:
    case MOSQ_ERR_CONN_LOST:
        return ENOTCONN;
    case MOSQ_ERR_PAYLOAD_SIZE:
        return EMSGSIZE;
    case MOSQ_ERR_ERRNO:
        return (errno != 0) ? errno : EIO;
    default:
        return EIO;
    }
}

}  // namespace

constexpr int                  MosquittoMessageBus::QoS;
constexpr std::chrono::seconds MosquittoMessageBus::MinReconnectDelay;
constexpr std::chrono::seconds MosquittoMessageBus::MaxReconnectDelay;

void MosquittoMessageBus::MosquittoDeleter::operator()(mosquitto* const mosq) const
{
    ::mosquitto_destroy(mosq);
}

MosquittoMessageBus::Ptr MosquittoMessageBus::make(const Params& params)
{
    auto logger = common::getLogger("mqtt");

    ::mosquitto_lib_init();

    MosquittoPtr mosq{::mosquitto_new(params.client_id.c_str(), true, nullptr)};
    if (!mosq)
    {
        logger->error("Failed to create MQTT client (client_id='{}'): {}.", params.client_id, std::strerror(errno));
        ::mosquitto_lib_cleanup();
        return nullptr;
    }

    if (params.username)
    {
        const char* const password = params.password ? params.password->c_str() : nullptr;
        const int         result   = ::mosquitto_username_pw_set(mosq.get(), params.username->c_str(), password);
        if (result != MOSQ_ERR_SUCCESS)
        {
            logger->error("Failed to set MQTT credentials: {}.", ::mosquitto_strerror(result));
            mosq.reset();
            ::mosquitto_lib_cleanup();
            return nullptr;
        }
    }
    if (params.ca_file)
    {
        const int result = ::mosquitto_tls_set(mosq.get(), params.ca_file->c_str(), nullptr, nullptr, nullptr, nullptr);
        if (result != MOSQ_ERR_SUCCESS)
        {
            logger->error("Failed to setup MQTT TLS (ca_file='{}'): {}.",
                          params.ca_file.value(),
                          ::mosquitto_strerror(result));
            mosq.reset();
            ::mosquitto_lib_cleanup();
            return nullptr;
        }
    }

    // Private constructor - hence `new` instead of `std::make_unique`.
    Ptr bus{new MosquittoMessageBus{std::move(mosq), params}};  // NOLINT(cppcoreguidelines-owning-memory)
    bus->connect();
    return bus;
}

MosquittoMessageBus::MosquittoMessageBus(MosquittoPtr mosq, Params params)
    : mosq_{std::move(mosq)}
    , params_{std::move(params)}
    , is_connected_{false}
    , reconnect_backoff_{MinReconnectDelay, MaxReconnectDelay}
{
    ::mosquitto_user_data_set(mosq_.get(), this);
    ::mosquitto_connect_callback_set(mosq_.get(), onConnect);
    ::mosquitto_disconnect_callback_set(mosq_.get(), onDisconnect);
    ::mosquitto_message_callback_set(mosq_.get(), onMessage);
}

MosquittoMessageBus::~MosquittoMessageBus()
{
    if (::mosquitto_socket(mosq_.get()) >= 0)
    {
        const int result = ::mosquitto_disconnect(mosq_.get());
        if (result != MOSQ_ERR_SUCCESS)
        {
            logger_->debug("Failed to disconnect from MQTT broker: {}.", ::mosquitto_strerror(result));
        }
    }
    mosq_.reset();
    ::mosquitto_lib_cleanup();
}

int MosquittoMessageBus::subscribe(const std::string& topic_filter, MessageHandler handler)
{
    if ((::mosquitto_sub_topic_check(topic_filter.c_str()) != MOSQ_ERR_SUCCESS) || !handler)
    {
        logger_->error("Invalid MQTT subscription (filter='{}').", topic_filter);
        return EINVAL;
    }

    subscriptions_.push_back({topic_filter, std::move(handler)});

    // While disconnected the subscription will be made on (re)connect.
    if (is_connected_)
    {
        const int result = ::mosquitto_subscribe(mosq_.get(), nullptr, topic_filter.c_str(), QoS);
        if (result != MOSQ_ERR_SUCCESS)
        {
            logger_->warn("Failed to subscribe (filter='{}'): {}.", topic_filter, ::mosquitto_strerror(result));
            return toErrorCode(result);
        }
    }
    logger_->debug("Subscribed (filter='{}').", topic_filter);
    return 0;
}

int MosquittoMessageBus::publish(const std::string& topic, const std::string& payload)
{
    if (!is_connected_)
    {
        return ENOTCONN;
    }

    const int result = ::mosquitto_publish(mosq_.get(),
                                           nullptr,
                                           topic.c_str(),
                                           static_cast<int>(payload.size()),
                                           payload.data(),
                                           QoS,
                                           false);
    if (result != MOSQ_ERR_SUCCESS)
    {
        logger_->debug("Failed to publish (topic='{}'): {}.", topic, ::mosquitto_strerror(result));
        return toErrorCode(result);
    }
    return 0;
}

int MosquittoMessageBus::socketFd() const
{
    return ::mosquitto_socket(mosq_.get());
}

bool MosquittoMessageBus::wantsWrite() const
{
    return ::mosquitto_want_write(mosq_.get());
}

void MosquittoMessageBus::handleReadable()
{
    handleLoopResult(::mosquitto_loop_read(mosq_.get(), 1), "read");
}

void MosquittoMessageBus::handleWritable()
{
    handleLoopResult(::mosquitto_loop_write(mosq_.get(), 1), "write");
}

void MosquittoMessageBus::handlePeriodic()
{
    if (::mosquitto_socket(mosq_.get()) >= 0)
    {
        handleLoopResult(::mosquitto_loop_misc(mosq_.get()), "misc");
        return;
    }

    if (!reconnect_backoff_.isScheduled())
    {
        scheduleReconnect();
        return;
    }
    if (!reconnect_backoff_.takeDue(Clock::now()))
    {
        return;
    }

    logger_->debug("Reconnecting to MQTT broker (host='{}', port={}).", params_.host, params_.port);
    const int result = ::mosquitto_reconnect(mosq_.get());
    if (result != MOSQ_ERR_SUCCESS)
    {
        reconnect_backoff_.onAttemptFailed(Clock::now());
        logger_->warn("Failed to reconnect to MQTT broker: {} (next attempt in {}s).",
                      ::mosquitto_strerror(result),
                      reconnect_backoff_.delay().count());
    }
}

void MosquittoMessageBus::connect()
{
    logger_->info("Connecting to MQTT broker (host='{}', port={}, client_id='{}').",
                  params_.host,
                  params_.port,
                  params_.client_id);

    const int result =
        ::mosquitto_connect(mosq_.get(), params_.host.c_str(), params_.port, static_cast<int>(params_.keepalive_s));
    if (result != MOSQ_ERR_SUCCESS)
    {
        logger_->warn("Failed to connect to MQTT broker: {}.", ::mosquitto_strerror(result));
        scheduleReconnect();
    }
}

void MosquittoMessageBus::renewSubscriptions()
{
    for (const auto& subscription : subscriptions_)
    {
        const int result = ::mosquitto_subscribe(mosq_.get(), nullptr, subscription.topic_filter.c_str(), QoS);
        if (result != MOSQ_ERR_SUCCESS)
        {
            logger_->warn("Failed to renew subscription (filter='{}'): {}.",
                          subscription.topic_filter,
                          ::mosquitto_strerror(result));
        }
    }
}

void MosquittoMessageBus::handleLoopResult(const int mosq_result, const char* const operation)
{
    if ((mosq_result == MOSQ_ERR_SUCCESS) || (mosq_result == MOSQ_ERR_NO_CONN))
    {
        return;
    }

    // The library has already closed the socket (and reported the disconnect) at this point.
    logger_->warn("MQTT {} failed: {}.", operation, ::mosquitto_strerror(mosq_result));
    is_connected_ = false;
    scheduleReconnect();
}

void MosquittoMessageBus::scheduleReconnect()
{
    if (!reconnect_backoff_.isScheduled())
    {
        reconnect_backoff_.schedule(Clock::now());
        logger_->debug("Next MQTT reconnect attempt in {}s.", reconnect_backoff_.delay().count());
    }
}

void MosquittoMessageBus::onConnect(mosquitto* const, void* const self, const int result)
{
    auto& bus = *static_cast<MosquittoMessageBus*>(self);
    if (result != 0)
    {
        bus.logger_->error("MQTT broker refused connection: {}.", ::mosquitto_connack_string(result));
        return;
    }

    bus.logger_->info("Connected to MQTT broker (host='{}', port={}).", bus.params_.host, bus.params_.port);
    bus.is_connected_ = true;
    bus.reconnect_backoff_.reset();
    bus.renewSubscriptions();
}

void MosquittoMessageBus::onDisconnect(mosquitto* const, void* const self, const int reason)
{
    auto& bus         = *static_cast<MosquittoMessageBus*>(self);
    bus.is_connected_ = false;
    if (reason == 0)
    {
        bus.logger_->info("Disconnected from MQTT broker.");
        return;
    }

    bus.logger_->warn("Lost connection to MQTT broker (reason={}).", reason);
    bus.scheduleReconnect();
}

void MosquittoMessageBus::onMessage(mosquitto* const, void* const self, const mosquitto_message* const message)
{
    auto& bus = *static_cast<MosquittoMessageBus*>(self);
    if ((message == nullptr) || (message->topic == nullptr))
    {
        return;
    }

    const std::string topic{message->topic};
    const std::string payload{(message->payload != nullptr) ? static_cast<const char*>(message->payload) : "",
                              static_cast<std::size_t>(std::max(message->payloadlen, 0))};
    bus.logger_->trace("Received message (topic='{}', payload_len={}).", topic, payload.size());

    // Copy of the handlers b/c a handler might add new subscriptions.
    const auto subscriptions = bus.subscriptions_;
    for (const auto& subscription : subscriptions)
    {
        bool is_matching = false;
        if ((::mosquitto_topic_matches_sub(subscription.topic_filter.c_str(), message->topic, &is_matching) ==
             MOSQ_ERR_SUCCESS) &&
            is_matching)
        {
            subscription.handler(topic, payload);
        }
    }
}

}  // namespace mqtt
}  // namespace engine
}  // namespace daemon
}  // namespace mqdevd
