//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "mqtt/mosquitto_message_bus.hpp"

#include "io/io.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <array>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <functional>
#include <netinet/in.h>
#include <poll.h>
#include <string>
#include <sys/socket.h>
#include <unistd.h>
#include <utility>
#include <vector>

namespace
{

using namespace mqdevd::daemon::engine::mqtt;  // NOLINT This our main concern here in the unit tests.
using mqdevd::common::io::OwnFd;

using testing::Pair;
using testing::NotNull;
using testing::ElementsAre;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

/// Bare TCP listener on the loopback interface, which talks just enough MQTT for one client.
///
class FakeBroker final
{
public:
    FakeBroker()
        : listen_fd_{::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0)}
    {
        sockaddr_in addr{};
        addr.sin_family      = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port        = 0;

        socklen_t addr_len = sizeof(addr);
        if ((listen_fd_.get() < 0) ||
            (::bind(listen_fd_.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) ||  // NOLINT
            (::listen(listen_fd_.get(), 4) != 0) ||
            (::getsockname(listen_fd_.get(), reinterpret_cast<sockaddr*>(&addr), &addr_len) != 0))  // NOLINT
        {
            listen_fd_.reset();
            return;
        }
        port_ = ntohs(addr.sin_port);
    }

    std::uint16_t port() const
    {
        return port_;
    }

    bool isListening() const
    {
        return listen_fd_.get() >= 0;
    }

    bool acceptClient(const std::chrono::milliseconds timeout)
    {
        pollfd pfd{listen_fd_.get(), POLLIN, 0};
        if (::poll(&pfd, 1, static_cast<int>(timeout.count())) <= 0)
        {
            return false;
        }
        client_fd_ = OwnFd{::accept4(listen_fd_.get(), nullptr, nullptr, SOCK_CLOEXEC | SOCK_NONBLOCK)};
        received_.clear();
        return client_fd_.get() >= 0;
    }

    void dropClient()
    {
        client_fd_.reset();
    }

    /// Reads whatever the client has sent so far (without waiting).
    ///
    void receive()
    {
        if (client_fd_.get() < 0)
        {
            return;
        }
        std::array<char, 1024> buffer{};
        ssize_t                size = 0;
        while ((size = ::read(client_fd_.get(), buffer.data(), buffer.size())) > 0)
        {
            received_.append(buffer.data(), static_cast<std::size_t>(size));
        }
    }

    bool hasReceived(const std::string& fragment) const
    {
        return received_.find(fragment) != std::string::npos;
    }

    void clearReceived()
    {
        received_.clear();
    }

    bool send(const std::string& packet) const
    {
        return ::write(client_fd_.get(), packet.data(), packet.size()) == static_cast<ssize_t>(packet.size());
    }

    static std::string connack()
    {
        return std::string{"\x20\x02\x00\x00", 4};
    }

    /// QoS 0 PUBLISH packet (short topic and payload only).
    ///
    static std::string publish(const std::string& topic, const std::string& payload)
    {
        std::string packet;
        packet.push_back('\x30');
        packet.push_back(static_cast<char>(2 + topic.size() + payload.size()));
        packet.push_back(static_cast<char>(topic.size() >> 8U));
        packet.push_back(static_cast<char>(topic.size() & 0xFFU));
        return packet + topic + payload;
    }

private:
    OwnFd         listen_fd_;
    OwnFd         client_fd_;
    std::uint16_t port_{0};
    std::string   received_;

};  // FakeBroker

class TestMosquittoMessageBus : public testing::Test
{
protected:
    using Message = std::pair<std::string, std::string>;

    static MosquittoMessageBus::Params paramsFor(const std::uint16_t port)
    {
        return {"127.0.0.1", port, "mqdevd-test", 60, cetl::nullopt, cetl::nullopt, cetl::nullopt};
    }

    /// Drives both the client I/O and the broker reception until the condition holds (or time is out).
    ///
    static bool runUntil(MosquittoMessageBus&         bus,
                         FakeBroker&                  broker,
                         const std::function<bool()>& condition,
                         const std::chrono::seconds   timeout = std::chrono::seconds{3})
    {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline)
        {
            broker.receive();
            if (condition())
            {
                return true;
            }

            const int fd = bus.socketFd();
            if (fd >= 0)
            {
                pollfd pfd{fd, static_cast<short>(POLLIN | (bus.wantsWrite() ? POLLOUT : 0)), 0};
                if (::poll(&pfd, 1, 10) > 0)
                {
                    if ((pfd.revents & (POLLIN | POLLHUP | POLLERR)) != 0)
                    {
                        bus.handleReadable();
                    }
                    if (((pfd.revents & POLLOUT) != 0) && (bus.socketFd() >= 0))
                    {
                        bus.handleWritable();
                    }
                }
            }
            else
            {
                ::usleep(10000);
            }
            bus.handlePeriodic();
        }
        broker.receive();
        return condition();
    }

    /// Accepts the client connection, and completes the MQTT handshake.
    ///
    static void completeHandshake(MosquittoMessageBus& bus, FakeBroker& broker)
    {
        ASSERT_TRUE(broker.acceptClient(std::chrono::seconds{3}));
        ASSERT_TRUE(runUntil(bus, broker, [&broker] { return broker.hasReceived("mqdevd-test"); }));
        broker.clearReceived();
        ASSERT_TRUE(broker.send(FakeBroker::connack()));
        ASSERT_TRUE(runUntil(bus, broker, [&bus] { return bus.isConnected(); }));
    }
};

// MARK: - Tests:

TEST_F(TestMosquittoMessageBus, unreachable_broker)
{
    std::uint16_t unused_port = 0;
    {
        const FakeBroker closed_broker;
        ASSERT_TRUE(closed_broker.isListening());
        unused_port = closed_broker.port();
    }

    const auto bus = MosquittoMessageBus::make(paramsFor(unused_port));
    ASSERT_THAT(bus, NotNull());
    EXPECT_FALSE(bus->isConnected());
    EXPECT_THAT(bus->socketFd(), -1);

    EXPECT_THAT(bus->publish("device/fe001/DeviceInstance", "{}"), ENOTCONN);
    EXPECT_THAT(bus->subscribe("device/+/Status", [](const auto&, const auto&) {}), 0);
    EXPECT_THAT(bus->subscribe("device/#/Status", [](const auto&, const auto&) {}), EINVAL);
    EXPECT_THAT(bus->subscribe("device/+/Status", nullptr), EINVAL);

    bus->handlePeriodic();
    EXPECT_FALSE(bus->isConnected());
}

TEST_F(TestMosquittoMessageBus, subscribe_receive_and_publish)
{
    FakeBroker broker;
    ASSERT_TRUE(broker.isListening());

    const auto bus = MosquittoMessageBus::make(paramsFor(broker.port()));
    ASSERT_THAT(bus, NotNull());

    // Subscription made while not connected yet is sent right after the handshake.
    std::vector<Message> received;
    EXPECT_THAT(bus->subscribe("device/+/Status",
                               [&received](const std::string& topic, const std::string& payload) {
                                   received.emplace_back(topic, payload);
                               }),
                0);
    EXPECT_THAT(bus->publish("device/fe001/DeviceInstance", "{}"), ENOTCONN);

    ASSERT_NO_FATAL_FAILURE(completeHandshake(*bus, broker));
    ASSERT_TRUE(runUntil(*bus, broker, [&broker] { return broker.hasReceived("device/+/Status"); }));

    // Only matching topics are delivered.
    ASSERT_TRUE(broker.send(FakeBroker::publish("device/fe001/Other", "x")));
    ASSERT_TRUE(broker.send(FakeBroker::publish("device/fe001/Status", R"({"clientid":"fe001","connected":0})")));
    ASSERT_TRUE(runUntil(*bus, broker, [&received] { return !received.empty(); }));
    EXPECT_THAT(received, ElementsAre(Pair("device/fe001/Status", R"({"clientid":"fe001","connected":0})")));

    broker.clearReceived();
    EXPECT_THAT(bus->publish("device/fe001/DeviceInstance", R"({"t1":0})"), 0);
    EXPECT_TRUE(runUntil(*bus, broker, [&broker] {
        return broker.hasReceived("device/fe001/DeviceInstance") && broker.hasReceived(R"({"t1":0})");
    }));
}

TEST_F(TestMosquittoMessageBus, reconnects_and_renews_subscriptions)
{
    FakeBroker broker;
    ASSERT_TRUE(broker.isListening());

    const auto bus = MosquittoMessageBus::make(paramsFor(broker.port()));
    ASSERT_THAT(bus, NotNull());
    EXPECT_THAT(bus->subscribe("device/+/Status", [](const auto&, const auto&) {}), 0);

    ASSERT_NO_FATAL_FAILURE(completeHandshake(*bus, broker));
    ASSERT_TRUE(runUntil(*bus, broker, [&broker] { return broker.hasReceived("device/+/Status"); }));

    // Lost connection.
    broker.dropClient();
    ASSERT_TRUE(runUntil(*bus, broker, [&bus] { return !bus->isConnected() && (bus->socketFd() < 0); }));
    EXPECT_THAT(bus->publish("device/fe001/DeviceInstance", "{}"), ENOTCONN);

    // The next attempt comes after the back-off delay, and renews the subscription.
    const auto lost_at = std::chrono::steady_clock::now();
    ASSERT_TRUE(runUntil(*bus, broker, [&bus] { return bus->socketFd() >= 0; }, std::chrono::seconds{5}));
    EXPECT_THAT(std::chrono::steady_clock::now() - lost_at, testing::Ge(std::chrono::milliseconds{900}));

    ASSERT_NO_FATAL_FAILURE(completeHandshake(*bus, broker));
    EXPECT_TRUE(runUntil(*bus, broker, [&broker] { return broker.hasReceived("device/+/Status"); }));
    EXPECT_THAT(bus->publish("device/fe001/DeviceInstance", "{}"), 0);
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
