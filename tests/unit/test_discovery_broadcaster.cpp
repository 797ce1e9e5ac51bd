/**
 * @file test_discovery_broadcaster.cpp
 * @brief Unit tests for discovery sweeps and reply fan-out
 */

#include <gtest/gtest.h>
#include <lumen/core/discovery_broadcaster.hpp>
#include <lumen/core/errors.hpp>

#include <atomic>
#include <functional>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

using namespace lumen::core;
using namespace std::chrono_literals;
using lumen::net::SocketAddress;

namespace {

class CountingSender : public DatagramSender {
public:
    void sendDatagram(const std::string& payload, const SocketAddress& destination) override {
        {
            std::lock_guard<std::mutex> lock(mutex);
            payloads.push_back(payload);
            destinations.push_back(destination);
        }
        if (fail) {
            throw TransportError(ErrorKind::TransientNetwork, "network unreachable");
        }
        if (onSend) {
            onSend();
        }
    }

    size_t count() {
        std::lock_guard<std::mutex> lock(mutex);
        return payloads.size();
    }

    std::mutex mutex;
    std::atomic<bool> fail{false};
    std::vector<std::string> payloads;
    std::vector<SocketAddress> destinations;
    std::function<void()> onSend;
};

Datagram makeReply(const std::string& ip, const std::string& mac) {
    std::string payload = R"({"method":"getSystemConfig","result":{"mac":")" + mac + R"("}})";
    Datagram datagram;
    datagram.payload = payload;
    datagram.envelope = *CommandEnvelope::parse(payload);
    datagram.source = SocketAddress(ip, 38899);
    datagram.received_at = std::chrono::steady_clock::now();
    return datagram;
}

DiscoveryConfig fastConfig() {
    DiscoveryConfig config;
    config.broadcast_interval_ms = 20;
    return config;
}

}  // namespace

TEST(DiscoveryBroadcasterTest, DefaultConfig) {
    DiscoveryConfig config;
    EXPECT_EQ(config.broadcast_addr, "255.255.255.255");
    EXPECT_EQ(config.port, 38899);
    EXPECT_EQ(config.broadcast_interval_ms, 500);
}

TEST(DiscoveryBroadcasterTest, RebroadcastsUntilDeadline) {
    CountingSender sender;
    DiscoveryBroadcaster broadcaster(sender, fastConfig());
    CommandEnvelope command(DeviceMethod::GetSystemConfig);

    auto start = std::chrono::steady_clock::now();
    broadcaster.discover(command, [](const Datagram&) {}, 200ms);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_GE(elapsed, 190ms);
    EXPECT_LT(elapsed, 2s);
    EXPECT_GE(sender.count(), 3u);
    EXPECT_EQ(sender.payloads.front(), command.assemble());
    EXPECT_EQ(sender.destinations.front(), SocketAddress("255.255.255.255", 38899));
    EXPECT_EQ(broadcaster.listenerCount(), 0u);
}

TEST(DiscoveryBroadcasterTest, DeliversRepliesDuringSweep) {
    CountingSender sender;
    DiscoveryBroadcaster broadcaster(sender, fastConfig());

    size_t accepted = 0;
    sender.onSend = [&] {
        accepted += broadcaster.dispatch(makeReply("192.168.1.20", "aabbccddeeff"));
    };

    std::vector<std::string> seen;
    broadcaster.discover(CommandEnvelope(DeviceMethod::GetSystemConfig),
                         [&seen](const Datagram& reply) {
                             seen.push_back(reply.source.ip);
                         },
                         100ms);

    // Every accepted reply is delivered; deduplication belongs to the caller
    EXPECT_GE(accepted, 1u);
    EXPECT_EQ(seen.size(), accepted);
    ASSERT_FALSE(seen.empty());
    EXPECT_EQ(seen.front(), "192.168.1.20");
}

TEST(DiscoveryBroadcasterTest, NoDeliveryOutsideSweep) {
    CountingSender sender;
    DiscoveryBroadcaster broadcaster(sender, fastConfig());

    EXPECT_EQ(broadcaster.dispatch(makeReply("192.168.1.20", "aabbccddeeff")), 0u);

    int calls = 0;
    broadcaster.discover(CommandEnvelope(DeviceMethod::GetPilot),
                         [&calls](const Datagram&) { ++calls; }, 50ms);

    EXPECT_EQ(broadcaster.dispatch(makeReply("192.168.1.20", "aabbccddeeff")), 0u);
    EXPECT_EQ(calls, 0);
}

TEST(DiscoveryBroadcasterTest, ReplyBeforeWindowIsIgnored) {
    CountingSender sender;
    DiscoveryBroadcaster broadcaster(sender, fastConfig());

    Datagram stale = makeReply("192.168.1.20", "aabbccddeeff");
    stale.received_at -= 10s;

    size_t delivered = 1;
    sender.onSend = [&] { delivered = broadcaster.dispatch(stale); };

    broadcaster.discover(CommandEnvelope(DeviceMethod::GetPilot), [](const Datagram&) {}, 30ms);
    EXPECT_EQ(delivered, 0u);
}

TEST(DiscoveryBroadcasterTest, ConcurrentSweepsBothReceive) {
    CountingSender sender;
    DiscoveryBroadcaster broadcaster(sender, fastConfig());

    std::atomic<int> first{0};
    std::atomic<int> second{0};

    auto sweepA = std::async(std::launch::async, [&] {
        broadcaster.discover(CommandEnvelope(DeviceMethod::GetPilot),
                             [&first](const Datagram&) { ++first; }, 300ms);
    });
    auto sweepB = std::async(std::launch::async, [&] {
        broadcaster.discover(CommandEnvelope(DeviceMethod::GetPilot),
                             [&second](const Datagram&) { ++second; }, 300ms);
    });

    for (int i = 0; i < 100 && broadcaster.listenerCount() < 2; ++i) {
        std::this_thread::sleep_for(5ms);
    }
    ASSERT_EQ(broadcaster.listenerCount(), 2u);
    EXPECT_EQ(broadcaster.dispatch(makeReply("192.168.1.21", "112233445566")), 2u);

    sweepA.get();
    sweepB.get();
    EXPECT_EQ(first.load(), 1);
    EXPECT_EQ(second.load(), 1);
}

TEST(DiscoveryBroadcasterTest, CancelEndsSweepEarly) {
    CountingSender sender;
    DiscoveryBroadcaster broadcaster(sender, fastConfig());
    CancellationSource source;

    auto sweep = std::async(std::launch::async, [&] {
        broadcaster.discover(CommandEnvelope(DeviceMethod::GetPilot),
                             [](const Datagram&) {}, 10s, source.token());
    });

    std::this_thread::sleep_for(50ms);
    auto start = std::chrono::steady_clock::now();
    source.cancel();

    try {
        sweep.get();
        FAIL() << "Expected cancellation";
    } catch (const TransportError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Cancelled);
    }
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
    EXPECT_EQ(broadcaster.listenerCount(), 0u);
}

TEST(DiscoveryBroadcasterTest, SendFailuresDoNotEndSweep) {
    CountingSender sender;
    sender.fail = true;
    DiscoveryBroadcaster broadcaster(sender, fastConfig());

    EXPECT_NO_THROW(broadcaster.discover(CommandEnvelope(DeviceMethod::GetPilot),
                                         [](const Datagram&) {}, 100ms));
    EXPECT_GE(sender.count(), 2u);
}

TEST(DiscoveryBroadcasterTest, ThrowingCallbackIsContained) {
    CountingSender sender;
    DiscoveryBroadcaster broadcaster(sender, fastConfig());

    size_t accepted = 0;
    sender.onSend = [&] {
        accepted += broadcaster.dispatch(makeReply("192.168.1.20", "aabbccddeeff"));
    };

    size_t calls = 0;
    EXPECT_NO_THROW(broadcaster.discover(
        CommandEnvelope(DeviceMethod::GetPilot),
        [&calls](const Datagram&) {
            ++calls;
            throw std::runtime_error("boom");
        },
        50ms));

    // Later replies still reach the callback after one throws
    EXPECT_GE(accepted, 1u);
    EXPECT_EQ(calls, accepted);
}

TEST(DiscoveryBroadcasterTest, CallbackRunsOnSweepThread) {
    CountingSender sender;
    DiscoveryBroadcaster broadcaster(sender, fastConfig());

    std::thread::id dispatcher;
    sender.onSend = [&] {
        auto worker = std::async(std::launch::async, [&] {
            dispatcher = std::this_thread::get_id();
            broadcaster.dispatch(makeReply("192.168.1.20", "aabbccddeeff"));
        });
        worker.get();
    };

    std::vector<std::thread::id> callers;
    broadcaster.discover(CommandEnvelope(DeviceMethod::GetPilot),
                         [&callers](const Datagram&) {
                             callers.push_back(std::this_thread::get_id());
                         },
                         60ms);

    ASSERT_FALSE(callers.empty());
    for (const auto& id : callers) {
        EXPECT_EQ(id, std::this_thread::get_id());
        EXPECT_NE(id, dispatcher);
    }
}

TEST(DiscoveryBroadcasterTest, DispatchDoesNotWaitForSlowCallback) {
    CountingSender sender;
    DiscoveryBroadcaster broadcaster(sender, fastConfig());
    std::atomic<int> calls{0};

    auto sweep = std::async(std::launch::async, [&] {
        broadcaster.discover(CommandEnvelope(DeviceMethod::GetPilot),
                             [&calls](const Datagram&) {
                                 ++calls;
                                 std::this_thread::sleep_for(200ms);
                             },
                             600ms);
    });

    for (int i = 0; i < 100 && broadcaster.listenerCount() < 1; ++i) {
        std::this_thread::sleep_for(5ms);
    }
    ASSERT_EQ(broadcaster.listenerCount(), 1u);

    EXPECT_EQ(broadcaster.dispatch(makeReply("192.168.1.20", "aabbccddeeff")), 1u);
    for (int i = 0; i < 100 && calls.load() == 0; ++i) {
        std::this_thread::sleep_for(5ms);
    }

    // The first callback is still sleeping
    auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(broadcaster.dispatch(makeReply("192.168.1.21", "112233445566")), 1u);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 100ms);

    sweep.get();
    EXPECT_EQ(calls.load(), 2);
}

TEST(DiscoveryBroadcasterTest, RejectsInvalidArguments) {
    CountingSender sender;
    DiscoveryBroadcaster broadcaster(sender, fastConfig());
    CommandEnvelope command(DeviceMethod::GetPilot);

    EXPECT_THROW(broadcaster.discover(command, nullptr, 100ms), std::invalid_argument);
    EXPECT_THROW(broadcaster.discover(command, [](const Datagram&) {}, 0ms),
                 std::invalid_argument);
    EXPECT_EQ(sender.count(), 0u);
}
