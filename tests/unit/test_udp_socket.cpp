/**
 * @file test_udp_socket.cpp
 * @brief Unit tests for UDP socket abstraction
 */

#include <gtest/gtest.h>
#include <lumen/net/udp_socket.hpp>

#include <chrono>
#include <string>
#include <utility>

using namespace lumen::net;

class UdpSocketTest : public ::testing::Test {
protected:
    SocketInitializer init_;
};

TEST_F(UdpSocketTest, CreateAndClose) {
    UdpSocket socket;
    EXPECT_TRUE(socket.isValid());

    socket.close();
    EXPECT_FALSE(socket.isValid());

    // Idempotent
    socket.close();
    EXPECT_FALSE(socket.isValid());
}

TEST_F(UdpSocketTest, BindToEphemeralPort) {
    UdpSocket socket;
    ASSERT_TRUE(socket.bind(0, "127.0.0.1"));
    EXPECT_NE(socket.getLocalPort(), 0);
    EXPECT_EQ(socket.getLocalAddress().ip, "127.0.0.1");
}

TEST_F(UdpSocketTest, BindRejectsBadAddress) {
    UdpSocket socket;
    EXPECT_FALSE(socket.bind(0, "not-an-address"));
}

TEST_F(UdpSocketTest, MoveTransfersHandle) {
    UdpSocket first;
    ASSERT_TRUE(first.isValid());
    SocketHandle handle = first.handle();

    UdpSocket second(std::move(first));
    EXPECT_FALSE(first.isValid());
    EXPECT_TRUE(second.isValid());
    EXPECT_EQ(second.handle(), handle);
}

TEST_F(UdpSocketTest, SendReceiveLoopback) {
    UdpSocket sender;
    UdpSocket receiver;

    ASSERT_TRUE(sender.bind(0, "127.0.0.1"));
    ASSERT_TRUE(receiver.bind(0, "127.0.0.1"));

    const std::string message = "Hello, UDP!";
    SocketAddress dest("127.0.0.1", receiver.getLocalPort());
    EXPECT_EQ(sender.sendTo(dest, message), static_cast<int>(message.size()));

    char buffer[256];
    SocketAddress from;
    int received = receiver.receiveFrom(buffer, sizeof(buffer), 1000, from);

    ASSERT_EQ(received, static_cast<int>(message.size()));
    EXPECT_EQ(std::string(buffer, received), message);
    EXPECT_EQ(from.ip, "127.0.0.1");
    EXPECT_EQ(from.port, sender.getLocalPort());
}

TEST_F(UdpSocketTest, ReceiveTimeout) {
    UdpSocket socket;
    ASSERT_TRUE(socket.bind(0, "127.0.0.1"));

    char buffer[256];
    SocketAddress from;

    auto start = std::chrono::steady_clock::now();
    int received = socket.receiveFrom(buffer, sizeof(buffer), 100, from);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    EXPECT_EQ(received, 0);
    EXPECT_GE(elapsed.count(), 90);  // Allow some tolerance
}

TEST_F(UdpSocketTest, SendToInvalidDestinationFails) {
    UdpSocket socket;
    EXPECT_EQ(socket.sendTo(SocketAddress("", 38899), std::string("x")), -1);
    EXPECT_EQ(socket.sendTo(SocketAddress("bogus", 38899), std::string("x")), -1);
}

TEST_F(UdpSocketTest, ClosedSocketOperationsFail) {
    UdpSocket socket;
    socket.close();

    char buffer[16];
    SocketAddress from;
    EXPECT_FALSE(socket.bind(0));
    EXPECT_FALSE(socket.setBroadcast(true));
    EXPECT_EQ(socket.sendTo(SocketAddress("127.0.0.1", 9), std::string("x")), -1);
    EXPECT_EQ(socket.receiveFrom(buffer, sizeof(buffer), 10, from), -1);
    EXPECT_EQ(socket.getLocalPort(), 0);
}

TEST_F(UdpSocketTest, EnableBroadcastAndReuse) {
    UdpSocket socket;
    EXPECT_TRUE(socket.setReuseAddress(true));
    EXPECT_TRUE(socket.setBroadcast(true));
}

TEST(SocketAddressTest, FormatsAndCompares) {
    SocketAddress a("10.0.0.1", 38899);
    SocketAddress b("10.0.0.1", 38899);
    SocketAddress c("10.0.0.1", 1);

    EXPECT_EQ(a.toString(), "10.0.0.1:38899");
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
}

TEST(SocketAddressTest, ValidatesIpv4) {
    EXPECT_TRUE(isValidIpv4("192.168.1.20"));
    EXPECT_TRUE(isValidIpv4("255.255.255.255"));
    EXPECT_FALSE(isValidIpv4(""));
    EXPECT_FALSE(isValidIpv4("192.168.1"));
    EXPECT_FALSE(isValidIpv4("bulb.local"));
}
