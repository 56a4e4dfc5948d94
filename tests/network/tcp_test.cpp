#include "lft/network/tcp.hpp"
#include "lft/protocol/frame_channel.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

using namespace lft::network;
using lft::ErrorCode;

TEST(TcpTest, EphemeralPortAcceptsLoopbackConnection) {
    TcpListener listener;
    auto port = listener.bind_first_available("127.0.0.1", {0});
    ASSERT_TRUE(port.is_ok()) << port.error().describe();
    ASSERT_NE(port.value(), 0);
    EXPECT_EQ(listener.port(), port.value());

    lft::Result<std::unique_ptr<TcpStream>> client = lft::Err<std::unique_ptr<TcpStream>>(
        ErrorCode::IOFailure, "not connected");
    std::thread connector([&] {
        client = TcpStream::connect("127.0.0.1", port.value(), std::chrono::milliseconds(2000));
    });

    auto server = listener.accept(std::chrono::milliseconds(2000));
    connector.join();
    ASSERT_TRUE(server.is_ok()) << server.error().describe();
    ASSERT_TRUE(client.is_ok()) << client.error().describe();

    lft::protocol::FrameChannel sending(*client.value());
    lft::protocol::FrameChannel receiving(*server.value());
    ASSERT_TRUE(sending.send(lft::protocol::Handshake{4, 1000005}).is_ok());

    auto frame = receiving.receive(std::chrono::milliseconds(2000));
    ASSERT_TRUE(frame.is_ok()) << frame.error().describe();
    const auto& handshake = std::get<lft::protocol::Handshake>(frame.value());
    EXPECT_EQ(handshake.total_items, 4u);
    EXPECT_EQ(handshake.total_bytes, 1000005u);
}

TEST(TcpTest, AcceptTimesOutWithoutClient) {
    TcpListener listener;
    ASSERT_TRUE(listener.bind_first_available("127.0.0.1", {0}).is_ok());

    auto stream = listener.accept(std::chrono::milliseconds(50));
    ASSERT_TRUE(stream.is_error());
    EXPECT_EQ(stream.error().code, ErrorCode::Timeout);
    EXPECT_TRUE(listener.is_open());
}

TEST(TcpTest, SkipsPortsInUse) {
    TcpListener first;
    auto taken = first.bind_first_available("127.0.0.1", {0});
    ASSERT_TRUE(taken.is_ok());

    TcpListener second;
    auto port = second.bind_first_available("127.0.0.1", {taken.value(), 0});
    ASSERT_TRUE(port.is_ok());
    EXPECT_NE(port.value(), taken.value());

    TcpListener third;
    auto none = third.bind_first_available("127.0.0.1", {taken.value()});
    ASSERT_TRUE(none.is_error());
    EXPECT_EQ(none.error().code, ErrorCode::IOFailure);
}

TEST(TcpTest, RejectsBadBindAddress) {
    TcpListener listener;
    auto port = listener.bind_first_available("not-an-address", {0});
    ASSERT_TRUE(port.is_error());
    EXPECT_EQ(port.error().code, ErrorCode::InvalidArgument);
}

namespace {

struct Connection {
    std::unique_ptr<TcpStream> client;
    std::unique_ptr<TcpStream> server;
};

Connection connect_loopback(TcpListener& listener) {
    auto port = listener.bind_first_available("127.0.0.1", {0});
    EXPECT_TRUE(port.is_ok());

    lft::Result<std::unique_ptr<TcpStream>> client = lft::Err<std::unique_ptr<TcpStream>>(
        ErrorCode::IOFailure, "not connected");
    std::thread connector([&] {
        client = TcpStream::connect("127.0.0.1", port.value(), std::chrono::milliseconds(2000));
    });
    auto server = listener.accept(std::chrono::milliseconds(2000));
    connector.join();

    Connection connection;
    if (client.is_ok() && server.is_ok()) {
        connection.client = std::move(client.value());
        connection.server = std::move(server.value());
    }
    return connection;
}

} // namespace

TEST(TcpTest, PeerCloseThenLocalCancel) {
    TcpListener listener;
    auto connection = connect_loopback(listener);
    ASSERT_TRUE(connection.client && connection.server);

    connection.client.reset();
    std::uint8_t byte = 0;
    auto closed = connection.server->read_exact(&byte, 1, std::chrono::milliseconds(2000));
    ASSERT_TRUE(closed.is_error());
    EXPECT_EQ(closed.error().code, ErrorCode::ConnectionClosed);

    connection.server->close();
    auto cancelled = connection.server->read_exact(&byte, 1, std::chrono::milliseconds(2000));
    ASSERT_TRUE(cancelled.is_error());
    EXPECT_EQ(cancelled.error().code, ErrorCode::Cancelled);
}

TEST(TcpTest, ReadTimesOutOnSilentPeer) {
    TcpListener listener;
    auto connection = connect_loopback(listener);
    ASSERT_TRUE(connection.client && connection.server);

    std::uint8_t byte = 0;
    auto silent = connection.server->read_exact(&byte, 1, std::chrono::milliseconds(50));
    ASSERT_TRUE(silent.is_error());
    EXPECT_EQ(silent.error().code, ErrorCode::Timeout);
}

TEST(TcpTest, ConnectToClosedPortFails) {
    TcpListener listener;
    auto port = listener.bind_first_available("127.0.0.1", {0});
    ASSERT_TRUE(port.is_ok());
    const auto unused = port.value();
    listener.close();

    auto stream = TcpStream::connect("127.0.0.1", unused, std::chrono::milliseconds(2000));
    ASSERT_TRUE(stream.is_error());
    EXPECT_EQ(stream.error().code, ErrorCode::IOFailure);
}
