#include <sstv/tcp_transport.h>

#include "gtest/gtest.h"

#include <asio.hpp>
#include <string>

using namespace std::string_literals;

namespace {

// Loopback peer standing in for the device. The kernel completes the
// handshake from the listen backlog, so accept() can run after the client
// connected on the same thread.
class TCPTransportTest : public ::testing::Test {
protected:
    asio::io_context server_io;
    asio::ip::tcp::acceptor acceptor{server_io,
        asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)};
    asio::ip::tcp::socket peer{server_io};

    int port() const { return acceptor.local_endpoint().port(); }

    void connect(TCPTransport& transport, int timeout_ms = 1000) {
        ASSERT_EQ(ErrorCode::OK, transport.connect_to_server("127.0.0.1", port(), timeout_ms));
        acceptor.accept(peer);
    }
};

}  // namespace

TEST_F(TCPTransportTest, ConnectsAndReportsLocalAddress) {
    TCPTransport transport;
    EXPECT_FALSE(transport.is_connected());
    EXPECT_EQ("", transport.local_address());

    connect(transport, 1500);
    EXPECT_TRUE(transport.is_connected());
    EXPECT_EQ("127.0.0.1", transport.local_address());
    EXPECT_EQ(1500, transport.get_read_timeout());
    EXPECT_EQ("TCP", transport.get_type());
}

TEST_F(TCPTransportTest, SendsBytesUnchanged) {
    TCPTransport transport;
    connect(transport);

    std::string data = "\x00\x05\x00" "hello\xff"s;
    size_t sent = 0;
    ASSERT_EQ(ErrorCode::OK, transport.send_data(data, &sent));
    EXPECT_EQ(data.size(), sent);

    std::string received(data.size(), '\0');
    asio::read(peer, asio::buffer(&received[0], received.size()));
    EXPECT_EQ(data, received);
}

TEST_F(TCPTransportTest, ReceivesOneFrame) {
    TCPTransport transport;
    connect(transport);

    std::string frame = "\x02\x0c\x00" "iapp.samsung" "\x02\x00" "\x10\x00"s;
    asio::write(peer, asio::buffer(frame));

    std::string received;
    ASSERT_EQ(ErrorCode::OK, transport.receive_data(&received));
    EXPECT_EQ(frame, received);
}

TEST_F(TCPTransportTest, TimeoutLeavesConnectionUsable) {
    TCPTransport transport;
    connect(transport);
    transport.set_read_timeout(50);

    std::string received;
    EXPECT_EQ(ErrorCode::RECEIVE_TIMEOUT, transport.receive_data(&received));
    EXPECT_TRUE(transport.is_connected());

    asio::write(peer, asio::buffer("late"s));
    transport.set_read_timeout(1000);
    ASSERT_EQ(ErrorCode::OK, transport.receive_data(&received));
    EXPECT_EQ("late", received);
}

TEST_F(TCPTransportTest, PeerCloseIsReported) {
    TCPTransport transport;
    connect(transport);

    peer.close();

    std::string received;
    EXPECT_EQ(ErrorCode::CONNECTION_CLOSED, transport.receive_data(&received));
}

TEST_F(TCPTransportTest, RefusedConnectionFails) {
    int closed_port = port();
    acceptor.close();

    TCPTransport transport;
    EXPECT_EQ(ErrorCode::CONNECT_ERROR, transport.connect_to_server("127.0.0.1", closed_port, 1000));
    EXPECT_FALSE(transport.is_connected());
}

TEST_F(TCPTransportTest, UnconnectedTransportRefusesIo) {
    TCPTransport transport;
    std::string received;
    EXPECT_EQ(ErrorCode::SEND_ERROR, transport.send_data("x", nullptr));
    EXPECT_EQ(ErrorCode::CONNECTION_CLOSED, transport.receive_data(&received));
}

TEST_F(TCPTransportTest, CloseIsIdempotent) {
    TCPTransport transport;
    connect(transport);

    transport.close();
    EXPECT_FALSE(transport.is_connected());
    transport.close();
    EXPECT_FALSE(transport.is_connected());

    std::string received;
    EXPECT_EQ(ErrorCode::CONNECTION_CLOSED, transport.receive_data(&received));
}
