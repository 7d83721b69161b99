#include "network/connection.hpp"
#include "network/sessionError.hpp"

#include <asio.hpp>
#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <variant>

namespace noughts::gtest {

using namespace std::chrono_literals;
using network::ErrorKind;
using network::SessionError;

//! A server side Connection with a plain asio client socket at the other end of a loopback link.
class ConnectionTest : public ::testing::Test {
protected:
	void SetUp() override {
		asio::ip::tcp::acceptor acceptor(m_clientContext, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0u));
		m_client.connect(acceptor.local_endpoint());
		acceptor.accept(m_connection->socket());
		m_connection->start();
	}

	void clientWrite(const std::string& text) {
		asio::write(m_client, asio::buffer(text));
	}

	std::string clientRead() {
		std::string buffer(256u, '\0');
		const auto bytes = m_client.read_some(asio::buffer(buffer));
		buffer.resize(bytes);
		return buffer;
	}

	asio::io_context m_clientContext{};
	asio::ip::tcp::socket m_client{m_clientContext};
	network::ConnectionPtr m_connection{std::make_shared<network::Connection>(1u)};
};

TEST_F(ConnectionTest, RemoteEndpointIsClient) {
	const auto endpoint = m_connection->remoteEndpoint();
	EXPECT_EQ(endpoint.address, "127.0.0.1");
	EXPECT_EQ(endpoint.port, m_client.local_endpoint().port());
	EXPECT_EQ(m_connection->connectionId(), 1u);
}

TEST_F(ConnectionTest, SendDeliversFullText) {
	ASSERT_FALSE(m_connection->send("Welcome! Waiting for opponent...\n").has_value());
	EXPECT_EQ(clientRead(), "Welcome! Waiting for opponent...\n");
}

TEST_F(ConnectionTest, ReceiveTrimsWhitespace) {
	clientWrite("  MOVE 4 \r\n");

	const auto result = m_connection->receive(1s);
	ASSERT_TRUE(std::holds_alternative<std::string>(result));
	EXPECT_EQ(std::get<std::string>(result), "MOVE 4");
	EXPECT_FALSE(m_connection->hasReadDeadline());
}

TEST_F(ConnectionTest, ReceiveTimeoutClearsDeadline) {
	const auto start  = std::chrono::steady_clock::now();
	const auto result = m_connection->receive(1s);
	const auto waited = std::chrono::steady_clock::now() - start;

	ASSERT_TRUE(std::holds_alternative<SessionError>(result));
	const auto& error = std::get<SessionError>(result);
	EXPECT_EQ(error.kind, ErrorKind::TimeoutWaitingForPlayer);
	EXPECT_EQ(error.message, "Timed out after 1 seconds");
	EXPECT_EQ(error.endpoint, m_connection->remoteEndpoint());
	EXPECT_GE(waited, 900ms);
	EXPECT_FALSE(m_connection->hasReadDeadline());

	// Connection stays usable after a timeout.
	clientWrite("5\n");
	const auto next = m_connection->receive(1s);
	ASSERT_TRUE(std::holds_alternative<std::string>(next));
	EXPECT_EQ(std::get<std::string>(next), "5");
	EXPECT_FALSE(m_connection->hasReadDeadline());
}

TEST_F(ConnectionTest, ReceiveRejectsInvalidUtf8) {
	clientWrite("\xff\xfe\n");

	const auto result = m_connection->receive(1s);
	ASSERT_TRUE(std::holds_alternative<SessionError>(result));
	const auto& error = std::get<SessionError>(result);
	EXPECT_EQ(error.kind, ErrorKind::PeerDisconnected);
	EXPECT_EQ(error.message, "recv failed: invalid UTF-8");
	EXPECT_EQ(error.endpoint, m_connection->remoteEndpoint());
	EXPECT_FALSE(m_connection->hasReadDeadline());
}

TEST_F(ConnectionTest, ReceiveKeepsMultibyteText) {
	clientWrite("z\xc3\xbcge \xe2\x82\xac\n");

	const auto result = m_connection->receive(1s);
	ASSERT_TRUE(std::holds_alternative<std::string>(result));
	EXPECT_EQ(std::get<std::string>(result), "z\xc3\xbcge \xe2\x82\xac");
}

TEST_F(ConnectionTest, ReceiveAfterPeerClose) {
	const auto clientEndpoint = m_connection->remoteEndpoint();
	m_client.shutdown(asio::socket_base::shutdown_both);
	m_client.close();

	const auto result = m_connection->receive(1s);
	ASSERT_TRUE(std::holds_alternative<SessionError>(result));
	const auto& error = std::get<SessionError>(result);
	EXPECT_EQ(error.kind, ErrorKind::PeerDisconnected);
	EXPECT_EQ(error.endpoint, clientEndpoint);
	EXPECT_FALSE(m_connection->hasReadDeadline());
}

TEST_F(ConnectionTest, SendAfterCloseFails) {
	const auto clientEndpoint = m_connection->remoteEndpoint();
	m_connection->close();
	EXPECT_FALSE(m_connection->isOpen());

	const auto error = m_connection->send("Your move (0-8) or QUIT:\n");
	ASSERT_TRUE(error.has_value());
	EXPECT_EQ(error->kind, ErrorKind::PeerDisconnected);
	EXPECT_TRUE(error->message.starts_with("send failed: "));
	// Endpoint was cached on start and survives the socket.
	EXPECT_EQ(error->endpoint, clientEndpoint);

	const auto result = m_connection->receive(1s);
	ASSERT_TRUE(std::holds_alternative<SessionError>(result));
	EXPECT_EQ(std::get<SessionError>(result).kind, ErrorKind::PeerDisconnected);
}

TEST_F(ConnectionTest, CloseIsIdempotent) {
	m_connection->close();
	m_connection->close();
	EXPECT_FALSE(m_connection->isOpen());
}

TEST(Connection, UnconnectedHasUnknownEndpoint) {
	network::Connection connection(3u);
	EXPECT_EQ(connection.remoteEndpoint(), network::UNKNOWN_ENDPOINT);
	EXPECT_FALSE(connection.hasReadDeadline());

	const auto error = connection.send("hello\n");
	ASSERT_TRUE(error.has_value());
	EXPECT_EQ(error->kind, ErrorKind::PeerDisconnected);
	EXPECT_EQ(error->endpoint, network::UNKNOWN_ENDPOINT);
}

TEST(SessionError, Rendering) {
	const SessionError error{ErrorKind::PlayerQuit, {"10.0.0.2", 4242u}, "Player quit"};
	EXPECT_EQ(network::toString(error), "Player quit: ('10.0.0.2', 4242)");
	EXPECT_EQ(network::toString(network::UNKNOWN_ENDPOINT), "('unknown', 0)");
	EXPECT_EQ(network::toString(ErrorKind::TimeoutWaitingForPlayer), "TimeoutWaitingForPlayer");
}

} // namespace noughts::gtest
