#pragma once

#include "network/protocol.hpp"
#include "network/sessionError.hpp"

#include <asio.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace noughts::network {

//! Received text or the failure that ended the receive.
using ReceiveResult = std::variant<std::string, SessionError>;

//! Transportation primitive. Blocking send and receive on a single client socket.
//! \note Each connection runs its own io_context so a receive deadline never touches other connections.
//!       Not thread safe: used by one worker at a time (acceptor worker, then session).
class Connection {
public:
	explicit Connection(ConnectionId connectionId, std::size_t readBufferBytes = READ_BUFFER_BYTES);
	~Connection();

	Connection(const Connection&)            = delete;
	Connection& operator=(const Connection&) = delete;

	asio::ip::tcp::socket& socket(); //!< Socket to accept or connect into.
	void start();                    //!< Cache the remote endpoint once the socket is connected.

	//! Write the full text. Returns PeerDisconnected on failure.
	std::optional<SessionError> send(std::string_view text);

	//! Block for one message of at most readBufferBytes, up to timeout.
	//! \returns Trimmed text, PeerDisconnected on close or IO failure, TimeoutWaitingForPlayer after timeout.
	//! \note The read deadline is cleared before returning on every path.
	ReceiveResult receive(std::chrono::seconds timeout);

	void close(); //!< Shutdown and close the socket. Safe to call on a closed connection.

	ConnectionId connectionId() const; //!< Get the identifier of this connection.
	Endpoint remoteEndpoint() const;   //!< Cached remote endpoint or UNKNOWN_ENDPOINT.
	bool isOpen() const;               //!< Socket not yet closed.
	bool hasReadDeadline() const;      //!< True while a receive deadline is armed.

private:
	Endpoint resolveEndpoint() const; //!< Best effort query of the socket peer.
	void clearDeadline();             //!< Revert to blocking forever.

private:
	asio::io_context m_ioContext{}; //!< Drives the deadline-bound reads of this connection.
	asio::ip::tcp::socket m_socket; //!< Client socket.
	asio::steady_timer m_deadline;  //!< Read deadline. time_point::max() means none.

	ConnectionId m_connectionId;
	std::size_t m_readBufferBytes;
	std::optional<Endpoint> m_remote; //!< Resolved in start().
};

using ConnectionPtr = std::shared_ptr<Connection>;

} // namespace noughts::network
