#pragma once

#include <cstdint>
#include <string>

namespace noughts::network {

//! Remote address of a player.
struct Endpoint {
	std::string address;
	std::uint16_t port{0};

	bool operator==(const Endpoint&) const = default;
};

//! Used when the peer address cannot be resolved (e.g. socket already torn down).
inline const Endpoint UNKNOWN_ENDPOINT{"unknown", 0u};

//! Failure categories of a player during a session.
enum class ErrorKind {
	PeerDisconnected,        //!< Connection closed or IO failed.
	PlayerQuit,              //!< Player sent QUIT.
	TimeoutWaitingForPlayer, //!< No reply within the move timeout.
	InvalidMessage           //!< Malformed protocol message. Recoverable.
};

//! Failure signal of a single player. Only lives for the handling of one loop iteration.
struct SessionError {
	ErrorKind kind;
	Endpoint endpoint; //!< Offending player.
	std::string message;
};

std::string toString(ErrorKind kind);
std::string toString(const Endpoint& endpoint);

//! "<message>: ('<address>', <port>)"
std::string toString(const SessionError& error);

} // namespace noughts::network
