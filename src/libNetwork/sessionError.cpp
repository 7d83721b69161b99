#include "network/sessionError.hpp"

#include <format>

namespace noughts::network {

std::string toString(const ErrorKind kind) {
	switch (kind) {
	case ErrorKind::PeerDisconnected:
		return "PeerDisconnected";
	case ErrorKind::PlayerQuit:
		return "PlayerQuit";
	case ErrorKind::TimeoutWaitingForPlayer:
		return "TimeoutWaitingForPlayer";
	case ErrorKind::InvalidMessage:
		return "InvalidMessage";
	}
	return "Unknown";
}

std::string toString(const Endpoint& endpoint) {
	return std::format("('{}', {})", endpoint.address, endpoint.port);
}

std::string toString(const SessionError& error) {
	return std::format("{}: {}", error.message, toString(error.endpoint));
}

} // namespace noughts::network
