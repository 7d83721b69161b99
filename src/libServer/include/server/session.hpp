#pragma once

#include "core/game.hpp"
#include "network/connection.hpp"
#include "network/sessionError.hpp"

#include <chrono>
#include <exception>
#include <optional>
#include <string>
#include <string_view>

namespace noughts::server {

//! Drives one paired game from greeting to termination.
//! Owns both connections and closes them when the game ends, whatever the reason.
class Session {
public:
	//! first plays X and starts, second plays O.
	Session(network::ConnectionPtr first, network::ConnectionPtr second, std::chrono::seconds moveTimeout);

	Session(const Session&)            = delete;
	Session& operator=(const Session&) = delete;

	//! Run the session loop on the calling thread until the game ends.
	void run();

private:
	enum class State { Starting, AwaitingMove, Terminated };

	State step(); //!< Advance the session by one state transition.

	bool greetPlayers(); //!< Tell both players their symbol. False if one is gone.
	bool playTurn();     //!< One request/response round. False when the session terminates.

	//! Apply a parsed move of the current player. False when the session terminates.
	bool applyMove(network::Connection& current, const std::string& cell);
	//! Tell both players the result if the game is decided. False when the session terminates.
	bool announceResult();

	//! React to a player failure. False when the session terminates.
	bool handleFailure(const network::SessionError& error, network::Connection& current);
	//! Uncategorized failure. Logged, both players told, session terminates.
	void handleInternalError(const std::exception& ex);

	//! Send to both players in order p1, p2. Stops at the first failure.
	std::optional<network::SessionError> broadcast(std::string_view text);
	//! Reject the current message of a player; the same player is prompted again without a board.
	std::optional<network::SessionError> reject(network::Connection& player, std::string_view text);
	//! Last gasp notification. Failures are dropped.
	void sendBestEffort(network::Connection& player, std::string_view text);

	network::Connection& connectionOf(PlayerId player);
	network::Connection& opponentOf(const network::Connection& player);
	network::Connection& survivorOf(const network::Endpoint& offender);

	void closeConnections();

private:
	network::ConnectionPtr m_first;
	network::ConnectionPtr m_second;
	std::chrono::seconds m_moveTimeout;

	Game m_game;
	State m_state{State::Starting};
	bool m_repeatPrompt{false}; //!< Last message was rejected. Skip the board on the next prompt.
};

} // namespace noughts::server
