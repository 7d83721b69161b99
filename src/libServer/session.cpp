#include "server/session.hpp"
#include "Logging.hpp"
#include "server/clientMessage.hpp"
#include "server/messages.hpp"

#include <format>
#include <type_traits>
#include <utility>
#include <variant>

namespace noughts::server {

using network::ErrorKind;
using network::SessionError;

static std::string line(std::string_view prefix, std::string_view detail) {
	return std::format("{}{}\n", prefix, detail);
}

Session::Session(network::ConnectionPtr first, network::ConnectionPtr second, const std::chrono::seconds moveTimeout)
    : m_first(std::move(first)), m_second(std::move(second)), m_moveTimeout(moveTimeout),
      m_game(m_first->connectionId(), m_second->connectionId()) {
}

void Session::run() {
	Logger().Log(Logging::LogLevel::Info, std::format("[Session] Game start: {} (X) vs {} (O).", network::toString(m_first->remoteEndpoint()),
	                                                  network::toString(m_second->remoteEndpoint())));

	try {
		while (m_state != State::Terminated) {
			m_state = step();
		}
	} catch (const std::exception& ex) {
		handleInternalError(ex);
		m_state = State::Terminated;
	}

	closeConnections();

	Logger().Log(Logging::LogLevel::Info, "[Session] Game session ended.");
}

Session::State Session::step() {
	switch (m_state) {
	case State::Starting:
		if (!greetPlayers()) {
			Logger().Log(Logging::LogLevel::Warning, "[Session] Game ended before the first move.");
			return State::Terminated;
		}
		return State::AwaitingMove;

	case State::AwaitingMove:
		return playTurn() ? State::AwaitingMove : State::Terminated;

	case State::Terminated:
		break;
	}
	return State::Terminated;
}

bool Session::greetPlayers() {
	for (auto* player: {m_first.get(), m_second.get()}) {
		const auto symbol = m_game.symbolOf(player->connectionId());
		if (const auto error = player->send(std::format("{}{}\n", MSG_GAME_START, toChar(*symbol)))) {
			Logger().Log(Logging::LogLevel::Warning, std::format("[Session] Player disconnected during start: {}", network::toString(*error)));
			return false;
		}
	}
	return true;
}

bool Session::playTurn() {
	if (!m_repeatPrompt) {
		if (const auto error = broadcast(m_game.render() + "\n")) {
			return handleFailure(*error, connectionOf(m_game.currentPlayer()));
		}
	}
	m_repeatPrompt = false;

	auto& current = connectionOf(m_game.currentPlayer());
	auto& other   = opponentOf(current);

	if (const auto error = current.send(MSG_PROMPT_MOVE)) {
		return handleFailure(*error, current);
	}
	if (const auto error = other.send(MSG_PROMPT_WAIT)) {
		return handleFailure(*error, current);
	}

	const auto reply = current.receive(m_moveTimeout);
	if (const auto* error = std::get_if<SessionError>(&reply)) {
		return handleFailure(*error, current);
	}
	const auto& text = std::get<std::string>(reply);

	return std::visit(
	        [&](const auto& message) -> bool {
		        using T = std::decay_t<decltype(message)>;
		        if constexpr (std::is_same_v<T, ClientQuit>) {
			        return handleFailure(SessionError{ErrorKind::PlayerQuit, current.remoteEndpoint(), "Player quit"}, current);
		        } else if constexpr (std::is_same_v<T, ClientMalformedMove>) {
			        return handleFailure(SessionError{ErrorKind::InvalidMessage, current.remoteEndpoint(), message.reason}, current);
		        } else if constexpr (std::is_same_v<T, ClientUnknown>) {
			        // Not a protocol failure. The player simply tries again.
			        if (const auto error = reject(current, line(MSG_INVALID_FORMAT, message.text))) {
				        return handleFailure(*error, current);
			        }
			        return true;
		        } else {
			        return applyMove(current, message.cell);
		        }
	        },
	        parseClientMessage(text));
}

bool Session::applyMove(network::Connection& current, const std::string& cell) {
	const auto result = m_game.makeMove(current.connectionId(), cell);

	switch (result) {
	case MoveResult::Accepted:
		break;

	case MoveResult::OutOfRange:
	case MoveResult::CellOccupied:
	case MoveResult::NotYourTurn:
	case MoveResult::InvalidMove:
		if (const auto error = reject(current, std::format("{}{}: {}\n", MSG_ERROR, toString(result), describe(result, cell)))) {
			return handleFailure(*error, current);
		}
		return true;

	case MoveResult::PlayerNotRecognized:
		Logger().Log(Logging::LogLevel::Error,
		             std::format("[Session] Connection {} is not a player of its own game.", current.connectionId()));
		sendBestEffort(current, std::format("{}Player not recognized: {}\n", MSG_ERROR, describe(result, cell)));
		return false;

	case MoveResult::GameOver: {
		const auto board = m_game.render() + "\n";
		const auto over  = line(MSG_GAME_OVER, describe(result, cell));
		for (auto* player: {m_first.get(), m_second.get()}) {
			sendBestEffort(*player, board);
			sendBestEffort(*player, over);
		}
		return false;
	}
	}

	if (const auto error = broadcast(m_game.render() + "\n")) {
		return handleFailure(*error, current);
	}
	return announceResult();
}

bool Session::announceResult() {
	const auto winner = m_game.winner();
	if (winner == Winner::None) {
		return true;
	}

	if (winner == Winner::Draw) {
		Logger().Log(Logging::LogLevel::Info, "[Session] Game ended in a draw.");
		for (auto* player: {m_first.get(), m_second.get()}) {
			sendBestEffort(*player, MSG_DRAW);
		}
		return false;
	}

	for (auto* player: {m_first.get(), m_second.get()}) {
		const auto symbol = m_game.symbolOf(player->connectionId());
		const bool won    = symbol.has_value() && toWinner(*symbol) == winner;
		if (won) {
			Logger().Log(Logging::LogLevel::Info, std::format("[Session] {} won the game.", network::toString(player->remoteEndpoint())));
		}
		sendBestEffort(*player, won ? MSG_WIN : MSG_LOSE);
	}
	return false;
}

bool Session::handleFailure(const SessionError& error, network::Connection& current) {
	Logger().Log(Logging::LogLevel::Warning, std::format("[Session] {}: {}", network::toString(error.kind), network::toString(error)));

	switch (error.kind) {
	case ErrorKind::InvalidMessage:
		m_repeatPrompt = true;
		sendBestEffort(current, line(MSG_INVALID_MESSAGE, network::toString(error)));
		return true;
	case ErrorKind::TimeoutWaitingForPlayer:
		sendBestEffort(survivorOf(error.endpoint), MSG_OPPONENT_TIMEOUT);
		return false;
	case ErrorKind::PlayerQuit:
		sendBestEffort(survivorOf(error.endpoint), MSG_OPPONENT_QUIT);
		return false;
	case ErrorKind::PeerDisconnected:
		sendBestEffort(survivorOf(error.endpoint), MSG_OPPONENT_LEFT);
		return false;
	}
	return false;
}

void Session::handleInternalError(const std::exception& ex) {
	Logger().Log(Logging::LogLevel::Error, std::format("[Session] Unexpected server error: {}", ex.what()));

	const auto notice = line(MSG_SERVER_ERROR, ex.what());
	sendBestEffort(*m_first, notice);
	sendBestEffort(*m_second, notice);
}

std::optional<SessionError> Session::broadcast(std::string_view text) {
	for (auto* player: {m_first.get(), m_second.get()}) {
		if (auto error = player->send(text)) {
			return error;
		}
	}
	return {};
}

std::optional<SessionError> Session::reject(network::Connection& player, std::string_view text) {
	m_repeatPrompt = true;
	return player.send(text);
}

void Session::sendBestEffort(network::Connection& player, std::string_view text) {
	if (const auto error = player.send(text)) {
		Logger().Log(Logging::LogLevel::Debug, std::format("[Session] Dropped notice: {}", network::toString(*error)));
	}
}

network::Connection& Session::connectionOf(const PlayerId player) {
	return player == m_first->connectionId() ? *m_first : *m_second;
}

network::Connection& Session::opponentOf(const network::Connection& player) {
	return &player == m_first.get() ? *m_second : *m_first;
}

network::Connection& Session::survivorOf(const network::Endpoint& offender) {
	return offender == m_first->remoteEndpoint() ? *m_second : *m_first;
}

void Session::closeConnections() {
	// close() only logs failures, so the second close always runs.
	m_first->close();
	m_second->close();
}

} // namespace noughts::server
