#include "core/game.hpp"

#include <algorithm>
#include <format>

namespace noughts {

std::string_view toString(const MoveResult result) {
	switch (result) {
	case MoveResult::Accepted:
		return "Accepted";
	case MoveResult::OutOfRange:
		return "OutOfRange";
	case MoveResult::CellOccupied:
		return "CellOccupied";
	case MoveResult::NotYourTurn:
		return "NotYourTurn";
	case MoveResult::InvalidMove:
		return "InvalidMove";
	case MoveResult::PlayerNotRecognized:
		return "PlayerNotRecognized";
	case MoveResult::GameOver:
		return "GameOver";
	}
	return "Unknown";
}

std::string describe(const MoveResult result, std::string_view move) {
	switch (result) {
	case MoveResult::Accepted:
		return std::format("Move {} accepted.", move);
	case MoveResult::OutOfRange:
		return std::format("Move {} is out of range (0-{}).", move, Board::CELLS - 1);
	case MoveResult::CellOccupied:
		return std::format("Cell {} is already occupied.", move);
	case MoveResult::NotYourTurn:
		return "It is not your turn.";
	case MoveResult::InvalidMove:
		return std::format("Move '{}' is not a cell number.", move);
	case MoveResult::PlayerNotRecognized:
		return "Player is not part of this game.";
	case MoveResult::GameOver:
		return "The game has already ended.";
	}
	return "Unknown move result.";
}

Game::Game(const PlayerId first, const PlayerId second) : m_first(first), m_second(second), m_current(first) {
}

MoveResult Game::makeMove(const PlayerId player, std::string_view move) {
	if (!isPlayer(player)) {
		return MoveResult::PlayerNotRecognized;
	}
	if (!isActive()) {
		return MoveResult::GameOver;
	}
	if (player != m_current) {
		return MoveResult::NotYourTurn;
	}
	if (move.empty() || !std::all_of(move.begin(), move.end(), [](char c) { return c >= '0' && c <= '9'; })) {
		return MoveResult::InvalidMove;
	}

	// Anything longer than one digit cannot be on the board. Avoids overflow on long inputs.
	const auto cell = move.size() == 1u ? static_cast<std::size_t>(move.front() - '0') : Board::CELLS;
	if (cell >= Board::CELLS) {
		return MoveResult::OutOfRange;
	}
	if (!m_board.isFree(cell)) {
		return MoveResult::CellOccupied;
	}

	const auto symbol = *symbolOf(player);
	m_board.setAt(cell, toBoardValue(symbol));

	if (const auto owner = m_board.lineOwner(); owner.has_value()) {
		m_winner = toWinner(*owner);
	} else if (m_board.isFull()) {
		m_winner = Winner::Draw;
	} else {
		m_current = opponentOf(player);
	}
	return MoveResult::Accepted;
}

PlayerId Game::currentPlayer() const {
	return m_current;
}

std::optional<Symbol> Game::symbolOf(const PlayerId player) const {
	if (player == m_first) {
		return Symbol::X;
	}
	if (player == m_second) {
		return Symbol::O;
	}
	return {};
}

Winner Game::winner() const {
	return m_winner;
}

bool Game::isActive() const {
	return m_winner == Winner::None;
}

const Board& Game::board() const {
	return m_board;
}

std::string Game::render() const {
	return m_board.render();
}

bool Game::isPlayer(const PlayerId player) const {
	return player == m_first || player == m_second;
}

PlayerId Game::opponentOf(const PlayerId player) const {
	return player == m_first ? m_second : m_first;
}

} // namespace noughts
