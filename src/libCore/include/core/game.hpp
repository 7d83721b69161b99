#pragma once

#include "core/board.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace noughts {

//! Outcome of applying a move to the game.
enum class MoveResult {
	Accepted,            //!< Move placed. Turn passed or game decided.
	OutOfRange,          //!< Cell index not in [0, 8].
	CellOccupied,        //!< Cell already taken.
	NotYourTurn,         //!< Move by the player who is not on turn.
	InvalidMove,         //!< Move token is not a number.
	PlayerNotRecognized, //!< Neither of the two players of this game.
	GameOver             //!< Game already decided.
};

//! Short name of a move result, used as the violation kind on the wire.
std::string_view toString(MoveResult result);

//! Human readable detail why the move was not applied.
std::string describe(MoveResult result, std::string_view move);

//! Tic-tac-toe rules for one pairing.
//! The first player is X and starts.
class Game {
public:
	Game(PlayerId first, PlayerId second);

	//! Validate and apply the move of player. The game is only modified on MoveResult::Accepted.
	MoveResult makeMove(PlayerId player, std::string_view move);

	PlayerId currentPlayer() const;                        //!< Returns the player on turn.
	std::optional<Symbol> symbolOf(PlayerId player) const; //!< Symbol of a player of this game.
	Winner winner() const;                                 //!< Winner so far. Winner::None while running.
	bool isActive() const;                                 //!< True until the game is decided.

	const Board& board() const; //!< Get board data for rendering.
	std::string render() const; //!< Board as text.

private:
	bool isPlayer(PlayerId player) const;
	PlayerId opponentOf(PlayerId player) const;

private:
	PlayerId m_first;  //!< Plays X.
	PlayerId m_second; //!< Plays O.
	PlayerId m_current;

	Board m_board;
	Winner m_winner{Winner::None};
};

} // namespace noughts
