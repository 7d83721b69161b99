#pragma once

#include "core/types.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <string>

namespace noughts {

//! 3x3 tic-tac-toe board.
//! \note Cells are indexed row by row from the top left: 0 1 2 / 3 4 5 / 6 7 8.
class Board {
public:
	static constexpr std::size_t SIZE  = 3u;
	static constexpr std::size_t CELLS = SIZE * SIZE;

	//! Possible ownership values of cells on the board.
	enum class Value { Empty = 0, X = static_cast<int>(Symbol::X), O = static_cast<int>(Symbol::O) };

public:
	Board();

	void setAt(std::size_t cell, Value value); //!< Set at given cell \in [0, CELLS-1]
	Value getAt(std::size_t cell) const;       //!< Get value at given cell \in [0, CELLS-1]
	bool isFree(std::size_t cell) const;       //!< Returns whether a cell is free or occupied.
	bool isFull() const;                       //!< True when no cell is free.

	//! Returns the symbol owning a complete row, column or diagonal.
	std::optional<Symbol> lineOwner() const;

	//! Text rendering. Empty cells show their index so players know what to send.
	std::string render() const;

private:
	std::array<Value, CELLS> m_cells{}; //!< Board values.
};

//! Returns the Board::Value enum value of input symbol.
inline constexpr Board::Value toBoardValue(Symbol symbol) {
	return symbol == Symbol::X ? Board::Value::X : Board::Value::O;
}

} // namespace noughts
