#pragma once

#include <cstdint>

namespace noughts {

using PlayerId = std::uint64_t; //!< Identifies a player towards the game. The server uses the connection id.

enum class Symbol { X = 1, O = 2 };

//! Result of the game so far.
enum class Winner { None = 0, X = static_cast<int>(Symbol::X), O = static_cast<int>(Symbol::O), Draw };

//! Returns the Winner enum value of input symbol.
inline constexpr Winner toWinner(Symbol symbol) {
	return symbol == Symbol::X ? Winner::X : Winner::O;
}

inline constexpr char toChar(Symbol symbol) {
	return symbol == Symbol::X ? 'X' : 'O';
}

} // namespace noughts
