#include "core/board.hpp"

#include <algorithm>
#include <cassert>
#include <format>

namespace noughts {

// Rows, columns, diagonals.
static constexpr std::array<std::array<std::size_t, 3>, 8> LINES{{
        {0u, 1u, 2u},
        {3u, 4u, 5u},
        {6u, 7u, 8u},
        {0u, 3u, 6u},
        {1u, 4u, 7u},
        {2u, 5u, 8u},
        {0u, 4u, 8u},
        {2u, 4u, 6u},
}};

Board::Board() {
	m_cells.fill(Value::Empty);
}

void Board::setAt(const std::size_t cell, Value value) {
	assert(value != Value::Empty);
	assert(cell < CELLS); // Game checks the range before setting

	m_cells[cell] = value;
}

Board::Value Board::getAt(const std::size_t cell) const {
	assert(cell < CELLS);

	return m_cells[cell];
}

bool Board::isFree(const std::size_t cell) const {
	return getAt(cell) == Value::Empty;
}

bool Board::isFull() const {
	return std::none_of(m_cells.begin(), m_cells.end(), [](Value v) { return v == Value::Empty; });
}

std::optional<Symbol> Board::lineOwner() const {
	for (const auto& line: LINES) {
		const auto first = m_cells[line[0]];
		if (first != Value::Empty && first == m_cells[line[1]] && first == m_cells[line[2]]) {
			return first == Value::X ? Symbol::X : Symbol::O;
		}
	}
	return {};
}

std::string Board::render() const {
	const auto cellText = [this](std::size_t cell) -> char {
		switch (m_cells[cell]) {
		case Value::X:
			return 'X';
		case Value::O:
			return 'O';
		case Value::Empty:
			break;
		}
		return static_cast<char>('0' + cell);
	};

	std::string text;
	for (std::size_t row = 0; row != SIZE; ++row) {
		if (row != 0) {
			text += "\n---+---+---\n";
		}
		const auto start = row * SIZE;
		text += std::format(" {} | {} | {} ", cellText(start), cellText(start + 1), cellText(start + 2));
	}
	return text;
}

} // namespace noughts
