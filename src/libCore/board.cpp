#include "core/board.hpp"

#include <algorithm>
#include <cassert>

namespace ttt {

Board::Board() {
	clear();
}

bool Board::isOnBoard(const Coord c) {
	return c.x < BOARD_SIZE && c.y < BOARD_SIZE;
}

void Board::setAt(const Coord c, Value value) {
	assert(isOnBoard(c)); // Game checks the move before setting.

	m_fields[c.x * BOARD_SIZE + c.y] = value;
}

Board::Value Board::getAt(const Coord c) const {
	assert(isOnBoard(c));

	return m_fields[c.x * BOARD_SIZE + c.y];
}

bool Board::isFree(const Coord c) const {
	return getAt(c) == Value::Empty;
}

bool Board::isFull() const {
	return std::ranges::none_of(m_fields, [](Value value) { return value == Value::Empty; });
}

void Board::clear() {
	m_fields.fill(Value::Empty);
}

} // namespace ttt
