#pragma once

#include "core/types.hpp"

#include <array>

namespace ttt {

//! Fixed 3x3 grid. Row major: index = x * BOARD_SIZE + y.
class Board {
public:
	//! Possible ownership values of fields on the board.
	enum class Value { Empty = 0, PlayerOne = static_cast<int>(Player::One), PlayerTwo = static_cast<int>(Player::Two) };

public:
	Board();

	static constexpr std::size_t size() {
		return BOARD_SIZE;
	}
	static bool isOnBoard(Coord c); //!< True if (x,y) \in [0, size-1].

	void setAt(Coord c, Value value); //!< Set at given coordinate. Coordinate must be on the board.
	Value getAt(Coord c) const;       //!< Get value at given coordinate. Coordinate must be on the board.
	bool isFree(Coord c) const;       //!< Returns whether a certain board coordinate is free or occupied.
	bool isFull() const;              //!< No empty field left.
	void clear();                     //!< Reset every field to empty.

	bool operator==(const Board&) const = default;

private:
	std::array<Value, BOARD_SIZE * BOARD_SIZE> m_fields{}; //!< Board values.
};

//! Returns the Board::Value enum value of input player.
inline constexpr Board::Value toBoardValue(Player player) {
	return player == Player::Two ? Board::Value::PlayerTwo : Board::Value::PlayerOne;
}

} // namespace ttt
