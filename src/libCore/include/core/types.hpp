#pragma once

#include <cstddef>
#include <cstdint>

namespace ttt {

using Id = unsigned; //!< Board index used by the core library.

inline constexpr std::size_t BOARD_SIZE = 3u;

//! Coordinate pair for the board.
//! \note x selects the row, y the column.
struct Coord {
	Id x, y;
};

enum class Player { One = 1, Two = 2 };

//! Returns the opponent enum value of input player.
inline constexpr Player opponent(Player player) {
	return player == Player::One ? Player::Two : Player::One;
}

} // namespace ttt
