#pragma once

#include "core/board.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace ttt {

//! Snapshot of everything the clients need to render the game.
struct GameState {
	Board board{};                     //!< Current board.
	Player currentPlayer{Player::One}; //!< Player allowed to move next.
	bool active{true};                 //!< False after a win or draw.

	bool operator==(const GameState&) const = default;
};

//! Canonical text of a state: "c,c,c;c,c,c;c,c,c|<player>|True".
//! \note Rows are separated by ';', fields by ','. Pure function of the input.
std::string serialize(const GameState& state);

//! Parse the canonical text back into a state. Returns empty on invalid input.
std::optional<GameState> deserialize(std::string_view text);

} // namespace ttt
