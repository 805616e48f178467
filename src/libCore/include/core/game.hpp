#pragma once

#include "core/board.hpp"
#include "core/gameState.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>

namespace ttt {

//! Result of a single move attempt.
enum class MoveResult {
	Rejected,  //!< Nothing changed.
	Continued, //!< Stone placed, other player moves next.
	Won,       //!< Stone placed and completed a line. Game is over.
	Drawn      //!< Stone placed on the last free field without a line. Game is over.
};

enum class GameStatus { Active, PlayerOneWin, PlayerTwoWin, Draw };

//! The authoritative game. Owns the only board.
//! \note Not thread safe. Exactly one thread applies moves.
class Game {
public:
	//! Empty board, player one to move, game active.
	Game();

	//! Validate and apply a move of player at c.
	//! Rejected without side effect if the game is over, c is off the board, the field is taken or it's not the player's turn.
	MoveResult applyMove(Player player, Coord c);

	void reset(); //!< Back to the initial state.

	const GameState& state() const; //!< Full state for broadcasting.
	const Board& board() const;     //!< Get board data.
	Player currentPlayer() const;   //!< Returns the player allowed to move.
	bool isActive() const;          //!< Return if the game accepts moves.

	GameStatus status() const;            //!< Active, or how the game ended.
	std::optional<Player> winner() const; //!< Set once a player completed a line.

	std::string serialize() const; //!< Canonical snapshot of the state.

private:
	GameState m_state{};
	std::optional<Player> m_winner{};
};

//! True if player owns all three fields of any row, column or diagonal.
bool hasCompletedLine(const Board& board, Player player);

} // namespace ttt
