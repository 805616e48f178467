#include "core/game.hpp"

#include <array>

namespace ttt {

using Line = std::array<Coord, BOARD_SIZE>;

// Rows, columns and both diagonals.
static constexpr std::array<Line, 8> LINES{{
        {{{0u, 0u}, {0u, 1u}, {0u, 2u}}},
        {{{1u, 0u}, {1u, 1u}, {1u, 2u}}},
        {{{2u, 0u}, {2u, 1u}, {2u, 2u}}},
        {{{0u, 0u}, {1u, 0u}, {2u, 0u}}},
        {{{0u, 1u}, {1u, 1u}, {2u, 1u}}},
        {{{0u, 2u}, {1u, 2u}, {2u, 2u}}},
        {{{0u, 0u}, {1u, 1u}, {2u, 2u}}},
        {{{0u, 2u}, {1u, 1u}, {2u, 0u}}},
}};

bool hasCompletedLine(const Board& board, Player player) {
	const auto value = toBoardValue(player);

	// Every line is checked. At most one can complete per move in a valid game.
	bool completed = false;
	for (const auto& line: LINES) {
		bool owned = true;
		for (const auto c: line) {
			owned = owned && board.getAt(c) == value;
		}
		completed = completed || owned;
	}
	return completed;
}

Game::Game() {
	reset();
}

MoveResult Game::applyMove(Player player, Coord c) {
	if (!m_state.active) {
		return MoveResult::Rejected;
	}
	if (!Board::isOnBoard(c) || !m_state.board.isFree(c)) {
		return MoveResult::Rejected;
	}
	if (player != m_state.currentPlayer) {
		return MoveResult::Rejected;
	}

	m_state.board.setAt(c, toBoardValue(player));

	// Only the player who just moved can have won.
	if (hasCompletedLine(m_state.board, player)) {
		m_state.active = false;
		m_winner       = player;
		return MoveResult::Won;
	}

	if (m_state.board.isFull()) {
		m_state.active = false;
		return MoveResult::Drawn;
	}

	m_state.currentPlayer = opponent(player);
	return MoveResult::Continued;
}

void Game::reset() {
	m_state.board.clear();
	m_state.currentPlayer = Player::One;
	m_state.active        = true;
	m_winner.reset();
}

const GameState& Game::state() const {
	return m_state;
}

const Board& Game::board() const {
	return m_state.board;
}

Player Game::currentPlayer() const {
	return m_state.currentPlayer;
}

bool Game::isActive() const {
	return m_state.active;
}

GameStatus Game::status() const {
	if (m_state.active) {
		return GameStatus::Active;
	}
	if (!m_winner) {
		return GameStatus::Draw;
	}
	return *m_winner == Player::One ? GameStatus::PlayerOneWin : GameStatus::PlayerTwoWin;
}

std::optional<Player> Game::winner() const {
	return m_winner;
}

std::string Game::serialize() const {
	return ttt::serialize(m_state);
}

} // namespace ttt
