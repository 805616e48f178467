#include "core/game.hpp"

#include <gtest/gtest.h>

#include <array>
#include <vector>

namespace ttt::gtest {

TEST(Game, InitialState) {
	Game game;
	EXPECT_TRUE(game.isActive());
	EXPECT_EQ(game.currentPlayer(), Player::One);
	EXPECT_EQ(game.status(), GameStatus::Active);
	EXPECT_FALSE(game.winner().has_value());
	EXPECT_EQ(game.serialize(), "0,0,0;0,0,0;0,0,0|1|True");
}

TEST(Game, TurnsAlternate) {
	Game game;
	EXPECT_EQ(game.applyMove(Player::One, {0u, 0u}), MoveResult::Continued);
	EXPECT_EQ(game.currentPlayer(), Player::Two);

	// Same player twice in a row is never accepted.
	EXPECT_EQ(game.applyMove(Player::One, {1u, 1u}), MoveResult::Rejected);
	EXPECT_EQ(game.currentPlayer(), Player::Two);
	EXPECT_TRUE(game.board().isFree({1u, 1u}));

	EXPECT_EQ(game.applyMove(Player::Two, {1u, 1u}), MoveResult::Continued);
	EXPECT_EQ(game.currentPlayer(), Player::One);
	EXPECT_EQ(game.applyMove(Player::Two, {2u, 2u}), MoveResult::Rejected);
}

TEST(Game, OccupiedFieldRejected) {
	Game game;
	ASSERT_EQ(game.applyMove(Player::One, {0u, 2u}), MoveResult::Continued);
	const auto before = game.state();

	EXPECT_EQ(game.applyMove(Player::Two, {0u, 2u}), MoveResult::Rejected);
	EXPECT_EQ(game.state(), before);
	EXPECT_EQ(game.board().getAt({0u, 2u}), Board::Value::PlayerOne);
}

TEST(Game, OutOfRangeRejected) {
	Game game;
	const auto before = game.state();

	EXPECT_EQ(game.applyMove(Player::One, {3u, 0u}), MoveResult::Rejected);
	EXPECT_EQ(game.applyMove(Player::One, {0u, 3u}), MoveResult::Rejected);
	EXPECT_EQ(game.applyMove(Player::One, {9u, 0u}), MoveResult::Rejected);
	EXPECT_EQ(game.state(), before);
}

TEST(Game, PreconditionOrder) {
	// Off board is rejected even for the wrong player, nothing is read out of range.
	Game game;
	EXPECT_EQ(game.applyMove(Player::Two, {5u, 5u}), MoveResult::Rejected);
	EXPECT_EQ(game.currentPlayer(), Player::One);
}

// Player one completes the given line. Player two fills fields that are not part of it.
TEST(Game, AllWinLines) {
	const std::array<std::array<Coord, 3>, 8> lines{{
	        {{{0u, 0u}, {0u, 1u}, {0u, 2u}}},
	        {{{1u, 0u}, {1u, 1u}, {1u, 2u}}},
	        {{{2u, 0u}, {2u, 1u}, {2u, 2u}}},
	        {{{0u, 0u}, {1u, 0u}, {2u, 0u}}},
	        {{{0u, 1u}, {1u, 1u}, {2u, 1u}}},
	        {{{0u, 2u}, {1u, 2u}, {2u, 2u}}},
	        {{{0u, 0u}, {1u, 1u}, {2u, 2u}}},
	        {{{0u, 2u}, {1u, 1u}, {2u, 0u}}},
	}};

	for (const auto& line: lines) {
		Game game;

		// Two fields of player two which are not on the line and do not form a line of their own.
		std::vector<Coord> others;
		for (Id x = 0; x != BOARD_SIZE && others.size() != 2; ++x) {
			for (Id y = 0; y != BOARD_SIZE && others.size() != 2; ++y) {
				bool onLine = false;
				for (const auto c: line) {
					onLine = onLine || (c.x == x && c.y == y);
				}
				if (!onLine) {
					others.push_back({x, y});
				}
			}
		}
		ASSERT_EQ(others.size(), 2u);

		EXPECT_EQ(game.applyMove(Player::One, line[0]), MoveResult::Continued);
		EXPECT_EQ(game.applyMove(Player::Two, others[0]), MoveResult::Continued);
		EXPECT_EQ(game.applyMove(Player::One, line[1]), MoveResult::Continued);
		EXPECT_EQ(game.applyMove(Player::Two, others[1]), MoveResult::Continued);
		EXPECT_EQ(game.applyMove(Player::One, line[2]), MoveResult::Won);

		EXPECT_FALSE(game.isActive());
		EXPECT_EQ(game.winner(), Player::One);
		EXPECT_EQ(game.status(), GameStatus::PlayerOneWin);
		EXPECT_TRUE(hasCompletedLine(game.board(), Player::One));
		EXPECT_FALSE(hasCompletedLine(game.board(), Player::Two));
	}
}

TEST(Game, PlayerTwoWins) {
	Game game;
	EXPECT_EQ(game.applyMove(Player::One, {0u, 0u}), MoveResult::Continued);
	EXPECT_EQ(game.applyMove(Player::Two, {2u, 0u}), MoveResult::Continued);
	EXPECT_EQ(game.applyMove(Player::One, {0u, 1u}), MoveResult::Continued);
	EXPECT_EQ(game.applyMove(Player::Two, {1u, 1u}), MoveResult::Continued);
	EXPECT_EQ(game.applyMove(Player::One, {2u, 2u}), MoveResult::Continued);
	EXPECT_EQ(game.applyMove(Player::Two, {0u, 2u}), MoveResult::Won);

	EXPECT_EQ(game.winner(), Player::Two);
	EXPECT_EQ(game.status(), GameStatus::PlayerTwoWin);
	EXPECT_EQ(game.serialize(), "1,1,2;0,2,0;2,0,1|2|False");
}

TEST(Game, DrawOnlyOnLastField) {
	// 1 2 1
	// 1 2 2
	// 2 1 1
	const std::array<Coord, 9> moves{{{0u, 0u}, {0u, 1u}, {0u, 2u}, {1u, 1u}, {1u, 0u}, {2u, 0u}, {2u, 1u}, {1u, 2u}, {2u, 2u}}};

	Game game;
	auto player = Player::One;
	for (std::size_t i = 0; i + 1 < moves.size(); ++i) {
		EXPECT_EQ(game.applyMove(player, moves[i]), MoveResult::Continued) << "move " << i;
		EXPECT_TRUE(game.isActive());
		player = opponent(player);
	}

	EXPECT_EQ(game.applyMove(player, moves.back()), MoveResult::Drawn);
	EXPECT_FALSE(game.isActive());
	EXPECT_EQ(game.status(), GameStatus::Draw);
	EXPECT_FALSE(game.winner().has_value());
	EXPECT_TRUE(game.board().isFull());
	EXPECT_EQ(game.serialize(), "1,2,1;1,2,2;2,1,1|1|False");
}

TEST(Game, WinOnLastFieldIsNotDraw) {
	// Last free field completes a line for player one.
	const std::array<Coord, 9> moves{{{0u, 0u}, {0u, 1u}, {0u, 2u}, {1u, 0u}, {1u, 1u}, {2u, 2u}, {1u, 2u}, {2u, 1u}, {2u, 0u}}};

	Game game;
	auto player = Player::One;
	for (std::size_t i = 0; i + 1 < moves.size(); ++i) {
		ASSERT_EQ(game.applyMove(player, moves[i]), MoveResult::Continued) << "move " << i;
		player = opponent(player);
	}
	EXPECT_EQ(game.applyMove(player, moves.back()), MoveResult::Won);
	EXPECT_EQ(game.status(), GameStatus::PlayerOneWin);
}

TEST(Game, TerminalStateIsAbsorbing) {
	Game game;
	game.applyMove(Player::One, {0u, 0u});
	game.applyMove(Player::Two, {1u, 0u});
	game.applyMove(Player::One, {0u, 1u});
	game.applyMove(Player::Two, {1u, 1u});
	ASSERT_EQ(game.applyMove(Player::One, {0u, 2u}), MoveResult::Won);

	const auto before = game.state();
	EXPECT_EQ(game.applyMove(Player::Two, {2u, 2u}), MoveResult::Rejected);
	EXPECT_EQ(game.applyMove(Player::One, {2u, 2u}), MoveResult::Rejected);
	EXPECT_EQ(game.state(), before);
	EXPECT_EQ(game.serialize(), "1,1,1;2,2,0;0,0,0|1|False");
}

TEST(Game, Reset) {
	Game game;
	game.applyMove(Player::One, {0u, 0u});
	game.applyMove(Player::Two, {1u, 0u});
	game.applyMove(Player::One, {0u, 1u});
	game.applyMove(Player::Two, {1u, 1u});
	ASSERT_EQ(game.applyMove(Player::One, {0u, 2u}), MoveResult::Won);

	game.reset();
	EXPECT_EQ(game.state(), GameState{});
	EXPECT_EQ(game.status(), GameStatus::Active);
	EXPECT_FALSE(game.winner().has_value());
	EXPECT_EQ(game.applyMove(Player::One, {0u, 0u}), MoveResult::Continued);
}

} // namespace ttt::gtest
