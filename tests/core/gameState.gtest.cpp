#include "core/gameState.hpp"

#include <gtest/gtest.h>

#include <string>

namespace ttt::gtest {

TEST(GameState, SerializeInitial) {
	EXPECT_EQ(serialize(GameState{}), "0,0,0;0,0,0;0,0,0|1|True");
}

TEST(GameState, SerializeIsRowMajor) {
	GameState state;
	state.board.setAt({0u, 2u}, Board::Value::PlayerOne);
	state.board.setAt({2u, 0u}, Board::Value::PlayerTwo);
	state.currentPlayer = Player::Two;
	state.active        = false;

	EXPECT_EQ(serialize(state), "0,0,1;0,0,0;2,0,0|2|False");
}

TEST(GameState, SerializeIsDeterministic) {
	GameState state;
	state.board.setAt({1u, 1u}, Board::Value::PlayerOne);
	const auto first = serialize(state);
	EXPECT_EQ(serialize(state), first);

	GameState copy = state;
	EXPECT_EQ(serialize(copy), first);
}

TEST(GameState, Deserialize) {
	const auto state = deserialize("1,1,1;2,2,0;0,0,0|1|False");
	ASSERT_TRUE(state.has_value());
	EXPECT_EQ(state->board.getAt({0u, 0u}), Board::Value::PlayerOne);
	EXPECT_EQ(state->board.getAt({0u, 2u}), Board::Value::PlayerOne);
	EXPECT_EQ(state->board.getAt({1u, 1u}), Board::Value::PlayerTwo);
	EXPECT_EQ(state->board.getAt({1u, 2u}), Board::Value::Empty);
	EXPECT_EQ(state->currentPlayer, Player::One);
	EXPECT_FALSE(state->active);
	EXPECT_EQ(serialize(*state), "1,1,1;2,2,0;0,0,0|1|False");
}

TEST(GameState, DeserializeRejectsInvalid) {
	EXPECT_FALSE(deserialize("").has_value());
	EXPECT_FALSE(deserialize("0,0,0;0,0,0;0,0,0").has_value());
	EXPECT_FALSE(deserialize("0,0,0;0,0,0;0,0,0|1").has_value());
	EXPECT_FALSE(deserialize("0,0,0;0,0,0;0,0,0|3|True").has_value());
	EXPECT_FALSE(deserialize("0,0,0;0,0,0;0,0,0|1|true").has_value());
	EXPECT_FALSE(deserialize("0,0,0;0,0,0;0,0,0|1|True ").has_value());
	EXPECT_FALSE(deserialize("0,0,3;0,0,0;0,0,0|1|True").has_value());
	EXPECT_FALSE(deserialize("0;0,0,0,0,0;0,0,0|1|True").has_value());
	EXPECT_FALSE(deserialize("0,0,0;0,0,0;0,0|1|True").has_value());
	EXPECT_FALSE(deserialize("WIN|1").has_value());
}

} // namespace ttt::gtest
