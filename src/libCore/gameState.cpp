#include "core/gameState.hpp"

#include <format>

namespace ttt {

static constexpr std::string_view LITERAL_TRUE  = "True";
static constexpr std::string_view LITERAL_FALSE = "False";

static constexpr char ROW_SEPARATOR   = ';';
static constexpr char FIELD_SEPARATOR = ',';
static constexpr char PART_SEPARATOR  = '|';

std::string serialize(const GameState& state) {
	std::string text;
	text.reserve(32);

	for (Id x = 0; x != BOARD_SIZE; ++x) {
		for (Id y = 0; y != BOARD_SIZE; ++y) {
			text += std::to_string(static_cast<int>(state.board.getAt({x, y})));
			if (y + 1 != BOARD_SIZE) {
				text.push_back(FIELD_SEPARATOR);
			}
		}
		if (x + 1 != BOARD_SIZE) {
			text.push_back(ROW_SEPARATOR);
		}
	}

	text += std::format("{}{}{}{}", PART_SEPARATOR, static_cast<int>(state.currentPlayer), PART_SEPARATOR, state.active ? LITERAL_TRUE : LITERAL_FALSE);
	return text;
}

static std::optional<Board::Value> parseField(char c) {
	switch (c) {
	case '0':
		return Board::Value::Empty;
	case '1':
		return Board::Value::PlayerOne;
	case '2':
		return Board::Value::PlayerTwo;
	default:
		return {};
	}
}

std::optional<GameState> deserialize(std::string_view text) {
	// Board part has a fixed layout: 9 digits and 8 separators.
	static constexpr std::size_t BOARD_CHARS = BOARD_SIZE * BOARD_SIZE * 2 - 1;
	if (text.size() < BOARD_CHARS + 2 || text[BOARD_CHARS] != PART_SEPARATOR) {
		return {};
	}

	GameState state{};
	std::size_t pos = 0;
	for (Id x = 0; x != BOARD_SIZE; ++x) {
		for (Id y = 0; y != BOARD_SIZE; ++y) {
			const auto value = parseField(text[pos++]);
			if (!value) {
				return {};
			}
			if (*value != Board::Value::Empty) {
				state.board.setAt({x, y}, *value);
			}

			if (pos == BOARD_CHARS) {
				break;
			}
			const char expected = y + 1 == BOARD_SIZE ? ROW_SEPARATOR : FIELD_SEPARATOR;
			if (text[pos++] != expected) {
				return {};
			}
		}
	}

	// Remaining: "<player>|<active>"
	const auto rest = text.substr(BOARD_CHARS + 1);
	if (rest.size() < 3 || rest[1] != PART_SEPARATOR) {
		return {};
	}

	if (rest[0] == '1') {
		state.currentPlayer = Player::One;
	} else if (rest[0] == '2') {
		state.currentPlayer = Player::Two;
	} else {
		return {};
	}

	const auto active = rest.substr(2);
	if (active == LITERAL_TRUE) {
		state.active = true;
	} else if (active == LITERAL_FALSE) {
		state.active = false;
	} else {
		return {};
	}

	return state;
}

} // namespace ttt
