#include "network/nwEvents.hpp"
#include "network/frameCodec.hpp"

#include <charconv>
#include <format>
#include <vector>

namespace ttt::network {

static constexpr std::string_view CLIENT_MOVE = "MOVE";

static constexpr std::string_view SERVER_WIN  = "WIN";
static constexpr std::string_view SERVER_DRAW = "DRAW";

static constexpr char SEPARATOR = '|';

static std::vector<std::string_view> split(std::string_view text, char separator) {
	std::vector<std::string_view> tokens;
	std::size_t start = 0;
	while (true) {
		const auto end = text.find(separator, start);
		if (end == std::string_view::npos) {
			tokens.push_back(text.substr(start));
			return tokens;
		}
		tokens.push_back(text.substr(start, end - start));
		start = end + 1;
	}
}

//! Strict unsigned decimal. No sign, no whitespace, no trailing characters.
static std::optional<unsigned> parseUnsigned(std::string_view value) {
	if (value.empty()) {
		return {};
	}
	unsigned parsed      = 0;
	const auto* end      = value.data() + value.size();
	const auto [ptr, ec] = std::from_chars(value.data(), end, parsed);
	if (ec != std::errc() || ptr != end) {
		return {};
	}
	return parsed;
}

static std::optional<Player> parsePlayer(std::string_view value) {
	const auto parsed = parseUnsigned(value);
	if (parsed == 1u) {
		return Player::One;
	}
	if (parsed == 2u) {
		return Player::Two;
	}
	return {};
}

static std::string toMessage(const ClientMove& e) {
	return std::format("{}{}{}{}{}{}{}", CLIENT_MOVE, SEPARATOR, static_cast<int>(e.player), SEPARATOR, e.c.x, SEPARATOR, e.c.y);
}

std::string toMessage(const ClientEvent& event) {
	return std::visit([&](auto&& ev) { return toMessage(ev); }, event);
}

std::optional<ClientEvent> fromClientMessage(std::string_view message) {
	// Expect "MOVE|player|x|y"
	const auto tokens = split(message, SEPARATOR);
	if (tokens.size() != 4 || tokens[0] != CLIENT_MOVE) {
		return {};
	}

	const auto player = parsePlayer(tokens[1]);
	const auto x      = parseUnsigned(tokens[2]);
	const auto y      = parseUnsigned(tokens[3]);
	if (!player || !x || !y) {
		return {};
	}

	return ClientMove{.player = *player, .c = {*x, *y}};
}

static std::string toMessage(const ServerStateUpdate& e) {
	return serialize(e.state);
}
static std::string toMessage(const ServerWin& e) {
	return std::format("{}{}{}", SERVER_WIN, SEPARATOR, static_cast<int>(e.player));
}
static std::string toMessage(const ServerDraw&) {
	return std::string{SERVER_DRAW};
}

std::string toMessage(const ServerEvent& event) {
	return std::visit([&](auto&& ev) { return toMessage(ev); }, event);
}

std::optional<ServerEvent> fromServerMessage(std::string_view message) {
	if (message == SERVER_DRAW) {
		return ServerDraw{};
	}

	const auto tokens = split(message, SEPARATOR);
	if (tokens.size() == 2 && tokens[0] == SERVER_WIN) {
		if (const auto player = parsePlayer(tokens[1])) {
			return ServerWin{.player = *player};
		}
		return {};
	}

	if (const auto state = deserialize(message)) {
		return ServerStateUpdate{.state = *state};
	}

	// Invalid
	return {};
}

Message toPayload(const ClientEvent& event) {
	return encodeFrame(toMessage(event));
}

Message toPayload(const ServerEvent& event) {
	return encodeFrame(toMessage(event));
}

std::optional<ClientEvent> clientEventFromPayload(const Message& payload) {
	const auto text = decodeFrame(payload);
	if (!text) {
		return {};
	}
	return fromClientMessage(*text);
}

std::optional<ServerEvent> serverEventFromPayload(const Message& payload) {
	const auto text = decodeFrame(payload);
	if (!text) {
		return {};
	}
	return fromServerMessage(*text);
}

} // namespace ttt::network
