#pragma once

#include "core/gameState.hpp"
#include "core/types.hpp"
#include "network/protocol.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace ttt::network {

// Client Network Events (client -> server)
struct ClientMove {
	Player player; //!< Player the client moves for.
	Coord c;       //!< Target field. Not range checked here, the game rejects off-board moves.
};

// Server Events (server -> client)
struct ServerStateUpdate {
	GameState state; //!< Full snapshot after an applied move.
};
struct ServerWin {
	Player player; //!< Player who completed a line.
};
struct ServerDraw {};

using ClientEvent = std::variant<ClientMove>;
using ServerEvent = std::variant<ServerStateUpdate, ServerWin, ServerDraw>;

// Serialize typed events to command strings.
std::string toMessage(const ClientEvent& event);
std::string toMessage(const ServerEvent& event);

// Parse command strings into typed events. Returns empty on invalid input.
std::optional<ClientEvent> fromClientMessage(std::string_view message);
std::optional<ServerEvent> fromServerMessage(std::string_view message);

// Typed events to and from a full transport payload (command string inside an application frame).
Message toPayload(const ClientEvent& event);
Message toPayload(const ServerEvent& event);
std::optional<ClientEvent> clientEventFromPayload(const Message& payload);
std::optional<ServerEvent> serverEventFromPayload(const Message& payload);

} // namespace ttt::network
