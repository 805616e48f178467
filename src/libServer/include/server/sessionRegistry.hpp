#pragma once

#include "core/types.hpp"
#include "network/protocol.hpp"
#include "network/transport.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <vector>

namespace ttt::server {

//! The role of a session in the game. Assigned by admission order.
enum class Seat : std::uint8_t {
	PlayerOne = 1, //!< First admitted while free.
	PlayerTwo = 2, //!< Second admitted while free.
	Observer  = 3  //!< Everyone else. Still gets every broadcast.
};

inline constexpr bool isPlayer(Seat seat) {
	return seat == Seat::PlayerOne || seat == Seat::PlayerTwo;
}

inline constexpr Player toPlayer(Seat seat) {
	return seat == Seat::PlayerTwo ? Player::Two : Player::One;
}

struct SessionContext {
	network::ConnectionId connectionId; //!< Identify connection on network layer.
	Seat seat;                          //!< Role in the game.
};

//! Live sessions of the server. Order of entries is irrelevant.
//! \note Used from the server thread only.
class SessionRegistry {
public:
	explicit SessionRegistry(std::size_t maxConnections);

	//! Remove every session the transport no longer reports live. Returns the number removed.
	std::size_t prune(const network::ITransport& transport);

	//! Register a new connection. Returns false if it is already known or the registry is full.
	bool admit(network::ConnectionId connectionId);

	//! Send payload to every live session. Failures are skipped. Returns the number of successful sends.
	std::size_t broadcast(network::ITransport& transport, const network::Message& payload) const;

	void forEachSession(const std::function<void(const SessionContext&)>& visitor) const;

	bool contains(network::ConnectionId connectionId) const;
	std::optional<Seat> getSeat(network::ConnectionId connectionId) const; //!< Empty if unknown.

	std::size_t size() const;
	std::size_t capacity() const; //!< Configured maximum.

private:
	Seat freeSeat() const; //!< First free player seat, or Observer.

private:
	std::size_t m_maxConnections;
	std::vector<SessionContext> m_sessions;
};

} // namespace ttt::server
