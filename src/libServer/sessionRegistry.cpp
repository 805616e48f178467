#include "server/sessionRegistry.hpp"

#include <algorithm>

namespace ttt::server {

SessionRegistry::SessionRegistry(std::size_t maxConnections) : m_maxConnections(maxConnections) {
	m_sessions.reserve(std::min<std::size_t>(maxConnections, 64u));
}

std::size_t SessionRegistry::prune(const network::ITransport& transport) {
	std::size_t removed = 0;

	// Swap with last and shrink. Order does not matter.
	for (std::size_t i = 0; i < m_sessions.size();) {
		if (transport.isLive(m_sessions[i].connectionId)) {
			++i;
			continue;
		}
		m_sessions[i] = m_sessions.back();
		m_sessions.pop_back();
		++removed;
	}
	return removed;
}

bool SessionRegistry::admit(network::ConnectionId connectionId) {
	if (m_sessions.size() >= m_maxConnections || contains(connectionId)) {
		return false;
	}

	m_sessions.push_back(SessionContext{.connectionId = connectionId, .seat = freeSeat()});
	return true;
}

std::size_t SessionRegistry::broadcast(network::ITransport& transport, const network::Message& payload) const {
	std::size_t sent = 0;
	for (const auto& session: m_sessions) {
		if (!transport.isLive(session.connectionId)) {
			continue;
		}
		if (transport.send(session.connectionId, payload)) {
			++sent;
		}
	}
	return sent;
}

void SessionRegistry::forEachSession(const std::function<void(const SessionContext&)>& visitor) const {
	for (const auto& session: m_sessions) {
		visitor(session);
	}
}

bool SessionRegistry::contains(network::ConnectionId connectionId) const {
	return std::ranges::any_of(m_sessions, [&](const SessionContext& session) { return session.connectionId == connectionId; });
}

std::optional<Seat> SessionRegistry::getSeat(network::ConnectionId connectionId) const {
	const auto it = std::ranges::find(m_sessions, connectionId, &SessionContext::connectionId);
	if (it == m_sessions.end()) {
		return {};
	}
	return it->seat;
}

std::size_t SessionRegistry::size() const {
	return m_sessions.size();
}

std::size_t SessionRegistry::capacity() const {
	return m_maxConnections;
}

Seat SessionRegistry::freeSeat() const {
	const auto taken = [&](Seat seat) { return std::ranges::any_of(m_sessions, [&](const SessionContext& s) { return s.seat == seat; }); };

	if (!taken(Seat::PlayerOne)) {
		return Seat::PlayerOne;
	}
	if (!taken(Seat::PlayerTwo)) {
		return Seat::PlayerTwo;
	}
	return Seat::Observer;
}

} // namespace ttt::server
