#include "server/gameServer.hpp"

#include "Logging.hpp"
#include "network/tcpTransport.hpp"

#include <format>
#include <utility>
#include <vector>

namespace ttt::server {

GameServer::GameServer(ServerConfig config) : GameServer(config, std::make_unique<network::TcpTransport>(config.port)) {
}

GameServer::GameServer(ServerConfig config, std::unique_ptr<network::ITransport> transport)
    : m_config(config), m_transport(std::move(transport)), m_sessions(config.maxConnections) {
}

GameServer::~GameServer() {
	stop();
	shutdown();
}

bool GameServer::init() {
	if (m_initialized) {
		return true;
	}

	auto logger = Logger();
	if (!m_transport->listen()) {
		logger.Log(Logging::LogLevel::Error, std::format("[GameServer] Failed to bind to port {}. Server is not listening.", m_config.port));
		return false;
	}

	m_game.reset();
	m_initialized = true;
	logger.Log(Logging::LogLevel::Info, std::format("[GameServer] Ready. Accepting up to {} connections.", m_config.maxConnections));
	return true;
}

void GameServer::tick() {
	if (!m_initialized) {
		return;
	}

	m_transport->poll();

	const auto pruned = m_sessions.prune(*m_transport);
	if (pruned != 0) {
		auto logger = Logger();
		logger.Log(Logging::LogLevel::Debug, std::format("[GameServer] Removed {} stale session(s).", pruned));
	}

	acceptConnections();

	// Iterate a snapshot of the ids.
	std::vector<network::ConnectionId> connections;
	connections.reserve(m_sessions.size());
	m_sessions.forEachSession([&](const SessionContext& session) { connections.push_back(session.connectionId); });

	for (const auto connectionId: connections) {
		if (m_transport->isLive(connectionId)) {
			drainConnection(connectionId);
		}
	}
}

void GameServer::shutdown() {
	if (!m_initialized) {
		return;
	}
	m_initialized = false;

	m_transport->close();
	m_sessions.prune(*m_transport);

	auto logger = Logger();
	logger.Log(Logging::LogLevel::Info, "[GameServer] Shut down.");
}

bool GameServer::start() {
	if (m_isRunning.exchange(true)) {
		return true;
	}

	if (!init()) {
		m_isRunning = false;
		return false;
	}

	m_serverThread = std::thread([this] { serverLoop(); });
	return true;
}

void GameServer::stop() {
	{
		std::lock_guard<std::mutex> lock(m_stopMutex);
		if (!m_isRunning.exchange(false)) {
			return;
		}
	}
	m_stopCondition.notify_all();

	if (m_serverThread.joinable()) {
		m_serverThread.join();
	}
	shutdown();
}

const Game& GameServer::game() const {
	return m_game;
}

const SessionRegistry& GameServer::sessions() const {
	return m_sessions;
}

void GameServer::serverLoop() {
	{
		auto logger = Logger();
		logger.Log(Logging::LogLevel::Info, "[GameServer] Event loop started.");
	}

	while (m_isRunning) {
		tick();

		std::unique_lock<std::mutex> lock(m_stopMutex);
		m_stopCondition.wait_for(lock, m_config.tickInterval, [this] { return !m_isRunning; });
	}

	{
		auto logger = Logger();
		logger.Log(Logging::LogLevel::Info, "[GameServer] Event loop stopped.");
	}
}

void GameServer::acceptConnections() {
	while (const auto connectionId = m_transport->accept()) {
		auto logger = Logger();

		if (!m_sessions.admit(*connectionId)) {
			m_transport->reject(*connectionId);
			logger.Log(Logging::LogLevel::Warning, std::format("[GameServer] Rejected client '{}': {} of {} connections in use.", *connectionId, m_sessions.size(),
			                                                   m_sessions.capacity()));
			continue;
		}

		const auto seat = m_sessions.getSeat(*connectionId);
		logger.Log(Logging::LogLevel::Info, std::format("[GameServer] Accepted client '{}' with seat {}.", *connectionId, static_cast<int>(seat.value_or(Seat::Observer))));
	}
}

void GameServer::drainConnection(network::ConnectionId connectionId) {
	while (const auto event = m_transport->receive(connectionId)) {
		switch (event->type) {
		case network::TransportEventType::Data:
			processClientMessage(connectionId, event->payload);
			break;
		case network::TransportEventType::Disconnect: {
			// Session is pruned on the next tick. Broadcasts already skip it.
			auto logger = Logger();
			logger.Log(Logging::LogLevel::Info, std::format("[GameServer] Client '{}' disconnected.", connectionId));
			break;
		}
		}
	}
}

void GameServer::processClientMessage(network::ConnectionId connectionId, const network::Message& payload) {
	const auto networkEvent = network::clientEventFromPayload(payload);
	if (!networkEvent) {
		auto logger = Logger();
		logger.Log(Logging::LogLevel::Warning, std::format("[GameServer] Could not decode payload of {} bytes from client '{}'.", payload.size(), connectionId));
		return;
	}

	{
		static constexpr char LOG_MSG[] = "[GameServer] Message from client '{}': '{}'.";
		auto logger                     = Logger();
		logger.Log(Logging::LogLevel::Debug, std::format(LOG_MSG, connectionId, network::toMessage(*networkEvent)));
	}

	std::visit([&](const auto& e) { handleNetworkEvent(connectionId, e); }, *networkEvent);
}

void GameServer::handleNetworkEvent(network::ConnectionId connectionId, const network::ClientMove& event) {
	auto logger = Logger();

	if (m_config.enforceSeats) {
		const auto seat = m_sessions.getSeat(connectionId);
		if (!seat || !isPlayer(*seat) || toPlayer(*seat) != event.player) {
			logger.Log(Logging::LogLevel::Warning,
			           std::format("[GameServer] Rejecting Move: client '{}' does not hold the seat of player {}.", connectionId, static_cast<int>(event.player)));
			return;
		}
	}

	const auto result = m_game.applyMove(event.player, event.c);
	switch (result) {
	case MoveResult::Rejected:
		logger.Log(Logging::LogLevel::Warning, std::format("[GameServer] Rejecting Move of player {} at ({}, {}).", static_cast<int>(event.player), event.c.x, event.c.y));
		return;
	case MoveResult::Continued:
		logger.Log(Logging::LogLevel::Info, std::format("[GameServer] Player {} placed at ({}, {}).", static_cast<int>(event.player), event.c.x, event.c.y));
		break;
	case MoveResult::Won:
		logger.Log(Logging::LogLevel::Info, std::format("[GameServer] Player {} won.", static_cast<int>(event.player)));
		broadcast(network::ServerWin{.player = event.player});
		break;
	case MoveResult::Drawn:
		logger.Log(Logging::LogLevel::Info, "[GameServer] Game ended in a draw.");
		broadcast(network::ServerDraw{});
		break;
	}

	broadcast(network::ServerStateUpdate{.state = m_game.state()});
}

void GameServer::broadcast(const network::ServerEvent& event) {
	const auto payload = network::toPayload(event);
	const auto sent    = m_sessions.broadcast(*m_transport, payload);

	if (sent != m_sessions.size()) {
		auto logger = Logger();
		logger.Log(Logging::LogLevel::Debug, std::format("[GameServer] Broadcast reached {} of {} sessions.", sent, m_sessions.size()));
	}
}

} // namespace ttt::server
