#pragma once

#include "core/game.hpp"
#include "network/nwEvents.hpp"
#include "network/transport.hpp"
#include "server/serverConfig.hpp"
#include "server/sessionRegistry.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace ttt::server {

//! Authoritative tic-tac-toe server.
//! - Network layer    : Talks to the transport, identifies a client through its connectionId.
//! - Application layer: Talks to the Game, identifies a player through the Player enum.
//! \note The game is only touched from the thread calling tick().
class GameServer {
public:
	explicit GameServer(ServerConfig config = {});                                      //!< Serve over TCP on config.port.
	GameServer(ServerConfig config, std::unique_ptr<network::ITransport> transport); //!< Serve over any transport.
	~GameServer();

	GameServer(const GameServer&)            = delete;
	GameServer& operator=(const GameServer&) = delete;

	bool init();     //!< Bind the transport. Returns false if the endpoint could not be bound.
	void tick();     //!< One server cycle: poll, prune, accept, drain and apply moves.
	void shutdown(); //!< Close the transport and drop all sessions.

	bool start(); //!< init() and run tick() every tickInterval on a server thread. Returns false if init failed.
	void stop();  //!< Stop the server thread and shut down. Safe to call multiple times.

	const Game& game() const;
	const SessionRegistry& sessions() const;

private:
	void serverLoop(); //!< Server thread: tick until stopped.

	void acceptConnections();                                                        //!< Admit everything the transport accepted.
	void drainConnection(network::ConnectionId connectionId);                        //!< Handle all pending events of one connection.
	void processClientMessage(network::ConnectionId connectionId, const network::Message& payload); //!< Decode and dispatch.

	// Processing of the network events that are sent in the payload.
	void handleNetworkEvent(network::ConnectionId connectionId, const network::ClientMove& event);

	void broadcast(const network::ServerEvent& event); //!< Send event to all live sessions.

private:
	ServerConfig m_config;
	std::unique_ptr<network::ITransport> m_transport; //!< Communication with clients.
	SessionRegistry m_sessions;
	Game m_game;

	bool m_initialized{false};
	std::atomic<bool> m_isRunning{false};
	std::thread m_serverThread;
	std::mutex m_stopMutex;
	std::condition_variable m_stopCondition; //!< Wakes the server thread early on stop.
};

} // namespace ttt::server
