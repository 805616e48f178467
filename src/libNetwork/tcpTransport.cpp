#include "network/tcpTransport.hpp"

#include "Logging.hpp"
#include "connection.hpp"

#include <asio.hpp>
#include <asio/ip/tcp.hpp>

#include <atomic>
#include <deque>
#include <format>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace ttt::network {

class TcpTransport::Implementation {
public:
	explicit Implementation(std::uint16_t port);

	bool listen();
	void close();

	void poll();
	std::optional<ConnectionId> accept();
	std::optional<TransportEvent> receive(ConnectionId id);

	bool send(ConnectionId id, const Message& payload);
	bool isLive(ConnectionId id) const;
	void reject(ConnectionId id);

	std::uint16_t port() const;

private:
	void doAccept();                                                                //!< Start async accept loop.
	bool createConnection(asio::ip::tcp::socket socket, ConnectionId connectionId); //!< Create, register and start a new connection.

	// Run on the IO thread.
	void onMessage(ConnectionId id, const Message& payload);
	void onDisconnect(ConnectionId id);

private:
	std::uint16_t m_requestedPort; //!< Port passed by the user. 0 lets the OS choose.
	std::uint16_t m_port;          //!< Bound port while listening.
	asio::io_context m_ioContext{};
	asio::ip::tcp::acceptor m_acceptor;
	std::optional<asio::executor_work_guard<asio::io_context::executor_type>> m_workGuard;
	std::optional<bool> m_listenResult{}; //!< Set by the first listen call after construction or close.

	std::thread m_ioThread;             //!< IO context thread.
	std::atomic<bool> m_running{false}; //!< IO running.
	ConnectionId m_nextConnectionId{1}; //!< Only touched on the IO thread.

	// Shared with the IO thread.
	std::unordered_map<ConnectionId, std::shared_ptr<Connection>> m_connections; //!< Open sockets.
	std::vector<ConnectionId> m_pendingAccepts;                                  //!< Accepted since the last poll.
	std::vector<std::pair<ConnectionId, TransportEvent>> m_pendingEvents;        //!< Received since the last poll, in arrival order.
	mutable std::mutex m_mutex;                                                  //!< Guards the members above.

	// Server thread only.
	std::deque<ConnectionId> m_readyAccepts;
	std::unordered_map<ConnectionId, std::deque<TransportEvent>> m_readyEvents;
	std::unordered_set<ConnectionId> m_live;
};

TcpTransport::Implementation::Implementation(std::uint16_t port) : m_requestedPort(port), m_port(port), m_acceptor(m_ioContext) {
}

bool TcpTransport::Implementation::listen() {
	if (m_listenResult) {
		return *m_listenResult;
	}
	m_listenResult = false;

	auto logger = Logger();

	// Do a manual open/bind/listen so we can stay in error_code land and avoid throws.
	asio::error_code ec;
	m_acceptor.open(asio::ip::tcp::v4(), ec);
	if (!ec) {
		m_acceptor.set_option(asio::ip::tcp::acceptor::reuse_address(true), ec);
	}
	if (!ec) {
		m_acceptor.bind(asio::ip::tcp::endpoint(asio::ip::tcp::v4(), m_requestedPort), ec);
	}
	if (!ec) {
		m_acceptor.listen(asio::socket_base::max_listen_connections, ec);
	}
	if (ec) {
		logger.Log(Logging::LogLevel::Error, std::format("[TcpTransport] Failed to bind to port {}: {}.", m_requestedPort, ec.message()));
		asio::error_code closeEc;
		m_acceptor.close(closeEc);
		return false;
	}

	m_port = m_acceptor.local_endpoint(ec).port();
	logger.Log(Logging::LogLevel::Info, std::format("[TcpTransport] Listening on port {}.", m_port));

	m_running = true;
	m_workGuard.emplace(asio::make_work_guard(m_ioContext));
	doAccept();
	m_ioThread = std::thread([this]() { m_ioContext.run(); });

	m_listenResult = true;
	return true;
}

void TcpTransport::Implementation::close() {
	// Next listen() binds again.
	m_listenResult.reset();
	if (!m_running.exchange(false)) {
		return;
	}

	asio::error_code ec;
	m_acceptor.cancel(ec);
	m_acceptor.close(ec);

	std::unordered_map<ConnectionId, std::shared_ptr<Connection>> connections;
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		connections.swap(m_connections);
		m_pendingAccepts.clear();
		m_pendingEvents.clear();
	}
	for (auto& [id, connection]: connections) {
		connection->stop();
	}

	// Drain the aborted handlers, then make the context reusable.
	if (m_workGuard) {
		m_workGuard->reset();
		m_workGuard.reset();
	}
	if (m_ioThread.joinable()) {
		m_ioThread.join();
	}
	m_ioContext.restart();
	m_port = m_requestedPort;

	m_readyAccepts.clear();
	m_readyEvents.clear();
	m_live.clear();
}

void TcpTransport::Implementation::poll() {
	std::vector<ConnectionId> accepts;
	std::vector<std::pair<ConnectionId, TransportEvent>> events;
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		accepts.swap(m_pendingAccepts);
		events.swap(m_pendingEvents);
	}

	for (const auto id: accepts) {
		m_readyAccepts.push_back(id);
		m_live.insert(id);
	}
	for (auto& [id, event]: events) {
		if (m_live.contains(id)) {
			m_readyEvents[id].push_back(std::move(event));
		}
	}
}

std::optional<ConnectionId> TcpTransport::Implementation::accept() {
	if (m_readyAccepts.empty()) {
		return {};
	}
	const auto id = m_readyAccepts.front();
	m_readyAccepts.pop_front();
	return id;
}

std::optional<TransportEvent> TcpTransport::Implementation::receive(ConnectionId id) {
	const auto it = m_readyEvents.find(id);
	if (it == m_readyEvents.end()) {
		return {};
	}

	auto event = std::move(it->second.front());
	it->second.pop_front();
	if (event.type == TransportEventType::Disconnect) {
		// Nothing can follow a disconnect.
		m_readyEvents.erase(it);
		m_live.erase(id);
	} else if (it->second.empty()) {
		m_readyEvents.erase(it);
	}
	return event;
}

bool TcpTransport::Implementation::send(ConnectionId id, const Message& payload) {
	if (payload.size() > MAX_PAYLOAD_BYTES) {
		return false;
	}

	std::lock_guard<std::mutex> lock(m_mutex);

	const auto it = m_connections.find(id);
	if (it == m_connections.end()) {
		return false;
	}
	it->second->send(payload);
	return true;
}

bool TcpTransport::Implementation::isLive(ConnectionId id) const {
	return m_live.contains(id);
}

void TcpTransport::Implementation::reject(ConnectionId id) {
	std::shared_ptr<Connection> connection;
	{
		std::lock_guard<std::mutex> lock(m_mutex);

		const auto it = m_connections.find(id);
		if (it != m_connections.end()) {
			connection = it->second;
			m_connections.erase(it);
		}
	}
	if (connection) {
		connection->stop();
	}

	m_readyEvents.erase(id);
	m_live.erase(id);
}

std::uint16_t TcpTransport::Implementation::port() const {
	return m_port;
}

void TcpTransport::Implementation::doAccept() {
	m_acceptor.async_accept([this](asio::error_code ec, asio::ip::tcp::socket socket) {
		if (!m_running) {
			return;
		}
		if (!ec) {
			const auto connectionId = m_nextConnectionId++;
			if (m_nextConnectionId == 0) {
				m_nextConnectionId = 1;
			}

			createConnection(std::move(socket), connectionId);
		} else if (ec != asio::error::operation_aborted) {
			auto logger = Logger();
			logger.Log(Logging::LogLevel::Warning, std::format("[TcpTransport] Accept failed: {}.", ec.message()));
		}

		if (m_running) {
			doAccept();
		}
	});
}

bool TcpTransport::Implementation::createConnection(asio::ip::tcp::socket socket, ConnectionId connectionId) {
	Connection::Callbacks callbacks;
	callbacks.onMessage    = [this](Connection& connection, const Message& message) { onMessage(connection.connectionId(), message); };
	callbacks.onDisconnect = [this](Connection& connection) { onDisconnect(connection.connectionId()); };

	// Checked under the lock so close() either sees and stops the connection or it is never started.
	std::lock_guard<std::mutex> lock(m_mutex);
	if (!m_running || m_connections.contains(connectionId)) {
		return false;
	}
	auto connection = std::make_shared<Connection>(std::move(socket), connectionId, std::move(callbacks));
	m_connections.emplace(connectionId, connection);
	m_pendingAccepts.push_back(connectionId);
	connection->start();
	return true;
}

void TcpTransport::Implementation::onMessage(ConnectionId id, const Message& payload) {
	std::lock_guard<std::mutex> lock(m_mutex);
	if (m_connections.contains(id)) {
		m_pendingEvents.emplace_back(id, TransportEvent{.type = TransportEventType::Data, .payload = payload});
	}
}

void TcpTransport::Implementation::onDisconnect(ConnectionId id) {
	std::lock_guard<std::mutex> lock(m_mutex);
	if (m_connections.erase(id) != 0) {
		m_pendingEvents.emplace_back(id, TransportEvent{.type = TransportEventType::Disconnect});
	}
}


TcpTransport::TcpTransport(std::uint16_t port) : m_pimpl(std::make_unique<Implementation>(port)) {
}

TcpTransport::~TcpTransport() {
	close();
}

bool TcpTransport::listen() {
	return m_pimpl->listen();
}

void TcpTransport::close() {
	m_pimpl->close();
}

void TcpTransport::poll() {
	m_pimpl->poll();
}

std::optional<ConnectionId> TcpTransport::accept() {
	return m_pimpl->accept();
}

std::optional<TransportEvent> TcpTransport::receive(ConnectionId id) {
	return m_pimpl->receive(id);
}

bool TcpTransport::send(ConnectionId id, const Message& payload) {
	return m_pimpl->send(id, payload);
}

bool TcpTransport::isLive(ConnectionId id) const {
	return m_pimpl->isLive(id);
}

void TcpTransport::reject(ConnectionId id) {
	m_pimpl->reject(id);
}

std::uint16_t TcpTransport::port() const {
	return m_pimpl->port();
}

} // namespace ttt::network
