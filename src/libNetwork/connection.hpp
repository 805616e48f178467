#pragma once

#include "network/protocol.hpp"

#include <asio.hpp>

#include <atomic>
#include <deque>
#include <functional>
#include <memory>

namespace ttt::network {

//! Transportation primitive. Handles read/write from a single client connection.
//! \note Internals are async and run on the transport IO thread.
//!       We use shared_from_this() so any in-flight async op keeps the Connection alive.
class Connection : public std::enable_shared_from_this<Connection> {
public:
	struct Callbacks {
		std::function<void(Connection&, const Message&)> onMessage;
		std::function<void(Connection&)> onDisconnect;
	};

	Connection(asio::ip::tcp::socket socket, ConnectionId connectionId, Callbacks callbacks);

	void start();                  //!< Start connection: begins async read loop.
	void stop();                   //!< Stop connection: closes the socket. No disconnect callback.
	void send(const Message& msg); //!< Queue message for the client. Safe to call from any thread.

	ConnectionId connectionId() const; //!< Get the identifier of this connection.

private:
	void startRead();    //!< Prime async read and dispatch messages.
	void startWrite();   //!< Prime async write for queued messages.
	void doDisconnect(); //!< Close socket and signal the parent once.

private:
	std::atomic<bool> m_running{false};           //!< Connection running.
	asio::ip::tcp::socket m_socket;               //!< Client socket.
	asio::strand<asio::any_io_executor> m_strand; //!< Serialises all handlers of this connection.

	ConnectionId m_connectionId; //!< Identifier on the transport.
	Callbacks m_callbacks;       //!< Used to signal to the parent.

	std::deque<Message> m_writeQueue;
	bool m_writeInProgress{false};
};

} // namespace ttt::network
