#pragma once

#include "network/protocol.hpp"

#include <optional>

namespace ttt::network {

enum class TransportEventType { Data, Disconnect };

struct TransportEvent {
	TransportEventType type{};
	Message payload{}; //!< Set for Data events.
};

//! Connection oriented, message based transport the game server is driven by.
//! \note All functions except send() are called from the server thread only.
//!       Nothing in here blocks.
class ITransport {
public:
	virtual ~ITransport() = default;

	virtual bool listen() = 0; //!< Bind and listen. Returns false if the endpoint could not be bound.
	virtual void close()  = 0; //!< Stop listening and drop all connections.

	//! Capture everything that arrived since the last call.
	//! accept() and receive() only hand out events captured here.
	virtual void poll() = 0;

	virtual std::optional<ConnectionId> accept()                    = 0; //!< Next new connection, at most one per call.
	virtual std::optional<TransportEvent> receive(ConnectionId id) = 0; //!< Next event of a connection. Empty when drained.

	virtual bool send(ConnectionId id, const Message& payload) = 0; //!< Best effort. Returns false if not handed to the connection.
	virtual bool isLive(ConnectionId id) const                 = 0; //!< False once the disconnect was received or the connection was rejected.
	virtual void reject(ConnectionId id)                       = 0; //!< Force close a connection.
};

} // namespace ttt::network
