#pragma once

#include "network/protocol.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace ttt::network {

//! Minimal synchronous TCP client speaking the transport framing.
//! \note    On any network failure, send/read return false/empty and the client is considered disconnected.
//! \example Usage: connect() once, then send()/read() from a single thread.
class TcpClient {
public:
	TcpClient();
	~TcpClient();

	TcpClient(const TcpClient&)            = delete;
	TcpClient& operator=(const TcpClient&) = delete;
	TcpClient(TcpClient&&)                 = delete;
	TcpClient& operator=(TcpClient&&)      = delete;

	//! Connect to host:port. Returns false on failure or if already connected.
	bool connect(const std::string& host, std::uint16_t port = DEFAULT_PORT);
	bool isConnected() const;
	void disconnect();

	bool send(const Message& message); //!< Send a message with a size prefix header. Returns false on failure.

	//! Read a full message. Empty if disconnected, on error, or if nothing arrived within timeout.
	std::optional<Message> read(std::chrono::milliseconds timeout = std::chrono::milliseconds{2000});

private:
	class Implementation;
	std::unique_ptr<Implementation> m_pimpl; //!< Pimpl to hide asio stuff in public interfaces.
};

} // namespace ttt::network
