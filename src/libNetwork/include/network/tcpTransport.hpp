#pragma once

#include "network/protocol.hpp"
#include "network/transport.hpp"

#include <cstdint>
#include <memory>

namespace ttt::network {

//! TCP implementation of the transport. Runs an async accept loop and all socket IO on a dedicated IO thread.
//! Events from the IO thread are buffered until the server thread calls poll().
//! \example Usage: listen() once, then poll()/accept()/receive() every tick. Call close() to shut down.
class TcpTransport final : public ITransport {
public:
	explicit TcpTransport(std::uint16_t port = DEFAULT_PORT);
	~TcpTransport() override;

	TcpTransport(const TcpTransport&)            = delete;
	TcpTransport& operator=(const TcpTransport&) = delete;
	TcpTransport(TcpTransport&&)                 = delete;
	TcpTransport& operator=(TcpTransport&&)      = delete;

	bool listen() override; //!< Bind, listen and start the IO thread. Repeated calls return the first result until close().
	void close() override;  //!< Disconnect clients and stop the IO thread. Safe to call multiple times. listen() may be called again afterwards.

	void poll() override;

	std::optional<ConnectionId> accept() override;
	std::optional<TransportEvent> receive(ConnectionId id) override;

	bool send(ConnectionId id, const Message& payload) override;
	bool isLive(ConnectionId id) const override;
	void reject(ConnectionId id) override;

	std::uint16_t port() const; //!< Bound port. Differs from the constructor argument when that was 0.

private:
	class Implementation;
	std::unique_ptr<Implementation> m_pimpl; //!< Pimpl to hide asio stuff in public interfaces.
};

} // namespace ttt::network
