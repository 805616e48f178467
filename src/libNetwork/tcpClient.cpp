#include "network/tcpClient.hpp"

#include <asio.hpp>
#include <asio/connect.hpp>
#include <asio/read.hpp>
#include <asio/write.hpp>

#include <array>
#include <utility>

namespace ttt::network {

class TcpClient::Implementation {
public:
	Implementation();

	bool connect(const std::string& host, std::uint16_t port);
	void disconnect();
	bool isConnected() const;

	bool send(const Message& message);
	std::optional<Message> read(std::chrono::milliseconds timeout);

private:
	//! Run the io context until the pending read finished or the timeout elapsed.
	bool runFor(std::chrono::milliseconds timeout, const bool& done);

private:
	asio::io_context m_ioContext{};
	asio::ip::tcp::resolver m_resolver;
	asio::ip::tcp::socket m_socket;

	bool m_isConnected{false};
};

TcpClient::Implementation::Implementation() : m_resolver(m_ioContext), m_socket(m_ioContext) {
}

bool TcpClient::Implementation::connect(const std::string& host, std::uint16_t port) {
	if (m_isConnected) {
		return false;
	}

	asio::error_code ec;
	const auto endpoints = m_resolver.resolve(host, std::to_string(port), ec);
	if (ec) {
		return false;
	}
	asio::connect(m_socket, endpoints, ec);
	if (ec) {
		return false;
	}

	m_isConnected = true;
	return true;
}

void TcpClient::Implementation::disconnect() {
	asio::error_code ec;
	m_socket.shutdown(asio::socket_base::shutdown_both, ec);
	m_socket.close(ec);
	m_isConnected = false;
}

bool TcpClient::Implementation::isConnected() const {
	return m_isConnected;
}

bool TcpClient::Implementation::send(const Message& message) {
	if (!m_isConnected || message.size() > MAX_PAYLOAD_BYTES) {
		return false;
	}

	BasicMessageHeader header{};
	header.payload_size = to_network_u32(static_cast<std::uint32_t>(message.size()));

	std::array<asio::const_buffer, 2> buffers = {asio::buffer(&header, sizeof(header)), asio::buffer(message.data(), message.size())};

	asio::error_code ec;
	asio::write(m_socket, buffers, ec);
	if (ec) {
		m_isConnected = false;
		return false;
	}
	return true;
}

bool TcpClient::Implementation::runFor(std::chrono::milliseconds timeout, const bool& done) {
	m_ioContext.restart();
	m_ioContext.run_for(timeout);
	if (!done) {
		// Timed out. Cancel and let the handler observe operation_aborted.
		asio::error_code ec;
		m_socket.cancel(ec);
		m_ioContext.restart();
		m_ioContext.run();
		return false;
	}
	return true;
}

std::optional<Message> TcpClient::Implementation::read(std::chrono::milliseconds timeout) {
	if (!m_isConnected) {
		return {};
	}

	// Async reads with a deadline so a silent server cannot block the caller forever.
	BasicMessageHeader header{};
	asio::error_code ec;
	bool done = false;
	asio::async_read(m_socket, asio::buffer(&header, sizeof(header)), [&](asio::error_code e, std::size_t) {
		ec   = e;
		done = true;
	});
	if (!runFor(timeout, done)) {
		return {};
	}
	if (ec) {
		m_isConnected = false;
		return {};
	}

	const auto payloadSize = from_network_u32(header.payload_size);
	if (payloadSize > MAX_PAYLOAD_BYTES) {
		disconnect();
		return {};
	}
	if (payloadSize == 0) {
		return Message{};
	}

	Message payload(payloadSize, '\0');
	done = false;
	asio::async_read(m_socket, asio::buffer(payload.data(), payload.size()), [&](asio::error_code e, std::size_t) {
		ec   = e;
		done = true;
	});
	if (!runFor(timeout, done) || ec) {
		// A half read frame leaves the stream unusable.
		disconnect();
		return {};
	}
	return payload;
}


TcpClient::TcpClient() : m_pimpl(std::make_unique<Implementation>()) {
}

TcpClient::~TcpClient() {
	disconnect();
}

bool TcpClient::connect(const std::string& host, std::uint16_t port) {
	return m_pimpl->connect(host, port);
}

void TcpClient::disconnect() {
	m_pimpl->disconnect();
}

bool TcpClient::isConnected() const {
	return m_pimpl->isConnected();
}

bool TcpClient::send(const Message& message) {
	return m_pimpl->send(message);
}

std::optional<Message> TcpClient::read(std::chrono::milliseconds timeout) {
	return m_pimpl->read(timeout);
}

} // namespace ttt::network
