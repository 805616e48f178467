#pragma once

#include "network/protocol.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ttt::server {

struct ServerConfig {
	std::uint16_t port{network::DEFAULT_PORT};                   //!< Listening port.
	std::size_t maxConnections{network::DEFAULT_MAX_CONNECTIONS}; //!< Connections beyond this are rejected.
	std::chrono::milliseconds tickInterval{16};                   //!< Period of the server loop.
	bool enforceSeats{false};                                     //!< Only accept moves for the seat of the sending connection.
};

struct ParsedArguments {
	ServerConfig config{};
	bool showHelp{false};
};

//! Arguments after the program name. Empty if there are none, including argc == 0.
std::vector<std::string_view> collectArguments(int argc, const char* const* argv);

//! Parse command line arguments (without program name). Returns empty on unknown flags or invalid values.
std::optional<ParsedArguments> parseArguments(const std::vector<std::string_view>& args);

//! Usage text for the command line.
std::string usage(std::string_view program);

} // namespace ttt::server
