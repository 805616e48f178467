#include "Logging.hpp"

#include "network/logSetup.hpp"

#include <mutex>

namespace ttt::server {

static Logging::LogConfig config;

Logging::Logger Logger() {
	static std::once_flag logInitFlag;
	std::call_once(logInitFlag, [] { network::InitializeLogConfig(config, "TicTacToe/Server"); });

	return Logging::Logger(config);
}

} // namespace ttt::server
