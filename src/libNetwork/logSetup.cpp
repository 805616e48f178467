#include "network/logSetup.hpp"

#include "Logger/LogOutputConsole.hpp"
#include "Logger/LogOutputFile.hpp"

#include <filesystem>
#include <format>
#include <iostream>
#include <memory>
#include <string>

namespace ttt::network {

void InitializeLogConfig(Logging::LogConfig& config, const std::string& logDir) {
	config.SetLogEnabled(true);
	config.SetMinLogLevel(Logging::LogLevel::Any);

#ifndef NDEBUG
	config.AddLogOutput(std::make_shared<Logging::LogOutputConsole>());
#endif

	const auto logPath = Logging::GetDefaultLogDir(logDir.c_str());

	std::error_code ec{};
	std::filesystem::create_directories(logPath, ec);
	if (!ec) {
		config.AddLogOutput(std::make_shared<Logging::LogOutputFile>(logPath / "log.txt"));
	} else {
		std::cerr << std::format("[Logger] Could not create directory: {}\nApplication will not log to file.\n", logPath.string());
	}
}

} // namespace ttt::network
