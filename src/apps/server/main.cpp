#include "server/gameServer.hpp"
#include "server/serverConfig.hpp"

#include <iostream>
#include <string>

int main(int argc, char** argv) {
	const auto parsed = ttt::server::parseArguments(ttt::server::collectArguments(argc, argv));
	if (!parsed || parsed->showHelp) {
		std::cerr << ttt::server::usage(argc > 0 && argv[0] != nullptr ? argv[0] : "ttt_server");
		return parsed ? 0 : 1;
	}

	ttt::server::GameServer server(parsed->config);
	if (!server.start()) {
		std::cerr << "Could not start the server. Is the port already in use?\n";
		return 1;
	}

	// Keep the server process alive until stdin closes or quit command.
	std::string line;
	while (std::getline(std::cin, line)) {
		if (line == "quit" || line == "exit") {
			break;
		}
	}

	server.stop();
	return 0;
}
