#include "server/gameServer.hpp"
#include "server/serverConfig.hpp"

#include <chrono>
#include <iostream>
#include <string>
#include <thread>

int main(int argc, char** argv) {
	const auto config = noughts::server::parseArguments(argc, argv);
	if (!config) {
		std::cerr << noughts::server::usage(argc > 0 ? argv[0] : "noughts_server");
		return 1;
	}

	noughts::server::GameServer server(*config);
	if (!server.start()) {
		std::cerr << "Could not listen on " << config->host << ":" << config->port << "\n";
		return 1;
	}
	std::cout << "Server running on " << config->host << ":" << server.port() << "\n";

	// Keep the server process alive until quit command. Without a console keep serving.
	std::string line;
	while (std::getline(std::cin, line)) {
		if (line == "quit" || line == "exit") {
			server.stop();
			return 0;
		}
	}

	while (true) {
		std::this_thread::sleep_for(std::chrono::hours(24));
	}
}
