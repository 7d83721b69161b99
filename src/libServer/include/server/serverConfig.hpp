#pragma once

#include "network/protocol.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace noughts::server {

//! Runtime settings of the game server.
struct ServerConfig {
	std::string host{network::DEFAULT_HOST};
	std::uint16_t port{network::DEFAULT_PORT}; //!< 0 binds an ephemeral port.
	std::chrono::seconds moveTimeout{network::MOVE_TIMEOUT};
	std::size_t readBufferBytes{network::READ_BUFFER_BYTES};
};

//! Build the configuration from the command line (--host, --port, --move-timeout, --buffer-size).
//! \returns Empty on unknown options, missing or invalid values and on --help.
std::optional<ServerConfig> parseArguments(int argc, const char* const* argv);

//! Command line help text.
std::string usage(const std::string& program);

} // namespace noughts::server
