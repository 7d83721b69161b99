#include "server/serverConfig.hpp"

#include <charconv>
#include <format>
#include <limits>
#include <string_view>

namespace noughts::server {

//! Parse an unsigned integer not larger than max.
template <typename T>
static std::optional<T> parseNumber(std::string_view text, T max) {
	unsigned long long value = 0;
	const auto [ptr, ec]     = std::from_chars(text.data(), text.data() + text.size(), value);
	if (ec != std::errc{} || ptr != text.data() + text.size() || value > static_cast<unsigned long long>(max)) {
		return {};
	}
	return static_cast<T>(value);
}

std::optional<ServerConfig> parseArguments(const int argc, const char* const* argv) {
	ServerConfig config;

	for (int i = 1; i < argc; ++i) {
		const std::string_view option = argv[i];
		if (option == "--help" || option == "-h") {
			return {};
		}
		if (i + 1 >= argc) {
			return {}; // Every other option takes a value.
		}
		const std::string_view value = argv[++i];

		if (option == "--host") {
			config.host = std::string(value);
		} else if (option == "--port") {
			// Port 0 is allowed and selects an ephemeral port.
			const auto port = parseNumber<std::uint16_t>(value, std::numeric_limits<std::uint16_t>::max());
			if (!port) {
				return {};
			}
			config.port = *port;
		} else if (option == "--move-timeout") {
			const auto seconds = parseNumber<long long>(value, 24 * 60 * 60);
			if (!seconds || *seconds == 0) {
				return {};
			}
			config.moveTimeout = std::chrono::seconds{*seconds};
		} else if (option == "--buffer-size") {
			const auto bytes = parseNumber<std::size_t>(value, 64u * 1024u);
			if (!bytes || *bytes == 0u) {
				return {};
			}
			config.readBufferBytes = *bytes;
		} else {
			return {};
		}
	}

	return config;
}

std::string usage(const std::string& program) {
	return std::format("Usage: {} [--host <address>] [--port <port>] [--move-timeout <seconds>] [--buffer-size <bytes>]\n"
	                   "  --host          Listen address (default {})\n"
	                   "  --port          Listen port, 0 for any free port (default {})\n"
	                   "  --move-timeout  Seconds a player has for a move (default {})\n"
	                   "  --buffer-size   Read buffer size in bytes (default {})\n",
	                   program, network::DEFAULT_HOST, network::DEFAULT_PORT, network::MOVE_TIMEOUT.count(), network::READ_BUFFER_BYTES);
}

} // namespace noughts::server
