#include "server/clientMessage.hpp"
#include "server/messages.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <sstream>
#include <utility>
#include <vector>

namespace noughts::server {

static bool isDigits(std::string_view text) {
	return !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

static bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs) {
	return lhs.size() == rhs.size() && std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](unsigned char a, unsigned char b) {
		       return std::toupper(a) == std::toupper(b);
	       });
}

static std::vector<std::string> splitWhitespace(std::string_view text) {
	std::vector<std::string> tokens;
	std::istringstream stream{std::string(text)};
	for (std::string token; stream >> token;) {
		tokens.push_back(std::move(token));
	}
	return tokens;
}

ClientMessage parseClientMessage(std::string_view text) {
	const auto tokens = splitWhitespace(text);
	if (tokens.empty()) {
		return ClientUnknown{std::string(text)};
	}

	if (tokens.size() == 1u && equalsIgnoreCase(tokens.front(), CMD_QUIT)) {
		return ClientQuit{};
	}

	if (equalsIgnoreCase(tokens.front(), CMD_MOVE)) {
		// Expect "MOVE <digits>"
		if (tokens.size() != 2u || !isDigits(tokens[1])) {
			return ClientMalformedMove{std::format("Malformed MOVE: {}", text)};
		}
		return ClientMove{tokens[1]};
	}

	if (tokens.size() == 1u && isDigits(tokens.front())) {
		return ClientMove{tokens.front()};
	}

	return ClientUnknown{std::string(text)};
}

} // namespace noughts::server
