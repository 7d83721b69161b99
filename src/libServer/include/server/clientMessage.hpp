#pragma once

#include <string>
#include <string_view>
#include <variant>

namespace noughts::server {

// Client messages
struct ClientQuit {};
struct ClientMove {
	std::string cell; //!< All digit token. Range is checked by the game.
};
struct ClientMalformedMove {
	std::string reason;
};
struct ClientUnknown {
	std::string text;
};

using ClientMessage = std::variant<ClientQuit, ClientMove, ClientMalformedMove, ClientUnknown>;

//! Message string to client message.
//! Accepts "QUIT" (any case), "MOVE <digits>" (keyword in any case) and bare "<digits>".
ClientMessage parseClientMessage(std::string_view text);

} // namespace noughts::server
