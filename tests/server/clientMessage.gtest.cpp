#include "server/clientMessage.hpp"

#include <gtest/gtest.h>

#include <variant>

namespace noughts::gtest {

using namespace noughts::server;

TEST(ClientMessage, Quit) {
	EXPECT_TRUE(std::holds_alternative<ClientQuit>(parseClientMessage("QUIT")));
	EXPECT_TRUE(std::holds_alternative<ClientQuit>(parseClientMessage("quit")));
	EXPECT_TRUE(std::holds_alternative<ClientQuit>(parseClientMessage("QuIt")));
	EXPECT_TRUE(std::holds_alternative<ClientQuit>(parseClientMessage("  quit \r\n")));

	EXPECT_FALSE(std::holds_alternative<ClientQuit>(parseClientMessage("QUIT now")));
	EXPECT_FALSE(std::holds_alternative<ClientQuit>(parseClientMessage("QUITTER")));
}

TEST(ClientMessage, BareDigits) {
	const auto message = parseClientMessage("4");
	ASSERT_TRUE(std::holds_alternative<ClientMove>(message));
	EXPECT_EQ(std::get<ClientMove>(message).cell, "4");

	// Range is checked by the game, not by the parser.
	const auto large = parseClientMessage("42");
	ASSERT_TRUE(std::holds_alternative<ClientMove>(large));
	EXPECT_EQ(std::get<ClientMove>(large).cell, "42");
}

TEST(ClientMessage, MoveCommand) {
	const auto message = parseClientMessage("MOVE 7");
	ASSERT_TRUE(std::holds_alternative<ClientMove>(message));
	EXPECT_EQ(std::get<ClientMove>(message).cell, "7");

	const auto lower = parseClientMessage("move   3");
	ASSERT_TRUE(std::holds_alternative<ClientMove>(lower));
	EXPECT_EQ(std::get<ClientMove>(lower).cell, "3");
}

TEST(ClientMessage, MalformedMoveCommand) {
	for (const auto* text: {"MOVE", "MOVE x", "MOVE 1 2", "MOVE -1", "MOVE 4a"}) {
		const auto message = parseClientMessage(text);
		ASSERT_TRUE(std::holds_alternative<ClientMalformedMove>(message)) << text;
		EXPECT_EQ(std::get<ClientMalformedMove>(message).reason, std::string("Malformed MOVE: ") + text);
	}
}

TEST(ClientMessage, UnknownText) {
	for (const auto* text: {"", "hello", "4 5", "-1", "X", "MOVES 4"}) {
		const auto message = parseClientMessage(text);
		ASSERT_TRUE(std::holds_alternative<ClientUnknown>(message)) << text;
		EXPECT_EQ(std::get<ClientUnknown>(message).text, text);
	}
}

} // namespace noughts::gtest
