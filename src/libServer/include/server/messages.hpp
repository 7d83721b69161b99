#pragma once

#include <string_view>

namespace noughts::server {

// Server to client lines. Every message is terminated by a newline.
inline constexpr std::string_view MSG_WELCOME          = "Welcome! Waiting for opponent...\n";
inline constexpr std::string_view MSG_PROMPT_MOVE      = "Your move (0-8) or QUIT:\n";
inline constexpr std::string_view MSG_PROMPT_WAIT      = "Waiting for opponent...\n";
inline constexpr std::string_view MSG_DRAW             = "Game over! It's a draw.\n";
inline constexpr std::string_view MSG_WIN              = "You win!\n";
inline constexpr std::string_view MSG_LOSE             = "You lose!\n";
inline constexpr std::string_view MSG_OPPONENT_TIMEOUT = "OPPONENT_TIMEOUT - you win\n";
inline constexpr std::string_view MSG_OPPONENT_QUIT    = "OPPONENT_QUIT - you win\n";
inline constexpr std::string_view MSG_OPPONENT_LEFT    = "OPPONENT_DISCONNECTED - you win\n";

// Prefixes of messages with a variable detail part.
inline constexpr std::string_view MSG_GAME_START      = "Game start! You are ";
inline constexpr std::string_view MSG_ERROR           = "ERROR: ";
inline constexpr std::string_view MSG_INVALID_MESSAGE = "INVALID_MESSAGE: ";
inline constexpr std::string_view MSG_INVALID_FORMAT  = "Invalid move format: ";
inline constexpr std::string_view MSG_GAME_OVER       = "GAME OVER: ";
inline constexpr std::string_view MSG_SERVER_ERROR    = "Server error: ";

// Client to server keywords. Matched case insensitive.
inline constexpr std::string_view CMD_QUIT = "QUIT";
inline constexpr std::string_view CMD_MOVE = "MOVE";

} // namespace noughts::server
