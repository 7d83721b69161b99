#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace noughts {
namespace network {

using ConnectionId = std::uint64_t; //!< Process unique identifier of an accepted connection.

inline constexpr std::string_view DEFAULT_HOST = "127.0.0.1";
inline constexpr std::uint16_t DEFAULT_PORT    = 5000;
inline constexpr std::chrono::seconds MOVE_TIMEOUT{30};

// Messages are plain text lines. We expect a client message to arrive in a single read
// of at most this many bytes; there is no further framing.
inline constexpr std::size_t READ_BUFFER_BYTES = 1024;

} // namespace network
} // namespace noughts
