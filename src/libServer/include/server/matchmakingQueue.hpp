#pragma once

#include "network/connection.hpp"

#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>

namespace noughts::server {

//! FIFO holding area for connections waiting for an opponent.
class MatchmakingQueue {
public:
	//! Receives the two longest waiting connections in the order they arrived.
	//! \note Called while the queue is locked. Must hand the pair off without blocking on the network.
	using PairHandler = std::function<void(network::ConnectionPtr first, network::ConnectionPtr second)>;

	explicit MatchmakingQueue(PairHandler onPair);

	//! Append the connection and pair the two oldest entries if at least two are waiting.
	//! Append and pairing happen atomically.
	void offer(network::ConnectionPtr connection);

	//! Send the welcome line and offer the connection.
	//! A client that cannot be welcomed is closed and never queued. Returns false in that case.
	bool admit(network::ConnectionPtr connection);

	std::size_t waiting() const; //!< Number of connections waiting for an opponent.

private:
	PairHandler m_onPair;
	std::deque<network::ConnectionPtr> m_waiting;
	mutable std::mutex m_mutex; //!< Covers append + pop pair.
};

} // namespace noughts::server
