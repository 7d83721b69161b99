#include "server/matchmakingQueue.hpp"
#include "Logging.hpp"
#include "server/messages.hpp"

#include <format>
#include <utility>

namespace noughts::server {

MatchmakingQueue::MatchmakingQueue(PairHandler onPair) : m_onPair(std::move(onPair)) {
}

void MatchmakingQueue::offer(network::ConnectionPtr connection) {
	std::lock_guard<std::mutex> lock(m_mutex);

	m_waiting.push_back(std::move(connection));
	if (m_waiting.size() < 2u) {
		return;
	}

	auto first = std::move(m_waiting.front());
	m_waiting.pop_front();
	auto second = std::move(m_waiting.front());
	m_waiting.pop_front();

	Logger().Log(Logging::LogLevel::Info,
	             std::format("[Matchmaking] Paired connection {} with connection {}.", first->connectionId(), second->connectionId()));

	if (m_onPair) {
		m_onPair(std::move(first), std::move(second));
	}
}

bool MatchmakingQueue::admit(network::ConnectionPtr connection) {
	if (const auto error = connection->send(MSG_WELCOME)) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[Matchmaking] Welcome failed, dropping client: {}", network::toString(*error)));
		connection->close();
		return false;
	}

	offer(std::move(connection));
	return true;
}

std::size_t MatchmakingQueue::waiting() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_waiting.size();
}

} // namespace noughts::server
