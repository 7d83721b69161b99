#include "server/gameServer.hpp"
#include "Logging.hpp"
#include "server/session.hpp"

#include <format>
#include <thread>
#include <utility>

namespace noughts::server {

GameServer::GameServer(ServerConfig config)
    : m_config(std::move(config)), m_server(m_config.host, m_config.port, m_config.readBufferBytes),
      m_queue([this](network::ConnectionPtr first, network::ConnectionPtr second) { startSession(std::move(first), std::move(second)); }) {
	m_server.connect([this](network::ConnectionPtr connection) { onConnection(std::move(connection)); });
}

GameServer::~GameServer() {
	stop();
}

bool GameServer::start() {
	if (!m_server.start()) {
		Logger().Log(Logging::LogLevel::Error, std::format("[GameServer] Could not start on {}:{}.", m_config.host, m_config.port));
		return false;
	}
	Logger().Log(Logging::LogLevel::Info,
	             std::format("[GameServer] Accepting players on {}:{} (move timeout {}s).", m_config.host, port(), m_config.moveTimeout.count()));
	return true;
}

void GameServer::stop() {
	m_server.stop();
}

std::uint16_t GameServer::port() const {
	return m_server.port();
}

std::size_t GameServer::waiting() const {
	return m_queue.waiting();
}

std::size_t GameServer::activeSessions() const {
	return m_activeSessions->load();
}

void GameServer::onConnection(network::ConnectionPtr connection) {
	Logger().Log(Logging::LogLevel::Info, std::format("[GameServer] Connected by {}", network::toString(connection->remoteEndpoint())));
	if (!m_queue.admit(std::move(connection))) {
		Logger().Log(Logging::LogLevel::Debug, "[GameServer] Client left before it could be queued.");
	}
}

void GameServer::startSession(network::ConnectionPtr first, network::ConnectionPtr second) {
	auto session = std::make_shared<Session>(std::move(first), std::move(second), m_config.moveTimeout);

	// The session owns everything it touches, so it may outlive the server.
	++*m_activeSessions;
	std::thread([session, active = m_activeSessions]() {
		session->run();
		--*active;
	}).detach();
}

} // namespace noughts::server
