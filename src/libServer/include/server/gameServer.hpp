#pragma once

#include "network/connection.hpp"
#include "network/tcpServer.hpp"
#include "server/matchmakingQueue.hpp"
#include "server/serverConfig.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>

namespace noughts {
namespace server {

//! Accepts players, pairs them in arrival order and runs every pairing on its own session thread.
class GameServer {
public:
	explicit GameServer(ServerConfig config = {});
	~GameServer();

	bool start(); //!< Boot the network listener. False if the address cannot be bound.
	void stop();  //!< Stop accepting players. Running sessions play on until they end.

	std::uint16_t port() const;  //!< Port the server listens on.
	std::size_t waiting() const;        //!< Players waiting for an opponent.
	std::size_t activeSessions() const; //!< Games currently being played.

private:
	//! Runs on the worker thread of a new connection: welcome, then queue.
	void onConnection(network::ConnectionPtr connection);
	//! Called by the queue with a fresh pairing.
	void startSession(network::ConnectionPtr first, network::ConnectionPtr second);

private:
	ServerConfig m_config;
	network::TcpServer m_server;
	MatchmakingQueue m_queue;

	//! Shared with the detached session threads, which may outlive the server.
	std::shared_ptr<std::atomic<std::size_t>> m_activeSessions{std::make_shared<std::atomic<std::size_t>>(0u)};
};

} // namespace server
} // namespace noughts
