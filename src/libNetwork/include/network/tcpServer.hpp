#pragma once

#include "network/connection.hpp"
#include "network/protocol.hpp"

#include <asio.hpp>

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace noughts {
namespace network {

//! Accepts clients on a dedicated IO thread and hands every connection to its own worker thread.
class TcpServer {
public:
	//! Runs on the worker thread of the accepted connection.
	using ConnectionHandler = std::function<void(ConnectionPtr)>;

	TcpServer(std::string host = std::string{DEFAULT_HOST}, std::uint16_t port = DEFAULT_PORT, std::size_t readBufferBytes = READ_BUFFER_BYTES);
	~TcpServer();

	void connect(ConnectionHandler handler); //!< Set the callback for new connections. Call before start().
	bool start();                            //!< Bind, listen and start accepting. False if the address cannot be used.
	void stop();                             //!< Stop accepting and wait for the running connection handlers.

	std::uint16_t port() const;        //!< Bound port. Differs from the configured one when that is 0.
	std::size_t activeWorkers() const; //!< Connection handlers still running.

private:
	bool openAcceptor();                      //!< Open, bind and listen in error_code land.
	void doAccept();                          //!< Start async accept loop.
	void runWorker(ConnectionPtr connection); //!< Detached thread body for one accepted connection.

private:
	asio::io_context m_ioContext{};
	asio::ip::tcp::acceptor m_acceptor;
	std::optional<asio::executor_work_guard<asio::io_context::executor_type>> m_workGuard;

	std::string m_host;
	std::uint16_t m_port;
	std::size_t m_readBufferBytes;

	std::thread m_ioThread;             //!< IO context thread running the accept loop.
	std::atomic<bool> m_running{false}; //!< TCP Server running.
	ConnectionId m_nextConnectionId{1u};

	ConnectionHandler m_handler;
	std::size_t m_activeWorkers{0u}; //!< Detached handler threads not yet returned.
	mutable std::mutex m_workerMutex;
	std::condition_variable m_workersDone;
};

} // namespace network
} // namespace noughts
