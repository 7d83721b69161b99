#include "network/tcpServer.hpp"
#include "Logging.hpp"

#include <asio/ip/tcp.hpp>

#include <exception>
#include <format>
#include <memory>
#include <system_error>
#include <utility>

namespace noughts::network {

TcpServer::TcpServer(std::string host, const std::uint16_t port, const std::size_t readBufferBytes)
    : m_acceptor(m_ioContext), m_host(std::move(host)), m_port(port), m_readBufferBytes(readBufferBytes) {
}

TcpServer::~TcpServer() {
	stop();
}

void TcpServer::connect(ConnectionHandler handler) {
	m_handler = std::move(handler);
}

bool TcpServer::start() {
	if (m_running.exchange(true)) {
		return true;
	}
	// Don't start a dead server.
	if (!openAcceptor()) {
		m_running = false;
		return false;
	}

	Logger().Log(Logging::LogLevel::Info, std::format("[Network] Server running on {}:{}", m_host, port()));

	m_ioContext.restart();
	m_workGuard.emplace(asio::make_work_guard(m_ioContext));
	doAccept();
	m_ioThread = std::thread([this]() { m_ioContext.run(); });
	return true;
}

void TcpServer::stop() {
	if (!m_running.exchange(false)) {
		return;
	}

	asio::error_code ec;
	m_acceptor.cancel(ec);
	m_acceptor.close(ec);

	if (m_workGuard) {
		m_workGuard->reset();
		m_workGuard.reset();
	}
	m_ioContext.stop();

	if (m_ioThread.joinable()) {
		m_ioThread.join();
	}

	// No new workers after the IO thread is gone. Handlers use this server until they return.
	{
		std::unique_lock<std::mutex> lock(m_workerMutex);
		m_workersDone.wait(lock, [this] { return m_activeWorkers == 0u; });
	}

	Logger().Log(Logging::LogLevel::Info, "[Network] Server stopped.");
}

std::uint16_t TcpServer::port() const {
	asio::error_code ec;
	const auto endpoint = m_acceptor.local_endpoint(ec);
	return ec ? m_port : endpoint.port();
}

std::size_t TcpServer::activeWorkers() const {
	std::lock_guard<std::mutex> lock(m_workerMutex);
	return m_activeWorkers;
}

bool TcpServer::openAcceptor() {
	asio::error_code ec;
	const auto address = asio::ip::make_address(m_host, ec);
	if (ec) {
		Logger().Log(Logging::LogLevel::Error, std::format("[Network] Invalid listen address '{}': {}", m_host, ec.message()));
		return false;
	}

	const asio::ip::tcp::endpoint endpoint(address, m_port);
	m_acceptor.open(endpoint.protocol(), ec);
	if (!ec) {
		m_acceptor.set_option(asio::ip::tcp::acceptor::reuse_address(true), ec);
	}
	if (!ec) {
		m_acceptor.bind(endpoint, ec);
	}
	if (!ec) {
		m_acceptor.listen(asio::socket_base::max_listen_connections, ec);
	}
	if (ec) {
		Logger().Log(Logging::LogLevel::Error, std::format("[Network] Cannot listen on {}:{}: {}", m_host, m_port, ec.message()));
		asio::error_code ignored;
		m_acceptor.close(ignored);
		return false;
	}
	return true;
}

void TcpServer::doAccept() {
	auto connection = std::make_shared<Connection>(m_nextConnectionId++, m_readBufferBytes);

	// The connection runs its own io_context. Accepting into a socket of another context is fine.
	m_acceptor.async_accept(connection->socket(), [this, connection](asio::error_code ec) {
		if (!m_running) {
			return;
		}

		if (ec) {
			Logger().Log(Logging::LogLevel::Error, "[Network] Accept failed - " + ec.message());
		} else {
			connection->start();

			{
				std::lock_guard<std::mutex> lock(m_workerMutex);
				++m_activeWorkers;
			}
			try {
				std::thread([this, connection]() { runWorker(connection); }).detach();
			} catch (const std::system_error& ex) {
				Logger().Log(Logging::LogLevel::Error, std::format("[Network] Cannot start worker for connection {}: {}", connection->connectionId(), ex.what()));
				connection->close();
				std::lock_guard<std::mutex> lock(m_workerMutex);
				--m_activeWorkers;
				m_workersDone.notify_all();
			}
		}

		doAccept();
	});
}

void TcpServer::runWorker(ConnectionPtr connection) {
	try {
		if (m_handler) {
			m_handler(std::move(connection));
		}
	} catch (const std::exception& ex) {
		Logger().Log(Logging::LogLevel::Error, std::format("[Network] Connection handler failed: {}", ex.what()));
	}

	std::lock_guard<std::mutex> lock(m_workerMutex);
	--m_activeWorkers;
	m_workersDone.notify_all();
}

} // namespace noughts::network
