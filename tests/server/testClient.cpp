#include "testClient.hpp"

#include <asio/read_until.hpp>
#include <asio/write.hpp>

#include <string>

namespace noughts::gtest {

static constexpr std::string_view PROMPT_MOVE = "Your move (0-8) or QUIT:";

TestClient::TestClient() : m_socket(m_ioContext) {
}

TestClient::~TestClient() {
	disconnect();
}

bool TestClient::connect(const std::uint16_t port) {
	asio::error_code ec;
	m_socket.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), port), ec);
	return !ec;
}

void TestClient::disconnect() {
	asio::error_code ec;
	m_socket.shutdown(asio::socket_base::shutdown_both, ec);
	m_socket.close(ec);
}

bool TestClient::send(std::string_view line) {
	const auto text = std::string(line) + "\n";

	asio::error_code ec;
	asio::write(m_socket, asio::buffer(text), ec);
	return !ec;
}

std::optional<std::string> TestClient::readLine(const std::chrono::milliseconds timeout) {
	std::optional<std::string> line;

	asio::async_read_until(m_socket, m_buffer, '\n', [&](const asio::error_code& ec, std::size_t bytes) {
		if (ec) {
			m_closedByServer = ec == asio::error::eof || ec == asio::error::connection_reset;
			return;
		}
		std::string text(asio::buffers_begin(m_buffer.data()), asio::buffers_begin(m_buffer.data()) + static_cast<std::ptrdiff_t>(bytes) - 1);
		m_buffer.consume(bytes);
		line = std::move(text);
	});

	m_ioContext.restart();
	m_ioContext.run_for(timeout);
	if (!m_ioContext.stopped()) {
		// Timed out. Abort the read and let its handler run.
		asio::error_code ignored;
		m_socket.cancel(ignored);
		m_ioContext.restart();
		m_ioContext.run();
	}
	return line;
}

bool TestClient::waitForLine(std::string_view expected, const std::chrono::milliseconds timeout) {
	const auto deadline = std::chrono::steady_clock::now() + timeout;
	while (std::chrono::steady_clock::now() < deadline) {
		const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
		const auto line      = readLine(remaining);
		if (!line) {
			return false;
		}
		if (*line == expected) {
			return true;
		}
	}
	return false;
}

std::optional<std::string> TestClient::waitForPrefix(std::string_view prefix, const std::chrono::milliseconds timeout) {
	const auto deadline = std::chrono::steady_clock::now() + timeout;
	while (std::chrono::steady_clock::now() < deadline) {
		const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
		auto line            = readLine(remaining);
		if (!line) {
			return {};
		}
		if (line->starts_with(prefix)) {
			return line;
		}
	}
	return {};
}

bool TestClient::waitForClose(const std::chrono::milliseconds timeout) {
	const auto deadline = std::chrono::steady_clock::now() + timeout;
	while (!m_closedByServer && std::chrono::steady_clock::now() < deadline) {
		const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
		readLine(remaining);
	}
	return m_closedByServer;
}

bool TestClient::play(std::string_view move) {
	return waitForLine(PROMPT_MOVE) && send(move);
}

} // namespace noughts::gtest
