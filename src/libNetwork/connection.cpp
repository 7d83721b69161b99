#include "network/connection.hpp"
#include "Logging.hpp"

#include <asio/write.hpp>

#include <algorithm>
#include <cctype>
#include <format>
#include <utility>

namespace noughts::network {

//! Remove leading and trailing whitespace.
static std::string trim(std::string_view text) {
	const auto isSpace = [](unsigned char c) { return std::isspace(c) != 0; };

	const auto first = std::find_if_not(text.begin(), text.end(), isSpace);
	const auto last  = std::find_if_not(text.rbegin(), text.rend(), isSpace).base();
	return first < last ? std::string(first, last) : std::string{};
}

//! Well formed UTF-8: no stray continuation bytes, overlong forms, surrogates or code points above U+10FFFF.
static bool isValidUtf8(std::string_view text) {
	std::size_t i = 0;
	while (i < text.size()) {
		const auto lead = static_cast<unsigned char>(text[i]);

		std::size_t length = 0;
		unsigned char low  = 0x80;
		unsigned char high = 0xBF;
		if (lead < 0x80) {
			length = 1;
		} else if (lead >= 0xC2 && lead <= 0xDF) {
			length = 2;
		} else if (lead >= 0xE0 && lead <= 0xEF) {
			length = 3;
			if (lead == 0xE0) {
				low = 0xA0;
			} else if (lead == 0xED) {
				high = 0x9F;
			}
		} else if (lead >= 0xF0 && lead <= 0xF4) {
			length = 4;
			if (lead == 0xF0) {
				low = 0x90;
			} else if (lead == 0xF4) {
				high = 0x8F;
			}
		} else {
			return false;
		}

		if (text.size() - i < length) {
			return false;
		}
		for (std::size_t k = 1; k != length; ++k) {
			const auto next = static_cast<unsigned char>(text[i + k]);
			const auto min  = k == 1 ? low : static_cast<unsigned char>(0x80);
			const auto max  = k == 1 ? high : static_cast<unsigned char>(0xBF);
			if (next < min || next > max) {
				return false;
			}
		}
		i += length;
	}
	return true;
}

Connection::Connection(const ConnectionId connectionId, const std::size_t readBufferBytes)
    : m_socket(m_ioContext), m_deadline(m_ioContext), m_connectionId(connectionId), m_readBufferBytes(readBufferBytes) {
	clearDeadline();
}

Connection::~Connection() {
	close();
}

asio::ip::tcp::socket& Connection::socket() {
	return m_socket;
}

void Connection::start() {
	const auto endpoint = resolveEndpoint();
	if (endpoint != UNKNOWN_ENDPOINT) {
		m_remote = endpoint;
	}
}

std::optional<SessionError> Connection::send(std::string_view text) {
	asio::error_code ec;
	asio::write(m_socket, asio::buffer(text.data(), text.size()), ec);
	if (ec) {
		return SessionError{ErrorKind::PeerDisconnected, remoteEndpoint(), std::format("send failed: {}", ec.message())};
	}
	return {};
}

ReceiveResult Connection::receive(const std::chrono::seconds timeout) {
	std::string buffer(m_readBufferBytes, '\0');
	std::size_t bytesRead = 0;
	asio::error_code readError;
	bool timedOut = false;

	m_deadline.expires_after(timeout);
	m_deadline.async_wait([this, &timedOut](const asio::error_code& ec) {
		if (ec == asio::error::operation_aborted) {
			return;
		}
		// Abort the pending read. Its handler reports operation_aborted.
		timedOut = true;
		asio::error_code ignored;
		m_socket.cancel(ignored);
	});

	m_socket.async_read_some(asio::buffer(buffer), [this, &bytesRead, &readError](const asio::error_code& ec, std::size_t bytes) {
		readError = ec;
		bytesRead = bytes;
		m_deadline.cancel();
	});

	// Returns once both the read and the timer handler ran.
	m_ioContext.restart();
	m_ioContext.run();
	clearDeadline();

	if (!readError && bytesRead > 0) {
		buffer.resize(bytesRead);
		if (!isValidUtf8(buffer)) {
			return SessionError{ErrorKind::PeerDisconnected, remoteEndpoint(), "recv failed: invalid UTF-8"};
		}
		return trim(buffer);
	}
	if (readError == asio::error::eof || (!readError && bytesRead == 0)) {
		return SessionError{ErrorKind::PeerDisconnected, remoteEndpoint(), "client closed connection"};
	}
	if (timedOut) {
		return SessionError{ErrorKind::TimeoutWaitingForPlayer, remoteEndpoint(), std::format("Timed out after {} seconds", timeout.count())};
	}
	return SessionError{ErrorKind::PeerDisconnected, remoteEndpoint(), std::format("recv failed: {}", readError.message())};
}

void Connection::close() {
	if (!m_socket.is_open()) {
		return;
	}

	asio::error_code ec;
	m_socket.shutdown(asio::socket_base::shutdown_both, ec);
	m_socket.close(ec);
	if (ec) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[Network] Closing connection {} failed: {}", m_connectionId, ec.message()));
	}
}

ConnectionId Connection::connectionId() const {
	return m_connectionId;
}

Endpoint Connection::remoteEndpoint() const {
	if (m_remote.has_value()) {
		return *m_remote;
	}
	return resolveEndpoint();
}

bool Connection::isOpen() const {
	return m_socket.is_open();
}

bool Connection::hasReadDeadline() const {
	return m_deadline.expiry() != asio::steady_timer::time_point::max();
}

Endpoint Connection::resolveEndpoint() const {
	asio::error_code ec;
	const auto endpoint = m_socket.remote_endpoint(ec);
	if (ec) {
		return UNKNOWN_ENDPOINT;
	}
	return Endpoint{endpoint.address().to_string(), endpoint.port()};
}

void Connection::clearDeadline() {
	m_deadline.expires_at(asio::steady_timer::time_point::max());
}

} // namespace noughts::network
