#include "BackupSession.hpp"

BackupSession::BackupSession()
    : socket_(io_context_)
{
}

BackupSession::~BackupSession() {
    boost::system::error_code ec;
    socket_.close(ec);
}

/// Resolve the host and connect
 /**
  *
  * @throws SessionStateError if already connected, TransportError if the connection fails
  *
  */
void BackupSession::connect(const std::string& host, unsigned short port) {
    if (state_ == State::Connected)
        throw SessionStateError("connect() on a session that is already connected");

    boost::system::error_code ec;
    boost::asio::ip::tcp::resolver resolver(io_context_);
    auto endpoints = resolver.resolve(host, std::to_string(port), ec);
    if (ec)
        throw TransportError("cannot resolve " + host, ec);

    boost::asio::connect(socket_, endpoints, ec);
    if (ec)
        throw TransportError("cannot connect to " + host + ":" + std::to_string(port), ec);

    state_ = State::Connected;
}

// Closing a disconnected session is a no-op
void BackupSession::close() {
    if (state_ == State::Disconnected)
        return;

    boost::system::error_code ec;
    socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);
    state_ = State::Disconnected;
}

void BackupSession::sendRequest(const ClientIdentity& identity, const Request& request) {
    requireConnected("send");
    try {
        writeRequest(*this, identity, request);
    }
    catch (const boost::system::system_error& e) {
        throw TransportError("send failed", e.code());
    }
}

Response BackupSession::receiveResponse() {
    requireConnected("receive");
    return decodeResponse(*this);
}

void BackupSession::requireConnected(const char* what) const {
    if (state_ != State::Connected)
        throw SessionStateError(std::string(what) + " on a disconnected session");
}
