#pragma once
#include <boost/asio.hpp>
#include <string>

#include "Errors.hpp"
#include "RequestEncoder.hpp"
#include "ResponseDecoder.hpp"

/// One TCP connection to the backup server.
/**
 *  The session is either Disconnected or Connected. connect() and close() move
 *  between the two; sending and receiving are only valid while Connected and
 *  throw SessionStateError otherwise. It never reconnects on its own.
 *  Not thread-safe: one exchange at a time, serialized by the caller.
 *
 *  read_some/write_some make the session itself an Asio sync stream, which is
 *  what the encoder and decoder are written against.
 */
class BackupSession {
public:
    enum class State { Disconnected, Connected };

    BackupSession();
    ~BackupSession();

    BackupSession(const BackupSession&) = delete;
    BackupSession& operator=(const BackupSession&) = delete;

    void connect(const std::string& host, unsigned short port);
    void close();

    State state() const { return state_; }
    bool isConnected() const { return state_ == State::Connected; }

    // Blocks until the whole request (and upload body) is written
    void sendRequest(const ClientIdentity& identity, const Request& request);

    // Blocks until exactly one response is decoded
    Response receiveResponse();

    template <typename MutableBufferSequence>
    std::size_t read_some(const MutableBufferSequence& buffers, boost::system::error_code& ec) {
        requireConnected("read");
        return socket_.read_some(buffers, ec);
    }

    template <typename MutableBufferSequence>
    std::size_t read_some(const MutableBufferSequence& buffers) {
        requireConnected("read");
        return socket_.read_some(buffers);
    }

    template <typename ConstBufferSequence>
    std::size_t write_some(const ConstBufferSequence& buffers, boost::system::error_code& ec) {
        requireConnected("write");
        return socket_.write_some(buffers, ec);
    }

    template <typename ConstBufferSequence>
    std::size_t write_some(const ConstBufferSequence& buffers) {
        requireConnected("write");
        return socket_.write_some(buffers);
    }

private:
    void requireConnected(const char* what) const;

    boost::asio::io_context io_context_;
    boost::asio::ip::tcp::socket socket_;
    State state_ = State::Disconnected;
};
