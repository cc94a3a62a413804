#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

#include <boost/system/error_code.hpp>

/// Base of every error the client raises on purpose.
class BackupError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Connect, send or receive failed. The connection is unusable afterwards.
class TransportError : public BackupError {
public:
    explicit TransportError(const std::string& what, boost::system::error_code ec = {})
        : BackupError(ec ? what + ": " + ec.message() : what), code_(ec) {}

    const boost::system::error_code& code() const { return code_; }

private:
    boost::system::error_code code_;
};

/// The peer closed the stream before a field was complete.
class EndOfStream : public TransportError {
public:
    EndOfStream(std::size_t expected, std::size_t received)
        : TransportError("stream closed after " + std::to_string(received) + " of "
                         + std::to_string(expected) + " bytes"),
          expected_(expected), received_(received) {}

    std::size_t expected() const { return expected_; }
    std::size_t received() const { return received_; }

private:
    std::size_t expected_;
    std::size_t received_;
};

/// A request could not be represented on the wire. Nothing was sent.
class EncodingError : public BackupError {
public:
    using BackupError::BackupError;
};

/// The server answered with a status whose mandatory payload is missing.
class ProtocolViolation : public BackupError {
public:
    using BackupError::BackupError;
};

class LocalFileError : public BackupError {
public:
    using BackupError::BackupError;
};

class ConfigError : public BackupError {
public:
    using BackupError::BackupError;
};

/// A session method was called in a state where it is not valid.
class SessionStateError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};
