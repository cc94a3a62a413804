#pragma once
#include <algorithm>
#include <cstddef>
#include <vector>

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>

#include "Errors.hpp"

constexpr std::size_t kReadExactStep = 64 * 1024;

/// Read exactly n bytes from a synchronous Asio read stream.
/**
 *  Keeps calling read_some for the missing bytes until all of them arrived.
 *  A read that ends the stream (eof or zero bytes) before that throws EndOfStream,
 *  any other error throws TransportError. The caller never sees a partial buffer.
 *  n == 0 returns an empty buffer without touching the stream.
 *  n comes off the wire, so the buffer only grows by kReadExactStep per read
 *  and never ahead of the bytes that actually arrived.
 *
 * @throws EndOfStream, TransportError
 */
template <typename SyncReadStream>
std::vector<char> readExact(SyncReadStream& stream, std::size_t n) {
    std::vector<char> buf;
    buf.reserve(std::min(n, kReadExactStep));
    std::size_t got = 0;
    while (got < n) {
        std::size_t want = std::min(n - got, kReadExactStep);
        buf.resize(got + want);

        boost::system::error_code ec;
        std::size_t count = stream.read_some(boost::asio::buffer(buf.data() + got, want), ec);
        got += count;
        buf.resize(got);
        if (got == n)
            break;
        if (ec == boost::asio::error::eof || (!ec && count == 0))
            throw EndOfStream(n, got);
        if (ec)
            throw TransportError("read failed", ec);
    }
    return buf;
}
