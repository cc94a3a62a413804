#pragma once
#include <algorithm>
#include <cstdint>
#include <limits>
#include <string>
#include <variant>
#include <vector>

#include <boost/asio/buffer.hpp>
#include <boost/asio/write.hpp>
#include <boost/filesystem/path.hpp>

#include "Errors.hpp"
#include "LocalFiles.hpp"
#include "Protocol.hpp"

/// Who the client claims to be. Generated once per process.
struct ClientIdentity {
    uint32_t userId = 0;
    uint8_t version = kClientVersion;

    static ClientIdentity generate();
};

struct BackupRequest {
    std::string filename;
    boost::filesystem::path source;
};

struct RestoreRequest {
    std::string filename;
};

struct DeleteRequest {
    std::string filename;
};

struct ListRequest {};

using Request = std::variant<BackupRequest, RestoreRequest, DeleteRequest, ListRequest>;

OpCode opCodeOf(const Request& request);

/// Serializes the request header: user_id, version, op, name_len, filename.
/**
 *  An empty filename is sent as name_len 0.
 *
 * @throws EncodingError if the filename is not ASCII or longer than 65535 bytes
 */
std::vector<char> encodeRequestHeader(uint32_t userId, uint8_t version, OpCode op,
                                      const std::string& filename = {});

std::vector<char> encodeRequestHeader(const ClientIdentity& identity, const Request& request);

// The 4 byte little-endian size that precedes an upload
std::vector<char> encodePayloadHeader(uint32_t size);

/// Writes a complete request to a synchronous Asio write stream.
/**
 *  Everything that can fail before the wire is touched (encoding, opening the
 *  upload source, its size) is checked first, so on those errors nothing is sent.
 *  Uploads stream the file in kUploadChunkSize pieces after the size field.
 *
 * @throws EncodingError, LocalFileError before anything is written,
 *         TransportError once part of the request is on the wire
 */
template <typename SyncWriteStream>
void writeRequest(SyncWriteStream& stream, const ClientIdentity& identity, const Request& request) {
    std::vector<char> header = encodeRequestHeader(identity, request);

    const auto* backup = std::get_if<BackupRequest>(&request);
    if (!backup) {
        boost::asio::write(stream, boost::asio::buffer(header));
        return;
    }

    uintmax_t size = fileSize(backup->source);
    if (size > std::numeric_limits<uint32_t>::max())
        throw EncodingError("file too large for a 32-bit size field: " + backup->source.string());
    FileChunkReader reader(backup->source);

    boost::asio::write(stream, boost::asio::buffer(header));
    boost::asio::write(stream, boost::asio::buffer(encodePayloadHeader(static_cast<uint32_t>(size))));

    // From here on the server expects `size` body bytes, a local failure
    // leaves the connection out of step and is reported as a TransportError.
    uintmax_t sent = 0;
    try {
        while (sent < size && reader.next()) {
            const std::vector<char>& chunk = reader.chunk();
            std::size_t take = static_cast<std::size_t>(std::min<uintmax_t>(chunk.size(), size - sent));
            boost::asio::write(stream, boost::asio::buffer(chunk.data(), take));
            sent += take;
        }
    }
    catch (const LocalFileError& e) {
        throw TransportError(std::string("upload aborted mid-body: ") + e.what());
    }
    if (sent != size)
        throw TransportError("upload aborted mid-body, file shrank after " + std::to_string(sent)
                             + " of " + std::to_string(size) + " bytes: " + backup->source.string());
}
