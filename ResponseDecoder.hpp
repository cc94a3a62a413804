#pragma once
#include <vector>

#include "Protocol.hpp"
#include "StreamReader.hpp"

/// Decodes one response from a synchronous Asio read stream.
/**
 *  version (1) | status (2, LE) | name_len (2, LE) | filename (name_len)
 *  then, only for status 210 and 211, size (4, LE) | payload (size).
 *  Any other status, known or not, ends the response after the filename.
 *  The filename is decoded lossily, bad bytes never abort the decode.
 *
 * @throws EndOfStream as soon as one field comes up short
 */
template <typename SyncReadStream>
Response decodeResponse(SyncReadStream& stream) {
    Response resp;

    resp.version = static_cast<uint8_t>(readExact(stream, 1)[0]);
    resp.status = loadLe16(readExact(stream, 2).data());
    resp.nameLen = loadLe16(readExact(stream, 2).data());

    std::vector<char> name = readExact(stream, resp.nameLen);
    if (resp.nameLen > 0)
        resp.filename = decodeAsciiLossy(name.data(), name.size());

    if (statusCarriesPayload(resp.status)) {
        resp.size = loadLe32(readExact(stream, kPayloadHeaderSize).data());
        resp.payload = readExact(stream, *resp.size);
    }
    return resp;
}
