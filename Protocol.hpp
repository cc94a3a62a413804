#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <boost/endian/conversion.hpp>

constexpr uint8_t kClientVersion = 1;

constexpr std::size_t kRequestHeaderSize = 8;   // user_id + version + op + name_len
constexpr std::size_t kPayloadHeaderSize = 4;
constexpr std::size_t kMaxNameLength = 0xFFFF;
constexpr std::size_t kUploadChunkSize = 4096;

enum class OpCode : uint8_t {
    Upload = 100,
    Retrieve = 200,
    Delete = 201,
    List = 202
};

enum class Status : uint16_t {
    SuccessFound = 210,
    SuccessFileList = 211,
    SuccessNoPayload = 212,
    ErrFileNotFound = 1001,
    ErrNoFiles = 1002,
    ErrGeneral = 1003
};

#pragma pack(push, 1)
struct RequestHeader {
    uint32_t user_id;   // 4 bytes
    uint8_t  version;   // 1 byte
    uint8_t  op;        // 1 byte
    uint16_t name_len;  // 2 bytes
    // filename follows (variable size)
};
#pragma pack(pop)

#pragma pack(push, 1)
struct PayloadHeader {
    uint32_t size;  // 4 bytes
    // binary data follows (variable)
};
#pragma pack(pop)

static_assert(sizeof(RequestHeader) == kRequestHeaderSize, "request header must be packed");
static_assert(sizeof(PayloadHeader) == kPayloadHeaderSize, "payload header must be packed");

/// A decoded server response.
/**
 *  size and payload are only present for the statuses that carry a payload (210, 211).
 *  A zero size still gives a present, empty payload.
 */
struct Response {
    uint8_t version = 0;
    uint16_t status = 0;
    uint16_t nameLen = 0;
    std::optional<std::string> filename;
    std::optional<uint32_t> size;
    std::optional<std::vector<char>> payload;

    bool hasStatus(Status s) const { return status == static_cast<uint16_t>(s); }
};

// true for 210 and 211, the only statuses followed by a size field
bool statusCarriesPayload(uint16_t status);

// Bytes above 0x7F become U+FFFD, nothing is rejected
std::string decodeAsciiLossy(const char* data, std::size_t len);

// Little-endian field access on raw buffers
inline uint16_t loadLe16(const char* p) {
    return boost::endian::load_little_u16(reinterpret_cast<const unsigned char*>(p));
}

inline uint32_t loadLe32(const char* p) {
    return boost::endian::load_little_u32(reinterpret_cast<const unsigned char*>(p));
}

inline void storeLe16(char* p, uint16_t v) {
    boost::endian::store_little_u16(reinterpret_cast<unsigned char*>(p), v);
}

inline void storeLe32(char* p, uint32_t v) {
    boost::endian::store_little_u32(reinterpret_cast<unsigned char*>(p), v);
}
