#include "RequestEncoder.hpp"
#include <cstring>
#include <random>

/**
 * @brief draws a random 32 bit user id for this process
 */
ClientIdentity ClientIdentity::generate() {
    std::default_random_engine rng(std::random_device{}());
    std::uniform_int_distribution<uint32_t> dist(0, std::numeric_limits<uint32_t>::max());
    ClientIdentity identity;
    identity.userId = dist(rng);
    identity.version = kClientVersion;
    return identity;
}

OpCode opCodeOf(const Request& request) {
    struct Visitor {
        OpCode operator()(const BackupRequest&) const { return OpCode::Upload; }
        OpCode operator()(const RestoreRequest&) const { return OpCode::Retrieve; }
        OpCode operator()(const DeleteRequest&) const { return OpCode::Delete; }
        OpCode operator()(const ListRequest&) const { return OpCode::List; }
    };
    return std::visit(Visitor{}, request);
}

std::vector<char> encodeRequestHeader(uint32_t userId, uint8_t version, OpCode op,
                                      const std::string& filename) {
    if (filename.size() > kMaxNameLength)
        throw EncodingError("filename is " + std::to_string(filename.size())
                            + " bytes, the name_len field holds at most 65535");
    for (unsigned char c : filename) {
        if (c > 0x7F)
            throw EncodingError("filename is not ASCII: " + filename);
    }

    RequestHeader hdr{};
    hdr.user_id = boost::endian::native_to_little(userId);
    hdr.version = version;
    hdr.op = static_cast<uint8_t>(op);
    hdr.name_len = boost::endian::native_to_little(static_cast<uint16_t>(filename.size()));

    std::vector<char> out(sizeof(hdr) + filename.size());
    std::memcpy(out.data(), &hdr, sizeof(hdr));
    std::memcpy(out.data() + sizeof(hdr), filename.data(), filename.size());
    return out;
}

std::vector<char> encodeRequestHeader(const ClientIdentity& identity, const Request& request) {
    struct NameOf {
        std::string operator()(const BackupRequest& r) const { return r.filename; }
        std::string operator()(const RestoreRequest& r) const { return r.filename; }
        std::string operator()(const DeleteRequest& r) const { return r.filename; }
        std::string operator()(const ListRequest&) const { return {}; }
    };
    return encodeRequestHeader(identity.userId, identity.version, opCodeOf(request),
                               std::visit(NameOf{}, request));
}

std::vector<char> encodePayloadHeader(uint32_t size) {
    PayloadHeader ph{ boost::endian::native_to_little(size) };
    std::vector<char> out(sizeof(ph));
    std::memcpy(out.data(), &ph, sizeof(ph));
    return out;
}
