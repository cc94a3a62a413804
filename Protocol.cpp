#include "Protocol.hpp"

bool statusCarriesPayload(uint16_t status) {
    return status == static_cast<uint16_t>(Status::SuccessFound)
        || status == static_cast<uint16_t>(Status::SuccessFileList);
}

std::string decodeAsciiLossy(const char* data, std::size_t len) {
    static const char kReplacement[] = "\xEF\xBF\xBD";  // U+FFFD in UTF-8

    std::string out;
    out.reserve(len);
    for (std::size_t i = 0; i < len; ++i) {
        unsigned char c = static_cast<unsigned char>(data[i]);
        if (c > 0x7F)
            out += kReplacement;
        else
            out += static_cast<char>(c);
    }
    return out;
}
