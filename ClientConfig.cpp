#include "ClientConfig.hpp"
#include <fstream>
#include <sstream>

#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>

#include "Errors.hpp"

ServerAddress parseServerAddress(const std::string& line) {
    std::string text = boost::algorithm::trim_copy(line);
    std::size_t colon = text.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == text.size())
        throw ConfigError("expected ip:port, got '" + text + "'");

    ServerAddress addr;
    addr.host = text.substr(0, colon);

    unsigned int port = 0;
    try {
        port = boost::lexical_cast<unsigned int>(text.substr(colon + 1));
    }
    catch (const boost::bad_lexical_cast&) {
        throw ConfigError("port is not a number in '" + text + "'");
    }
    if (port == 0 || port > 65535)
        throw ConfigError("port out of range in '" + text + "'");

    addr.port = static_cast<unsigned short>(port);
    return addr;
}

ServerAddress readServerInfo(const std::string& path) {
    std::ifstream in(path);
    if (!in)
        throw ConfigError("cannot open " + path);

    std::ostringstream content;
    content << in.rdbuf();
    return parseServerAddress(content.str());
}

std::vector<std::string> readBackupList(const std::string& path) {
    std::ifstream in(path);
    if (!in)
        throw ConfigError("cannot open " + path);

    std::vector<std::string> files;
    std::string line;
    while (std::getline(in, line)) {
        boost::algorithm::trim(line);
        if (!line.empty())
            files.push_back(line);
    }
    return files;
}
