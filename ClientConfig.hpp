#pragma once
#include <string>
#include <vector>

struct ServerAddress {
    std::string host;
    unsigned short port = 0;
};

// Parses "ip:port". Throws ConfigError on anything else.
ServerAddress parseServerAddress(const std::string& line);

// Reads the single "ip:port" line of server.info
ServerAddress readServerInfo(const std::string& path = "server.info");

// One local filename per line, blank lines skipped
std::vector<std::string> readBackupList(const std::string& path = "backup.info");
