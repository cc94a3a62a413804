#include "BackupClient.hpp"
#include "ClientConfig.hpp"
#include <iostream>

/**
 * @brief the client starts here: reads server.info and backup.info (or the paths
 *          given as arguments), connects and runs the backup / restore / delete script
 * @return 0 when the script completed, 1 on configuration or connection failure
 */
int main(int argc, char* argv[]) {
    const std::string serverInfo = argc > 1 ? argv[1] : "server.info";
    const std::string backupInfo = argc > 2 ? argv[2] : "backup.info";

    BackupSession session;
    BackupClient client(session, ClientIdentity::generate());

    try {
        ServerAddress server = readServerInfo(serverInfo);
        session.connect(server.host, server.port);
        std::cout << "Connected to " << server.host << ":" << server.port
                  << " as user " << client.identity().userId << std::endl;

        std::vector<std::string> files = readBackupList(backupInfo);
        if (!client.runScript(files))
            return 1;

        std::cout << "Client work completed." << std::endl;
    }
    catch (const std::exception& e) {
        std::cerr << "Client error: " << e.what() << std::endl;
        session.close();
        return 1;
    }

    session.close();
    std::cout << "Connection closed." << std::endl;
    return 0;
}
