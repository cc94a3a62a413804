#pragma once
#include <functional>
#include <iostream>
#include <string>
#include <variant>
#include <vector>

#include <boost/filesystem/path.hpp>

#include "BackupSession.hpp"

struct FileRestored {
    Response response;
    boost::filesystem::path savedTo;
};

struct FileDeleted {
    Response response;
};

struct FileListing {
    Response response;
    std::vector<std::string> names;
};

struct FileNotFound {
    Response response;
};

struct NoFiles {
    Response response;
};

struct ServerFailure {
    Response response;
};

using RestoreOutcome = std::variant<FileRestored, FileNotFound, ServerFailure>;
using DeleteOutcome = std::variant<FileDeleted, FileNotFound, ServerFailure>;
using ListOutcome = std::variant<FileListing, NoFiles, ServerFailure>;

/// Runs the user visible operations over a connected session.
/**
 *  Every call is one exchange: a request, then exactly one response.
 *  Server failure statuses come back as outcome alternatives, not exceptions.
 *  Reports go to out, failure reports to err.
 */
class BackupClient {
public:
    BackupClient(BackupSession& session, ClientIdentity identity,
                 std::ostream& out = std::cout, std::ostream& err = std::cerr);

    const ClientIdentity& identity() const { return identity_; }

    Response backup(const std::string& fileName);
    RestoreOutcome restore(const std::string& fileName, const std::string& saveAs = {});
    DeleteOutcome remove(const std::string& fileName);
    ListOutcome list();

    /// The session script: list, back up the first two files, list,
    /// restore the first one as restoreAs, delete it, restore it again.
    /**
     *  Errors that only spoil one exchange are reported and the script goes on.
     *  A TransportError leaves the connection out of step with the server:
     *  it is reported, the session is closed and the script stops.
     *
     * @return true if every step ran, false if the connection was lost
     */
    bool runScript(const std::vector<std::string>& files, const std::string& restoreAs = "tmp");

private:
    Response exchange(const Request& request);
    bool runStep(const std::function<void()>& step);

    BackupSession& session_;
    ClientIdentity identity_;
    std::ostream& out_;
    std::ostream& err_;
};

// "{version: 1, status: 210, name_len: 0, filename: None}" plus size/payload when present
std::string describeResponse(const Response& resp, bool withPayload);

// Space separated lowercase hex, "68 65 6c 6c 6f"
std::string hexBytes(const std::vector<char>& data);

// Splits a list payload into names, dropping empty lines and trailing '\r'
std::vector<std::string> parseFileList(const std::vector<char>& payload);
