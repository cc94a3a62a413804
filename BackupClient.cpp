#include "BackupClient.hpp"
#include <iomanip>
#include <sstream>

#include "LocalFiles.hpp"

BackupClient::BackupClient(BackupSession& session, ClientIdentity identity,
                           std::ostream& out, std::ostream& err)
    : session_(session), identity_(identity), out_(out), err_(err)
{
}

Response BackupClient::exchange(const Request& request) {
    session_.sendRequest(identity_, request);
    return session_.receiveResponse();
}

/// Upload a local file, the name sent is the path as given
 /**
  *  The response is reported as is, whatever status it carries.
  */
Response BackupClient::backup(const std::string& fileName) {
    out_ << "--- Saving file '" << fileName << "' ---" << std::endl;
    Response resp = exchange(BackupRequest{ fileName, boost::filesystem::path(fileName) });
    out_ << "Response: " << describeResponse(resp, false) << "\n" << std::endl;
    return resp;
}

/**
 * @brief fetches a file and writes its payload to saveAs (fileName if empty)
 *  not found and general error write nothing, every other status must carry a payload
 * @throws ProtocolViolation if it does not, LocalFileError if the write fails
 */
RestoreOutcome BackupClient::restore(const std::string& fileName, const std::string& saveAs) {
    out_ << "--- Restoring file '" << fileName << "' ---" << std::endl;
    Response resp = exchange(RestoreRequest{ fileName });

    if (resp.hasStatus(Status::ErrFileNotFound)) {
        err_ << "File '" << fileName << "' not found on the server." << std::endl;
        out_ << "Response: " << describeResponse(resp, false) << "\n" << std::endl;
        return FileNotFound{ resp };
    }
    if (resp.hasStatus(Status::ErrGeneral)) {
        err_ << "Fatal error: server failed to restore file." << std::endl;
        out_ << "Response: " << describeResponse(resp, false) << "\n" << std::endl;
        return ServerFailure{ resp };
    }
    if (!resp.payload)
        throw ProtocolViolation("status " + std::to_string(resp.status)
                                + " for restore of '" + fileName + "' came without a payload");

    boost::filesystem::path target(saveAs.empty() ? fileName : saveAs);
    writeFile(target, *resp.payload);
    out_ << "Restored '" << fileName << "' to '" << target.string() << "'." << std::endl;
    out_ << "Response: " << describeResponse(resp, true) << "\n" << std::endl;
    return FileRestored{ resp, target };
}

DeleteOutcome BackupClient::remove(const std::string& fileName) {
    out_ << "--- Deleting file '" << fileName << "' ---" << std::endl;
    Response resp = exchange(DeleteRequest{ fileName });

    if (resp.hasStatus(Status::ErrFileNotFound)) {
        err_ << "File '" << fileName << "' not found on the server." << std::endl;
        out_ << "Response: " << describeResponse(resp, false) << "\n" << std::endl;
        return FileNotFound{ resp };
    }
    if (resp.hasStatus(Status::ErrGeneral)) {
        err_ << "Fatal error: server failed to delete file." << std::endl;
        out_ << "Response: " << describeResponse(resp, false) << "\n" << std::endl;
        return ServerFailure{ resp };
    }

    out_ << "File deleted successfully." << std::endl;
    out_ << "Response: " << describeResponse(resp, false) << "\n" << std::endl;
    return FileDeleted{ resp };
}

/**
 * @brief asks for every file this user has on the server
 *  an empty but present payload is a listing with zero files, not NoFiles
 * @throws ProtocolViolation if a success status has no payload
 */
ListOutcome BackupClient::list() {
    out_ << "--- Requesting list of files ---" << std::endl;
    Response resp = exchange(ListRequest{});

    if (resp.hasStatus(Status::ErrNoFiles)) {
        out_ << "No files found on the server." << std::endl;
        out_ << "Response: " << describeResponse(resp, false) << "\n" << std::endl;
        return NoFiles{ resp };
    }
    if (resp.hasStatus(Status::ErrGeneral)) {
        err_ << "Fatal error: server failed to list files." << std::endl;
        out_ << "Response: " << describeResponse(resp, false) << "\n" << std::endl;
        return ServerFailure{ resp };
    }
    if (!resp.payload)
        throw ProtocolViolation("status " + std::to_string(resp.status)
                                + " for list came without a payload");

    FileListing listing{ resp, parseFileList(*resp.payload) };
    out_ << "--- List of files ---" << std::endl;
    for (const auto& name : listing.names)
        out_ << name << std::endl;
    out_ << "--- End of list ---" << std::endl;
    out_ << "Response: " << describeResponse(resp, true) << "\n" << std::endl;
    return listing;
}

bool BackupClient::runScript(const std::vector<std::string>& files, const std::string& restoreAs) {
    if (!runStep([&] { list(); }))
        return false;
    for (std::size_t i = 0; i < files.size() && i < 2; ++i) {
        if (!runStep([&] { backup(files[i]); }))
            return false;
    }
    if (!runStep([&] { list(); }))
        return false;
    if (files.empty())
        return true;

    return runStep([&] { restore(files[0], restoreAs); })
        && runStep([&] { remove(files[0]); })
        && runStep([&] { restore(files[0]); });
}

bool BackupClient::runStep(const std::function<void()>& step) {
    try {
        step();
    }
    catch (const TransportError& e) {
        err_ << "Connection lost: " << e.what() << std::endl;
        session_.close();
        return false;
    }
    catch (const BackupError& e) {
        err_ << "Request failed: " << e.what() << "\n" << std::endl;
    }
    return true;
}

std::string describeResponse(const Response& resp, bool withPayload) {
    std::ostringstream os;
    os << "{version: " << static_cast<int>(resp.version)
       << ", status: " << resp.status
       << ", name_len: " << resp.nameLen
       << ", filename: " << (resp.filename ? "'" + *resp.filename + "'" : std::string("None"));
    if (withPayload) {
        os << ", size: " << (resp.size ? std::to_string(*resp.size) : std::string("None"))
           << ", payload: " << (resp.payload ? "'" + hexBytes(*resp.payload) + "'" : std::string("None"));
    }
    os << "}";
    return os.str();
}

std::string hexBytes(const std::vector<char>& data) {
    std::ostringstream os;
    os << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < data.size(); ++i) {
        if (i)
            os << ' ';
        os << std::setw(2) << static_cast<int>(static_cast<unsigned char>(data[i]));
    }
    return os.str();
}

std::vector<std::string> parseFileList(const std::vector<char>& payload) {
    std::istringstream in(decodeAsciiLossy(payload.data(), payload.size()));
    std::vector<std::string> names;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (!line.empty())
            names.push_back(line);
    }
    return names;
}
