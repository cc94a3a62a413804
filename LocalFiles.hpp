#pragma once
#include <cstdint>
#include <fstream>
#include <vector>

#include <boost/filesystem.hpp>

#include "Protocol.hpp"

// Size of a local regular file. Throws LocalFileError if it is missing or not a regular file.
uintmax_t fileSize(const boost::filesystem::path& path);

// Writes the whole buffer, replacing any existing file.
void writeFile(const boost::filesystem::path& path, const std::vector<char>& data);

/// Reads a local file in fixed size chunks
class FileChunkReader {
public:
    explicit FileChunkReader(const boost::filesystem::path& path, std::size_t chunkSize = kUploadChunkSize);

    /**
     * @brief reads the next chunk into the internal buffer
     * @return false once the whole file was read
     */
    bool next();

    const std::vector<char>& chunk() const { return chunk_; }

private:
    boost::filesystem::path path_;
    std::ifstream in_;
    std::vector<char> chunk_;
    std::size_t chunkSize_;
};
