#include "LocalFiles.hpp"
#include "Errors.hpp"

uintmax_t fileSize(const boost::filesystem::path& path) {
    boost::system::error_code ec;
    if (!boost::filesystem::is_regular_file(path, ec))
        throw LocalFileError("not a regular file: " + path.string());

    uintmax_t size = boost::filesystem::file_size(path, ec);
    if (ec)
        throw LocalFileError("cannot stat " + path.string() + ": " + ec.message());
    return size;
}

void writeFile(const boost::filesystem::path& path, const std::vector<char>& data) {
    std::ofstream out(path.string(), std::ios::binary | std::ios::trunc);
    if (!out)
        throw LocalFileError("cannot open " + path.string() + " for writing");

    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    out.close();
    if (!out)
        throw LocalFileError("failed writing " + path.string());
}

FileChunkReader::FileChunkReader(const boost::filesystem::path& path, std::size_t chunkSize)
    : path_(path), in_(path.string(), std::ios::binary), chunkSize_(chunkSize)
{
    if (!in_)
        throw LocalFileError("cannot open " + path.string() + " for reading");
    chunk_.reserve(chunkSize_);
}

bool FileChunkReader::next() {
    chunk_.resize(chunkSize_);
    in_.read(chunk_.data(), static_cast<std::streamsize>(chunkSize_));
    std::streamsize got = in_.gcount();
    if (in_.bad())
        throw LocalFileError("failed reading " + path_.string());

    chunk_.resize(static_cast<std::size_t>(got));
    return got > 0;
}
