#include "ChunkReader.hpp"
#include "ReadError.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <sys/stat.h>
#include <unistd.h>
#include <trantor/utils/Logger.h>

ChunkReader::ChunkReader(int fd, std::size_t chunkSize)
    : fd_(fd),
      chunkSize_(chunkSize) {
    if (chunkSize_ == 0) {
        throw std::invalid_argument("Chunk size must be positive");
    }
    struct stat st;
    if (::fstat(fd_, &st) != 0) {
        const int err = errno;
        LOG_ERROR << "fstat failed for fd " << fd_ << ": " << std::strerror(err);
        throw std::system_error(err, std::system_category(), "fstat");
    }
    fileLength_ = static_cast<int64_t>(st.st_size);

    const auto chunk = static_cast<int64_t>(chunkSize_);
    if (fileLength_ == 0) {
        nextOffset_ = 0;
    } else if (fileLength_ % chunk == 0) {
        // Exactly chunked: start with the last full chunk.
        nextOffset_ = fileLength_ - chunk;
    } else {
        // Start with the partial tail chunk.
        nextOffset_ = fileLength_ - fileLength_ % chunk;
    }
}

std::size_t ChunkReader::read(char* buffer, std::size_t length, std::error_code& ec) {
    ec.clear();
    if (lastError_) {
        ec = lastError_;
        return 0;
    }
    if (exhausted()) {
        lastError_ = ReadErrc::EndOfData;
        ec = lastError_;
        return 0;
    }

    const std::size_t want = std::min(length, chunkSize_);
    std::size_t got = 0;
    while (got < want) {
        ssize_t n = ::pread(fd_, buffer + got, want - got, static_cast<off_t>(nextOffset_ + static_cast<int64_t>(got)));
        if (n < 0) {
            if (errno == EINTR) continue;
            ec = std::error_code(errno, std::system_category());
            break;
        }
        if (n == 0) break; // end of input; keep whatever was read
        got += static_cast<std::size_t>(n);
    }
    ++readCount_;

    // Always back up a whole chunk, not the byte count: the tail chunk may be
    // short but every earlier chunk is full and aligned to the file start.
    const int64_t offset = nextOffset_;
    nextOffset_ -= static_cast<int64_t>(chunkSize_);

    if (ec) {
        LOG_ERROR << "pread failed at offset " << offset << ": " << ec.message();
        lastError_ = ec;
        return 0;
    }
    if (got == 0) {
        // The file shrank below the offset computed at construction.
        LOG_WARN << "No data at offset " << offset << " of " << fileLength_ << " bytes, stopping";
        lastError_ = ReadErrc::EndOfData;
        ec = lastError_;
        return 0;
    }
    return got;
}
