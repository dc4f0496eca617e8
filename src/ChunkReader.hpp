#pragma once
#include <cstddef>
#include <cstdint>
#include <system_error>

// Reads a file backwards, one chunk at a time, using positional reads.
// The first read returns the (possibly partial) tail chunk; every later read
// returns the full, chunk-aligned chunk before it. The file descriptor stays
// owned by the caller and is never closed here.
class ChunkReader {
public:
    // Throws std::system_error if the file cannot be stat'd and
    // std::invalid_argument if chunkSize is zero.
    ChunkReader(int fd, std::size_t chunkSize);

    // Reads the next chunk into buffer, which must hold chunkSize() bytes for
    // every call on this reader. Returns the number of bytes read.
    // ec is ReadErrc::EndOfData once the start of the file has been consumed,
    // or a system error if the read failed. Both conditions are sticky.
    std::size_t read(char* buffer, std::size_t length, std::error_code& ec);

    std::size_t chunkSize() const { return chunkSize_; }
    int64_t fileLength() const { return fileLength_; }
    int64_t nextOffset() const { return nextOffset_; }
    // True once the chunk at offset 0 has been handed out.
    bool exhausted() const { return fileLength_ == 0 || nextOffset_ < 0; }
    std::size_t readCount() const { return readCount_; }

private:
    int fd_;
    std::size_t chunkSize_;
    int64_t fileLength_ = 0;
    int64_t nextOffset_ = 0;
    std::size_t readCount_ = 0;
    std::error_code lastError_;
};
