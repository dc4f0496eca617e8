#pragma once
#include <cstddef>
#include <string>
#include <system_error>
#include <vector>
#include "ChunkReader.hpp"

// Presents a file backwards, newest line first, one chunk's worth of lines at a time.
//
// Chunks arrive from the end of the file toward the start, but the bytes inside
// a chunk are in file order. A line crossing a chunk boundary therefore has its
// tail in the chunk read first and its head in the chunk read next. The first
// line of every chunk is held back as a pending suffix and appended to the next
// chunk before that one is split, so no line is emitted before its start has
// been read. The chunk at offset 0 holds nothing back: the start of the file is
// the start of a line.
//
// Typical use:
//
//     LineReverser r(fd, chunkSize);
//     while (r.advance()) {
//         for (const auto& line : r.lines()) { ... }
//     }
//     if (r.error()) { ... }
class LineReverser {
public:
    enum class State {
        Ready,      // nothing read yet
        Advancing,  // a batch is available through lines()
        DoneClean,  // the start of the file was reached
        DoneError   // stopped on an I/O or line-splitting error
    };

    static constexpr std::size_t kDefaultMaxLineLength = 1024 * 1024;

    // Throws like ChunkReader's constructor. The descriptor stays owned by the caller.
    LineReverser(int fd, std::size_t chunkSize, std::size_t maxLineLength = kDefaultMaxLineLength);

    // Moves to the next chunk. Returns false once no more lines will follow;
    // error() then tells a clean finish from a failure.
    bool advance();

    // Lines of the current chunk, most recent first. Valid until the next advance().
    const std::vector<std::string>& lines() const { return batch_; }
    std::vector<std::string> takeLines();

    // Empty after a clean, complete traversal; end-of-data never shows here.
    std::error_code error() const;

    State state() const { return state_; }
    std::size_t chunksRead() const { return reader_.readCount(); }

private:
    void extractLines(std::size_t count);
    void finish(std::error_code ec);

    ChunkReader reader_;
    std::size_t maxLineLength_;
    std::vector<char> chunk_;
    std::string pending_;
    std::vector<std::string> batch_;
    State state_ = State::Ready;
    std::error_code lastError_;
};
