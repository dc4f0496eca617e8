#include <iostream>
#include <fcntl.h>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>
#include <unistd.h>
#include <vector>
#include "../src/ChunkReader.hpp"
#include "../src/ReadError.hpp"
#include "reverse_helpers.hpp"

static std::string next_chunk(ChunkReader& reader, std::error_code& ec) {
    std::vector<char> buf(reader.chunkSize());
    size_t n = reader.read(buf.data(), buf.size(), ec);
    return std::string(buf.data(), n);
}

int main() {
    try {
        std::error_code ec;

        // 1) Empty file: exhausted before any read, and stays that way without touching the file
        {
            TempFile f("chunk_empty", "");
            ChunkReader reader(f.fd(), 4);
            ASSERT_TRUE(reader.fileLength() == 0);
            ASSERT_TRUE(reader.nextOffset() == 0);
            ASSERT_TRUE(next_chunk(reader, ec).empty());
            ASSERT_TRUE(ec == ReadErrc::EndOfData);
            ASSERT_TRUE(next_chunk(reader, ec).empty());
            ASSERT_TRUE(ec == ReadErrc::EndOfData);
            ASSERT_TRUE(reader.readCount() == 0);
        }

        // 2) Partial tail chunk first, then full aligned chunks
        {
            TempFile f("chunk_partial", "abcdefghij");
            ChunkReader reader(f.fd(), 4);
            ASSERT_TRUE(reader.nextOffset() == 8);
            ASSERT_TRUE(next_chunk(reader, ec) == "ij");
            ASSERT_TRUE(!ec);
            // backs up a full chunk even though only two bytes came back
            ASSERT_TRUE(reader.nextOffset() == 4);
            ASSERT_TRUE(next_chunk(reader, ec) == "efgh");
            ASSERT_TRUE(!ec);
            ASSERT_TRUE(!reader.exhausted());
            ASSERT_TRUE(next_chunk(reader, ec) == "abcd");
            ASSERT_TRUE(!ec);
            ASSERT_TRUE(reader.exhausted());
            ASSERT_TRUE(reader.nextOffset() == -4);
            ASSERT_TRUE(next_chunk(reader, ec).empty());
            ASSERT_TRUE(ec == ReadErrc::EndOfData);
            ASSERT_TRUE(reader.readCount() == 3);
        }

        // 3) Exact multiple of the chunk size starts at the last full chunk
        {
            TempFile f("chunk_exact", "abcdefgh");
            ChunkReader reader(f.fd(), 4);
            ASSERT_TRUE(reader.nextOffset() == 4);
            ASSERT_TRUE(next_chunk(reader, ec) == "efgh");
            ASSERT_TRUE(next_chunk(reader, ec) == "abcd");
            ASSERT_TRUE(!ec);
            ASSERT_TRUE(next_chunk(reader, ec).empty());
            ASSERT_TRUE(ec == ReadErrc::EndOfData);
        }

        // 4) Chunk size equal to the file length: a single read at offset 0
        {
            TempFile f("chunk_whole", "abcdefgh");
            ChunkReader reader(f.fd(), 8);
            ASSERT_TRUE(reader.nextOffset() == 0);
            ASSERT_TRUE(next_chunk(reader, ec) == "abcdefgh");
            ASSERT_TRUE(!ec);
            ASSERT_TRUE(reader.exhausted());
            ASSERT_TRUE(next_chunk(reader, ec).empty());
            ASSERT_TRUE(ec == ReadErrc::EndOfData);
            ASSERT_TRUE(reader.readCount() == 1);
        }

        // 5) Chunk size larger than the file: the short read at offset 0 is data, not end of input
        {
            TempFile f("chunk_large", "abc");
            ChunkReader reader(f.fd(), 64 * 1024);
            ASSERT_TRUE(reader.nextOffset() == 0);
            ASSERT_TRUE(next_chunk(reader, ec) == "abc");
            ASSERT_TRUE(!ec);
            next_chunk(reader, ec);
            ASSERT_TRUE(ec == ReadErrc::EndOfData);
        }

        // 6) Chunk size 1 walks the file byte by byte
        {
            TempFile f("chunk_one", "xyz");
            ChunkReader reader(f.fd(), 1);
            ASSERT_TRUE(next_chunk(reader, ec) == "z");
            ASSERT_TRUE(next_chunk(reader, ec) == "y");
            ASSERT_TRUE(next_chunk(reader, ec) == "x");
            ASSERT_TRUE(!ec);
            next_chunk(reader, ec);
            ASSERT_TRUE(ec == ReadErrc::EndOfData);
        }

        // 7) Construction failures
        {
            bool threw = false;
            try {
                ChunkReader reader(-1, 4);
            } catch (const std::system_error& e) {
                threw = e.code().value() == EBADF;
            }
            ASSERT_TRUE(threw);

            TempFile f("chunk_zero", "abc");
            threw = false;
            try {
                ChunkReader reader(f.fd(), 0);
            } catch (const std::invalid_argument&) {
                threw = true;
            }
            ASSERT_TRUE(threw);
        }

        // 8) I/O errors are sticky: a directory stats fine but cannot be read
        {
            auto dir = std::filesystem::temp_directory_path() / ("varlog_chunk_dir_" + std::to_string(::getpid()));
            std::filesystem::create_directories(dir);
            int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
            ASSERT_TRUE(fd >= 0);
            ChunkReader reader(fd, 16);
            next_chunk(reader, ec);
            ASSERT_TRUE(ec == std::errc::is_a_directory);
            const size_t reads = reader.readCount();
            next_chunk(reader, ec);
            ASSERT_TRUE(ec == std::errc::is_a_directory);
            ASSERT_TRUE(reader.readCount() == reads);
            ::close(fd);
            std::filesystem::remove(dir);
        }

    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "All chunk reader tests passed" << std::endl;
    return 0;
}
