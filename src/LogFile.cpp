#include "LogFile.hpp"
#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <system_error>
#include <unistd.h>

LogFile::LogFile(const std::string& path)
    : path_(path),
      // O_NONBLOCK keeps a FIFO from stalling the open; it has no effect on pread
      fd_(::open(path.c_str(), O_RDONLY | O_CLOEXEC | O_NONBLOCK)) {
    if (fd_ < 0) {
        throw std::system_error(errno, std::system_category(), "Cannot open " + path);
    }
    struct stat st;
    if (::fstat(fd_, &st) != 0) {
        const int err = errno;
        ::close(fd_);
        throw std::system_error(err, std::system_category(), "Cannot stat " + path);
    }
    regular_ = S_ISREG(st.st_mode);
    size_ = static_cast<int64_t>(st.st_size);
}

LogFile::~LogFile() {
    ::close(fd_);
}
