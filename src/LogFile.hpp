#pragma once
#include <string>
#include <cstdint>

// Read-only file descriptor for a single request. Closed on destruction.
class LogFile {
public:
    // Throws std::system_error if the file cannot be opened or stat'd.
    explicit LogFile(const std::string& path);
    ~LogFile();

    LogFile(const LogFile&) = delete;
    LogFile& operator=(const LogFile&) = delete;

    int fd() const { return fd_; }
    bool isRegular() const { return regular_; }
    int64_t size() const { return size_; }
    const std::string& path() const { return path_; }

private:
    std::string path_;
    int fd_;
    bool regular_ = false;
    int64_t size_ = 0;
};
