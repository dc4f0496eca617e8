#pragma once
#include <json/json.h>
#include <string>
#include "PathResolver.hpp"
#include "RequestParams.hpp"
#include "ServiceConfig.hpp"

struct ReadResponse {
    std::string body;
    // Value for a Content-Disposition header; empty leaves it to the server.
    std::string contentDisposition;
    std::size_t lineCount = 0;
};

// Endpoint logic for /read and /list, independent of the HTTP framework.
// Holds no per-request state, so one instance serves all I/O threads.
class LogController {
public:
    explicit LogController(const ServiceConfig& config);

    // Most recent matching lines first, at most params.count() of them.
    // Throws RequestError carrying the HTTP status on failure.
    ReadResponse readLines(const RequestParams& params) const;

    // Pull loop of readLines over an already open descriptor. The name is only
    // used in messages. Throws RequestError(500) if the read fails.
    ReadResponse pullLines(int fd, const std::string& name, const RequestParams& params) const;

    // JSON array of {name, type} for a directory's children or a single file.
    // Throws RequestError carrying the HTTP status on failure.
    Json::Value listEntries(const RequestParams& params) const;

    Json::Value createError(int code, const std::string& message) const;

    const PathResolver& resolver() const { return resolver_; }

private:
    Json::Value listDirectory(const std::string& path, const RequestParams& params) const;
    Json::Value makeEntry(const std::string& path, const char* type) const;

    PathResolver resolver_;
    std::size_t chunkSize_;
    std::size_t maxLineLength_;
};
