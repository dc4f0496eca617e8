#pragma once
#include <stdexcept>
#include <string>

// A request that cannot be served, carrying the HTTP status to answer with.
class RequestError : public std::runtime_error {
public:
    RequestError(int status, const std::string& message)
        : std::runtime_error(message), status_(status) {}

    int status() const { return status_; }

private:
    int status_;
};
