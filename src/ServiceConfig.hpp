#pragma once
#include <cstddef>
#include <string>
#include <json/json.h>

struct ServiceConfig {
    std::string root = "/var/log";
    std::size_t chunkSize = 64 * 1024;
    std::size_t maxLineLength = 1024 * 1024;
    std::string address = "127.0.0.1";
    int port = 8000;
    std::string logLevel = "INFO";
};

// Reads the "varlog" section of a JSON config file. A missing file gives the
// defaults; a malformed file or an invalid value throws std::runtime_error.
ServiceConfig loadServiceConfig(const std::string& path);

// Applies the "varlog" section of an already parsed document over the defaults.
ServiceConfig parseServiceConfig(const Json::Value& document);

// Checks the root directory and normalizes it. Throws std::runtime_error.
void validateServiceConfig(ServiceConfig& config);
