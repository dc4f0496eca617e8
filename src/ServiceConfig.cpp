#include "ServiceConfig.hpp"
#include "PathResolver.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <trantor/utils/Logger.h>

namespace {

// 0 keeps the default; negative values are rejected.
std::size_t sizeSetting(const Json::Value& section, const char* key, std::size_t fallback) {
    if (!section.isMember(key)) {
        return fallback;
    }
    const Json::Value& v = section[key];
    if (!v.isIntegral()) {
        throw std::runtime_error(std::string("'") + key + "' must be an integer");
    }
    Json::Int64 n = v.asInt64();
    if (n < 0) {
        throw std::runtime_error(std::string("'") + key + "' (" + std::to_string(n) + ") cannot be negative");
    }
    return n == 0 ? fallback : static_cast<std::size_t>(n);
}

} // namespace

ServiceConfig parseServiceConfig(const Json::Value& document) {
    ServiceConfig config;
    if (!document.isObject() || !document.isMember("varlog")) {
        LOG_INFO << "No 'varlog' section in config, using defaults";
        return config;
    }
    const Json::Value& section = document["varlog"];
    if (!section.isObject()) {
        throw std::runtime_error("'varlog' must be an object");
    }

    if (section.isMember("root")) {
        config.root = section["root"].asString();
        if (config.root.empty()) {
            config.root = ServiceConfig().root;
        }
    }
    config.chunkSize = sizeSetting(section, "chunk_size", config.chunkSize);
    config.maxLineLength = sizeSetting(section, "max_line_length", config.maxLineLength);

    if (section.isMember("address")) {
        config.address = section["address"].asString();
    }
    std::size_t port = sizeSetting(section, "port", static_cast<std::size_t>(config.port));
    if (port > 65535) {
        throw std::runtime_error("'port' (" + std::to_string(port) + ") out of range");
    }
    config.port = static_cast<int>(port);

    if (section.isMember("log_level")) {
        config.logLevel = section["log_level"].asString();
        if (config.logLevel != "TRACE" && config.logLevel != "DEBUG" && config.logLevel != "INFO" &&
            config.logLevel != "WARN" && config.logLevel != "ERROR") {
            throw std::runtime_error("Unknown log_level '" + config.logLevel + "'");
        }
    }
    return config;
}

ServiceConfig loadServiceConfig(const std::string& path) {
    std::ifstream configFile(path);
    if (!configFile) {
        LOG_INFO << "Config file " << path << " not found, using defaults";
        return ServiceConfig();
    }

    Json::CharReaderBuilder builder;
    Json::Value document;
    std::string errs;
    if (!Json::parseFromStream(builder, configFile, &document, &errs)) {
        throw std::runtime_error("Failed to parse " + path + ": " + errs);
    }
    LOG_INFO << "Config file " << path << " parsed successfully";
    return parseServiceConfig(document);
}

void validateServiceConfig(ServiceConfig& config) {
    config.root = PathResolver::clean(config.root);
    if (config.root == "." || config.root == ".." || config.root == "/") {
        throw std::runtime_error("Invalid root directory (" + config.root + ")");
    }
    std::error_code ec;
    if (!std::filesystem::is_directory(config.root, ec)) {
        throw std::runtime_error("Root (" + config.root + ") is not a directory");
    }
}
