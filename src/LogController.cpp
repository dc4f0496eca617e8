#include "LogController.hpp"
#include "LineReverser.hpp"
#include "LogFile.hpp"
#include "RequestError.hpp"
#include <algorithm>
#include <filesystem>
#include <memory>
#include <system_error>
#include <vector>
#include <trantor/utils/Logger.h>

namespace {
const char* kTypeDir = "dir";
const char* kTypeFile = "file";

// Content-Disposition quoted-string: backslash-escape quotes, replace control bytes.
std::string quoteFilename(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        if (c == '"' || c == '\\') {
            out.push_back('\\');
            out.push_back(c);
        } else if (static_cast<unsigned char>(c) < 0x20 || c == 0x7f) {
            out.push_back('_');
        } else {
            out.push_back(c);
        }
    }
    return out;
}
}

LogController::LogController(const ServiceConfig& config)
    : resolver_(config.root),
      chunkSize_(config.chunkSize),
      maxLineLength_(config.maxLineLength) {
}

Json::Value LogController::createError(int code, const std::string& message) const {
    Json::Value response;
    response["error"]["code"] = code;
    response["error"]["message"] = message;
    return response;
}

ReadResponse LogController::readLines(const RequestParams& params) const {
    const std::string path = resolver_.resolve(params.name());

    std::unique_ptr<LogFile> file;
    try {
        file = std::make_unique<LogFile>(path);
    } catch (const std::system_error& e) {
        LOG_ERROR << e.what();
        throw RequestError(404, "Cannot open " + params.name());
    }
    if (!file->isRegular()) {
        LOG_WARN << "Read of non-regular file " << path << " refused";
        throw RequestError(400, "Not a regular file: " + params.name());
    }

    ReadResponse response = pullLines(file->fd(), params.name(), params);

    if (!params.contentDisposition().empty()) {
        const std::string filename = std::filesystem::path(path).filename().string();
        response.contentDisposition = params.contentDisposition() + "; filename=\"" + quoteFilename(filename) + "\"";
    }
    return response;
}

ReadResponse LogController::pullLines(int fd, const std::string& name, const RequestParams& params) const {
    std::unique_ptr<LineReverser> reverser;
    try {
        reverser = std::make_unique<LineReverser>(fd, chunkSize_, maxLineLength_);
    } catch (const std::exception& e) {
        LOG_ERROR << "Create reverser error for " << name << ": " << e.what();
        throw RequestError(500, std::string("Cannot read ") + name + ": " + e.what());
    }

    ReadResponse response;
    const auto limit = static_cast<std::size_t>(params.count());
    bool full = false;
    while (!full && reverser->advance()) {
        for (const auto& line : reverser->lines()) {
            if (!params.filterAllows(line)) {
                continue;
            }
            response.body.append(line);
            response.body.push_back('\n');
            if (++response.lineCount == limit) {
                // stop pulling; the rest of the file stays unread
                full = true;
                break;
            }
        }
    }
    LOG_DEBUG << "total lines " << response.lineCount << " from " << name << " in " << reverser->chunksRead() << " chunks";

    if (auto ec = reverser->error()) {
        LOG_ERROR << "Read of " << name << " failed: " << ec.message();
        throw RequestError(500, "Read of " + name + " failed: " + ec.message());
    }
    return response;
}

Json::Value LogController::makeEntry(const std::string& path, const char* type) const {
    Json::Value entry;
    // Responses never reveal where the root lives on the server.
    entry["name"] = resolver_.stripRoot(path);
    entry["type"] = type;
    return entry;
}

Json::Value LogController::listDirectory(const std::string& path, const RequestParams& params) const {
    std::vector<std::filesystem::directory_entry> children;
    std::error_code ec;
    for (std::filesystem::directory_iterator it(path, ec), end; !ec && it != end; it.increment(ec)) {
        children.push_back(*it);
    }
    if (ec) {
        LOG_ERROR << "Unable to read directory " << path << ": " << ec.message();
        throw RequestError(500, "Unable to read directory " + params.name());
    }
    std::sort(children.begin(), children.end(),
              [](const auto& a, const auto& b) { return a.path().filename() < b.path().filename(); });

    Json::Value data(Json::arrayValue);
    for (const auto& child : children) {
        const std::string name = child.path().filename().string();
        if (!params.filterAllows(name)) {
            continue;
        }
        // symlinks are not followed; they count as special
        std::error_code typeEc;
        const auto type = child.symlink_status(typeEc);
        if (typeEc) {
            continue;
        }
        if (std::filesystem::is_directory(type)) {
            data.append(makeEntry(child.path().string(), kTypeDir));
        } else if (std::filesystem::is_regular_file(type)) {
            data.append(makeEntry(child.path().string(), kTypeFile));
        }
        // special files are not listed
    }
    return data;
}

Json::Value LogController::listEntries(const RequestParams& params) const {
    const std::string path = resolver_.resolve(params.name());

    std::error_code ec;
    auto status = std::filesystem::status(path, ec);
    if (ec || !std::filesystem::exists(status)) {
        LOG_WARN << "Path " << path << " invalid" << (ec ? ", " + ec.message() : std::string());
        throw RequestError(404, "No such file or directory: " + params.name());
    }

    if (std::filesystem::is_directory(status)) {
        LOG_DEBUG << "List directory " << path;
        return listDirectory(path, params);
    }
    if (std::filesystem::is_regular_file(status)) {
        LOG_DEBUG << "List file " << path;
        Json::Value data(Json::arrayValue);
        if (params.filterAllows(params.name())) {
            data.append(makeEntry(path, kTypeFile));
        }
        return data;
    }
    LOG_WARN << "Special file " << path << " not allowed";
    throw RequestError(404, "Special file \"" + params.name() + "\" not allowed");
}
