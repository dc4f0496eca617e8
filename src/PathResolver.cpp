#include "PathResolver.hpp"
#include "RequestError.hpp"
#include <filesystem>
#include <trantor/utils/Logger.h>

PathResolver::PathResolver(const std::string& root)
    : root_(clean(root)) {}

std::string PathResolver::clean(const std::string& path) {
    if (path.empty()) {
        return ".";
    }
    std::string cleaned = std::filesystem::path(path).lexically_normal().string();
    while (cleaned.size() > 1 && cleaned.back() == '/') {
        cleaned.pop_back();
    }
    return cleaned.empty() ? "." : cleaned;
}

std::string PathResolver::resolve(const std::string& name) const {
    // operator/ would discard the root for an absolute name
    std::string relative = name;
    relative.erase(0, relative.find_first_not_of('/'));

    std::string joined = clean((std::filesystem::path(root_) / relative).string());
    if (joined != root_ && joined.compare(0, root_.size() + 1, root_ + "/") != 0) {
        LOG_WARN << "Name " << name << " resolves outside " << root_;
        throw RequestError(403, "Invalid name parameter (\"" + name + "\")");
    }
    return joined;
}

std::string PathResolver::stripRoot(const std::string& path) const {
    if (path == root_) {
        return "";
    }
    const std::string prefix = root_ + "/";
    if (path.compare(0, prefix.size(), prefix) == 0) {
        return path.substr(prefix.size());
    }
    return path;
}
