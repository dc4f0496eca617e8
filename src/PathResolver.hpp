#pragma once
#include <string>

// Maps client-supplied names onto the served directory tree and keeps them inside it.
class PathResolver {
public:
    explicit PathResolver(const std::string& root);

    const std::string& root() const { return root_; }

    // Joins name onto the root and normalizes the result. A leading '/' in name
    // is still relative to the root. Throws RequestError (403) if the result is
    // neither the root nor below it.
    std::string resolve(const std::string& name) const;

    // "/var/log/dir/f" -> "dir/f". Paths outside the root come back unchanged.
    std::string stripRoot(const std::string& path) const;

    // Lexical cleanup: collapses '.', '..' and repeated or trailing separators.
    static std::string clean(const std::string& path);

private:
    std::string root_;
};
