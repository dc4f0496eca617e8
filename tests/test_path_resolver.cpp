#include <iostream>
#include <string>
#include "../src/PathResolver.hpp"
#include "../src/RequestError.hpp"

#define ASSERT_TRUE(cond) if(!(cond)) { std::cerr << "Assertion failed: " << #cond << " at " << __FILE__ << ":" << __LINE__ << std::endl; return 1; }

static bool escapes(const PathResolver& resolver, const std::string& name) {
    try {
        resolver.resolve(name);
    } catch (const RequestError& e) {
        return e.status() == 403;
    }
    return false;
}

int main() {
    try {
        PathResolver resolver("/var/log/");
        ASSERT_TRUE(resolver.root() == "/var/log");

        // 1) Names inside the root
        ASSERT_TRUE(resolver.resolve("") == "/var/log");
        ASSERT_TRUE(resolver.resolve("syslog") == "/var/log/syslog");
        ASSERT_TRUE(resolver.resolve("apt/history.log") == "/var/log/apt/history.log");
        ASSERT_TRUE(resolver.resolve("apt//./history.log") == "/var/log/apt/history.log");
        ASSERT_TRUE(resolver.resolve("apt/") == "/var/log/apt");
        ASSERT_TRUE(resolver.resolve("apt/../syslog") == "/var/log/syslog");
        ASSERT_TRUE(resolver.resolve(".") == "/var/log");
        // a leading slash is still relative to the root
        ASSERT_TRUE(resolver.resolve("/syslog") == "/var/log/syslog");

        // 2) Names escaping the root
        ASSERT_TRUE(escapes(resolver, ".."));
        ASSERT_TRUE(escapes(resolver, "../../etc/passwd"));
        ASSERT_TRUE(escapes(resolver, "apt/../../lib"));
        ASSERT_TRUE(escapes(resolver, "/../logs"));

        // 3) A sibling sharing the root as a string prefix is outside
        ASSERT_TRUE(escapes(resolver, "../logfiles"));
        ASSERT_TRUE(escapes(resolver, "../log2/x"));

        // 4) Stripping the root from results
        ASSERT_TRUE(resolver.stripRoot("/var/log/dir/f") == "dir/f");
        ASSERT_TRUE(resolver.stripRoot("/var/log") == "");
        ASSERT_TRUE(resolver.stripRoot("/var/logs/x") == "/var/logs/x");

        // 5) Cleaning
        ASSERT_TRUE(PathResolver::clean("/a/b/../c/") == "/a/c");
        ASSERT_TRUE(PathResolver::clean("") == ".");
        ASSERT_TRUE(PathResolver::clean("/") == "/");
        ASSERT_TRUE(PathResolver::clean("x/..") == ".");

    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "All path resolver tests passed" << std::endl;
    return 0;
}
