// Writes synthetic log lines to stdout for exercising varlog-srv.
#include <ctime>
#include <iomanip>
#include <iostream>
#include <string>

namespace {

const char* kApps[] = {"aaaaa", "bbbbb", "ccccc", "ddddd", "eeeee",
                       "fffff", "ggggg", "hhhhh", "iiiii", "jjjjj"};
const char* kLevels[] = {"DEBUG", "INFO", "WARNING", "ERROR"};

bool parseCount(const char* arg, long& count) {
    try {
        std::size_t pos = 0;
        count = std::stol(arg, &pos);
        return pos == std::string(arg).size();
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    long count = 20;
    if (argc > 1) {
        if (!parseCount(argv[1], count)) {
            std::cerr << "*** Expected argument (" << argv[1] << ") to be a number" << std::endl;
            return 1;
        }
        if (count <= 0) {
            std::cerr << "*** Expected line count (" << count << ") to be positive" << std::endl;
            return 1;
        }
    }

    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    for (long j = 0; j < count; ++j) {
        std::cout << std::put_time(&local, "%Y/%m/%d %H:%M:%S") << ' '
                  << kApps[j % 10] << ' ' << std::setw(10) << j << ' ' << std::setw(7) << kLevels[j % 4]
                  << " abcde fghij klmno pqrst uvwxy\n";
    }
    return 0;
}
