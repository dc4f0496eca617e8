// Writes one long run of letters with no newline, changing letter every 50
// bytes, for trying lines that span many chunks.
#include <iostream>
#include <stdexcept>
#include <string>

int main(int argc, char* argv[]) {
    long count = 20;
    if (argc > 1) {
        try {
            std::size_t pos = 0;
            count = std::stol(argv[1], &pos);
            if (pos != std::string(argv[1]).size()) throw std::invalid_argument(argv[1]);
        } catch (const std::exception&) {
            std::cerr << "*** Expected argument (" << argv[1] << ") to be a number" << std::endl;
            return 1;
        }
        if (count <= 0) {
            std::cerr << "*** Expected line count (" << count << ") to be positive" << std::endl;
            return 1;
        }
    }

    char letter = 'a';
    for (long j = 0; j < count;) {
        std::cout.put(letter);
        if (++j % 50 == 0) {
            switch (letter) {
            case 'z': letter = 'A'; break;
            case 'Z': letter = 'a'; break;
            default: ++letter; break;
            }
        }
    }
    std::cout.flush();
    return 0;
}
