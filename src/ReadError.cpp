#include "ReadError.hpp"

namespace {

class ReadCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "varlog.read";
    }

    std::string message(int ev) const override {
        switch (static_cast<ReadErrc>(ev)) {
        case ReadErrc::EndOfData:
            return "end of data";
        case ReadErrc::LineTooLong:
            return "line exceeds maximum line length";
        }
        return "unknown read error";
    }
};

} // namespace

const std::error_category& read_category() {
    static ReadCategory category;
    return category;
}

std::error_code make_error_code(ReadErrc e) {
    return {static_cast<int>(e), read_category()};
}
