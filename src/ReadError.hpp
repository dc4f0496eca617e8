#pragma once
#include <string>
#include <system_error>

// Conditions raised by the reversal engine itself. I/O failures use the system category.
enum class ReadErrc {
    EndOfData = 1,   // traversal reached the start of the file; not a failure
    LineTooLong      // a line exceeded the configured maximum line length
};

const std::error_category& read_category();

std::error_code make_error_code(ReadErrc e);

namespace std {
template <>
struct is_error_code_enum<ReadErrc> : true_type {};
}
