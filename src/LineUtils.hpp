#pragma once
#include <cstddef>
#include <string_view>
#include <vector>

// Helper: split data on '\n' into views over the input, earliest line first.
// An unterminated final line counts as a line; a trailing '\n' does not add an empty one.
// Returns false if a line is longer than max_line_length; 'lines' then holds the lines before it.
bool split_lines(const char* data, size_t total_size, size_t max_line_length, std::vector<std::string_view> &lines);

// Strips one trailing '\r' so CRLF files read like LF files.
std::string_view drop_cr(std::string_view line);
