#include "LineUtils.hpp"
#include <cstddef>
#include <cstring>

bool split_lines(const char* data, size_t total_size, size_t max_line_length, std::vector<std::string_view> &lines) {
	lines.clear();
	size_t pos = 0;

	while (pos < total_size) {
		// find the end of the current line
		const void* nl = std::memchr(data + pos, '\n', total_size - pos);
		size_t end_pos = nl ? static_cast<size_t>(static_cast<const char*>(nl) - data) : total_size;

		if (end_pos - pos > max_line_length) {
			return false;
		}
		lines.emplace_back(data + pos, end_pos - pos);

		// consume the newline, if any; the end of data is an implicit line end
		pos = nl ? end_pos + 1 : total_size;
	}
	return true;
}

std::string_view drop_cr(std::string_view line) {
	if (!line.empty() && line.back() == '\r') {
		line.remove_suffix(1);
	}
	return line;
}
